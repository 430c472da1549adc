// Copyright 2010, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "utils/process/child.hpp"

extern "C" {
#include <sys/types.h>

#include <fcntl.h>
#include <unistd.h>
}

#include <cerrno>
#include <vector>

#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/exceptions.hpp"
#include "utils/process/operations.hpp"
#include "utils/sanity.hpp"
#include "utils/signals/interrupts.hpp"

namespace fs = utils::fs;
namespace process = utils::process;
namespace signals = utils::signals;

using utils::none;
using utils::optional;


namespace {


/// Stage of the child setup that failed, as reported through the error pipe.
enum setup_stage {
    stage_dup,
    stage_chdir,
    stage_exec,
};


/// Message sent by the child to the parent when its setup fails.
struct setup_failure {
    /// The stage that failed.
    int stage;

    /// The errno value of the failed system call.
    int error;
};


/// Closes a file descriptor if it is open, and marks it as closed.
///
/// \param fd The file descriptor to close; set to -1 on return.
static void
safe_close(int& fd)
{
    if (fd != -1) {
        if (::close(fd) == -1)
            LW(F("Failed to close file descriptor %s") % fd);
        fd = -1;
    }
}


/// Creates a pipe whose both ends are closed upon exec.
///
/// The close-on-exec flag must be set atomically because other threads may be
/// spawning children at the same time, and a stray copy of a write end kept
/// by an unrelated child would prevent the reader from ever seeing EOF.
///
/// \param fds Output array for the read and write ends.
///
/// \throw process::system_error If the pipe cannot be created.
static void
safe_pipe(int fds[2])
{
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        const int original_errno = errno;
        throw process::system_error("pipe2(2) failed", original_errno);
    }
}


/// Reports a setup failure to the parent and terminates the child.
///
/// Only async-signal-safe functions can be used here.
///
/// \param error_fd The write end of the error pipe.
/// \param stage The stage that failed.
/// \param error The errno of the failed call.
static void
report_failure(const int error_fd, const setup_stage stage, const int error)
    UTILS_NORETURN;
static void
report_failure(const int error_fd, const setup_stage stage, const int error)
{
    setup_failure failure;
    failure.stage = stage;
    failure.error = error;
    (void)::write(error_fd, &failure, sizeof(failure));
    ::_exit(127);
}


/// Configures the process after fork and executes the program.
///
/// This runs in the child after fork(2) of a possibly multithreaded parent,
/// so only async-signal-safe functions can be used: no memory allocation, no
/// logging and no exceptions.
///
/// \param program The program to execute; looked up in the PATH if it does
///     not contain any slashes.
/// \param argv The NULL-terminated arguments, including the program name.
/// \param work_directory Directory to change to, or NULL.
/// \param stdin_fd Read end of the stdin pipe.
/// \param stdout_fd Write end of the stdout pipe.
/// \param stderr_fd Write end of the stderr pipe.
/// \param error_fd Write end of the error pipe.
static void
run_child(const char* program, char* const* argv, const char* work_directory,
          const int stdin_fd, const int stdout_fd, const int stderr_fd,
          const int error_fd) UTILS_NORETURN;
static void
run_child(const char* program, char* const* argv, const char* work_directory,
          const int stdin_fd, const int stdout_fd, const int stderr_fd,
          const int error_fd)
{
    (void)::setpgid(0, 0);
    signals::reset_interrupts_in_new_child();

    if (::dup2(stdin_fd, STDIN_FILENO) == -1 ||
        ::dup2(stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stderr_fd, STDERR_FILENO) == -1)
        report_failure(error_fd, stage_dup, errno);

    if (work_directory != NULL && ::chdir(work_directory) == -1)
        report_failure(error_fd, stage_chdir, errno);

    ::execvp(program, argv);
    report_failure(error_fd, stage_exec, errno);
}


}  // anonymous namespace


namespace utils {
namespace process {


/// Private implementation fields for child objects.
struct child::impl : utils::noncopyable {
    /// The process identifier.
    pid_t pid;

    /// Write end of the pipe connected to the stdin of the child.
    int stdin_fd;

    /// Read end of the pipe connected to the stdout of the child.
    int stdout_fd;

    /// Read end of the pipe connected to the stderr of the child.
    int stderr_fd;

    /// Termination status of the child, once it has been reaped.
    optional< process::status > status;

    /// Initializes private implementation data.
    ///
    /// \param pid_ The process identifier.
    /// \param stdin_fd_ Write end of the stdin pipe.
    /// \param stdout_fd_ Read end of the stdout pipe.
    /// \param stderr_fd_ Read end of the stderr pipe.
    impl(const pid_t pid_, const int stdin_fd_, const int stdout_fd_,
         const int stderr_fd_) :
        pid(pid_), stdin_fd(stdin_fd_), stdout_fd(stdout_fd_),
        stderr_fd(stderr_fd_)
    {
    }

    /// Releases the pipes and ensures the child does not outlive us.
    ~impl(void)
    {
        safe_close(stdin_fd);
        safe_close(stdout_fd);
        safe_close(stderr_fd);
        if (!status) {
            LW(F("Destroying unreaped child %s; killing it") % pid);
            process::terminate_group(pid);
            try {
                (void)process::wait(pid);
            } catch (const process::system_error& e) {
                LE(F("Failed to reap child %s: %s") % pid % e.what());
            }
        }
    }
};


}  // namespace process
}  // namespace utils


/// Creates a new child.
///
/// \param implptr A dynamically-allocated impl object with the contents of the
///     new child.
process::child::child(impl *implptr) :
    _pimpl(implptr)
{
}


/// Destructor for child.
///
/// A child that has not been waited for is killed and reaped.
process::child::~child(void)
{
}


/// Spawns a program in a subprocess connected to three pipes.
///
/// Execution failures (a missing program, a program without execution
/// permissions, a work directory that cannot be entered) are detected
/// synchronously: the child reports the errno through a close-on-exec pipe
/// before exiting, and this function raises an exec_error after reaping it.
///
/// \param program The program to execute.  If it does not contain any slashes,
///     it is looked up in the PATH.
/// \param args The arguments to pass to the program, without the program name.
/// \param work_directory If not none, the directory in which to run the
///     program.
///
/// \return A new child object, returned as a dynamically-allocated object
/// because children classes are unique and thus noncopyable.
///
/// \throw process::exec_error If the program cannot be executed.
/// \throw process::system_error If the process cannot be spawned due to a
///     system call error.
std::unique_ptr< process::child >
process::child::spawn(const std::string& program, const args_vector& args,
                      const optional< fs::path >& work_directory)
{
    // All the memory used by the child must be allocated before forking.
    std::vector< char* > argv;
    argv.push_back(const_cast< char* >(program.c_str()));
    for (args_vector::const_iterator iter = args.begin(); iter != args.end();
         ++iter)
        argv.push_back(const_cast< char* >(iter->c_str()));
    argv.push_back(NULL);
    const char* work_directory_cstr = work_directory ?
        work_directory.get().c_str() : NULL;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    try {
        safe_pipe(stdin_pipe);
        safe_pipe(stdout_pipe);
        safe_pipe(stderr_pipe);
        safe_pipe(error_pipe);
    } catch (const process::system_error& e) {
        safe_close(stdin_pipe[0]); safe_close(stdin_pipe[1]);
        safe_close(stdout_pipe[0]); safe_close(stdout_pipe[1]);
        safe_close(stderr_pipe[0]); safe_close(stderr_pipe[1]);
        safe_close(error_pipe[0]); safe_close(error_pipe[1]);
        throw;
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int original_errno = errno;
        safe_close(stdin_pipe[0]); safe_close(stdin_pipe[1]);
        safe_close(stdout_pipe[0]); safe_close(stdout_pipe[1]);
        safe_close(stderr_pipe[0]); safe_close(stderr_pipe[1]);
        safe_close(error_pipe[0]); safe_close(error_pipe[1]);
        throw process::system_error("fork(2) failed", original_errno);
    } else if (pid == 0) {
        run_child(program.c_str(), &argv[0], work_directory_cstr,
                  stdin_pipe[0], stdout_pipe[1], stderr_pipe[1],
                  error_pipe[1]);
    }

    (void)::setpgid(pid, pid);
    signals::track_child_group(pid);
    safe_close(stdin_pipe[0]);
    safe_close(stdout_pipe[1]);
    safe_close(stderr_pipe[1]);
    safe_close(error_pipe[1]);

    std::unique_ptr< process::child > new_child(new process::child(
        new impl(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0])));

    setup_failure failure;
    ssize_t ret;
    while ((ret = ::read(error_pipe[0], &failure, sizeof(failure))) == -1 &&
           errno == EINTR) {}
    safe_close(error_pipe[0]);

    if (ret == static_cast< ssize_t >(sizeof(failure))) {
        new_child->_pimpl->status = process::wait(pid);
        switch (failure.stage) {
        case stage_dup:
            throw process::system_error("Failed to set up the standard streams "
                                        "of the child", failure.error);
        case stage_chdir:
            throw process::exec_error(F("Failed to enter directory %s") %
                                      work_directory.get(), failure.error);
        case stage_exec:
            throw process::exec_error(F("Failed to execute %s") % program,
                                      failure.error);
        default:
            UNREACHABLE_MSG(F("Unknown setup stage %s") % failure.stage);
        }
    }

    LD(F("Spawned process %s: %s") % pid % program);
    return new_child;
}


/// Returns the process identifier of this child.
///
/// \return A process identifier.
int
process::child::pid(void) const
{
    return _pimpl->pid;
}


/// Returns the write end of the pipe connected to the stdin of the child.
///
/// \return A file descriptor, or -1 if it has been closed.
int
process::child::stdin_fd(void) const
{
    return _pimpl->stdin_fd;
}


/// Returns the read end of the pipe connected to the stdout of the child.
///
/// \return A file descriptor, or -1 if it has been closed.
int
process::child::stdout_fd(void) const
{
    return _pimpl->stdout_fd;
}


/// Returns the read end of the pipe connected to the stderr of the child.
///
/// \return A file descriptor, or -1 if it has been closed.
int
process::child::stderr_fd(void) const
{
    return _pimpl->stderr_fd;
}


/// Closes the stdin of the child, signaling the end of its input.
void
process::child::close_stdin(void)
{
    safe_close(_pimpl->stdin_fd);
}


/// Closes our end of the stdout pipe.
void
process::child::close_stdout(void)
{
    safe_close(_pimpl->stdout_fd);
}


/// Closes our end of the stderr pipe.
void
process::child::close_stderr(void)
{
    safe_close(_pimpl->stderr_fd);
}


/// Checks whether the child has terminated without blocking.
///
/// \return The termination status, or none if the child is still running.
///
/// \throw process::system_error If the call to waitpid(2) fails.
optional< process::status >
process::child::wait_nohang(void)
{
    if (!_pimpl->status)
        _pimpl->status = process::wait_nohang(_pimpl->pid);
    return _pimpl->status;
}


/// Blocks to wait for completion.
///
/// \return The termination status of the child process.
///
/// \throw process::system_error If the call to waitpid(2) fails.
process::status
process::child::wait(void)
{
    if (!_pimpl->status)
        _pimpl->status = process::wait(_pimpl->pid);
    return _pimpl->status.get();
}
