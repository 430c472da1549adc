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

#include "engine/io_director.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
}

#include <cerrno>
#include <deque>

#include "engine/cancellation.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/optional.ipp"
#include "utils/process/child.hpp"
#include "utils/process/deadline_killer.hpp"
#include "utils/process/exceptions.hpp"
#include "utils/process/operations.hpp"
#include "utils/sanity.hpp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace process = utils::process;
namespace text = utils::text;

using utils::none;
using utils::optional;


namespace {


/// Maximum time to block in poll(2) before rechecking the process.
static const datetime::delta poll_tick(0, 50000);


/// Time to keep draining output after the process has exited.
static const datetime::delta drain_grace(0, 500000);


/// Time after the deadline at which the director gives up on the pipes.
static const datetime::delta kill_grace(0, 500000);


/// Sets the O_NONBLOCK flag of a file descriptor.
///
/// \param fd The file descriptor to modify.
///
/// \throw process::system_error If fcntl(2) fails.
static void
set_nonblocking(const int fd)
{
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        const int original_errno = errno;
        throw process::system_error(F("Failed to set fd %s as non-blocking") %
                                    fd, original_errno);
    }
}


/// Writes to a pipe without being killed if its reader is gone.
///
/// SIGPIPE is blocked in the calling thread for the duration of the write and
/// any instance of it raised by the write is consumed before unblocking it.
///
/// \param fd The file descriptor to write to.
/// \param data The data to write.
/// \param size The number of bytes in data.
///
/// \return The result of write(2); errno is preserved on failure.
static ssize_t
write_without_sigpipe(const int fd, const char* data, const std::size_t size)
{
    ::sigset_t sigpipe_mask, old_mask;
    sigemptyset(&sigpipe_mask);
    sigaddset(&sigpipe_mask, SIGPIPE);
    (void)::pthread_sigmask(SIG_BLOCK, &sigpipe_mask, &old_mask);

    const ssize_t ret = ::write(fd, data, size);
    const int original_errno = errno;

    if (ret == -1 && original_errno == EPIPE &&
        !sigismember(&old_mask, SIGPIPE)) {
        const struct ::timespec no_wait = {0, 0};
        while (::sigtimedwait(&sigpipe_mask, NULL, &no_wait) == -1 &&
               errno == EINTR) {}
    }

    (void)::pthread_sigmask(SIG_SETMASK, &old_mask, NULL);
    errno = original_errno;
    return ret;
}


/// Keeps a process group registered in a cancellation object.
class group_registration : utils::noncopyable {
    /// The cancellation object; may be NULL.
    engine::cancellation* _cancellation;

    /// The registered process group.
    const int _pgid;

public:
    /// Registers the group.
    ///
    /// \param cancellation_ The cancellation object; may be NULL.
    /// \param pgid_ The process group to register.
    group_registration(engine::cancellation* cancellation_, const int pgid_) :
        _cancellation(cancellation_), _pgid(pgid_)
    {
        if (_cancellation != NULL)
            _cancellation->add_group(_pgid);
    }

    /// Unregisters the group.
    ~group_registration(void)
    {
        if (_cancellation != NULL)
            _cancellation->remove_group(_pgid);
    }
};


/// State of the interaction with a single process.
class director : utils::noncopyable {
    /// The process being driven.
    process::child& _child;

    /// Limits of the interaction.
    const engine::io_limits& _limits;

    /// Suite-wide cancellation; may be NULL.
    engine::cancellation* _cancellation;

    /// Whether input is delivered one line at a time.
    const bool _interleaved;

    /// Lines not yet handed to the process in interleaved mode.
    std::deque< std::string > _queue;

    /// Bytes queued for writing to the stdin of the process.
    std::string _pending;

    /// Raw contents read from stdout.
    std::string _stdout_data;

    /// Raw contents read from stderr.
    std::string _stderr_data;

    /// Number of bytes read so far from both output streams.
    std::size_t _total_bytes;

    /// Time of the last output or the last completed input line.
    datetime::timestamp _last_activity;

    /// Time at which the process was seen to exit.
    optional< datetime::timestamp > _exit_time;

    /// Terminal state decided during the interaction, if any.
    optional< engine::io_state > _final_state;

    /// Description of the failure, if the interaction failed.
    optional< std::string > _failure;

    /// Timer that kills the process at its deadline.
    process::deadline_killer* _killer;

    /// Whether the timer has been cancelled already.
    bool _unscheduled;

    /// Whether the timer fired before being cancelled.
    bool _killed;

    /// Cancels the deadline timer once the process is gone.
    ///
    /// \return True if the timer fired and killed the process.
    bool
    unschedule_killer(void)
    {
        if (!_unscheduled) {
            _killed = _killer->unschedule();
            _unscheduled = true;
        }
        return _killed;
    }

    /// Aborts the interaction due to an error.
    ///
    /// \param reason Description of the failure.
    void
    fail(const std::string& reason)
    {
        LI(F("Interaction with PID %s failed: %s") % _child.pid() % reason);
        _final_state = engine::io_errored;
        _failure = reason;
        process::terminate_group(_child.pid());
    }

    /// Hands the next input line to the process if it is due.
    ///
    /// \param now The current time.
    void
    feed(const datetime::timestamp& now)
    {
        if (_child.stdin_fd() == -1 || !_pending.empty())
            return;

        if (!_interleaved || _queue.empty()) {
            LD(F("All input delivered to PID %s; closing its stdin") %
               _child.pid());
            _child.close_stdin();
            return;
        }

        if (now - _last_activity < _limits.quiescence)
            return;
        _pending = _queue.front() + "\n";
        _queue.pop_front();
    }

    /// Computes how long to block waiting for events.
    ///
    /// \param now The current time.
    ///
    /// \return A timeout in milliseconds for poll(2).
    int
    poll_timeout(const datetime::timestamp& now) const
    {
        datetime::delta wait = poll_tick;
        if (_interleaved && _child.stdin_fd() != -1 && _pending.empty() &&
            !_queue.empty()) {
            const datetime::delta silence = now - _last_activity;
            if (!(silence < _limits.quiescence))
                wait = datetime::delta();
            else if (_limits.quiescence - silence < wait)
                wait = _limits.quiescence - silence;
        }
        return static_cast< int >((wait.to_microseconds() + 999) / 1000);
    }

    /// Reads available data from one of the output streams.
    ///
    /// \param fd The stream to read from.
    /// \param [in,out] buffer The buffer in which to accumulate the data.
    ///
    /// \return False if the stream reached EOF; true otherwise.
    ///
    /// \throw process::system_error If read(2) fails.
    bool
    read_from(const int fd, std::string& buffer)
    {
        char chunk[4096];
        const ssize_t ret = ::read(fd, chunk, sizeof(chunk));
        if (ret == -1) {
            const int original_errno = errno;
            if (original_errno == EAGAIN || original_errno == EWOULDBLOCK ||
                original_errno == EINTR)
                return true;
            throw process::system_error("Failed to read output of the program",
                                        original_errno);
        } else if (ret == 0) {
            return false;
        }

        _total_bytes += ret;
        if (_total_bytes > _limits.max_output_bytes) {
            fail(F("Output exceeded the limit of %s bytes") %
                 _limits.max_output_bytes);
            return true;
        }
        buffer.append(chunk, ret);
        _last_activity = datetime::timestamp::now();
        return true;
    }

    /// Writes queued input to the process.
    ///
    /// \throw process::system_error If write(2) fails for reasons other than
    ///     the process not reading its input.
    void
    write_pending(void)
    {
        PRE(!_pending.empty());

        const ssize_t ret = write_without_sigpipe(
            _child.stdin_fd(), _pending.data(), _pending.length());
        if (ret == -1) {
            const int original_errno = errno;
            if (original_errno == EAGAIN || original_errno == EWOULDBLOCK ||
                original_errno == EINTR)
                return;
            if (original_errno == EPIPE) {
                LD(F("PID %s closed its stdin with input pending") %
                   _child.pid());
                if (!_interleaved)
                    _pending.clear();
                _child.close_stdin();
                return;
            }
            throw process::system_error("Failed to write input of the program",
                                        original_errno);
        }

        _pending.erase(0, ret);
        if (_pending.empty() && _interleaved)
            _last_activity = datetime::timestamp::now();
    }

    /// Records the exit of the process leader.
    ///
    /// Undelivered interleaved input is kept so that run() can judge it once
    /// the process has been reaped.
    ///
    /// \param now The current time.
    /// \param status The termination status of the leader.
    void
    handle_exit(const datetime::timestamp& now, const process::status& status)
    {
        LD(F("PID %s exited: %s") % _child.pid() % status);
        _exit_time = now;
        (void)unschedule_killer();
        process::terminate_group(_child.pid());

        if (!_interleaved)
            _pending.clear();
        _child.close_stdin();
    }

    /// Checks whether interleaved input was left undelivered.
    ///
    /// \return True if the process went away with lines still queued.
    bool
    input_left(void) const
    {
        return _interleaved && (!_queue.empty() || !_pending.empty());
    }

    /// Multiplexes input and output until the interaction ends.
    ///
    /// \param hard_stop Time at which to abandon the process.
    ///
    /// \throw process::system_error If any system call fails.
    void
    loop(const datetime::timestamp& hard_stop)
    {
        while (!_final_state &&
               (_child.stdout_fd() != -1 || _child.stderr_fd() != -1)) {
            if (_cancellation != NULL && _cancellation->cancelled()) {
                _final_state = engine::io_cancelled;
                process::terminate_group(_child.pid());
                return;
            }

            const datetime::timestamp now = datetime::timestamp::now();
            if (!_exit_time) {
                const optional< process::status > status =
                    _child.wait_nohang();
                if (status)
                    handle_exit(now, status.get());
            }
            if (_exit_time && !(now < _exit_time.get() + drain_grace)) {
                LW(F("Output of PID %s still open after its exit; ignoring "
                     "the rest") % _child.pid());
                return;
            }
            if (!(now < hard_stop)) {
                LW(F("PID %s did not release its output after the deadline") %
                   _child.pid());
                _final_state = engine::io_timed_out;
                process::terminate_group(_child.pid());
                return;
            }

            feed(now);

            struct ::pollfd fds[3];
            int stdout_index = -1, stderr_index = -1, stdin_index = -1;
            ::nfds_t nfds = 0;
            if (_child.stdout_fd() != -1) {
                fds[nfds].fd = _child.stdout_fd();
                fds[nfds].events = POLLIN;
                stdout_index = nfds++;
            }
            if (_child.stderr_fd() != -1) {
                fds[nfds].fd = _child.stderr_fd();
                fds[nfds].events = POLLIN;
                stderr_index = nfds++;
            }
            if (_child.stdin_fd() != -1 && !_pending.empty()) {
                fds[nfds].fd = _child.stdin_fd();
                fds[nfds].events = POLLOUT;
                stdin_index = nfds++;
            }
            for (::nfds_t i = 0; i < nfds; ++i)
                fds[i].revents = 0;

            if (::poll(fds, nfds, poll_timeout(now)) == -1) {
                const int original_errno = errno;
                if (original_errno == EINTR)
                    continue;
                throw process::system_error("poll(2) failed", original_errno);
            }

            if (stdout_index != -1 && fds[stdout_index].revents != 0) {
                if (!read_from(fds[stdout_index].fd, _stdout_data))
                    _child.close_stdout();
            }
            if (!_final_state && stderr_index != -1 &&
                fds[stderr_index].revents != 0) {
                if (!read_from(fds[stderr_index].fd, _stderr_data))
                    _child.close_stderr();
            }
            if (!_final_state && stdin_index != -1 &&
                fds[stdin_index].revents != 0)
                write_pending();
        }
    }

public:
    /// Constructor.
    ///
    /// \param child_ The process to drive.
    /// \param input The lines to feed to the process.
    /// \param interleaved_ Whether to feed the input one line at a time.
    /// \param limits_ Limits of the interaction.
    /// \param cancellation_ Suite-wide cancellation; may be NULL.
    director(process::child& child_, const model::lines_vector& input,
             const bool interleaved_, const engine::io_limits& limits_,
             engine::cancellation* cancellation_) :
        _child(child_), _limits(limits_), _cancellation(cancellation_),
        _interleaved(interleaved_), _total_bytes(0),
        _last_activity(datetime::timestamp::now()),
        _killer(NULL), _unscheduled(false), _killed(false)
    {
        if (_interleaved) {
            _queue.insert(_queue.end(), input.begin(), input.end());
        } else {
            for (model::lines_vector::const_iterator iter = input.begin();
                 iter != input.end(); ++iter)
                _pending += *iter + "\n";
        }
    }

    /// Drives the process until it finishes, times out or is cancelled.
    ///
    /// \return The outcome of the interaction.
    engine::io_outcome
    run(void)
    {
        const datetime::timestamp start = datetime::timestamp::now();
        _last_activity = start;
        process::deadline_killer killer(_limits.timeout, _child.pid());
        _killer = &killer;
        group_registration registration(_cancellation, _child.pid());
        const datetime::timestamp hard_stop = killer.deadline() + kill_grace;

        engine::io_outcome outcome;
        try {
            if (_child.stdin_fd() != -1)
                set_nonblocking(_child.stdin_fd());
            set_nonblocking(_child.stdout_fd());
            set_nonblocking(_child.stderr_fd());
            loop(hard_stop);
        } catch (const process::system_error& e) {
            fail(e.what());
        }

        _child.close_stdin();
        _child.close_stdout();
        _child.close_stderr();

        try {
            outcome.status = _child.wait();
        } catch (const process::system_error& e) {
            if (!_final_state)
                fail(e.what());
        }
        const bool killed = unschedule_killer();
        const datetime::timestamp end = _exit_time ? _exit_time.get() :
            datetime::timestamp::now();

        if (_final_state) {
            outcome.state = _final_state.get();
        } else if (_cancellation != NULL && _cancellation->cancelled()) {
            outcome.state = engine::io_cancelled;
        } else if (killed && outcome.status &&
                   outcome.status.get().signaled()) {
            outcome.state = engine::io_timed_out;
        } else if (input_left()) {
            outcome.state = engine::io_errored;
            _failure = std::string("Program terminated before reading all of "
                                   "its input");
            LI(F("PID %s: %s") % _child.pid() % _failure.get());
        } else {
            outcome.state = engine::io_done;
        }

        outcome.output = engine::split_output(_stdout_data);
        outcome.error_output = _stderr_data;
        outcome.failure = _failure;
        outcome.elapsed = end - start;
        LD(F("PID %s finished in %s") % _child.pid() % outcome.elapsed);
        return outcome;
    }
};


}  // anonymous namespace


/// Constructs a set of limits.
///
/// \param timeout_ Maximum wall-clock time of the process.
/// \param quiescence_ Silence window of interactive processes.
/// \param max_output_bytes_ Maximum number of bytes to read from the process.
engine::io_limits::io_limits(const datetime::delta& timeout_,
                             const datetime::delta& quiescence_,
                             const std::size_t max_output_bytes_) :
    timeout(timeout_),
    quiescence(quiescence_),
    max_output_bytes(max_output_bytes_)
{
}


/// Constructs an empty outcome.
engine::io_outcome::io_outcome(void) :
    state(io_done)
{
}


/// Splits the raw stdout of a program into lines.
///
/// \param data The raw output.
///
/// \return The lines of the output without their terminators.  A trailing
/// carriage return is removed from each line and the empty piece that follows
/// a final newline is dropped.
model::lines_vector
engine::split_output(const std::string& data)
{
    model::lines_vector lines = text::split(data, '\n');
    if (!lines.empty() && lines.back().empty())
        lines.pop_back();
    for (model::lines_vector::iterator iter = lines.begin();
         iter != lines.end(); ++iter) {
        if (!(*iter).empty() && (*iter)[(*iter).length() - 1] == '\r')
            (*iter).erase((*iter).length() - 1);
    }
    return lines;
}


/// Drives a process against the input of a test case.
///
/// In batch mode, all the input is written upfront and stdin is closed once
/// delivered.  In interleaved mode, each line is written only after the
/// process has been silent for the quiescence window, and stdin is closed
/// after the last line.  In both modes, output is read concurrently with the
/// delivery of the input.
///
/// The process is killed along with its process group when the deadline
/// expires, when the run is cancelled, when it prints too much or when the
/// director fails to talk to it.  The process is always reaped on return.
///
/// \param child The process to drive; must have just been spawned.
/// \param input The lines to feed to the process.
/// \param interleaved Whether to feed the input one line at a time.
/// \param limits Limits of the interaction.
/// \param cancellation Suite-wide cancellation; may be NULL.
///
/// \return The outcome of the interaction.
engine::io_outcome
engine::drive(process::child& child, const model::lines_vector& input,
              const bool interleaved, const io_limits& limits,
              cancellation* cancellation)
{
    director director(child, input, interleaved, limits, cancellation);
    return director.run();
}
