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

#include "utils/process/operations.hpp"

extern "C" {
#include <sys/types.h>
#include <sys/wait.h>

#include <signal.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/exceptions.hpp"
#include "utils/process/status.hpp"
#include "utils/signals/interrupts.hpp"

namespace process = utils::process;
namespace signals = utils::signals;

using utils::none;
using utils::optional;


/// Forcibly terminates a process group.
///
/// This is the only mechanism used to stop the programs under test, be it
/// because their deadline expired, because the run was cancelled or because
/// the leader exited leaving some of its descendants behind.  Every child
/// spawned by this module leads its own process group, so killing the group
/// reaches all the descendants that did not explicitly detach themselves.
///
/// \param pgid The identifier of the process group to kill; this is the PID of
///     the group leader.
void
process::terminate_group(const int pgid)
{
retry:
    if (::killpg(pgid, SIGKILL) == -1) {
        const int original_errno = errno;
        if (original_errno == EINTR)
            goto retry;
        if (original_errno != ESRCH)
            LW(F("Failed to kill process group %s: %s") % pgid %
               std::strerror(original_errno));
    }
}


/// Blocks to wait for completion of a subprocess.
///
/// \param pid Identifier of the process to wait for.
///
/// \return The termination status of the child process that terminated.
///
/// \throw process::system_error If the call to waitpid(2) fails.
process::status
process::wait(const int pid)
{
    LD(F("Waiting for pid=%s") % pid);
    int stat_loc;
    while (::waitpid(pid, &stat_loc, 0) == -1) {
        const int original_errno = errno;
        if (original_errno != EINTR)
            throw process::system_error(F("Failed to wait for PID %s") % pid,
                                        original_errno);
    }
    signals::untrack_child_group(pid);
    return process::status(pid, stat_loc);
}


/// Checks whether a subprocess has terminated without blocking.
///
/// \param pid Identifier of the process to check.
///
/// \return The termination status of the process if it has been reaped; none
/// if it is still running.
///
/// \throw process::system_error If the call to waitpid(2) fails.
optional< process::status >
process::wait_nohang(const int pid)
{
    int stat_loc;
    pid_t ret;
    while ((ret = ::waitpid(pid, &stat_loc, WNOHANG)) == -1) {
        const int original_errno = errno;
        if (original_errno != EINTR)
            throw process::system_error(F("Failed to wait for PID %s") % pid,
                                        original_errno);
    }
    if (ret == 0)
        return none;

    signals::untrack_child_group(pid);
    return utils::make_optional(process::status(pid, stat_loc));
}
