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

#include "utils/signals/interrupts.hpp"

extern "C" {
#include <sys/types.h>

#include <signal.h>
#include <unistd.h>
}

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/process/operations.hpp"
#include "utils/sanity.hpp"
#include "utils/signals/exceptions.hpp"
#include "utils/signals/programmer.hpp"

namespace signals = utils::signals;
namespace process = utils::process;


namespace {


/// Signals whose disposition is restored to the default in new children.
static const int child_reset_signals[] = {
    SIGHUP, SIGINT, SIGPIPE, SIGTERM, SIGQUIT, SIGALRM, SIGCHLD,
};


/// Shared state between the workers and the signal-watching thread.
///
/// The atomics are written from the signal handler; everything else is
/// guarded by the mutex.
class interrupt_monitor : utils::noncopyable {
    std::mutex _mutex;
    std::condition_variable _changed;

    /// Whether the watcher thread has programmed its handlers.
    bool _watching;

    /// Whether the watcher has terminated all tracked groups.
    bool _groups_killed;

    /// Leaders of the process groups to terminate on interrupt.
    ///
    /// PIDs may be recycled between the reaping of a child by one worker and
    /// the registration of another child by a different worker, hence the
    /// multiset.
    std::multiset< pid_t > _groups;

public:
    /// Last interrupt signal received, or -1.
    std::atomic_int pending_signo;

    /// Number of interrupt signals received so far.
    std::atomic_int received;

    /// Set by redeliver_to_exit() so that the watcher exits quietly.
    std::atomic_bool exiting;

    interrupt_monitor(void) :
        _watching(false), _groups_killed(false), pending_signo(-1),
        received(0), exiting(false)
    {
    }

    void
    mark_watching(void)
    {
        std::lock_guard< std::mutex > guard(_mutex);
        _watching = true;
        _changed.notify_all();
    }

    void
    wait_until_watching(void)
    {
        std::unique_lock< std::mutex > lock(_mutex);
        while (!_watching)
            _changed.wait(lock);
    }

    bool
    watching(void)
    {
        std::lock_guard< std::mutex > guard(_mutex);
        return _watching;
    }

    void
    kill_groups(void)
    {
        std::lock_guard< std::mutex > guard(_mutex);
        for (std::multiset< pid_t >::const_iterator iter = _groups.begin();
             iter != _groups.end(); ++iter) {
            LD(F("Interrupt: terminating process group %s") % *iter);
            process::terminate_group(*iter);
        }
        _groups_killed = true;
        _changed.notify_all();
    }

    void
    wait_until_killed(void)
    {
        std::unique_lock< std::mutex > lock(_mutex);
        while (!_groups_killed)
            _changed.wait(lock);
    }

    void
    track(const pid_t pgid)
    {
        std::lock_guard< std::mutex > guard(_mutex);
        _groups.insert(pgid);
    }

    void
    untrack(const pid_t pgid)
    {
        std::lock_guard< std::mutex > guard(_mutex);
        const std::multiset< pid_t >::iterator iter = _groups.find(pgid);
        if (iter != _groups.end())
            _groups.erase(iter);
    }
};


/// The watcher thread is detached and outlives main(), so the monitor is
/// never destroyed.
static interrupt_monitor& monitor = *new interrupt_monitor();


/// Records an interrupt signal for the watcher thread to act upon.
///
/// \param signo The received signal.
static void
record_signal(const int signo)
{
    monitor.pending_signo = signo;
    monitor.received += 1;
}


/// Suspends the calling thread until a signal has been handled.
static void
suspend_until_signal(void)
{
    ::sigset_t empty;
    sigemptyset(&empty);
    (void)::sigsuspend(&empty);
}


/// Body of the thread that owns signal handling.
///
/// Every other thread runs with all signals blocked.  The first interrupt
/// terminates the tracked process groups, which makes the workers waiting on
/// them return.  The next interrupt, or redeliver_to_exit(), ends the program
/// with the original signal.
static void
watch_signals(void)
{
    signals::programmer on_sighup(SIGHUP, record_signal);
    signals::programmer on_sigint(SIGINT, record_signal);
    signals::programmer on_sigterm(SIGTERM, record_signal);
    monitor.mark_watching();

    while (monitor.pending_signo == -1)
        suspend_until_signal();
    std::cerr << "[-- Interrupted; stopping running programs --]\n";
    monitor.kill_groups();

    while (!monitor.exiting && monitor.received == 1)
        suspend_until_signal();
    if (!monitor.exiting)
        std::cerr << "[-- Interrupted again; exiting now --]\n";
    const int signo = monitor.pending_signo != -1 ?
        static_cast< int >(monitor.pending_signo) : SIGINT;
    on_sigterm.unprogram();
    on_sigint.unprogram();
    on_sighup.unprogram();
    ::kill(::getpid(), signo);
}


}  // anonymous namespace


/// Raises the pending interrupt, if any.
///
/// The pending interrupt is consumed, so that cleanup code running after the
/// exception does not see it again unless a new signal arrives.  This waits
/// until the tracked process groups have been terminated.
///
/// \throw interrupted_error If an interrupt signal was received.
void
signals::check_interrupt(void)
{
    const int signo = monitor.pending_signo;
    if (signo == -1)
        return;
    monitor.wait_until_killed();
    monitor.pending_signo = -1;
    throw interrupted_error(signo);
}


/// Tracks a process group to be terminated upon interrupt.
///
/// \param pgid Leader of the process group.
void
signals::track_child_group(const pid_t pgid)
{
    monitor.track(pgid);
}


/// Stops tracking a process group; unknown groups are ignored.
///
/// \param pgid Leader of the process group.
void
signals::untrack_child_group(const pid_t pgid)
{
    monitor.untrack(pgid);
}


/// Installs the interrupt handling thread.
///
/// Must be called from the main thread before any other thread is spawned so
/// that all of them inherit a fully-blocked signal mask.
///
/// \throw signals::system_error If the signal mask cannot be changed.
void
signals::setup_interrupts(void)
{
    PRE(!monitor.watching());

    ::sigset_t all;
    sigfillset(&all);
    if (::sigprocmask(SIG_BLOCK, &all, NULL) == -1) {
        const int original_errno = errno;
        throw signals::system_error("sigprocmask(2) failed", original_errno);
    }

    std::thread watcher(watch_signals);
    watcher.detach();
    monitor.wait_until_watching();
}


/// Restores default signal handling in a freshly-forked child.
///
/// Only async-signal-safe calls are made here.
void
signals::reset_interrupts_in_new_child(void)
{
    for (std::size_t i = 0;
         i < sizeof(child_reset_signals) / sizeof(child_reset_signals[0]); ++i)
        (void)::signal(child_reset_signals[i], SIG_DFL);

    ::sigset_t empty;
    sigemptyset(&empty);
    (void)::sigprocmask(SIG_SETMASK, &empty, NULL);
}


/// Terminates the program by re-sending a caught interrupt signal.
///
/// Call from the main thread after handling interrupted_error so that the
/// exit status reflects the signal.
///
/// \param signo The signal to redeliver.
void
signals::redeliver_to_exit(const int signo)
{
    monitor.exiting = true;
    ::kill(::getpid(), signo);
    LD("Interrupt signal re-delivery did not terminate program");
}
