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

#include "utils/process/deadline_killer.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/process/operations.hpp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace process = utils::process;


namespace {


/// Ordered collection of PIDs by the time they have to be killed.
typedef std::multimap< datetime::timestamp, int > pids_by_deadline_map;


/// Longest single wait of the killer thread.
///
/// Deadlines further away are waited for in several steps, which keeps the
/// conversion to the clock of the standard library within its range.
static const datetime::delta max_wait(3600, 0);


/// State shared between the deadline_killer objects and the killer thread.
///
/// The killer thread is detached and may still be waiting on the condition
/// variable when the program exits, so this state is never destroyed.
struct killer_state : utils::noncopyable {
    /// Protects all other fields.
    std::mutex mutex;

    /// Signaled whenever a new deadline is registered.
    std::condition_variable deadlines_changed;

    /// True once the killer thread is running.
    bool started;

    /// PIDs that have deadline_killer objects alive ordered by deadline.
    pids_by_deadline_map pids_by_deadline;

    killer_state(void) : started(false) {}
};


/// Returns the shared state, creating it on first use.
///
/// \return A state object that lives until the program terminates.
static killer_state&
state(void)
{
    static killer_state* instance = new killer_state();
    return *instance;
}


/// Converts a timestamp to a point of the system clock.
///
/// \param timestamp The timestamp to convert.  Must not be further than
///     max_wait from now.
///
/// \return A time point usable with the standard waiting primitives.
static std::chrono::system_clock::time_point
to_time_point(const datetime::timestamp& timestamp)
{
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast< std::chrono::system_clock::duration >(
            std::chrono::microseconds(timestamp.to_microseconds())));
}


/// Thread that kills PIDs with expired deadlines.
///
/// The kills happen with the mutex held so that unschedule() cannot return
/// false for a process that is being killed at that very moment.
static void
killer_thread(void)
{
    killer_state& killer = state();
    std::unique_lock< std::mutex > lock(killer.mutex);
    for (;;) {
        const datetime::timestamp now = datetime::timestamp::now();
        pids_by_deadline_map::iterator iter =
            killer.pids_by_deadline.begin();
        while (iter != killer.pids_by_deadline.end() && !(now < iter->first)) {
            LD(F("Deadline reached for process %s") % iter->second);
            process::terminate_group(iter->second);
            killer.pids_by_deadline.erase(iter++);
        }

        if (killer.pids_by_deadline.empty()) {
            killer.deadlines_changed.wait(lock);
        } else {
            const datetime::timestamp limit = now + max_wait;
            const datetime::timestamp& next =
                killer.pids_by_deadline.begin()->first;
            killer.deadlines_changed.wait_until(
                lock, to_time_point(next < limit ? next : limit));
        }
    }
}


}  // anonymous namespace


/// Constructor.
///
/// \param delta Time to the timer activation.
/// \param pid PID of the process (and process group) to kill.
process::deadline_killer::deadline_killer(const datetime::delta& delta,
                                          const int pid) :
    _pid(pid),
    _deadline(datetime::timestamp::now() + delta)
{
    killer_state& killer = state();
    std::lock_guard< std::mutex > lock(killer.mutex);
    killer.pids_by_deadline.insert(
        pids_by_deadline_map::value_type(_deadline, pid));
    if (!killer.started) {
        std::thread thread(killer_thread);
        thread.detach();
        killer.started = true;
    }
    killer.deadlines_changed.notify_all();

    _scheduled = true;
}


/// Destructor; unschedules the PID's death if still alive.
process::deadline_killer::~deadline_killer(void)
{
    if (_scheduled)
        (void)unschedule();
}


/// Returns the absolute time at which the process is killed.
///
/// \return A timestamp.
const datetime::timestamp&
process::deadline_killer::deadline(void) const
{
    return _deadline;
}


/// Unschedules the PID's death.
///
/// This can only be called once.
///
/// \return True if the process was killed because its deadline expired; false
/// otherwise.
bool
process::deadline_killer::unschedule(void)
{
    PRE(_scheduled);

    killer_state& killer = state();
    std::lock_guard< std::mutex > lock(killer.mutex);
    bool found = false;
    std::pair< pids_by_deadline_map::iterator, pids_by_deadline_map::iterator >
        range = killer.pids_by_deadline.equal_range(_deadline);
    for (pids_by_deadline_map::iterator iter = range.first;
         iter != range.second; ++iter) {
        if (iter->second == _pid) {
            killer.pids_by_deadline.erase(iter);
            found = true;
            break;
        }
    }

    _scheduled = false;

    return !found;
}
