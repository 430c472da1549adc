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

/// \file utils/process/deadline_killer.hpp
/// Timer to terminate a process group at a certain point in time.

#if !defined(UTILS_PROCESS_DEADLINE_KILLER_HPP)
#define UTILS_PROCESS_DEADLINE_KILLER_HPP

#include "utils/datetime.hpp"
#include "utils/noncopyable.hpp"

namespace utils {
namespace process {


/// Kills a process group when its deadline is reached.
///
/// All instances share a single background thread that sleeps until the
/// nearest deadline, so the number of live timers does not translate into a
/// number of threads.
class deadline_killer : noncopyable {
    /// PID of the process (and process group) to kill.
    const int _pid;

    /// Absolute time at which the process has to be killed.
    const datetime::timestamp _deadline;

    /// Whether the deadline is still registered.
    bool _scheduled;

public:
    deadline_killer(const datetime::delta&, const int);
    ~deadline_killer(void);

    const datetime::timestamp& deadline(void) const;

    bool unschedule(void);
};


}  // namespace process
}  // namespace utils

#endif  // !defined(UTILS_PROCESS_DEADLINE_KILLER_HPP)
