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

#include "engine/cancellation.hpp"

#include <atomic>
#include <mutex>
#include <set>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/process/operations.hpp"

namespace process = utils::process;


/// Internal implementation of the cancellation.
struct engine::cancellation::impl : utils::noncopyable {
    /// Whether cancel() has been called.
    std::atomic_bool cancelled;

    /// Protects the groups collection.
    std::mutex mutex;

    /// Process groups currently owned by units of work.
    std::multiset< int > groups;

    /// Constructor.
    impl(void) : cancelled(false)
    {
    }
};


/// Constructs a new non-cancelled object.
engine::cancellation::cancellation(void) :
    _pimpl(new impl())
{
}


/// Destructor.
engine::cancellation::~cancellation(void)
{
}


/// Cancels the run and kills all registered process groups.
void
engine::cancellation::cancel(void)
{
    std::lock_guard< std::mutex > guard(_pimpl->mutex);
    if (_pimpl->cancelled)
        return;
    LI(F("Cancelling run; killing %s process groups") %
       _pimpl->groups.size());
    _pimpl->cancelled = true;
    for (std::multiset< int >::const_iterator iter = _pimpl->groups.begin();
         iter != _pimpl->groups.end(); ++iter)
        process::terminate_group(*iter);
}


/// Checks whether the run has been cancelled.
///
/// \return True if cancel() has been called.
bool
engine::cancellation::cancelled(void) const
{
    return _pimpl->cancelled;
}


/// Registers a process group to be killed on cancellation.
///
/// \param pgid The process group identifier.
void
engine::cancellation::add_group(const int pgid)
{
    std::lock_guard< std::mutex > guard(_pimpl->mutex);
    _pimpl->groups.insert(pgid);
    if (_pimpl->cancelled)
        process::terminate_group(pgid);
}


/// Unregisters a process group.
///
/// \param pgid The process group identifier, previously passed to add_group.
void
engine::cancellation::remove_group(const int pgid)
{
    std::lock_guard< std::mutex > guard(_pimpl->mutex);
    const std::multiset< int >::iterator iter = _pimpl->groups.find(pgid);
    if (iter != _pimpl->groups.end())
        _pimpl->groups.erase(iter);
}
