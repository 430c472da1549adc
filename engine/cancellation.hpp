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

/// \file engine/cancellation.hpp
/// Suite-wide cancellation of in-flight units of work.

#if !defined(ENGINE_CANCELLATION_HPP)
#define ENGINE_CANCELLATION_HPP

#include <memory>

#include "utils/noncopyable.hpp"

namespace engine {


/// Shared flag that aborts a run and kills the processes it spawned.
///
/// Units of work register the process groups they create while they drive
/// them.  Cancelling kills all registered groups at once, and any group
/// registered after the cancellation is killed immediately.
class cancellation : utils::noncopyable {
    struct impl;

    /// Pointer to the internal implementation.
    std::unique_ptr< impl > _pimpl;

public:
    cancellation(void);
    ~cancellation(void);

    void cancel(void);
    bool cancelled(void) const;

    void add_group(const int);
    void remove_group(const int);
};


}  // namespace engine


#endif  // !defined(ENGINE_CANCELLATION_HPP)
