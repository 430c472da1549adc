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

/// \file utils/sanity.hpp
/// Set of macros that replace the standard assert macro with more semantical
/// expressivity and meaningful diagnostics.  Prefer these macros over assert.
///
/// The checks in this header are always enabled.  The engine deals with live
/// child processes and a programming error that goes unnoticed can leave
/// orphaned processes behind, so aborting early is preferable.

#if !defined(UTILS_SANITY_HPP)
#define UTILS_SANITY_HPP

#include <cstddef>
#include <string>

#include "utils/defs.hpp"

namespace utils {


/// Enumeration to define the assertion type.
///
/// The assertion type is used by the module to format the assertion messages
/// appropriately.
enum assert_type {
    invariant,
    postcondition,
    precondition,
    unreachable,
};


void sanity_failure(const assert_type, const char*, const size_t,
                    const std::string&) UTILS_NORETURN;


}  // namespace utils


/// Asserts that a condition holds at a generic point in the code.
#define INV(expr) \
    do { \
        if (!(expr)) \
            utils::sanity_failure(utils::invariant, __FILE__, __LINE__, \
                                  #expr); \
    } while (0)


/// Asserts that a condition holds with a user-provided message.
#define INV_MSG(expr, msg) \
    do { \
        if (!(expr)) \
            utils::sanity_failure(utils::invariant, __FILE__, __LINE__, msg); \
    } while (0)


/// Asserts that a condition holds at the entry of a function.
#define PRE(expr) \
    do { \
        if (!(expr)) \
            utils::sanity_failure(utils::precondition, __FILE__, __LINE__, \
                                  #expr); \
    } while (0)


/// Asserts that a condition holds at the entry of a function, with a message.
#define PRE_MSG(expr, msg) \
    do { \
        if (!(expr)) \
            utils::sanity_failure(utils::precondition, __FILE__, __LINE__, \
                                  msg); \
    } while (0)


/// Asserts that a condition holds at the exit of a function.
#define POST(expr) \
    do { \
        if (!(expr)) \
            utils::sanity_failure(utils::postcondition, __FILE__, __LINE__, \
                                  #expr); \
    } while (0)


/// Flags that a code path must never be reached.
#define UNREACHABLE \
    utils::sanity_failure(utils::unreachable, __FILE__, __LINE__, "")


/// Flags that a code path must never be reached, with a message.
#define UNREACHABLE_MSG(msg) \
    utils::sanity_failure(utils::unreachable, __FILE__, __LINE__, msg)


#endif  // !defined(UTILS_SANITY_HPP)
