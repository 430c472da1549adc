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

/// \file engine/exceptions.hpp
/// Exception types raised by the engine module.

#if !defined(ENGINE_EXCEPTIONS_HPP)
#define ENGINE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "utils/fs/path.hpp"

namespace engine {


/// Base exception for engine errors.
class error : public std::runtime_error {
public:
    explicit error(const std::string&);
    virtual ~error(void) throw();
};


/// Error in the definition of a test suite.
///
/// These errors are raised while ingesting a suite configuration and abort
/// the whole run before any process is spawned.
class config_error : public error {
public:
    explicit config_error(const std::string&);
    virtual ~config_error(void) throw();
};


/// Error while loading the engine settings file.
class load_error : public error {
public:
    /// The file that failed to load.
    utils::fs::path file;

    /// The reason for the failure.
    std::string reason;

    explicit load_error(const utils::fs::path&, const std::string&);
    virtual ~load_error(void) throw();
};


/// Error while compiling a program before running its tests.
class compile_error : public error {
public:
    explicit compile_error(const std::string&);
    virtual ~compile_error(void) throw();
};


/// Error while starting the process of a program under test.
class spawn_error : public error {
public:
    explicit spawn_error(const std::string&);
    virtual ~spawn_error(void) throw();
};


/// Error raised once a cancelled run has reaped all of its units.
class interrupted_error : public error {
public:
    explicit interrupted_error(const std::string&);
    virtual ~interrupted_error(void) throw();
};


}  // namespace engine


#endif  // !defined(ENGINE_EXCEPTIONS_HPP)
