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

/// \file engine/config.hpp
/// Settings of the execution engine and their configuration file.

#if !defined(ENGINE_CONFIG_HPP)
#define ENGINE_CONFIG_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"

namespace engine {


/// An override for a configuration property in the form of a key/value pair.
typedef std::pair< std::string, std::string > override_pair;


/// Collection of key/value string pairs describing the settings.
typedef std::map< std::string, std::string > properties_map;


/// Runtime knobs of the execution engine.
///
/// Configuration files are Lua scripts that start with a call to
/// syntax("config", 1) and then assign the global variables named after the
/// fields of this structure.
struct config {
    /// Maximum number of units of work to run concurrently.
    std::size_t parallelism;

    /// Time without output after which an interactive program is assumed to
    /// be waiting for input.
    utils::datetime::delta quiescence;

    /// Maximum time a compile command is allowed to run.
    utils::datetime::delta compile_timeout;

    /// Maximum number of bytes captured from a program before killing it.
    std::size_t max_output_bytes;

    config(const std::size_t, const utils::datetime::delta&,
           const utils::datetime::delta&, const std::size_t);

    static config defaults(void);
    static config load(const utils::fs::path&);

    config apply_overrides(const std::vector< override_pair >&) const;

    properties_map all_properties(void) const;

    bool operator==(const config&) const;
    bool operator!=(const config&) const;
};


}  // namespace engine


#endif  // !defined(ENGINE_CONFIG_HPP)
