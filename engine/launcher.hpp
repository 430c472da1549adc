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

/// \file engine/launcher.hpp
/// Preparation and startup of the programs under test.

#if !defined(ENGINE_LAUNCHER_HPP)
#define ENGINE_LAUNCHER_HPP

#include <memory>
#include <string>

#include "engine/config.hpp"
#include "model/submission_config.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.hpp"
#include "utils/process/operations.hpp"

namespace utils {
namespace process {
class child;
}  // namespace process
}  // namespace utils

namespace engine {


class cancellation;


utils::process::args_vector build_command(
    const utils::optional< std::string >&, const utils::fs::path&);

std::string expand_compile_command(const std::string&, const utils::fs::path&,
                                   const utils::fs::path&);


/// Builds and spawns the programs of a suite.
///
/// A launcher is shared by all the units of work of a suite and is stateless
/// once constructed, so its methods can be called concurrently.
class launcher {
    /// Definition of the suite.
    model::submission_config _submission;

    /// Settings of the engine.
    engine::config _config;

    /// Directory in which to place compiled artifacts.
    utils::fs::path _build_root;

    /// Suite-wide cancellation; may be NULL.
    cancellation* _cancellation;

public:
    launcher(const model::submission_config&, const engine::config&,
             const utils::fs::path&, cancellation* = NULL);

    bool needs_compilation(void) const;
    utils::fs::path compile(const utils::fs::path&) const;
    std::unique_ptr< utils::process::child > spawn(
        const utils::fs::path&) const;
};


}  // namespace engine


#endif  // !defined(ENGINE_LAUNCHER_HPP)
