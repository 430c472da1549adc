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

/// \file cli/config.hpp
/// Utilities to load the configuration files.
///
/// Configuration files are searched for in the following order: the path
/// given with --config, the user's home directory and the system-wide
/// configuration directory.  A missing file results in the built-in defaults.

#if !defined(CLI_CONFIG_HPP)
#define CLI_CONFIG_HPP

#include "engine/config.hpp"
#include "utils/cmdline/options.hpp"

namespace utils {
namespace cmdline {
class parsed_cmdline;
}  // namespace cmdline
namespace fs {
class path;
}  // namespace fs
}  // namespace utils

namespace cli {


extern const utils::cmdline::path_option config_option;
extern const utils::cmdline::property_option variable_option;


engine::config load_config(const utils::cmdline::parsed_cmdline&,
                           const bool);


namespace detail {


utils::fs::path system_config_path(void);
void set_confdir_for_testing(const utils::fs::path&);


}  // namespace detail


}  // namespace cli

#endif  // !defined(CLI_CONFIG_HPP)
