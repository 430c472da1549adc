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

/// \file cli/common.hpp
/// Utility functions to implement CLI subcommands.

#if !defined(CLI_COMMON_HPP)
#define CLI_COMMON_HPP

#include <memory>
#include <stdexcept>
#include <string>

#include "engine/config.hpp"
#include "utils/cmdline/base_command.hpp"

namespace utils {
namespace datetime {
class delta;
}  // namespace datetime
}  // namespace utils

namespace cli {


/// Exit code returned when the program detects an internal error.
extern const int exit_internal_error;


/// Exit code returned on usage errors and invalid suite definitions.
extern const int exit_usage_error;


/// Base type for commands defined in the cli module.
///
/// All commands in Testio receive the settings of the engine as loaded from
/// the configuration file and the overrides given in the command line.
typedef utils::cmdline::base_command< engine::config > cli_command;


/// Scoped, strictly owned pointer to a cli_command.
typedef std::unique_ptr< cli_command > cli_command_ptr;


std::string format_delta(const utils::datetime::delta&);
std::string format_error(const std::exception&);
std::string format_percentage(const double);


}  // namespace cli

#endif  // !defined(CLI_COMMON_HPP)
