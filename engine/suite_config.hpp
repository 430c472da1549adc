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

/// \file engine/suite_config.hpp
/// Ingestion of the JSON definitions of test suites.
///
/// A suite definition names the programs to test, how to build and run them
/// and the list of test cases to feed them.  Definitions are validated in a
/// single pass and the first violation raises a config_error that names the
/// offending field.

#if !defined(ENGINE_SUITE_CONFIG_HPP)
#define ENGINE_SUITE_CONFIG_HPP

#include <istream>
#include <string>
#include <vector>

#include "model/submission_config.hpp"
#include "utils/fs/path.hpp"

namespace engine {


/// Collection of non-fatal problems found in a suite definition.
typedef std::vector< std::string > warnings_vector;


/// Collection of paths to programs under test.
typedef std::vector< utils::fs::path > paths_vector;


model::submission_config parse_suite_config(const utils::fs::path&);
model::submission_config parse_suite_config(std::istream&,
                                            const utils::fs::path&);

warnings_vector validate_suite_config(const utils::fs::path&, const bool);
warnings_vector validate_suite_config(std::istream&, const utils::fs::path&,
                                      const bool);

paths_vector list_programs(const model::submission_config&);


}  // namespace engine


#endif  // !defined(ENGINE_SUITE_CONFIG_HPP)
