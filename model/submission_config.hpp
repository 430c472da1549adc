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

/// \file model/submission_config.hpp
/// Definition of the "submission configuration" concept.

#if !defined(MODEL_SUBMISSION_CONFIG_HPP)
#define MODEL_SUBMISSION_CONFIG_HPP

#include <memory>
#include <ostream>
#include <string>

#include "model/test_case_fwd.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.hpp"

namespace model {


/// Description of how to build and run a set of programs and what to test.
///
/// The path may denote a single program or a directory holding one program
/// per file.  Relative paths have already been resolved against the location
/// of the configuration file when the object is created.
class submission_config {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::shared_ptr< impl > _pimpl;

public:
    submission_config(const utils::optional< std::string >&,
                      const utils::optional< std::string >&,
                      const utils::optional< std::string >&,
                      const utils::fs::path&,
                      const test_cases_vector&);
    ~submission_config(void);

    const utils::optional< std::string >& command(void) const;
    const utils::optional< std::string >& run_command(void) const;
    const utils::optional< std::string >& compile_command(void) const;
    const utils::fs::path& path(void) const;
    const test_cases_vector& tests(void) const;

    utils::optional< std::string > effective_run_command(void) const;

    bool operator==(const submission_config&) const;
    bool operator!=(const submission_config&) const;
};


std::ostream& operator<<(std::ostream&, const submission_config&);


}  // namespace model

#endif  // !defined(MODEL_SUBMISSION_CONFIG_HPP)
