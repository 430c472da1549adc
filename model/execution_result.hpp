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

/// \file model/execution_result.hpp
/// Definition of the outcome of running one test case against one program.

#if !defined(MODEL_EXECUTION_RESULT_HPP)
#define MODEL_EXECUTION_RESULT_HPP

#include <cstddef>
#include <ostream>
#include <string>

#include "model/test_case_fwd.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.hpp"

namespace model {


/// Outcome of judging a test case.
enum verdict_type {
    verdict_match,
    verdict_mismatch,
    verdict_timeout,
    verdict_error,
};


std::string verdict_name(const verdict_type);


/// First difference between the expected and the actual output.
///
/// Either line may be missing when one of the sequences is shorter than the
/// other.
struct output_diff {
    /// Zero-based index of the first mismatching line.
    std::size_t index;

    /// Expected line at the mismatching index, if any.
    utils::optional< std::string > expected;

    /// Actual line at the mismatching index, if any.
    utils::optional< std::string > actual;

    output_diff(const std::size_t, const utils::optional< std::string >&,
                const utils::optional< std::string >&);

    bool operator==(const output_diff&) const;
    bool operator!=(const output_diff&) const;
};


std::ostream& operator<<(std::ostream&, const output_diff&);


/// Result of running one test case against one program.
class execution_result {
    /// The verdict of the test case.
    verdict_type _verdict;

    /// Lines captured from the standard output of the program.
    lines_vector _actual_output;

    /// Error message; the captured stderr or the reason of a failure.
    utils::optional< std::string > _error;

    /// Wall-clock time taken by the program.
    utils::datetime::delta _execution_time;

    /// Exit code of the program, if it exited on its own.
    utils::optional< int > _exit_code;

    /// First difference found by the comparison, if any.
    utils::optional< output_diff > _diff;

public:
    execution_result(const verdict_type, const lines_vector&,
                     const utils::optional< std::string >&,
                     const utils::datetime::delta&,
                     const utils::optional< int >& = utils::none,
                     const utils::optional< output_diff >& = utils::none);

    verdict_type verdict(void) const;
    const lines_vector& actual_output(void) const;
    const utils::optional< std::string >& error(void) const;
    const utils::datetime::delta& execution_time(void) const;
    const utils::optional< int >& exit_code(void) const;
    const utils::optional< output_diff >& diff(void) const;

    bool passed(void) const;

    bool operator==(const execution_result&) const;
    bool operator!=(const execution_result&) const;
};


std::ostream& operator<<(std::ostream&, const execution_result&);


}  // namespace model

#endif  // !defined(MODEL_EXECUTION_RESULT_HPP)
