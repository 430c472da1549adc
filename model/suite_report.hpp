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

/// \file model/suite_report.hpp
/// Aggregation of the results of a run.

#if !defined(MODEL_SUITE_REPORT_HPP)
#define MODEL_SUITE_REPORT_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "model/execution_result.hpp"
#include "model/test_case.hpp"
#include "utils/fs/path.hpp"

namespace model {


/// A test case along with the result of running it.
typedef std::pair< test_case, execution_result > test_outcome;


/// Collection of test outcomes in test index order.
typedef std::vector< test_outcome > test_outcomes_vector;


/// Results of all the test cases of one program.
class program_report {
    /// User-visible name of the program; its file name.
    std::string _name;

    /// Path to the program.
    utils::fs::path _path;

    /// Outcomes of the test cases, in test index order.
    test_outcomes_vector _tests;

public:
    program_report(const std::string&, const utils::fs::path&,
                   const test_outcomes_vector&);

    const std::string& name(void) const;
    const utils::fs::path& path(void) const;
    const test_outcomes_vector& tests(void) const;

    std::size_t passed_tests(void) const;
    std::size_t total_tests(void) const;
    double passed_tests_ratio(void) const;
};


/// Collection of program reports in program order.
typedef std::vector< program_report > program_reports_vector;


/// Aggregate of the results of a whole run.
class suite_report {
    /// Reports of the programs, sorted by program.
    program_reports_vector _programs;

public:
    explicit suite_report(const program_reports_vector&);

    const program_reports_vector& programs(void) const;

    std::size_t total_tests(void) const;
    std::size_t total_passed_tests(void) const;
    double pass_rate(void) const;
    bool all_passed(void) const;
};


}  // namespace model

#endif  // !defined(MODEL_SUITE_REPORT_HPP)
