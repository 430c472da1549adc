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

#include "model/suite_report.hpp"

namespace fs = utils::fs;


/// Constructs a new program report.
///
/// \param name_ User-visible name of the program.
/// \param path_ Path to the program.
/// \param tests_ Outcomes of the test cases, in test index order.
model::program_report::program_report(const std::string& name_,
                                      const fs::path& path_,
                                      const test_outcomes_vector& tests_) :
    _name(name_),
    _path(path_),
    _tests(tests_)
{
}


/// \return The user-visible name of the program.
const std::string&
model::program_report::name(void) const
{
    return _name;
}


/// \return The path to the program.
const fs::path&
model::program_report::path(void) const
{
    return _path;
}


/// \return The outcomes of the test cases, in test index order.
const model::test_outcomes_vector&
model::program_report::tests(void) const
{
    return _tests;
}


/// Counts the test cases with a MATCH verdict.
///
/// \return The number of passed test cases.
std::size_t
model::program_report::passed_tests(void) const
{
    std::size_t count = 0;
    for (test_outcomes_vector::const_iterator iter = _tests.begin();
         iter != _tests.end(); ++iter) {
        if ((*iter).second.passed())
            ++count;
    }
    return count;
}


/// \return The number of test cases run against the program.
std::size_t
model::program_report::total_tests(void) const
{
    return _tests.size();
}


/// Computes the pass ratio of the program.
///
/// \return A value between 0 and 1; 0 if no test cases were run.
double
model::program_report::passed_tests_ratio(void) const
{
    if (_tests.empty())
        return 0.0;
    return static_cast< double >(passed_tests()) / total_tests();
}


/// Constructs a new suite report.
///
/// \param programs_ Reports of the programs, sorted by program.
model::suite_report::suite_report(const program_reports_vector& programs_) :
    _programs(programs_)
{
}


/// \return The reports of the programs, sorted by program.
const model::program_reports_vector&
model::suite_report::programs(void) const
{
    return _programs;
}


/// \return The number of test cases run across all programs.
std::size_t
model::suite_report::total_tests(void) const
{
    std::size_t count = 0;
    for (program_reports_vector::const_iterator iter = _programs.begin();
         iter != _programs.end(); ++iter)
        count += (*iter).total_tests();
    return count;
}


/// \return The number of passed test cases across all programs.
std::size_t
model::suite_report::total_passed_tests(void) const
{
    std::size_t count = 0;
    for (program_reports_vector::const_iterator iter = _programs.begin();
         iter != _programs.end(); ++iter)
        count += (*iter).passed_tests();
    return count;
}


/// Computes the pass rate of the whole run.
///
/// \return A value between 0 and 1; 0 if no test cases were run.
double
model::suite_report::pass_rate(void) const
{
    const std::size_t total = total_tests();
    if (total == 0)
        return 0.0;
    return static_cast< double >(total_passed_tests()) / total;
}


/// Checks whether every test case of every program passed.
///
/// \return True if all verdicts are MATCH.  An empty run is successful.
bool
model::suite_report::all_passed(void) const
{
    return total_passed_tests() == total_tests();
}
