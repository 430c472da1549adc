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

#include "engine/report_json.hpp"

#include <cmath>

#include "model/execution_result.hpp"
#include "model/test_case.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.ipp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace text = utils::text;

using nlohmann::json;


namespace {


/// Converts an optional string to JSON.
///
/// \param value The value to convert.
///
/// \return The string or null.
static json
optional_to_json(const utils::optional< std::string >& value)
{
    if (value)
        return json(value.get());
    else
        return json(nullptr);
}


}  // anonymous namespace


/// Converts a duration to seconds, as printed in the reports.
///
/// \param delta The duration.
///
/// \return The number of seconds, with microsecond precision.
double
engine::json_seconds(const datetime::delta& delta)
{
    return static_cast< double >(delta.to_microseconds()) / 1000000.0;
}


/// Converts a ratio to a percentage rounded to two decimals.
///
/// \param ratio The ratio in the [0, 1] range.
///
/// \return The percentage in the [0, 100] range.
double
engine::json_percentage(const double ratio)
{
    return std::floor(ratio * 10000.0 + 0.5) / 100.0;
}


/// Serializes the outcome of a test case.
///
/// Inputs and outputs are printed as newline-joined strings.  The diff and
/// the exit code are only included when known.
///
/// \param outcome The test case and its result.
///
/// \return The JSON object.
json
engine::test_to_json(const model::test_outcome& outcome)
{
    const model::test_case& test_case = outcome.first;
    const model::execution_result& result = outcome.second;

    json object;
    object["input"] = text::join(test_case.input(), "\n");
    object["expected_output"] = text::join(test_case.expected_output(), "\n");
    object["output"] = text::join(result.actual_output(), "\n");
    object["error"] = optional_to_json(result.error());
    object["result"] = model::verdict_name(result.verdict());
    object["execution_time"] = json_seconds(result.execution_time());
    if (result.exit_code())
        object["exit_code"] = result.exit_code().get();
    if (result.diff()) {
        const model::output_diff& diff = result.diff().get();
        object["diff"] = {
            {"index", diff.index},
            {"expected", optional_to_json(diff.expected)},
            {"actual", optional_to_json(diff.actual)},
        };
    }
    return object;
}


/// Serializes the results of a program.
///
/// \param program The report of the program.
///
/// \return The JSON object.
json
engine::program_to_json(const model::program_report& program)
{
    json tests = json::array();
    for (model::test_outcomes_vector::const_iterator iter =
             program.tests().begin(); iter != program.tests().end(); ++iter)
        tests.push_back(test_to_json(*iter));

    json object;
    object["name"] = program.name();
    object["path"] = program.path().str();
    object["tests"] = tests;
    object["passed_tests"] = program.passed_tests();
    object["total_tests"] = program.total_tests();
    object["passed_tests_ratio"] = json_percentage(
        program.passed_tests_ratio());
    return object;
}


/// Serializes a whole suite report.
///
/// \param report The report.
///
/// \return The JSON object, with the programs under the "results" key.
json
engine::report_to_json(const model::suite_report& report)
{
    json results = json::array();
    for (model::program_reports_vector::const_iterator iter =
             report.programs().begin(); iter != report.programs().end();
         ++iter)
        results.push_back(program_to_json(*iter));

    json object;
    object["results"] = results;
    object["total_tests"] = report.total_tests();
    object["total_passed_tests"] = report.total_passed_tests();
    object["pass_rate"] = json_percentage(report.pass_rate());
    return object;
}


/// Writes a suite report as indented JSON.
///
/// Programs may print arbitrary bytes; invalid UTF-8 sequences in their
/// output are written as U+FFFD.
///
/// \param report The report to write.
/// \param output The stream into which to write the report.
void
engine::write_json_report(const model::suite_report& report,
                          std::ostream& output)
{
    output << report_to_json(report).dump(
        4, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}
