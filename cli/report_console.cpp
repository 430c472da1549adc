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

#include "cli/report_console.hpp"

#include <string>

#include "cli/common.hpp"
#include "model/execution_result.hpp"
#include "model/test_case.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/text/operations.ipp"

namespace cmdline = utils::cmdline;
namespace text = utils::text;


namespace {


/// Prints a block of lines under a title.
///
/// \param ui Interface to print to.
/// \param title The title of the block.
/// \param lines The lines to print; a placeholder is printed if empty.
/// \param empty_message Placeholder for an empty block.
static void
print_block(cmdline::ui* ui, const std::string& title,
            const model::lines_vector& lines, const char* empty_message)
{
    if (lines.empty()) {
        ui->out(F("    %s") % empty_message);
        return;
    }
    ui->out(F("    %s:") % title);
    for (model::lines_vector::const_iterator iter = lines.begin();
         iter != lines.end(); ++iter)
        ui->out(F("      %s") % *iter);
}


/// Formats a line of a diff, which may be missing.
///
/// \param line The line, if any.
///
/// \return The quoted line or a marker for a missing line.
static std::string
diff_line(const utils::optional< std::string >& line)
{
    if (line)
        return text::quote(line.get(), '\'');
    else
        return "(no line)";
}


}  // anonymous namespace


/// Prints the result of a single test case.
///
/// Passing tests take a single line.  Failures are followed by the details
/// needed to diagnose them.
///
/// \param ui Interface to print to.
/// \param index Zero-based index of the test case.
/// \param outcome The test case and its result.
void
cli::print_test(cmdline::ui* ui, const std::size_t index,
                const model::test_outcome& outcome)
{
    const model::test_case& test_case = outcome.first;
    const model::execution_result& result = outcome.second;

    ui->out(F("  test #%s: %s [%s]") % (index + 1) %
            model::verdict_name(result.verdict()) %
            format_delta(result.execution_time()));
    if (result.passed())
        return;

    if (result.diff()) {
        const model::output_diff& diff = result.diff().get();
        ui->out(F("    First difference at line %s: expected %s, got %s") %
                (diff.index + 1) % diff_line(diff.expected) %
                diff_line(diff.actual));
    }
    print_block(ui, "Input", test_case.input(), "No input given");
    if (result.verdict() == model::verdict_mismatch) {
        print_block(ui, "Expected output", test_case.expected_output(),
                    "No output was expected");
        print_block(ui, "Actual output", result.actual_output(),
                    "The program did not produce any output");
    }
    if (result.error()) {
        std::string message = result.error().get();
        while (!message.empty() && message[message.length() - 1] == '\n')
            message.erase(message.length() - 1);
        print_block(ui, "Error", text::split(message, '\n'),
                    "No error message");
    }
}


/// Prints the results of all the test cases of a program.
///
/// \param ui Interface to print to.
/// \param program The report of the program.
void
cli::print_program(cmdline::ui* ui, const model::program_report& program)
{
    ui->out(F("===> %s") % program.name());
    std::size_t index = 0;
    for (model::test_outcomes_vector::const_iterator iter =
             program.tests().begin(); iter != program.tests().end(); ++iter)
        print_test(ui, index++, *iter);
    ui->out(F("Results: %s/%s (%s)") % program.passed_tests() %
            program.total_tests() %
            format_percentage(program.passed_tests_ratio()));
}


/// Prints the totals of a suite.
///
/// \param ui Interface to print to.
/// \param report The report of the suite.
void
cli::print_summary(cmdline::ui* ui, const model::suite_report& report)
{
    ui->out("===> Summary");
    ui->out(F("Programs tested: %s") % report.programs().size());
    ui->out(F("Total tests: %s") % report.total_tests());
    ui->out(F("Passed: %s") % report.total_passed_tests());
    ui->out(F("Failed: %s") %
            (report.total_tests() - report.total_passed_tests()));
    ui->out(F("Overall pass rate: %s") % format_percentage(report.pass_rate()));
}


/// Prints a whole suite report.
///
/// \param ui Interface to print to.
/// \param report The report of the suite.
/// \param quiet Whether to print the totals only.
void
cli::print_report(cmdline::ui* ui, const model::suite_report& report,
                  const bool quiet)
{
    if (!quiet) {
        for (model::program_reports_vector::const_iterator iter =
                 report.programs().begin(); iter != report.programs().end();
             ++iter) {
            print_program(ui, *iter);
            ui->out("");
        }
    }
    print_summary(ui, report);
}
