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
#include <vector>

#include <atf-c++.hpp>

#include "model/execution_result.hpp"
#include "model/test_case.hpp"
#include "utils/cmdline/ui_mock.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"

namespace cmdline = utils::cmdline;
namespace datetime = utils::datetime;
namespace fs = utils::fs;

using utils::none;


namespace {


/// Builds a test case with one line of input and two of expected output.
///
/// \return The test case.
static model::test_case
sample_test(void)
{
    return model::test_case_builder()
        .add_input("5")
        .add_expected_output("a")
        .add_expected_output("b")
        .build();
}


/// Builds an output vector from two lines.
///
/// \param first The first line.
/// \param second The second line.
///
/// \return The lines.
static model::lines_vector
two_lines(const char* first, const char* second)
{
    model::lines_vector lines;
    lines.push_back(first);
    lines.push_back(second);
    return lines;
}


/// Builds a program report with one passing and one failing test.
///
/// \return The report.
static model::program_report
sample_program(void)
{
    model::test_outcomes_vector tests;
    tests.push_back(std::make_pair(sample_test(), model::execution_result(
        model::verdict_match, two_lines("a", "b"), none,
        datetime::delta(0, 250000), utils::make_optional(0))));
    tests.push_back(std::make_pair(sample_test(), model::execution_result(
        model::verdict_mismatch, two_lines("a", "c"), none,
        datetime::delta(0, 100000), utils::make_optional(0),
        utils::make_optional(model::output_diff(
            1, utils::make_optional(std::string("b")),
            utils::make_optional(std::string("c")))))));
    return model::program_report("prog.sh", fs::path("dir/prog.sh"), tests);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(print_test__match);
ATF_TEST_CASE_BODY(print_test__match)
{
    cmdline::ui_mock ui;
    cli::print_test(&ui, 3, std::make_pair(
        sample_test(), model::execution_result(
            model::verdict_match, two_lines("a", "b"), none,
            datetime::delta(1, 5000))));
    ATF_REQUIRE_EQ(1, ui.out_log().size());
    ATF_REQUIRE_EQ("  test #4: MATCH [1.005s]", ui.out_log()[0]);
    ATF_REQUIRE(ui.err_log().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(print_test__mismatch);
ATF_TEST_CASE_BODY(print_test__mismatch)
{
    cmdline::ui_mock ui;
    cli::print_test(&ui, 1, sample_program().tests()[1]);

    std::vector< std::string > exp;
    exp.push_back("  test #2: MISMATCH [0.100s]");
    exp.push_back("    First difference at line 2: expected 'b', got 'c'");
    exp.push_back("    Input:");
    exp.push_back("      5");
    exp.push_back("    Expected output:");
    exp.push_back("      a");
    exp.push_back("      b");
    exp.push_back("    Actual output:");
    exp.push_back("      a");
    exp.push_back("      c");
    ATF_REQUIRE(exp == ui.out_log());
}


ATF_TEST_CASE_WITHOUT_HEAD(print_test__missing_line);
ATF_TEST_CASE_BODY(print_test__missing_line)
{
    model::lines_vector output;
    output.push_back("a");

    cmdline::ui_mock ui;
    cli::print_test(&ui, 0, std::make_pair(
        sample_test(), model::execution_result(
            model::verdict_mismatch, output, none, datetime::delta(),
            utils::make_optional(0),
            utils::make_optional(model::output_diff(
                1, utils::make_optional(std::string("b")), none)))));
    ATF_REQUIRE_EQ("    First difference at line 2: expected 'b', got "
                   "(no line)", ui.out_log()[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(print_test__error);
ATF_TEST_CASE_BODY(print_test__error)
{
    const model::test_case test_case = model::test_case_builder()
        .add_expected_output("a").build();

    cmdline::ui_mock ui;
    cli::print_test(&ui, 0, std::make_pair(
        test_case, model::execution_result(
            model::verdict_error, model::lines_vector(),
            utils::make_optional(std::string("First\nSecond\n")),
            datetime::delta())));

    std::vector< std::string > exp;
    exp.push_back("  test #1: ERROR [0.000s]");
    exp.push_back("    No input given");
    exp.push_back("    Error:");
    exp.push_back("      First");
    exp.push_back("      Second");
    ATF_REQUIRE(exp == ui.out_log());
}


ATF_TEST_CASE_WITHOUT_HEAD(print_test__timeout);
ATF_TEST_CASE_BODY(print_test__timeout)
{
    cmdline::ui_mock ui;
    cli::print_test(&ui, 0, std::make_pair(
        sample_test(), model::execution_result(
            model::verdict_timeout, model::lines_vector(),
            utils::make_optional(std::string("Timed out after 1.00s")),
            datetime::delta(1, 0))));

    std::vector< std::string > exp;
    exp.push_back("  test #1: TIMEOUT [1.000s]");
    exp.push_back("    Input:");
    exp.push_back("      5");
    exp.push_back("    Error:");
    exp.push_back("      Timed out after 1.00s");
    ATF_REQUIRE(exp == ui.out_log());
}


ATF_TEST_CASE_WITHOUT_HEAD(print_program);
ATF_TEST_CASE_BODY(print_program)
{
    cmdline::ui_mock ui;
    cli::print_program(&ui, sample_program());
    ATF_REQUIRE_EQ(13, ui.out_log().size());
    ATF_REQUIRE_EQ("===> prog.sh", ui.out_log()[0]);
    ATF_REQUIRE_EQ("  test #1: MATCH [0.250s]", ui.out_log()[1]);
    ATF_REQUIRE_EQ("  test #2: MISMATCH [0.100s]", ui.out_log()[2]);
    ATF_REQUIRE_EQ("Results: 1/2 (50.00%)", ui.out_log()[12]);
}


ATF_TEST_CASE_WITHOUT_HEAD(print_report__quiet);
ATF_TEST_CASE_BODY(print_report__quiet)
{
    model::program_reports_vector programs;
    programs.push_back(sample_program());
    programs.push_back(sample_program());

    cmdline::ui_mock ui;
    cli::print_report(&ui, model::suite_report(programs), true);

    std::vector< std::string > exp;
    exp.push_back("===> Summary");
    exp.push_back("Programs tested: 2");
    exp.push_back("Total tests: 4");
    exp.push_back("Passed: 2");
    exp.push_back("Failed: 2");
    exp.push_back("Overall pass rate: 50.00%");
    ATF_REQUIRE(exp == ui.out_log());
}


ATF_TEST_CASE_WITHOUT_HEAD(print_report__verbose);
ATF_TEST_CASE_BODY(print_report__verbose)
{
    model::program_reports_vector programs;
    programs.push_back(sample_program());

    cmdline::ui_mock ui;
    cli::print_report(&ui, model::suite_report(programs), false);
    ATF_REQUIRE_EQ(13 + 1 + 6, ui.out_log().size());
    ATF_REQUIRE_EQ("===> prog.sh", ui.out_log()[0]);
    ATF_REQUIRE_EQ("", ui.out_log()[13]);
    ATF_REQUIRE_EQ("===> Summary", ui.out_log()[14]);
    ATF_REQUIRE_EQ("Overall pass rate: 50.00%", ui.out_log()[19]);
}


ATF_TEST_CASE_WITHOUT_HEAD(print_report__empty);
ATF_TEST_CASE_BODY(print_report__empty)
{
    cmdline::ui_mock ui;
    cli::print_report(&ui, model::suite_report(
        model::program_reports_vector()), false);
    ATF_REQUIRE_EQ(6, ui.out_log().size());
    ATF_REQUIRE_EQ("Total tests: 0", ui.out_log()[2]);
    ATF_REQUIRE_EQ("Overall pass rate: 0.00%", ui.out_log()[5]);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, print_test__match);
    ATF_ADD_TEST_CASE(tcs, print_test__mismatch);
    ATF_ADD_TEST_CASE(tcs, print_test__missing_line);
    ATF_ADD_TEST_CASE(tcs, print_test__error);
    ATF_ADD_TEST_CASE(tcs, print_test__timeout);
    ATF_ADD_TEST_CASE(tcs, print_program);
    ATF_ADD_TEST_CASE(tcs, print_report__quiet);
    ATF_ADD_TEST_CASE(tcs, print_report__verbose);
    ATF_ADD_TEST_CASE(tcs, print_report__empty);
}
