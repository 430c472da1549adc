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

#include "engine/suite_runner.hpp"

#include <cmath>
#include <vector>

#include <atf-c++.hpp>

#include "engine/exceptions.hpp"
#include "model/test_case.hpp"
#include "utils/datetime.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;

using utils::none;
using utils::optional;


namespace {


/// Program that greets and then prints the sum and the product of two numbers.
static const char* calculator =
    "read a\n"
    "read b\n"
    "echo 'Hello World'\n"
    "echo $((a + b))\n"
    "echo $((a * b))\n";


/// Same as calculator but with a broken multiplication.
static const char* buggy_calculator =
    "read a\n"
    "read b\n"
    "echo 'Hello World'\n"
    "echo $((a + b))\n"
    "echo $((a + b))\n";


/// Builds a test case for the calculator programs.
///
/// \param a The first operand.
/// \param b The second operand.
///
/// \return A test case expecting the correct results.
static model::test_case
calculator_test(const int a, const int b)
{
    return model::test_case_builder()
        .add_input(F("%s") % a)
        .add_input(F("%s") % b)
        .add_expected_output("Hello World")
        .add_expected_output(F("%s") % (a + b))
        .add_expected_output(F("%s") % (a * b))
        .set_timeout(datetime::delta(10, 0))
        .build();
}


/// Builds a test case without input.
///
/// \param expected The single expected line.
/// \param seconds The timeout in seconds.
///
/// \return The test case.
static model::test_case
simple_test(const char* expected, const int seconds = 10)
{
    return model::test_case_builder()
        .add_expected_output(expected)
        .set_timeout(datetime::delta(seconds, 0))
        .build();
}


/// Builds a suite that runs the programs in a directory with /bin/sh.
///
/// \param path The file or directory with the programs.
/// \param tests The test cases.
/// \param compile_command The compile command, if any.
///
/// \return The suite definition.
static model::submission_config
shell_suite(const char* path, const model::test_cases_vector& tests,
            const optional< std::string >& compile_command = none)
{
    return model::submission_config(
        utils::make_optional(std::string("/bin/sh")), none, compile_command,
        fs::path(path).to_absolute(), tests);
}


/// Builds an engine configuration with a given parallelism.
///
/// \param parallelism The number of workers.
///
/// \return The configuration.
static engine::config
make_config(const std::size_t parallelism)
{
    const engine::config defaults = engine::config::defaults();
    return engine::config(parallelism, defaults.quiescence,
                          defaults.compile_timeout, defaults.max_output_bytes);
}


/// Hooks that record the calls they receive.
class recording_hooks : public engine::suite_hooks {
public:
    /// Leaf names of the programs that were compiled, with their status.
    std::vector< std::string > compilations;

    /// Program leaf names and test indexes of the results received.
    std::vector< std::string > results;

    /// Records the compilation of a program.
    ///
    /// \param program The program.
    /// \param error The failure, if any.
    void
    compiled_program(const fs::path& program,
                     const optional< std::string >& error)
    {
        compilations.push_back(program.leaf_name() + (error ? ":fail" : ":ok"));
    }

    /// Records a result.
    ///
    /// \param program The program.
    /// \param index The index of the test.
    /// \param unused_test_case The test case.
    /// \param result The result.
    void
    got_result(const fs::path& program, const std::size_t index,
               const model::test_case& UTILS_UNUSED_PARAM(test_case),
               const model::execution_result& result)
    {
        results.push_back(F("%s#%s:%s") % program.leaf_name() % index %
                          model::verdict_name(result.verdict()));
    }
};


/// Hooks that cancel the run upon receiving the first result.
class cancelling_hooks : public engine::suite_hooks {
    /// The runner to cancel.
    engine::suite_runner& _runner;

public:
    /// Constructor.
    ///
    /// \param runner_ The runner to cancel.
    explicit cancelling_hooks(engine::suite_runner& runner_) :
        _runner(runner_)
    {
    }

    /// Cancels the run.
    void
    got_result(const fs::path& UTILS_UNUSED_PARAM(program),
               const std::size_t UTILS_UNUSED_PARAM(index),
               const model::test_case& UTILS_UNUSED_PARAM(test_case),
               const model::execution_result& UTILS_UNUSED_PARAM(result))
    {
        _runner.cancel();
    }
};


}  // anonymous namespace


ATF_TEST_CASE(all_match);
ATF_TEST_CASE_HEAD(all_match)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(all_match)
{
    atf::utils::create_file("calculator.sh", calculator);
    model::test_cases_vector tests;
    tests.push_back(calculator_test(5, 3));
    tests.push_back(calculator_test(2, 2));
    tests.push_back(calculator_test(1, 4));

    engine::suite_runner runner(shell_suite("calculator.sh", tests),
                                make_config(2), fs::path("."));
    const model::suite_report report = runner.run();

    ATF_REQUIRE_EQ(1, report.programs().size());
    const model::program_report& program = report.programs()[0];
    ATF_REQUIRE_EQ("calculator.sh", program.name());
    ATF_REQUIRE_EQ(3, program.passed_tests());
    ATF_REQUIRE_EQ(3, program.total_tests());
    ATF_REQUIRE_EQ(1.0, program.passed_tests_ratio());
    ATF_REQUIRE(report.all_passed());

    const model::execution_result& first = program.tests()[0].second;
    ATF_REQUIRE_EQ(model::verdict_match, first.verdict());
    ATF_REQUIRE_EQ(3, first.actual_output().size());
    ATF_REQUIRE_EQ("15", first.actual_output()[2]);
    ATF_REQUIRE(first.exit_code());
    ATF_REQUIRE_EQ(0, first.exit_code().get());
}


ATF_TEST_CASE(partial_match);
ATF_TEST_CASE_HEAD(partial_match)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(partial_match)
{
    atf::utils::create_file("buggy.sh", buggy_calculator);
    model::test_cases_vector tests;
    tests.push_back(calculator_test(5, 3));
    tests.push_back(calculator_test(2, 2));
    tests.push_back(calculator_test(1, 4));

    engine::suite_runner runner(shell_suite("buggy.sh", tests),
                                make_config(4), fs::path("."));
    const model::suite_report report = runner.run();

    const model::program_report& program = report.programs()[0];
    ATF_REQUIRE_EQ(1, program.passed_tests());
    ATF_REQUIRE_EQ(3, program.total_tests());
    ATF_REQUIRE(std::fabs(program.passed_tests_ratio() - 1.0 / 3) < 0.0001);
    ATF_REQUIRE(!report.all_passed());

    ATF_REQUIRE_EQ(model::verdict_mismatch,
                   program.tests()[0].second.verdict());
    ATF_REQUIRE_EQ(model::verdict_match, program.tests()[1].second.verdict());
    ATF_REQUIRE_EQ(model::verdict_mismatch,
                   program.tests()[2].second.verdict());

    const optional< model::output_diff >& diff =
        program.tests()[0].second.diff();
    ATF_REQUIRE(diff);
    ATF_REQUIRE_EQ(2, diff.get().index);
    ATF_REQUIRE_EQ("15", diff.get().expected.get());
    ATF_REQUIRE_EQ("8", diff.get().actual.get());
}


ATF_TEST_CASE(directory_of_programs);
ATF_TEST_CASE_HEAD(directory_of_programs)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(directory_of_programs)
{
    fs::mkdir(fs::path("programs"), 0755);
    atf::utils::create_file("programs/b.sh", buggy_calculator);
    atf::utils::create_file("programs/a.sh", calculator);
    atf::utils::create_file("programs/.hidden.sh", "exit 1\n");
    model::test_cases_vector tests;
    tests.push_back(calculator_test(5, 3));
    tests.push_back(calculator_test(2, 2));

    recording_hooks hooks;
    engine::suite_runner runner(shell_suite("programs", tests),
                                make_config(3), fs::path("."));
    const model::suite_report report = runner.run(&hooks);

    ATF_REQUIRE_EQ(2, report.programs().size());
    ATF_REQUIRE_EQ("a.sh", report.programs()[0].name());
    ATF_REQUIRE_EQ(2, report.programs()[0].passed_tests());
    ATF_REQUIRE_EQ("b.sh", report.programs()[1].name());
    ATF_REQUIRE_EQ(1, report.programs()[1].passed_tests());
    ATF_REQUIRE_EQ(4, report.total_tests());
    ATF_REQUIRE_EQ(3, report.total_passed_tests());

    ATF_REQUIRE(hooks.compilations.empty());
    ATF_REQUIRE_EQ(4, hooks.results.size());
}


ATF_TEST_CASE(compile_failure);
ATF_TEST_CASE_HEAD(compile_failure)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(compile_failure)
{
    fs::mkdir(fs::path("programs"), 0755);
    atf::utils::create_file("programs/bad.sh",
                            "touch bad-was-run\necho Hello\n");
    atf::utils::create_file("programs/good.sh", "echo Hello\n");
    model::test_cases_vector tests;
    tests.push_back(simple_test("Hello"));
    tests.push_back(simple_test("Hello"));

    recording_hooks hooks;
    engine::suite_runner runner(
        shell_suite("programs", tests, utils::make_optional(std::string(
            "case {source} in "
            "*/bad.sh) echo 'bad.sh:1: error' >&2; exit 1;; "
            "esac; cp {source} {output}"))),
        make_config(2), fs::path("."));
    const model::suite_report report = runner.run(&hooks);

    ATF_REQUIRE_EQ(2, report.programs().size());
    const model::program_report& bad = report.programs()[0];
    ATF_REQUIRE_EQ("bad.sh", bad.name());
    ATF_REQUIRE_EQ(0, bad.passed_tests());
    for (model::test_outcomes_vector::const_iterator iter =
             bad.tests().begin(); iter != bad.tests().end(); ++iter) {
        ATF_REQUIRE_EQ(model::verdict_error, (*iter).second.verdict());
        ATF_REQUIRE((*iter).second.actual_output().empty());
        ATF_REQUIRE_MATCH("bad.sh:1: error", (*iter).second.error().get());
    }
    ATF_REQUIRE(!fs::exists(fs::path("bad-was-run")));

    const model::program_report& good = report.programs()[1];
    ATF_REQUIRE_EQ("good.sh", good.name());
    ATF_REQUIRE_EQ(2, good.passed_tests());

    ATF_REQUIRE_EQ(2, hooks.compilations.size());
    ATF_REQUIRE_EQ(4, hooks.results.size());
}


ATF_TEST_CASE(mixed_verdicts);
ATF_TEST_CASE_HEAD(mixed_verdicts)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(mixed_verdicts)
{
    atf::utils::create_file(
        "prog.sh",
        "read what\n"
        "case $what in\n"
        "list) echo C; echo A; echo B ;;\n"
        "result) echo 'Result: 42' ;;\n"
        "hang) sleep 60 ;;\n"
        "crash) echo oops >&2; exit 5 ;;\n"
        "esac\n");

    model::test_cases_vector tests;
    tests.push_back(model::test_case_builder()
                    .add_input("list")
                    .add_expected_output("A")
                    .add_expected_output("B")
                    .add_expected_output("C")
                    .set_unordered(true)
                    .set_timeout(datetime::delta(10, 0))
                    .build());
    tests.push_back(model::test_case_builder()
                    .add_input("result")
                    .add_expected_output("Result: \\d+")
                    .set_use_regex(true)
                    .set_timeout(datetime::delta(10, 0))
                    .build());
    tests.push_back(model::test_case_builder()
                    .add_input("hang")
                    .set_timeout(datetime::delta(1, 0))
                    .build());
    tests.push_back(model::test_case_builder()
                    .add_input("crash")
                    .add_expected_output("fine")
                    .set_timeout(datetime::delta(10, 0))
                    .build());

    engine::suite_runner runner(shell_suite("prog.sh", tests),
                                make_config(4), fs::path("."));
    const model::suite_report report = runner.run();
    const model::test_outcomes_vector& outcomes =
        report.programs()[0].tests();

    ATF_REQUIRE_EQ(model::verdict_match, outcomes[0].second.verdict());
    ATF_REQUIRE_EQ(model::verdict_match, outcomes[1].second.verdict());

    ATF_REQUIRE_EQ(model::verdict_timeout, outcomes[2].second.verdict());
    ATF_REQUIRE_MATCH("Timed out after 1.00s",
                      outcomes[2].second.error().get());
    ATF_REQUIRE(outcomes[2].second.execution_time() < datetime::delta(3, 0));

    ATF_REQUIRE_EQ(model::verdict_mismatch, outcomes[3].second.verdict());
    ATF_REQUIRE_EQ("oops\n", outcomes[3].second.error().get());
    ATF_REQUIRE_EQ(5, outcomes[3].second.exit_code().get());

    ATF_REQUIRE_EQ(2, report.total_passed_tests());
}


ATF_TEST_CASE(missing_interpreter);
ATF_TEST_CASE_HEAD(missing_interpreter)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(missing_interpreter)
{
    atf::utils::create_file("prog.py", "print('hi')\n");
    model::test_cases_vector tests;
    tests.push_back(simple_test("hi"));

    const model::submission_config submission(
        utils::make_optional(std::string("/nonexistent/python")), none, none,
        fs::path("prog.py").to_absolute(), tests);
    engine::suite_runner runner(submission, make_config(1), fs::path("."));
    const model::suite_report report = runner.run();

    const model::execution_result& result =
        report.programs()[0].tests()[0].second;
    ATF_REQUIRE_EQ(model::verdict_error, result.verdict());
    ATF_REQUIRE_MATCH("Failed to execute", result.error().get());
}


ATF_TEST_CASE(runs_in_parallel);
ATF_TEST_CASE_HEAD(runs_in_parallel)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(runs_in_parallel)
{
    atf::utils::create_file("slow.sh", "sleep 2\necho done\n");
    model::test_cases_vector tests;
    for (int i = 0; i < 4; ++i)
        tests.push_back(simple_test("done"));

    engine::suite_runner runner(shell_suite("slow.sh", tests),
                                make_config(4), fs::path("."));
    const datetime::timestamp start = datetime::timestamp::now();
    const model::suite_report report = runner.run();
    const datetime::delta elapsed = datetime::timestamp::now() - start;

    ATF_REQUIRE(report.all_passed());
    ATF_REQUIRE(elapsed < datetime::delta(6, 0));
}


ATF_TEST_CASE(cancel);
ATF_TEST_CASE_HEAD(cancel)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(cancel)
{
    atf::utils::create_file("prog.sh",
                            "read what\n"
                            "[ \"$what\" = fast ] || sleep 60\n"
                            "echo done\n");
    model::test_cases_vector tests;
    tests.push_back(model::test_case_builder().add_input("fast")
                    .set_timeout(datetime::delta(50, 0)).build());
    tests.push_back(model::test_case_builder().add_input("slow")
                    .set_timeout(datetime::delta(50, 0)).build());

    engine::suite_runner runner(shell_suite("prog.sh", tests),
                                make_config(2), fs::path("."));
    cancelling_hooks hooks(runner);
    const datetime::timestamp start = datetime::timestamp::now();
    ATF_REQUIRE_THROW_RE(engine::interrupted_error, "cancelled",
                         runner.run(&hooks));
    ATF_REQUIRE(datetime::timestamp::now() - start < datetime::delta(20, 0));
}


ATF_TEST_CASE_WITHOUT_HEAD(missing_path);
ATF_TEST_CASE_BODY(missing_path)
{
    model::test_cases_vector tests;
    tests.push_back(simple_test("x"));
    engine::suite_runner runner(shell_suite("missing", tests),
                                make_config(1), fs::path("."));
    ATF_REQUIRE_THROW_RE(engine::config_error, "does not exist",
                         runner.run());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, all_match);
    ATF_ADD_TEST_CASE(tcs, partial_match);
    ATF_ADD_TEST_CASE(tcs, directory_of_programs);
    ATF_ADD_TEST_CASE(tcs, compile_failure);
    ATF_ADD_TEST_CASE(tcs, mixed_verdicts);
    ATF_ADD_TEST_CASE(tcs, missing_interpreter);
    ATF_ADD_TEST_CASE(tcs, runs_in_parallel);
    ATF_ADD_TEST_CASE(tcs, cancel);
    ATF_ADD_TEST_CASE(tcs, missing_path);
}
