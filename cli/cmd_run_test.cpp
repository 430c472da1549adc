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

#include "cli/cmd_run.hpp"

#include <cstdlib>
#include <fstream>

#include <atf-c++.hpp>
#include <nlohmann/json.hpp>

#include "engine/config.hpp"
#include "engine/exceptions.hpp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui_mock.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"

namespace cmdline = utils::cmdline;
namespace datetime = utils::datetime;
namespace fs = utils::fs;

using atf::utils::grep_collection;
using nlohmann::json;
using utils::optional;


namespace {


/// Creates a suite that checks the greeting of a program.
///
/// \param name Base name of the files to create.
/// \param greeting What the program prints.
static void
create_suite(const std::string& name, const std::string& greeting)
{
    atf::utils::create_file(name + ".sh", "echo " + greeting + "\n");
    atf::utils::create_file(
        name + ".json",
        "{\"command\": \"/bin/sh\", \"path\": \"" + name + ".sh\", "
        "\"tests\": [{\"output\": \"hello\", \"timeout\": 5}]}");
}


/// Runs the run command.
///
/// \param args The arguments to the command, excluding its name.
/// \param [out] ui The ui in which to capture the output.
///
/// \return The exit code of the command.
static int
run_cmd(const cmdline::args_vector& args, cmdline::ui_mock& ui)
{
    cmdline::init("progname");

    cmdline::args_vector full_args;
    full_args.push_back("run");
    full_args.insert(full_args.end(), args.begin(), args.end());

    cli::cmd_run cmd;
    return cmd.main(&ui, full_args, engine::config::defaults());
}


/// Parses the command line of the run command.
///
/// \param args The arguments to the command, excluding its name.
///
/// \return The parsed command line.
static cmdline::parsed_cmdline
parse_run(const cmdline::args_vector& args)
{
    cmdline::args_vector full_args;
    full_args.push_back("run");
    full_args.insert(full_args.end(), args.begin(), args.end());

    const cmdline::bool_option report('r', "report", "Report");
    const cmdline::path_option output('o', "output", "Output", "file");
    cmdline::options_vector options;
    options.push_back(&report);
    options.push_back(&output);
    return cmdline::parse(full_args, options);
}


}  // anonymous namespace


ATF_TEST_CASE(all_pass);
ATF_TEST_CASE_HEAD(all_pass)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(all_pass)
{
    create_suite("good", "hello");

    cmdline::args_vector args;
    args.push_back("good.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_cmd(args, ui));
    ATF_REQUIRE(grep_collection("^Running 1 tests from good.json",
                                ui.out_log()));
    ATF_REQUIRE(grep_collection("^===> good.sh$", ui.out_log()));
    ATF_REQUIRE(grep_collection("^  test #1: MATCH", ui.out_log()));
    ATF_REQUIRE(grep_collection("^Results: 1/1 \\(100.00%\\)$",
                                ui.out_log()));
    ATF_REQUIRE_EQ("Overall pass rate: 100.00%", ui.out_log().back());
    ATF_REQUIRE(ui.err_log().empty());
}


ATF_TEST_CASE(some_fail);
ATF_TEST_CASE_HEAD(some_fail)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(some_fail)
{
    create_suite("good", "hello");
    create_suite("bad", "goodbye");

    cmdline::args_vector args;
    args.push_back("good.json");
    args.push_back("bad.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE, run_cmd(args, ui));
    ATF_REQUIRE(grep_collection("^  test #1: MISMATCH", ui.out_log()));
    ATF_REQUIRE(grep_collection("^Programs tested: 2$", ui.out_log()));
    ATF_REQUIRE(grep_collection("^Failed: 1$", ui.out_log()));
    ATF_REQUIRE_EQ("Overall pass rate: 50.00%", ui.out_log().back());
}


ATF_TEST_CASE(quiet);
ATF_TEST_CASE_HEAD(quiet)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(quiet)
{
    create_suite("good", "hello");

    cmdline::args_vector args;
    args.push_back("--quiet");
    args.push_back("good.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_cmd(args, ui));
    ATF_REQUIRE_EQ(6, ui.out_log().size());
    ATF_REQUIRE_EQ("===> Summary", ui.out_log()[0]);
    ATF_REQUIRE_EQ("Total tests: 1", ui.out_log()[2]);
}


ATF_TEST_CASE(output__file);
ATF_TEST_CASE_HEAD(output__file)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(output__file)
{
    create_suite("bad", "goodbye");

    cmdline::args_vector args;
    args.push_back("--output=out.json");
    args.push_back("bad.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE, run_cmd(args, ui));
    ATF_REQUIRE(grep_collection("Report written to out.json", ui.err_log()));

    std::ifstream input("out.json");
    ATF_REQUIRE(input);
    const json document = json::parse(input);
    ATF_REQUIRE_EQ(1, document["total_tests"].get< int >());
    ATF_REQUIRE_EQ(0, document["total_passed_tests"].get< int >());
    ATF_REQUIRE_EQ("MISMATCH",
                   document["results"][0]["tests"][0]["result"]
                   .get< std::string >());
    ATF_REQUIRE_EQ("goodbye", document["results"][0]["tests"][0]["output"]
                   .get< std::string >());
}


ATF_TEST_CASE(output__stdout);
ATF_TEST_CASE_HEAD(output__stdout)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(output__stdout)
{
    create_suite("good", "hello");

    cmdline::args_vector args;
    args.push_back("-o");
    args.push_back("-");
    args.push_back("good.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_cmd(args, ui));
    ATF_REQUIRE_EQ(1, ui.out_log().size());
    const json document = json::parse(ui.out_log()[0]);
    ATF_REQUIRE_EQ(100.0, document["pass_rate"].get< double >());
    ATF_REQUIRE(ui.err_log().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(invalid_suite);
ATF_TEST_CASE_BODY(invalid_suite)
{
    atf::utils::create_file("marker.sh", "touch was-run\n");
    atf::utils::create_file(
        "first.json", "{\"command\": \"/bin/sh\", \"path\": \"marker.sh\", "
        "\"tests\": [{\"timeout\": 5}]}");
    atf::utils::create_file("second.json", "{\"path\": \"marker.sh\"}");

    cmdline::args_vector args;
    args.push_back("first.json");
    args.push_back("second.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(engine::config_error, "Missing 'command'",
                         run_cmd(args, ui));
    ATF_REQUIRE(!fs::exists(fs::path("was-run")));
    ATF_REQUIRE(ui.out_log().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(missing_path);
ATF_TEST_CASE_BODY(missing_path)
{
    atf::utils::create_file("marker.sh", "touch was-run\n");
    atf::utils::create_file(
        "first.json", "{\"command\": \"/bin/sh\", \"path\": \"marker.sh\", "
        "\"tests\": [{\"timeout\": 5}]}");
    atf::utils::create_file(
        "second.json", "{\"command\": \"/bin/sh\", \"path\": \"gone.sh\", "
        "\"tests\": [{\"timeout\": 5}]}");

    cmdline::args_vector args;
    args.push_back("first.json");
    args.push_back("second.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(engine::config_error, "gone.sh.*does not exist",
                         run_cmd(args, ui));
    ATF_REQUIRE(!fs::exists(fs::path("was-run")));
    ATF_REQUIRE(ui.out_log().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(no_args);
ATF_TEST_CASE_BODY(no_args)
{
    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(cmdline::usage_error, "Not enough arguments",
                         run_cmd(cmdline::args_vector(), ui));
}


ATF_TEST_CASE_WITHOUT_HEAD(report_path__none);
ATF_TEST_CASE_BODY(report_path__none)
{
    cmdline::args_vector args;
    args.push_back("suite.json");
    ATF_REQUIRE(!cli::detail::report_path(parse_run(args)));
}


ATF_TEST_CASE_WITHOUT_HEAD(report_path__default_name);
ATF_TEST_CASE_BODY(report_path__default_name)
{
    datetime::set_mock_now(2026, 1, 2, 3, 4, 5);

    cmdline::args_vector args;
    args.push_back("-r");
    args.push_back("suite.json");
    const optional< fs::path > path = cli::detail::report_path(
        parse_run(args));
    ATF_REQUIRE(path);
    ATF_REQUIRE_EQ(fs::path("report_20260102_030405.json"), path.get());
}


ATF_TEST_CASE_WITHOUT_HEAD(report_path__explicit);
ATF_TEST_CASE_BODY(report_path__explicit)
{
    cmdline::args_vector args;
    args.push_back("-r");
    args.push_back("--output=results/out.json");
    args.push_back("suite.json");
    const optional< fs::path > path = cli::detail::report_path(
        parse_run(args));
    ATF_REQUIRE(path);
    ATF_REQUIRE_EQ(fs::path("results/out.json"), path.get());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, all_pass);
    ATF_ADD_TEST_CASE(tcs, some_fail);
    ATF_ADD_TEST_CASE(tcs, quiet);
    ATF_ADD_TEST_CASE(tcs, output__file);
    ATF_ADD_TEST_CASE(tcs, output__stdout);
    ATF_ADD_TEST_CASE(tcs, invalid_suite);
    ATF_ADD_TEST_CASE(tcs, missing_path);
    ATF_ADD_TEST_CASE(tcs, no_args);
    ATF_ADD_TEST_CASE(tcs, report_path__none);
    ATF_ADD_TEST_CASE(tcs, report_path__default_name);
    ATF_ADD_TEST_CASE(tcs, report_path__explicit);
}
