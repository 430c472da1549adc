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

#include "cli/cmd_validate.hpp"

#include <cstdlib>

#include <atf-c++.hpp>

#include "engine/config.hpp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui_mock.hpp"

namespace cmdline = utils::cmdline;

using cli::cmd_validate;


namespace {


/// Definition of a suite without problems.
static const char* valid_suite =
    "{\"command\": \"sh\", \"path\": \"prog.sh\", "
    "\"tests\": [{\"output\": \"hi\", \"timeout\": 1}]}";


/// Runs the validate command.
///
/// \param args The arguments to the command, excluding its name.
/// \param [out] ui The ui in which to capture the output.
///
/// \return The exit code of the command.
static int
run_validate(const cmdline::args_vector& args, cmdline::ui_mock& ui)
{
    cmdline::init("progname");

    cmdline::args_vector full_args;
    full_args.push_back("validate");
    full_args.insert(full_args.end(), args.begin(), args.end());

    cmd_validate cmd;
    return cmd.main(&ui, full_args, engine::config::defaults());
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(valid);
ATF_TEST_CASE_BODY(valid)
{
    atf::utils::create_file("prog.sh", "echo hi\n");
    atf::utils::create_file("suite.json", valid_suite);

    cmdline::args_vector args;
    args.push_back("suite.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_validate(args, ui));
    ATF_REQUIRE_EQ(1, ui.out_log().size());
    ATF_REQUIRE_EQ("suite.json: OK (0 warnings)", ui.out_log()[0]);
    ATF_REQUIRE(ui.err_log().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(warnings);
ATF_TEST_CASE_BODY(warnings)
{
    atf::utils::create_file(
        "suite.json", "{\"command\": \"sh\", \"path\": \"missing.sh\", "
        "\"tests\": [{\"output\": \"hi\", \"timeout\": 1}]}");

    cmdline::args_vector args;
    args.push_back("suite.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_validate(args, ui));
    ATF_REQUIRE_EQ("suite.json: OK (1 warnings)", ui.out_log()[0]);
    ATF_REQUIRE_EQ(1, ui.err_log().size());
    ATF_REQUIRE_MATCH("^progname: W: suite.json: Path '.*missing.sh' does "
                      "not exist\\.$", ui.err_log()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(strict);
ATF_TEST_CASE_BODY(strict)
{
    atf::utils::create_file("prog.sh", "echo hi\n");
    atf::utils::create_file(
        "suite.json", "{\"command\": \"sh\", \"path\": \"prog.sh\", "
        "\"tests\": [{\"timeout\": 1}]}");

    cmdline::args_vector args;
    args.push_back("suite.json");
    {
        cmdline::ui_mock ui;
        ATF_REQUIRE_EQ(EXIT_SUCCESS, run_validate(args, ui));
        ATF_REQUIRE(ui.err_log().empty());
    }

    args.insert(args.begin(), "--strict");
    {
        cmdline::ui_mock ui;
        ATF_REQUIRE_EQ(EXIT_SUCCESS, run_validate(args, ui));
        ATF_REQUIRE_EQ(1, ui.err_log().size());
        ATF_REQUIRE_MATCH("test #1 has no expected output",
                          ui.err_log()[0]);
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(invalid);
ATF_TEST_CASE_BODY(invalid)
{
    atf::utils::create_file("prog.sh", "echo hi\n");
    atf::utils::create_file("bad.json",
                            "{\"command\": \"sh\", \"path\": \"prog.sh\"}");
    atf::utils::create_file("good.json", valid_suite);

    cmdline::args_vector args;
    args.push_back("bad.json");
    args.push_back("missing.json");
    args.push_back("good.json");

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE, run_validate(args, ui));
    ATF_REQUIRE_EQ(1, ui.out_log().size());
    ATF_REQUIRE_EQ("good.json: OK (0 warnings)", ui.out_log()[0]);
    ATF_REQUIRE_EQ(2, ui.err_log().size());
    ATF_REQUIRE_MATCH("^progname: E: bad.json: Missing 'tests'",
                      ui.err_log()[0]);
    ATF_REQUIRE_MATCH("^progname: E: missing.json: Cannot open",
                      ui.err_log()[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(no_args);
ATF_TEST_CASE_BODY(no_args)
{
    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(cmdline::usage_error, "Not enough arguments",
                         run_validate(cmdline::args_vector(), ui));
    ATF_REQUIRE(ui.out_log().empty());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, valid);
    ATF_ADD_TEST_CASE(tcs, warnings);
    ATF_ADD_TEST_CASE(tcs, strict);
    ATF_ADD_TEST_CASE(tcs, invalid);
    ATF_ADD_TEST_CASE(tcs, no_args);
}
