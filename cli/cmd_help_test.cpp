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

#include "cli/cmd_help.hpp"

#include <cstdlib>

#include <atf-c++.hpp>

#include "cli/common.ipp"
#include "engine/config.hpp"
#include "utils/cmdline/commands_map.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui_mock.hpp"
#include "utils/defs.hpp"
#include "utils/sanity.hpp"

namespace cmdline = utils::cmdline;

using atf::utils::grep_collection;
using cli::cmd_help;


namespace {


/// Command without options nor arguments.
class cmd_mock_check : public cli::cli_command {
public:
    cmd_mock_check(void) : cli::cli_command(
        "check", "", 0, 0, "Checks something")
    {
    }

    int
    run(cmdline::ui* UTILS_UNUSED_PARAM(ui),
        const cmdline::parsed_cmdline& UTILS_UNUSED_PARAM(cmdline),
        const engine::config& UTILS_UNUSED_PARAM(config))
    {
        UNREACHABLE;
        return EXIT_FAILURE;
    }
};


/// Command with options of all kinds and a variable number of arguments.
class cmd_mock_execute : public cli::cli_command {
public:
    cmd_mock_execute(void) : cli::cli_command(
        "execute", "suite [suite2 ..]", 1, -1, "Executes suites")
    {
        add_option(cmdline::bool_option("dry", "Do nothing"));
        add_option(cmdline::bool_option('q', "quiet", "Print less"));
        add_option(cmdline::string_option('m', "mode", "Execution mode",
                                          "name"));
        add_option(cmdline::string_option("label", "Label of the run",
                                          "text", "unnamed"));
    }

    int
    run(cmdline::ui* UTILS_UNUSED_PARAM(ui),
        const cmdline::parsed_cmdline& UTILS_UNUSED_PARAM(cmdline),
        const engine::config& UTILS_UNUSED_PARAM(config))
    {
        UNREACHABLE;
        return EXIT_FAILURE;
    }
};


/// Registers the mock commands in two categories.
///
/// \param [out] commands The map in which to register the commands.
static void
setup(cmdline::commands_map< cli::cli_command >& commands)
{
    cmdline::init("progname");

    commands.insert(new cmd_mock_check(), "Inspection commands");
    commands.insert(new cmd_mock_execute(), "Execution commands");
}


/// Runs the help command and returns the captured output.
///
/// \param general_options The program-wide options.
/// \param args The arguments to the command, including its name.
/// \param [out] ui The ui in which to capture the output.
static void
run_help(const cmdline::options_vector& general_options,
         const cmdline::args_vector& args, cmdline::ui_mock& ui)
{
    cmdline::commands_map< cli::cli_command > commands;
    setup(commands);

    cmd_help cmd(&general_options, &commands);
    ATF_REQUIRE_EQ(EXIT_SUCCESS,
                   cmd.main(&ui, args, engine::config::defaults()));
    ATF_REQUIRE(ui.err_log().empty());
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(global__no_options);
ATF_TEST_CASE_BODY(global__no_options)
{
    cmdline::args_vector args;
    args.push_back("help");

    cmdline::ui_mock ui;
    run_help(cmdline::options_vector(), args, ui);
    ATF_REQUIRE_EQ("Usage: progname [general_options] command "
                   "[command_options] [args]", ui.out_log()[0]);
    ATF_REQUIRE(!grep_collection("Available general options", ui.out_log()));
}


ATF_TEST_CASE_WITHOUT_HEAD(global__categories);
ATF_TEST_CASE_BODY(global__categories)
{
    cmdline::args_vector args;
    args.push_back("help");

    cmdline::options_vector general_options;
    const cmdline::string_option config('c', "config", "Settings file",
                                        "file");
    general_options.push_back(&config);

    cmdline::ui_mock ui;
    run_help(general_options, args, ui);

    ATF_REQUIRE_EQ(10, ui.out_log().size());
    ATF_REQUIRE_EQ("", ui.out_log()[1]);
    ATF_REQUIRE_EQ("Available general options:", ui.out_log()[2]);
    ATF_REQUIRE(grep_collection("-c file, --config=file: Settings file",
                                ui.out_log()));
    ATF_REQUIRE_EQ("", ui.out_log()[4]);
    ATF_REQUIRE_EQ("Execution commands:", ui.out_log()[5]);
    ATF_REQUIRE_EQ("    execute  Executes suites.", ui.out_log()[6]);
    ATF_REQUIRE_EQ("", ui.out_log()[7]);
    ATF_REQUIRE_EQ("Inspection commands:", ui.out_log()[8]);
    ATF_REQUIRE_EQ("    check  Checks something.", ui.out_log()[9]);
}


ATF_TEST_CASE_WITHOUT_HEAD(subcommand__no_options);
ATF_TEST_CASE_BODY(subcommand__no_options)
{
    cmdline::args_vector args;
    args.push_back("help");
    args.push_back("check");

    cmdline::ui_mock ui;
    run_help(cmdline::options_vector(), args, ui);
    ATF_REQUIRE_EQ(3, ui.out_log().size());
    ATF_REQUIRE_EQ("Usage: progname [general_options] check",
                   ui.out_log()[0]);
    ATF_REQUIRE_EQ("Checks something.", ui.out_log()[2]);
}


ATF_TEST_CASE_WITHOUT_HEAD(subcommand__options);
ATF_TEST_CASE_BODY(subcommand__options)
{
    cmdline::args_vector args;
    args.push_back("help");
    args.push_back("execute");

    cmdline::ui_mock ui;
    run_help(cmdline::options_vector(), args, ui);
    ATF_REQUIRE_EQ("Usage: progname [general_options] execute "
                   "[command_options] suite [suite2 ..]", ui.out_log()[0]);
    ATF_REQUIRE(grep_collection("Available command options", ui.out_log()));
    ATF_REQUIRE(grep_collection("^    --dry: Do nothing\\.$", ui.out_log()));
    ATF_REQUIRE(grep_collection("-q, --quiet: Print less", ui.out_log()));
    ATF_REQUIRE(grep_collection("-m name, --mode=name: Execution mode",
                                ui.out_log()));
    ATF_REQUIRE(grep_collection("--label=text: Label of the run "
                                "\\(default: unnamed\\)", ui.out_log()));
}


ATF_TEST_CASE_WITHOUT_HEAD(subcommand__unknown);
ATF_TEST_CASE_BODY(subcommand__unknown)
{
    cmdline::commands_map< cli::cli_command > commands;
    setup(commands);

    cmdline::args_vector args;
    args.push_back("help");
    args.push_back("foobar");

    const cmdline::options_vector general_options;
    cmd_help cmd(&general_options, &commands);
    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(cmdline::usage_error, "command foobar.*not exist",
                         cmd.main(&ui, args, engine::config::defaults()));
    ATF_REQUIRE(ui.out_log().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(invalid_args);
ATF_TEST_CASE_BODY(invalid_args)
{
    cmdline::commands_map< cli::cli_command > commands;
    setup(commands);

    cmdline::args_vector args;
    args.push_back("help");
    args.push_back("check");
    args.push_back("execute");

    const cmdline::options_vector general_options;
    cmd_help cmd(&general_options, &commands);
    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(cmdline::usage_error, "Too many arguments",
                         cmd.main(&ui, args, engine::config::defaults()));
    ATF_REQUIRE(ui.out_log().empty());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, global__no_options);
    ATF_ADD_TEST_CASE(tcs, global__categories);
    ATF_ADD_TEST_CASE(tcs, subcommand__no_options);
    ATF_ADD_TEST_CASE(tcs, subcommand__options);
    ATF_ADD_TEST_CASE(tcs, subcommand__unknown);
    ATF_ADD_TEST_CASE(tcs, invalid_args);
}
