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

#include "cli/main.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

#include "cli/cmd_batch.hpp"
#include "cli/cmd_config.hpp"
#include "cli/cmd_help.hpp"
#include "cli/cmd_run.hpp"
#include "cli/cmd_validate.hpp"
#include "cli/cmd_version.hpp"
#include "cli/common.ipp"
#include "cli/config.hpp"
#include "engine/exceptions.hpp"
#include "utils/cmdline/commands_map.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/logging/operations.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"
#include "utils/signals/exceptions.hpp"
#include "utils/signals/interrupts.hpp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;
namespace logging = utils::logging;
namespace signals = utils::signals;

using utils::optional;


namespace {


/// Registers all valid commands in the program.
///
/// \param [out] commands The map in which to register the commands.
/// \param options The general options of the program, for the help command.
static void
register_commands(cmdline::commands_map< cli::cli_command >& commands,
                  const cmdline::options_vector* options)
{
    commands.insert(new cli::cmd_batch(), "Suite commands");
    commands.insert(new cli::cmd_run(), "Suite commands");
    commands.insert(new cli::cmd_validate(), "Suite commands");

    commands.insert(new cli::cmd_config(), "Generic commands");
    commands.insert(new cli::cmd_help(options, &commands), "Generic commands");
    commands.insert(new cli::cmd_version(), "Generic commands");
}


/// Executes the given subcommand with proper usage_error reporting.
///
/// \param ui Object to interact with the I/O of the program.
/// \param command The subcommand to execute.
/// \param args The part of the command line passed to the subcommand.  The
///     first item of this collection must match the command name.
/// \param config The runtime settings to pass to the subcommand.
///
/// \return The exit code of the command.  Typically 0 on success, some other
/// integer otherwise.
///
/// \throw cmdline::usage_error If the user input to the subcommand is invalid.
///     This error does not encode the command name within it, so this function
///     extends the message in the error to specify which subcommand was
///     affected.
/// \throw std::exception This propagates any uncaught exception.  Such
///     exceptions are bugs, but we let them propagate so that the runtime will
///     abort and dump core.
static int
run_subcommand(cmdline::ui* ui, cli::cli_command* command,
               const cmdline::args_vector& args,
               const engine::config& config)
{
    try {
        PRE(command->name() == args[0]);
        return command->main(ui, args, config);
    } catch (const cmdline::usage_error& e) {
        throw std::pair< std::string, cmdline::usage_error >(
            command->name(), e);
    }
}


/// Exception-safe version of main.
///
/// This function provides the real meat of the entry point of the program.  It
/// is allowed to throw some known exceptions which are parsed by the caller.
/// Doing so keeps this function simpler and allow tests to actually validate
/// that the errors reported are accurate.
///
/// \return The exit code of the program.  Typically 0 on success, some other
/// integer otherwise, but this depends on the subcommand executed (if any).
///
/// \param ui Object to interact with the I/O of the program.
/// \param argc The number of arguments passed on the command line.
/// \param argv NULL-terminated array containing the command line arguments.
/// \param mock_command An extra command provided for testing purposes; should
///     just be NULL other than for tests.
///
/// \throw cmdline::usage_error If the user ran the program with invalid
///     arguments.
/// \throw std::exception This propagates any uncaught exception.  Such
///     exceptions are bugs, but we let them propagate so that the runtime will
///     abort and dump core.
static int
safe_main(cmdline::ui* ui, int argc, const char* const argv[],
          cli::cli_command_ptr mock_command)
{
    const std::string default_log = cli::detail::default_log_name().str();
    const cmdline::path_option logfile_option(
        "logfile", "Path to the log file", "file", default_log.c_str());
    const cmdline::string_option loglevel_option(
        "loglevel", "Level of the messages to log", "level", "info");

    cmdline::options_vector options;
    options.push_back(&logfile_option);
    options.push_back(&loglevel_option);
    options.push_back(&cli::config_option);
    options.push_back(&cli::variable_option);
    const cmdline::parsed_cmdline cmdline = cmdline::parse(argc, argv, options);

    const fs::path logfile(cmdline.get_option< cmdline::path_option >(
        "logfile"));
    fs::mkdir_p(logfile.branch_path(), 0755);
    LD(F("Log file is %s") % logfile);
    try {
        logging::set_persistency(cmdline.get_option< cmdline::string_option >(
            "loglevel"), logfile);
    } catch (const std::range_error& e) {
        throw cmdline::usage_error(e.what());
    }

    if (cmdline.arguments().empty())
        throw cmdline::usage_error("No command provided");
    const std::string cmdname = cmdline.arguments()[0];

    cmdline::commands_map< cli::cli_command > commands;
    register_commands(commands, &options);
    if (mock_command.get() != NULL)
        commands.insert(std::move(mock_command));

    cli::cli_command* command = commands.find(cmdname);
    if (command == NULL)
        throw cmdline::usage_error(F("Unknown command '%s'") % cmdname);

    const engine::config config = cli::load_config(cmdline,
                                                   cmdname != "help");
    return run_subcommand(ui, command, cmdline.arguments(), config);
}


}  // anonymous namespace


/// Gets the name of the default log file.
///
/// \return The path to the log file.
fs::path
cli::detail::default_log_name(void)
{
    const optional< fs::path > home = utils::get_home();
    if (home) {
        return logging::generate_log_name(home.get() / ".testio" / "logs",
                                          cmdline::progname());
    } else {
        const optional< std::string > tmpdir = utils::getenv("TMPDIR");
        if (tmpdir && !tmpdir.get().empty()) {
            return logging::generate_log_name(fs::path(tmpdir.get()),
                                              cmdline::progname());
        } else {
            return logging::generate_log_name(fs::path("/tmp"),
                                              cmdline::progname());
        }
    }
}


/// Testable entry point, with catch-all exception handlers.
///
/// This entry point does not perform any initialization of global state; it is
/// provided to allow unit-testing of the utility's entry point.
///
/// \param ui Object to interact with the I/O of the program.
/// \param argc The number of arguments passed on the command line.
/// \param argv NULL-terminated array containing the command line arguments.
/// \param mock_command An extra command provided for testing purposes; should
///     just be NULL other than for tests.
///
/// \return 0 on success, some other integer on error.
///
/// \throw std::exception This propagates any uncaught exception.  Such
///     exceptions are bugs, but we let them propagate so that the runtime will
///     abort and dump core.
int
cli::main(cmdline::ui* ui, const int argc, const char* const* const argv,
          cli_command_ptr mock_command)
{
    try {
        const int exit_code = safe_main(ui, argc, argv,
                                        std::move(mock_command));

        // Catch interrupts that may have arrived after the command finished
        // so that we report them instead of a success.
        signals::check_interrupt();

        return exit_code;
    } catch (const signals::interrupted_error& e) {
        cmdline::print_error(ui, format_error(e));
        signals::redeliver_to_exit(e.signo());
        UNREACHABLE;
    } catch (const std::pair< std::string, cmdline::usage_error >& e) {
        const std::string message = F("Usage error for command %s: %s.") %
            e.first % e.second.what();
        LE(message);
        ui->err(message);
        ui->err(F("Type '%s help %s' for usage information.") %
                cmdline::progname() % e.first);
        return exit_usage_error;
    } catch (const cmdline::usage_error& e) {
        const std::string message = F("Usage error: %s.") % e.what();
        LE(message);
        ui->err(message);
        ui->err(F("Type '%s help' for usage information.") %
                cmdline::progname());
        return exit_usage_error;
    } catch (const engine::config_error& e) {
        cmdline::print_error(ui, format_error(e));
        return exit_usage_error;
    } catch (const engine::load_error& e) {
        cmdline::print_error(ui, format_error(e));
        return exit_usage_error;
    } catch (const std::runtime_error& e) {
        cmdline::print_error(ui, format_error(e));
        return exit_internal_error;
    }
}


/// Delegate for ::main().
///
/// This function is supposed to be called directly from the top-level ::main()
/// function.  It takes care of initializing internal libraries and then calls
/// main(ui, argc, argv).
///
/// \pre This function can only be called once.
///
/// \throw std::exception This propagates any uncaught exception.  Such
///     exceptions are bugs, but we let them propagate so that the runtime will
///     abort and dump core.
int
cli::main(const int argc, const char* const* const argv)
{
    logging::set_inmemory();

    LI(F("%s %s") % PACKAGE_NAME % PACKAGE_VERSION);
    for (int i = 1; i < argc; ++i)
        LI(F("argv[%s] = %s") % i % argv[i]);

    cmdline::init(argv[0]);
    signals::setup_interrupts();
    cmdline::ui ui;
    return main(&ui, argc, argv);
}
