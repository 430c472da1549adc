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
#include <sstream>
#include <stdexcept>
#include <vector>

#include "cli/common.ipp"
#include "cli/report_console.hpp"
#include "drivers/run_suite.hpp"
#include "engine/report_json.hpp"
#include "engine/suite_config.hpp"
#include "model/suite_report.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/datetime.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

namespace cmdline = utils::cmdline;
namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace run_suite = drivers::run_suite;

using cli::cmd_run;
using utils::none;
using utils::optional;


namespace {


/// Path that represents the standard output in the --output flag.
static const char* stdout_name = "-";


/// Prints the progress of the run of a suite.
class print_hooks : public run_suite::base_hooks {
    /// Object to interact with the I/O of the program.
    cmdline::ui* _ui;

    /// Whether to omit the progress messages.
    const bool _quiet;

public:
    /// Constructor for the hooks.
    ///
    /// \param ui_ Object to interact with the I/O of the program.
    /// \param quiet_ Whether to omit the progress messages.
    print_hooks(cmdline::ui* ui_, const bool quiet_) :
        _ui(ui_),
        _quiet(quiet_)
    {
    }

    /// Called once the definition of the suite has been loaded.
    ///
    /// \param path The path to the definition of the suite.
    /// \param submission The loaded definition.
    void
    got_suite(const fs::path& path, const model::submission_config& submission)
    {
        if (!_quiet)
            _ui->out(F("Running %s tests from %s against %s") %
                     submission.tests().size() % path % submission.path());
    }

    /// Called when the compilation of a program finishes.
    ///
    /// \param program The compiled program.
    /// \param error The reason of the failure, if any.
    void
    compiled_program(const fs::path& program,
                     const optional< std::string >& error)
    {
        if (error)
            cmdline::print_warning(_ui, F("Compilation of %s failed; all of "
                                          "its tests are errors") % program);
        else
            LI(F("Compiled %s") % program);
    }
};


/// Merges the reports of several suites into a single one.
///
/// \param results The results of the individual suites.
///
/// \return A report with the programs of all suites, in order.
static model::suite_report
merge_reports(const std::vector< run_suite::result >& results)
{
    model::program_reports_vector programs;
    for (std::vector< run_suite::result >::const_iterator iter =
             results.begin(); iter != results.end(); ++iter) {
        const model::program_reports_vector& these = (*iter).report.programs();
        programs.insert(programs.end(), these.begin(), these.end());
    }
    return model::suite_report(programs);
}


/// Writes the JSON version of a report.
///
/// \param ui Object to interact with the I/O of the program.
/// \param report The report to write.
/// \param path Destination of the report; "-" represents stdout.
///
/// \throw std::runtime_error If the output file cannot be written.
static void
write_report(cmdline::ui* ui, const model::suite_report& report,
             const fs::path& path)
{
    if (path.str() == stdout_name) {
        std::ostringstream output;
        engine::write_json_report(report, output);
        ui->out(output.str());
        return;
    }

    std::ofstream output(path.c_str());
    if (!output)
        throw std::runtime_error(F("Cannot open output file %s") % path);
    engine::write_json_report(report, output);
    output.close();
    if (output.fail())
        throw std::runtime_error(F("Failed to write report to %s") % path);
    cmdline::print_info(ui, F("Report written to %s") % path);
}


}  // anonymous namespace


/// Computes the destination of the JSON report, if any.
///
/// \param cmdline The parsed command line of the run command.
///
/// \return The path given with --output, a timestamped file name if only
/// --report was given, or none if no report was requested.
optional< fs::path >
cli::detail::report_path(const cmdline::parsed_cmdline& cmdline)
{
    if (cmdline.has_option("output"))
        return utils::make_optional(
            cmdline.get_option< cmdline::path_option >("output"));
    else if (cmdline.has_option("report"))
        return utils::make_optional(fs::path(
            datetime::timestamp::now().strftime("report_%Y%m%d_%H%M%S.json")));
    else
        return none;
}


/// Default constructor for cmd_run.
cmd_run::cmd_run(void) : cli_command(
    "run", "suite1 [.. suiteN]", 1, -1,
    "Runs the tests of one or more suites")
{
    add_option(cmdline::bool_option(
        'q', "quiet", "Only print the totals of the run"));
    add_option(cmdline::bool_option(
        'r', "report", "Write a JSON report to a timestamped file"));
    add_option(cmdline::path_option(
        'o', "output", "Path to the JSON report; '-' for stdout", "file"));
}


/// Entry point for the "run" subcommand.
///
/// All the definitions are loaded before running anything so that a mistake
/// in any of them does not waste the run of the others.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param config The runtime settings of the program.
///
/// \return 0 if all the tests passed; 1 otherwise.
///
/// \throw engine::config_error If any of the suite definitions is invalid or
///     names programs that do not exist.  No suite runs in that case.
int
cmd_run::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
             const engine::config& config)
{
    const bool quiet = cmdline.has_option("quiet");
    const optional< fs::path > output = detail::report_path(cmdline);
    const bool report_to_stdout = output && output.get().str() == stdout_name;

    std::vector< fs::path > suites;
    for (cmdline::args_vector::const_iterator iter =
             cmdline.arguments().begin(); iter != cmdline.arguments().end();
         ++iter) {
        const fs::path suite(*iter);
        (void)engine::list_programs(engine::parse_suite_config(suite));
        suites.push_back(suite);
    }

    print_hooks hooks(ui, quiet || report_to_stdout);
    std::vector< run_suite::result > results;
    for (std::vector< fs::path >::const_iterator iter = suites.begin();
         iter != suites.end(); ++iter)
        results.push_back(run_suite::drive(*iter, config, hooks));

    const model::suite_report report = merge_reports(results);
    if (!report_to_stdout)
        print_report(ui, report, quiet);
    if (output)
        write_report(ui, report, output.get());

    return report.all_passed() ? EXIT_SUCCESS : EXIT_FAILURE;
}
