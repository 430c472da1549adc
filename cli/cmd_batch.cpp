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

#include "cli/cmd_batch.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "cli/common.ipp"
#include "drivers/run_suite.hpp"
#include "engine/report_json.hpp"
#include "engine/suite_config.hpp"
#include "engine/suite_runner.hpp"
#include "model/submission_config.hpp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/auto_cleaners.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/operations.ipp"

namespace cmdline = utils::cmdline;
namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace text = utils::text;

using cli::cmd_batch;
using nlohmann::json;


namespace {


/// Width of the separators of the text report.
static const std::size_t rule_width = 70;


/// Orders submissions by name and then by path.
///
/// \param a The first submission to compare.
/// \param b The second submission to compare.
///
/// \return True if a goes before b.
static bool
submission_less(const cli::detail::submission_entry& a,
                const cli::detail::submission_entry& b)
{
    if (a.first != b.first)
        return a.first < b.first;
    return a.second < b.second;
}


/// Quotes a field of a CSV record if it needs it.
///
/// \param field The raw value of the field.
///
/// \return The field, surrounded by double quotes and with its quotes doubled
/// if it contains separators, quotes or line breaks.
static std::string
csv_field(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;

    std::string quoted = "\"";
    for (std::string::const_iterator iter = field.begin();
         iter != field.end(); ++iter) {
        if (*iter == '"')
            quoted += '"';
        quoted += *iter;
    }
    return quoted + "\"";
}


/// Prints a report to the output of the program or to a file.
///
/// \param ui Object to interact with the I/O of the program.
/// \param report The formatted report.
/// \param path Destination of the report; "-" represents stdout.
///
/// \throw std::runtime_error If the output file cannot be written.
static void
write_report(cmdline::ui* ui, const std::string& report, const fs::path& path)
{
    if (path.str() == "-") {
        const std::vector< std::string > lines = text::split(report, '\n');
        for (std::vector< std::string >::const_iterator iter = lines.begin();
             iter != lines.end(); ++iter) {
            if (iter + 1 != lines.end() || !(*iter).empty())
                ui->out(*iter);
        }
        return;
    }

    std::ofstream output(path.c_str());
    if (!output)
        throw std::runtime_error(F("Cannot open output file %s") % path);
    output << report;
    output.close();
    if (output.fail())
        throw std::runtime_error(F("Failed to write report to %s") % path);
    cmdline::print_info(ui, F("Report saved to %s") % path);
}


}  // anonymous namespace


/// Constructs a graded submission.
///
/// \param name_ Name of the author of the submission.
/// \param path_ Path to the tested program.
/// \param report_ Results of the tests run against the program.
cli::detail::graded_submission::graded_submission(
    const std::string& name_, const fs::path& path_,
    const model::suite_report& report_) :
    name(name_),
    path(path_),
    report(report_)
{
}


/// Computes the score of the submission.
///
/// \return The percentage of passed tests, rounded to two decimals.  A
/// submission without tests scores 0.
double
cli::detail::graded_submission::score(void) const
{
    return engine::json_percentage(report.pass_rate());
}


/// Expands the command-line arguments into the submissions to grade.
///
/// Files are submissions on their own.  Directories contribute each of their
/// regular, non-hidden files.  The name of a submission is the name of its
/// file without the extension.
///
/// \param ui Object to interact with the I/O of the program.
/// \param args Paths to files or directories with the submissions.
///
/// \return The submissions sorted by name.  Paths that do not exist are
/// reported as warnings and skipped.
cli::detail::submissions_vector
cli::detail::collect_submissions(cmdline::ui* ui,
                                 const cmdline::args_vector& args)
{
    submissions_vector submissions;
    for (cmdline::args_vector::const_iterator iter = args.begin();
         iter != args.end(); ++iter) {
        const fs::path path(*iter);
        if (fs::is_directory(path)) {
            const std::set< std::string > entries = fs::list_directory(path);
            for (std::set< std::string >::const_iterator eiter =
                     entries.begin(); eiter != entries.end(); ++eiter) {
                if ((*eiter)[0] == '.')
                    continue;
                const fs::path entry = path / *eiter;
                if (fs::is_regular_file(entry))
                    submissions.push_back(submission_entry(entry.stem(),
                                                           entry));
            }
        } else if (fs::is_regular_file(path)) {
            submissions.push_back(submission_entry(path.stem(), path));
        } else {
            cmdline::print_warning(ui, F("Path not found: %s") % path);
        }
    }
    std::sort(submissions.begin(), submissions.end(), submission_less);
    return submissions;
}


/// Computes the statistics of a batch.
///
/// \param config_file Path to the suite definition used for grading.
/// \param results The graded submissions.
///
/// \return The statistics; all zero if there are no results.
cli::detail::batch_summary
cli::detail::summarize(const fs::path& config_file,
                       const graded_vector& results)
{
    batch_summary summary = { std::string(), config_file };
    summary.generated_at = datetime::timestamp::now().strftime(
        "%Y-%m-%dT%H:%M:%S");
    summary.config_file = config_file;
    summary.total_students = results.size();
    summary.average_score = 0.0;
    summary.highest_score = 0.0;
    summary.lowest_score = 0.0;
    summary.pass_rate = 0.0;
    if (results.empty())
        return summary;

    double total = 0.0;
    std::size_t passing = 0;
    summary.highest_score = results[0].score();
    summary.lowest_score = results[0].score();
    for (graded_vector::const_iterator iter = results.begin();
         iter != results.end(); ++iter) {
        const double score = (*iter).score();
        total += score;
        summary.highest_score = std::max(summary.highest_score, score);
        summary.lowest_score = std::min(summary.lowest_score, score);
        if (score >= passing_score)
            ++passing;
    }
    summary.average_score = total / results.size();
    summary.pass_rate = 100.0 * passing / results.size();
    return summary;
}


/// Formats the results of a batch as a table for humans.
///
/// \param results The graded submissions.
/// \param summary The statistics of the batch.
///
/// \return The report, one line per submission plus the statistics.
std::string
cli::detail::text_report(const graded_vector& results,
                         const batch_summary& summary)
{
    const std::string heavy(rule_width, '=');
    const std::string light(rule_width, '-');

    std::string report;
    report += heavy + "\n";
    report += "BATCH TEST RESULTS\n";
    report += heavy + "\n";
    report += F("Generated: %s\n") % summary.generated_at;
    report += F("Config: %s\n") % summary.config_file;
    report += "\n";
    report += light + "\n";
    report += F("%-30s %10s %10s %10s\n") % "Student" % "Score" % "Passed" %
        "Failed";
    report += light + "\n";
    for (graded_vector::const_iterator iter = results.begin();
         iter != results.end(); ++iter) {
        const std::size_t passed = (*iter).report.total_passed_tests();
        const std::size_t failed = (*iter).report.total_tests() - passed;
        report += F("%-30s %9.1f%% %10s %10s\n") % (*iter).name %
            (*iter).score() % passed % failed;
    }
    report += light + "\n";
    report += "\n";
    report += "SUMMARY\n";
    report += F("  Total students: %s\n") % summary.total_students;
    report += F("  Average score: %.2f%%\n") % summary.average_score;
    report += F("  Highest score: %.2f%%\n") % summary.highest_score;
    report += F("  Lowest score: %.2f%%\n") % summary.lowest_score;
    report += F("  Pass rate (>= %.0f%%): %.2f%%\n") % passing_score %
        summary.pass_rate;
    report += heavy + "\n";
    return report;
}


/// Formats the results of a batch as comma-separated values.
///
/// \param results The graded submissions.
///
/// \return A header row followed by one row per submission.
std::string
cli::detail::csv_report(const graded_vector& results)
{
    std::string report = "Student Name,File Path,Score (%),Passed Tests,"
        "Failed Tests,Total Tests\n";
    for (graded_vector::const_iterator iter = results.begin();
         iter != results.end(); ++iter) {
        const std::size_t total = (*iter).report.total_tests();
        const std::size_t passed = (*iter).report.total_passed_tests();
        report += F("%s,%s,%.2f,%s,%s,%s\n") % csv_field((*iter).name) %
            csv_field((*iter).path.str()) % (*iter).score() % passed %
            (total - passed) % total;
    }
    return report;
}


/// Formats the results of a batch as JSON.
///
/// \param results The graded submissions.
/// \param summary The statistics of the batch.
///
/// \return An indented JSON document with the statistics and, for each
/// submission, its counters and the outcome of every test.
std::string
cli::detail::json_report(const graded_vector& results,
                         const batch_summary& summary)
{
    json students = json::array();
    for (graded_vector::const_iterator iter = results.begin();
         iter != results.end(); ++iter) {
        const std::size_t total = (*iter).report.total_tests();
        const std::size_t passed = (*iter).report.total_passed_tests();

        json tests = json::array();
        const model::program_reports_vector& programs =
            (*iter).report.programs();
        for (model::program_reports_vector::const_iterator piter =
                 programs.begin(); piter != programs.end(); ++piter) {
            for (model::test_outcomes_vector::const_iterator titer =
                     (*piter).tests().begin(); titer != (*piter).tests().end();
                 ++titer)
                tests.push_back(engine::test_to_json(*titer));
        }

        json student;
        student["student_name"] = (*iter).name;
        student["file_path"] = (*iter).path.str();
        student["total_tests"] = total;
        student["passed_tests"] = passed;
        student["failed_tests"] = total - passed;
        student["score"] = (*iter).score();
        student["test_results"] = tests;
        students.push_back(student);
    }

    json document;
    document["summary"] = {
        {"generated_at", summary.generated_at},
        {"config_file", summary.config_file.str()},
        {"total_students", summary.total_students},
        {"average_score", summary.average_score},
        {"highest_score", summary.highest_score},
        {"lowest_score", summary.lowest_score},
        {"pass_rate", summary.pass_rate},
    };
    document["results"] = students;
    return document.dump(2, ' ', false, json::error_handler_t::replace) +
        "\n";
}


/// Default constructor for cmd_batch.
cmd_batch::cmd_batch(void) : cli_command(
    "batch", "suite submission1 [.. submissionN]", 2, -1,
    "Grades several submissions against the tests of one suite")
{
    add_option(cmdline::string_option(
        'f', "format", "Format of the report: text, csv or json", "format",
        "text"));
    add_option(cmdline::path_option(
        'o', "output", "Path to the report; '-' for stdout", "file", "-"));
    add_option(cmdline::positive_int_option(
        'p', "parallel", "Number of tests to run concurrently", "count"));
    add_option(cmdline::bool_option(
        'q', "quiet", "Do not print progress messages"));
}


/// Entry point for the "batch" subcommand.
///
/// Each submission is tested in turn with the commands and test cases of the
/// suite, replacing the path the suite names with that of the submission.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param config The runtime settings of the program.
///
/// \return 0 if the batch was graded; 1 if there was nothing to grade.
///
/// \throw cmdline::usage_error If the format of the report is unknown.
/// \throw engine::config_error If the suite definition is invalid.
/// \throw std::runtime_error If the report cannot be written.
int
cmd_batch::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
               const engine::config& config)
{
    const std::string format = cmdline.get_option< cmdline::string_option >(
        "format");
    if (format != "text" && format != "csv" && format != "json")
        throw cmdline::usage_error(F("Unknown report format '%s'") % format);
    const bool quiet = cmdline.has_option("quiet");

    engine::config batch_config = config;
    if (cmdline.has_option("parallel"))
        batch_config.parallelism = static_cast< std::size_t >(
            cmdline.get_option< cmdline::positive_int_option >("parallel"));

    const fs::path config_file(cmdline.arguments()[0]);
    const model::submission_config suite = engine::parse_suite_config(
        config_file);

    const detail::submissions_vector submissions =
        detail::collect_submissions(ui, cmdline::args_vector(
            cmdline.arguments().begin() + 1, cmdline.arguments().end()));
    if (submissions.empty()) {
        cmdline::print_error(ui, "No submission files found");
        return EXIT_FAILURE;
    }
    if (!quiet)
        cmdline::print_info(ui, F("Found %s submissions to test") %
                            submissions.size());

    detail::graded_vector results;
    for (detail::submissions_vector::const_iterator iter =
             submissions.begin(); iter != submissions.end(); ++iter) {
        const model::submission_config submission(
            suite.command(), suite.run_command(), suite.compile_command(),
            (*iter).second, suite.tests());

        fs::scratch_directory build_root(
            drivers::run_suite::build_root_template());
        LD(F("Grading %s with %s as the build root") % (*iter).second %
           build_root.directory());
        engine::suite_runner runner(submission, batch_config,
                                    build_root.directory());
        const model::suite_report report = runner.run();
        build_root.cleanup();

        results.push_back(detail::graded_submission(
            (*iter).first, (*iter).second, report));
        if (!quiet)
            cmdline::print_info(ui, F("%s: %.2f%%") % (*iter).first %
                                results.back().score());
    }

    const detail::batch_summary summary = detail::summarize(config_file,
                                                            results);
    std::string report;
    if (format == "json") {
        report = detail::json_report(results, summary);
    } else if (format == "csv") {
        report = detail::csv_report(results);
    } else {
        INV(format == "text");
        report = detail::text_report(results, summary);
    }
    write_report(ui, report, cmdline.get_option< cmdline::path_option >(
        "output"));

    return EXIT_SUCCESS;
}
