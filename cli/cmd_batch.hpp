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

/// \file cli/cmd_batch.hpp
/// Provides the cmd_batch class.

#if !defined(CLI_CMD_BATCH_HPP)
#define CLI_CMD_BATCH_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "cli/common.hpp"
#include "model/suite_report.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/fs/path.hpp"

namespace utils {
namespace cmdline {
class ui;
}  // namespace cmdline
}  // namespace utils

namespace cli {


/// The "batch" subcommand.
class cmd_batch : public cli_command
{
public:
    cmd_batch(void);

    int run(utils::cmdline::ui*, const utils::cmdline::parsed_cmdline&,
            const engine::config&);
};


namespace detail {


/// A submission to grade: the name of its author and the program to test.
typedef std::pair< std::string, utils::fs::path > submission_entry;


/// Collection of submissions, sorted by name.
typedef std::vector< submission_entry > submissions_vector;


/// Grade of a single submission.
struct graded_submission {
    /// Name of the author of the submission.
    std::string name;

    /// Path to the tested program.
    utils::fs::path path;

    /// Results of the tests run against the program.
    model::suite_report report;

    graded_submission(const std::string&, const utils::fs::path&,
                      const model::suite_report&);

    double score(void) const;
};


/// Collection of graded submissions in submission order.
typedef std::vector< graded_submission > graded_vector;


/// Aggregated statistics of a batch.
struct batch_summary {
    /// When the batch was run, in ISO 8601 format.
    std::string generated_at;

    /// Path to the suite definition used to grade the submissions.
    utils::fs::path config_file;

    /// Number of graded submissions.
    std::size_t total_students;

    /// Mean score, as a percentage.
    double average_score;

    /// Best score, as a percentage.
    double highest_score;

    /// Worst score, as a percentage.
    double lowest_score;

    /// Percentage of submissions whose score reaches the passing score.
    double pass_rate;
};


/// Minimum score, as a percentage, for a submission to pass.
const double passing_score = 60.0;


submissions_vector collect_submissions(utils::cmdline::ui*,
                                       const utils::cmdline::args_vector&);
batch_summary summarize(const utils::fs::path&, const graded_vector&);

std::string text_report(const graded_vector&, const batch_summary&);
std::string csv_report(const graded_vector&);
std::string json_report(const graded_vector&, const batch_summary&);


}  // namespace detail


}  // namespace cli


#endif  // !defined(CLI_CMD_BATCH_HPP)
