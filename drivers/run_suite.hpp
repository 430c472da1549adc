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

/// \file drivers/run_suite.hpp
/// Driver to run a suite and build its report.
///
/// This driver module implements the logic to load the definition of a suite,
/// prepare the scratch space for its compiled programs and execute all of its
/// test cases.  Progress is reported through hooks so that the caller can
/// print results as they come in.

#if !defined(DRIVERS_RUN_SUITE_HPP)
#define DRIVERS_RUN_SUITE_HPP

#include "engine/config.hpp"
#include "engine/suite_runner.hpp"
#include "model/submission_config.hpp"
#include "model/suite_report.hpp"
#include "utils/fs/path.hpp"

namespace drivers {
namespace run_suite {


/// Abstract definition of the hooks for this driver.
class base_hooks : public engine::suite_hooks {
public:
    virtual ~base_hooks(void) = 0;

    /// Called once the definition of the suite has been loaded.
    ///
    /// \param path The path to the definition of the suite.
    /// \param submission The loaded definition.
    virtual void got_suite(const utils::fs::path& path,
                           const model::submission_config& submission) = 0;
};


/// Tuple containing the results of this driver.
struct result {
    /// The definition of the suite that was run.
    model::submission_config submission;

    /// The report of the run.
    model::suite_report report;

    /// Initializer for the tuple's fields.
    ///
    /// \param submission_ The definition of the suite that was run.
    /// \param report_ The report of the run.
    result(const model::submission_config& submission_,
           const model::suite_report& report_) :
        submission(submission_),
        report(report_)
    {
    }
};


utils::fs::path build_root_template(void);

result drive(const utils::fs::path&, const engine::config&, base_hooks&);


}  // namespace run_suite
}  // namespace drivers

#endif  // !defined(DRIVERS_RUN_SUITE_HPP)
