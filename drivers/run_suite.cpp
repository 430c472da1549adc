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

#include "drivers/run_suite.hpp"

#include "engine/suite_config.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/auto_cleaners.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

namespace fs = utils::fs;

using utils::optional;


/// Pure abstract destructor.
drivers::run_suite::base_hooks::~base_hooks(void)
{
}


/// Computes the template for the directory holding compiled programs.
///
/// \return A template for fs::scratch_directory in TMPDIR, or in /tmp if the
/// variable is not defined.
fs::path
drivers::run_suite::build_root_template(void)
{
    const optional< std::string > tmpdir = utils::getenv("TMPDIR");
    if (tmpdir && !tmpdir.get().empty())
        return fs::path(tmpdir.get()) / "testio.XXXXXX";
    else
        return fs::path("/tmp/testio.XXXXXX");
}


/// Executes the operation.
///
/// \param suite_path The path to the JSON definition of the suite.
/// \param config The settings of the engine.
/// \param hooks The hooks for this execution.
///
/// \returns A structure with all results computed by this driver.
///
/// \throw engine::config_error If the definition of the suite is invalid.
/// \throw engine::interrupted_error If the run is cancelled.
/// \throw utils::signals::interrupted_error If a signal interrupts the run.
drivers::run_suite::result
drivers::run_suite::drive(const fs::path& suite_path,
                          const engine::config& config,
                          base_hooks& hooks)
{
    const model::submission_config submission =
        engine::parse_suite_config(suite_path);
    hooks.got_suite(suite_path, submission);

    fs::scratch_directory build_root(build_root_template());
    LD(F("Using %s as the build root for %s") % build_root.directory() %
       suite_path);

    engine::suite_runner runner(submission, config, build_root.directory());
    const model::suite_report report = runner.run(&hooks);

    build_root.cleanup();
    return result(submission, report);
}
