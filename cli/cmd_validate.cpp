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

#include "cli/common.ipp"
#include "engine/exceptions.hpp"
#include "engine/suite_config.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;

using cli::cmd_validate;


/// Default constructor for cmd_validate.
cmd_validate::cmd_validate(void) : cli_command(
    "validate", "suite1 [.. suiteN]", 1, -1,
    "Checks suite definitions without running them")
{
    add_option(cmdline::bool_option(
        "strict", "Also warn about questionable but valid definitions"));
}


/// Entry point for the "validate" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param unused_config The runtime settings of the program.
///
/// \return 0 if all the definitions are valid; 1 otherwise.
int
cmd_validate::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
                  const engine::config& UTILS_UNUSED_PARAM(config))
{
    const bool strict = cmdline.has_option("strict");

    bool ok = true;
    for (cmdline::args_vector::const_iterator iter =
             cmdline.arguments().begin(); iter != cmdline.arguments().end();
         ++iter) {
        const fs::path path(*iter);
        try {
            const engine::warnings_vector warnings =
                engine::validate_suite_config(path, strict);
            for (engine::warnings_vector::const_iterator witer =
                     warnings.begin(); witer != warnings.end(); ++witer)
                cmdline::print_warning(ui, F("%s: %s") % path % *witer);
            ui->out(F("%s: OK (%s warnings)") % path % warnings.size());
        } catch (const engine::config_error& e) {
            LD(F("Validation of %s failed: %s") % path % e.what());
            cmdline::print_error(ui, F("%s: %s") % path %
                                 cli::format_error(e));
            ok = false;
        }
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
