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

#include "engine/launcher.hpp"

#include <cstdlib>

#include "engine/cancellation.hpp"
#include "engine/exceptions.hpp"
#include "engine/io_director.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/child.hpp"
#include "utils/process/exceptions.hpp"
#include "utils/process/status.hpp"
#include "utils/sanity.hpp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace process = utils::process;
namespace text = utils::text;

using utils::none;
using utils::optional;


namespace {


/// Formats the diagnostics printed by a compiler.
///
/// \param outcome The result of running the compiler.
///
/// \return The stdout and stderr of the compiler, or a placeholder if empty.
static std::string
diagnostics(const engine::io_outcome& outcome)
{
    std::string text = text::join(outcome.output, "\n");
    if (!text.empty() && !outcome.error_output.empty())
        text += "\n";
    text += outcome.error_output;
    return text.empty() ? "(no diagnostics)" : text;
}


/// Describes how a process terminated.
///
/// \param status The termination status.
///
/// \return A user-friendly description.
static std::string
describe(const process::status& status)
{
    if (status.exited())
        return F("exit code %s") % status.exitstatus();
    else
        return F("signal %s") % status.termsig();
}


}  // anonymous namespace


/// Computes the command line to run a program.
///
/// \param run_command The command configured for the suite, if any.  It is
///     split into words like a shell would, without any expansions.
/// \param executable The program to run, appended as the last argument.
///
/// \return The full argument vector, including the name of the program to
/// execute as its first item.
///
/// \throw spawn_error If the command cannot be split into words.
process::args_vector
engine::build_command(const optional< std::string >& run_command,
                      const fs::path& executable)
{
    process::args_vector command;
    if (run_command) {
        try {
            command = text::split_words(run_command.get());
        } catch (const text::syntax_error& e) {
            throw spawn_error(F("Invalid command '%s': %s") %
                              run_command.get() % e.what());
        }
    }
    command.push_back(executable.str());
    return command;
}


/// Replaces the placeholders of a compile command.
///
/// \param compile_command The command with {source} and {output} markers.
/// \param source The absolute path to the source file.
/// \param output The absolute path to the artifact to generate.
///
/// \return The command ready to be passed to the shell.
std::string
engine::expand_compile_command(const std::string& compile_command,
                               const fs::path& source, const fs::path& output)
{
    return text::replace_all(
        text::replace_all(compile_command, "{source}", source.str()),
        "{output}", output.str());
}


/// Constructs a launcher.
///
/// \param submission_ Definition of the suite.
/// \param config_ Settings of the engine.
/// \param build_root_ Existing directory in which to place compiled
///     artifacts.  The caller is responsible for cleaning it up.
/// \param cancellation_ Suite-wide cancellation; may be NULL.
engine::launcher::launcher(const model::submission_config& submission_,
                           const engine::config& config_,
                           const fs::path& build_root_,
                           cancellation* cancellation_) :
    _submission(submission_),
    _config(config_),
    _build_root(build_root_),
    _cancellation(cancellation_)
{
}


/// Checks whether programs have to be compiled before running them.
///
/// \return True if the suite has a compile command.
bool
engine::launcher::needs_compilation(void) const
{
    return _submission.compile_command() &&
        !_submission.compile_command().get().empty();
}


/// Compiles a program.
///
/// The compile command is run through /bin/sh in the directory of the source
/// file, with an empty stdin and its output captured for diagnostics.
///
/// \pre needs_compilation() is true.
///
/// \param source The source file of the program.
///
/// \return The path to the generated executable.
///
/// \throw compile_error If the compiler fails, times out or does not create
///     the artifact.
/// \throw interrupted_error If the run is cancelled during the compilation.
fs::path
engine::launcher::compile(const fs::path& source) const
{
    PRE(needs_compilation());

    const fs::path abs_source = source.to_absolute();
    fs::path output_directory(".");
    try {
        output_directory = fs::mkdtemp(_build_root / "build.XXXXXX");
    } catch (const fs::error& e) {
        throw compile_error(F("Cannot create build directory for '%s': %s") %
                            source % e.what());
    }
    const fs::path output = output_directory.to_absolute() / abs_source.stem();
    const std::string command = expand_compile_command(
        _submission.compile_command().get(), abs_source, output);
    LI(F("Compiling '%s' with: %s") % source % command);

    process::args_vector args;
    args.push_back("-c");
    args.push_back(command);
    std::unique_ptr< process::child > child;
    try {
        child = process::child::spawn(
            "/bin/sh", args, utils::make_optional(abs_source.branch_path()));
    } catch (const process::error& e) {
        throw compile_error(F("Cannot run compiler for '%s': %s") % source %
                            e.what());
    }

    const io_outcome outcome = drive(
        *child, model::lines_vector(), false,
        io_limits(_config.compile_timeout, _config.quiescence,
                  _config.max_output_bytes),
        _cancellation);

    switch (outcome.state) {
    case io_cancelled:
        throw interrupted_error(F("Compilation of '%s' cancelled") % source);

    case io_timed_out:
        throw compile_error(F("Compilation of '%s' timed out after %s "
                              "seconds\n%s") % source %
                            (_config.compile_timeout.to_microseconds() /
                             1000000) % diagnostics(outcome));

    case io_errored:
        throw compile_error(F("Compilation of '%s' failed: %s") % source %
                            outcome.failure.get());

    case io_done:
        break;
    }

    INV(outcome.status);
    const process::status& status = outcome.status.get();
    if (!status.exited() || status.exitstatus() != EXIT_SUCCESS)
        throw compile_error(F("Compilation of '%s' failed with %s\n%s") %
                            source % describe(status) % diagnostics(outcome));

    if (!fs::exists(output))
        throw compile_error(F("Compilation of '%s' did not produce '%s'\n%s") %
                            source % output % diagnostics(outcome));

    LI(F("Compiled '%s' into '%s'") % source % output);
    return output;
}


/// Spawns a program with its stdin, stdout and stderr connected to pipes.
///
/// \param executable The program to run, either the original program or the
///     artifact returned by compile().
///
/// \return The spawned process, leader of its own process group.
///
/// \throw spawn_error If the program or its interpreter cannot be executed.
std::unique_ptr< process::child >
engine::launcher::spawn(const fs::path& executable) const
{
    const process::args_vector command = build_command(
        _submission.effective_run_command(), executable.to_absolute());
    INV(!command.empty());

    const process::args_vector args(command.begin() + 1, command.end());
    try {
        return process::child::spawn(command[0], args, none);
    } catch (const process::error& e) {
        throw spawn_error(e.what());
    }
}
