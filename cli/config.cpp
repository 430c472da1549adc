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

#include "cli/config.hpp"

#include "engine/exceptions.hpp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;

using utils::none;
using utils::optional;


namespace {


/// Basename of the configuration file.
static const char* config_basename = "testio.conf";


/// Magic string to disable loading of configuration files.
static const char* none_config = "none";


/// Overrides the location of the system-wide configuration, for testing.
static optional< fs::path > confdir_for_testing;


/// Scans the directories containing configuration files for a file.
///
/// \return The path to the configuration file to load, or none if no file
/// exists in any of the known locations.
static optional< fs::path >
find_config_file(void)
{
    const optional< fs::path > home = utils::get_home();
    if (home) {
        const fs::path path = home.get() / ".testio" / config_basename;
        LI(F("Looking for configuration file in home directory: %s") % path);
        if (fs::exists(path))
            return utils::make_optional(path);
    }

    const fs::path path = cli::detail::system_config_path();
    LI(F("Looking for system-wide configuration file: %s") % path);
    if (fs::exists(path))
        return utils::make_optional(path);

    return none;
}


/// Loads the configuration file for this session, if any.
///
/// \param cmdline The parsed command line.
///
/// \return The loaded configuration, or the defaults if there is no file.
///
/// \throw engine::load_error If the file exists but cannot be loaded.
static engine::config
load_config_file(const cmdline::parsed_cmdline& cmdline)
{
    if (cmdline.has_option(cli::config_option.long_name())) {
        const fs::path path = cmdline.get_option< cmdline::path_option >(
            cli::config_option.long_name());
        if (path.str() == none_config) {
            LI("Configuration loading disabled; using defaults");
            return engine::config::defaults();
        }
        return engine::config::load(path);
    }

    const optional< fs::path > path = find_config_file();
    if (!path) {
        LI("No configuration file found; using defaults");
        return engine::config::defaults();
    }
    return engine::config::load(path.get());
}


}  // anonymous namespace


/// Standard definition of the option to specify a configuration file.
///
/// You must use load_config() to load a configuration file while honoring the
/// value of this flag.
const cmdline::path_option cli::config_option(
    "config",
    "Path to the configuration file, or 'none' to use the built-in defaults",
    "file");


/// Standard definition of the option to override configuration variables.
///
/// You must use load_config() to load a configuration file while honoring the
/// values of this flag.
const cmdline::property_option cli::variable_option(
    'v', "variable",
    "Overrides a particular configuration variable",
    "K=V");


/// Computes the path to the system-wide configuration file.
///
/// The directory is taken from the TESTIO_CONFDIR environment variable if
/// defined, or from the location chosen at build time otherwise.
///
/// \return The path to the system-wide configuration file.
fs::path
cli::detail::system_config_path(void)
{
    if (confdir_for_testing)
        return confdir_for_testing.get() / config_basename;

    const optional< std::string > confdir = utils::getenv(
        "TESTIO_CONFDIR");
    if (confdir && !confdir.get().empty())
        return fs::path(confdir.get()) / config_basename;
    else
        return fs::path(TESTIO_CONFDIR) / config_basename;
}


/// Changes the location of the system-wide configuration directory.
///
/// \param dir The new location of the configuration directory.
void
cli::detail::set_confdir_for_testing(const fs::path& dir)
{
    confdir_for_testing = dir;
}


/// Loads the configuration file for this session, if any.
///
/// This is a helper function that does not apply user-specified overrides.
/// See the documentation for cli::load_config() for more details.
///
/// \param cmdline The parsed command line.
/// \param required Whether the loading of the configuration file must succeed.
///     Some commands should run regardless, and therefore we need to set this
///     to false for those commands.
///
/// \return The loaded configuration file, or the built-in defaults if loading
/// is not required and fails.
///
/// \throw engine::load_error If the file cannot be loaded and required is
///     true.
/// \throw cmdline::usage_error If any user-provided override is invalid.
engine::config
cli::load_config(const cmdline::parsed_cmdline& cmdline, const bool required)
{
    engine::config config = engine::config::defaults();
    try {
        config = load_config_file(cmdline);
    } catch (const engine::load_error& e) {
        if (required)
            throw;
        LW(F("Ignoring failure to load configuration because the requested "
             "command should not fail: %s") % e.what());
    }

    try {
        return config.apply_overrides(
            cmdline.get_multi_option< cmdline::property_option >(
                variable_option.long_name()));
    } catch (const engine::error& e) {
        throw cmdline::usage_error(e.what());
    }
}
