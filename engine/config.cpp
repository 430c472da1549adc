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

#include "engine/config.hpp"

#include <stdexcept>

#include <lutok/exceptions.hpp>
#include <lutok/operations.hpp>
#include <lutok/stack_cleaner.hpp>
#include <lutok/state.ipp>

#include "engine/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace text = utils::text;


namespace {


/// Name of the only file format accepted by load().
static const char* const config_format = "config";


/// Version of the only file format accepted by load().
static const int config_version = 1;


/// Implementation of the Lua syntax() function.
///
/// Records the format and version requested by the configuration file so
/// that load() can validate them once the file has been processed.
///
/// \pre state(-2) The syntax format name.
/// \pre state(-1) The syntax format version.
///
/// \param state The Lua state to operate in.
///
/// \return The number of results pushed onto the stack; always 0.
static int
lua_syntax(lutok::state& state)
{
    if (!state.is_string(-2))
        throw std::runtime_error("First argument to syntax must be a string");
    const std::string syntax_format = state.to_string(-2);

    if (!state.is_number(-1))
        throw std::runtime_error("Second argument to syntax must be a number");
    const int syntax_version = state.to_integer(-1);

    state.get_global("_syntax_format");
    const bool already_called = !state.is_nil();
    state.pop(1);
    if (already_called)
        throw std::runtime_error("syntax() can only be invoked once");

    state.push_string(syntax_format);
    state.set_global("_syntax_format");
    state.push_integer(syntax_version);
    state.set_global("_syntax_version");

    return 0;
}


/// Validates the syntax requested by an already loaded file.
///
/// \param state The Lua state.
///
/// \throw std::runtime_error If syntax() was not called or if it requested an
///     unsupported format.
static void
check_syntax(lutok::state& state)
{
    lutok::stack_cleaner cleaner(state);

    state.get_global("_syntax_format");
    state.get_global("_syntax_version");
    if (state.is_nil(-2) || state.is_nil(-1))
        throw std::runtime_error("Syntax not defined; must call syntax()");

    const std::string format = state.to_string(-2);
    const int version = state.to_integer(-1);
    if (format != config_format)
        throw std::runtime_error(F("Unexpected file format '%s'; need '%s'") %
                                 format % config_format);
    if (version != config_version)
        throw std::runtime_error(F("Unexpected file version '%s'; only %s is "
                                   "supported") % version % config_version);
}


/// Queries an optional Lua integer variable that must be positive.
///
/// \param state The Lua state.
/// \param expr An expression to resolve the variable to query.
/// \param default_value The default value for the variable.
///
/// \return The value of 'expr', or default_value if 'expr' is nil.
///
/// \throw std::runtime_error If the variable has an invalid type or value.
static int64_t
get_positive_var(lutok::state& state, const std::string& expr,
                 const int64_t default_value)
{
    lutok::stack_cleaner cleaner(state);
    lutok::eval(state, expr, 1);
    if (state.is_nil())
        return default_value;
    else if (state.is_number()) {
        const int64_t value = state.to_integer();
        if (value <= 0)
            throw std::runtime_error(F("Invalid value for variable '%s': must "
                                       "be a positive integer") % expr);
        return value;
    } else
        throw std::runtime_error(F("Invalid type for variable '%s': must be "
                                   "an integer") % expr);
}


/// Parses the textual value of an override that must be a positive integer.
///
/// \param override The override being processed.
///
/// \return The parsed value.
///
/// \throw engine::error If the value is not valid.
static int64_t
parse_positive_override(const engine::override_pair& override)
{
    int64_t value;
    try {
        value = text::to_type< int64_t >(override.second);
    } catch (const text::value_error& e) {
        throw engine::error(F("Invalid value in override '%s=%s': %s") %
                            override.first % override.second % e.what());
    }
    if (value <= 0)
        throw engine::error(F("Invalid value in override '%s=%s': must be a "
                              "positive integer") % override.first %
                            override.second);
    return value;
}


/// Applies a text-form override to a configuration object.
///
/// \param config [in,out] The configuration to which the override will be
///     applied.
/// \param override The override to apply.
///
/// \throw engine::error If the override has an invalid name or value.
static void
apply_override(engine::config& config, const engine::override_pair& override)
{
    LI(F("Applying override to configuration: key %s, value %s") %
       override.first % override.second);

    if (override.first == "parallelism") {
        config.parallelism = parse_positive_override(override);
    } else if (override.first == "quiescence_ms") {
        config.quiescence = datetime::delta::from_milliseconds(
            parse_positive_override(override));
    } else if (override.first == "compile_timeout") {
        config.compile_timeout = datetime::delta(
            parse_positive_override(override), 0);
    } else if (override.first == "max_output_bytes") {
        config.max_output_bytes = parse_positive_override(override);
    } else {
        throw engine::error(F("Unrecognized configuration property '%s' in "
                              "override '%s=%s'") % override.first %
                            override.first % override.second);
    }
}


}  // anonymous namespace


/// Constructs a config from initialized data.
///
/// Use load() to parse a configuration file and construct a config object.
///
/// \param parallelism_ Maximum number of concurrent units of work.
/// \param quiescence_ Silence window of interactive programs.
/// \param compile_timeout_ Time limit of compile commands.
/// \param max_output_bytes_ Limit of captured output per program run.
engine::config::config(const std::size_t parallelism_,
                       const datetime::delta& quiescence_,
                       const datetime::delta& compile_timeout_,
                       const std::size_t max_output_bytes_) :
    parallelism(parallelism_),
    quiescence(quiescence_),
    compile_timeout(compile_timeout_),
    max_output_bytes(max_output_bytes_)
{
    PRE(parallelism > 0);
    PRE(max_output_bytes > 0);
}


/// Constructs a config with the built-in settings.
///
/// \return The default settings.
engine::config
engine::config::defaults(void)
{
    return config(4, datetime::delta::from_milliseconds(100),
                  datetime::delta(30, 0), 16 * 1024 * 1024);
}


/// Parses a configuration file.
///
/// \param file The file to parse.
///
/// \return The settings in the file, with defaults for the variables that
/// the file does not set.
///
/// \throw load_error If there is any problem loading the file.  This includes
///     file access errors and syntax errors.
engine::config
engine::config::load(const fs::path& file)
{
    LI(F("Loading configuration file '%s'") % file);

    config values = defaults();

    try {
        lutok::state state;
        lutok::stack_cleaner cleaner(state);

        state.open_base();
        state.open_string();
        state.open_table();
        state.push_cxx_function(lua_syntax);
        state.set_global("syntax");

        lutok::do_file(state, file.str(), 0, 0, 0);
        check_syntax(state);

        values.parallelism = get_positive_var(state, "parallelism",
                                              values.parallelism);
        values.quiescence = datetime::delta::from_milliseconds(
            get_positive_var(state, "quiescence_ms",
                             values.quiescence.to_milliseconds()));
        values.compile_timeout = datetime::delta(
            get_positive_var(state, "compile_timeout",
                             values.compile_timeout.to_microseconds() /
                             1000000), 0);
        values.max_output_bytes = get_positive_var(state, "max_output_bytes",
                                                   values.max_output_bytes);
    } catch (const std::runtime_error& e) {
        throw load_error(file, e.what());
    }

    return values;
}


/// Updates properties in a configuration object based on textual definitions.
///
/// \param overrides The list of overrides to process, as provided by the user
///     in the command line with -v key=value.
///
/// \return A new configuration object with the overrides applied.
///
/// \throw error If any override is invalid.
engine::config
engine::config::apply_overrides(
    const std::vector< override_pair >& overrides) const
{
    config new_config(*this);

    for (std::vector< override_pair >::const_iterator iter = overrides.begin();
         iter != overrides.end(); iter++) {
        apply_override(new_config, *iter);
    }

    return new_config;
}


/// Returns all configuration properties as a key/value map.
///
/// The key names match the names of the variables in configuration files.
///
/// \return A key/value mapping describing all configuration properties.
engine::properties_map
engine::config::all_properties(void) const
{
    properties_map properties;

    properties["parallelism"] = (F("%s") % parallelism).str();
    properties["quiescence_ms"] = (F("%s") %
                                   quiescence.to_milliseconds()).str();
    properties["compile_timeout"] = (F("%s") %
        (compile_timeout.to_microseconds() / 1000000)).str();
    properties["max_output_bytes"] = (F("%s") % max_output_bytes).str();

    return properties;
}


/// Checks if two configuration objects are equal.
///
/// \param other The object to compare to.
///
/// \return True if other and this are equal; false otherwise.
bool
engine::config::operator==(const config& other) const
{
    return (parallelism == other.parallelism &&
            quiescence == other.quiescence &&
            compile_timeout == other.compile_timeout &&
            max_output_bytes == other.max_output_bytes);
}


/// Checks if two configuration objects are different.
///
/// \param other The object to compare to.
///
/// \return True if other and this are different; false otherwise.
bool
engine::config::operator!=(const config& other) const
{
    return !(*this == other);
}
