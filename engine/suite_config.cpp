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

#include "engine/suite_config.hpp"

#include <cmath>
#include <fstream>
#include <set>

#include <nlohmann/json.hpp>

#include "engine/exceptions.hpp"
#include "model/test_case.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace text = utils::text;

using nlohmann::json;
using utils::none;
using utils::optional;


namespace {


/// Timeout above which a test is reported by the strict validation.
static const double strict_max_timeout = 60.0;


/// Longest timeout accepted for a test, in seconds (one day).
static const double max_timeout = 86400.0;


/// Keys recognized at the top level of a suite definition.
static const char* const known_suite_keys[] = {
    "command", "run_command", "compile_command", "path", "tests", NULL,
};


/// Keys recognized in the definition of a test case.
static const char* const known_test_keys[] = {
    "input", "output", "timeout", "interleaved", "unordered", "use_regex",
    NULL,
};


/// Reads a JSON document from a stream.
///
/// \param input The stream to read from.
///
/// \return The parsed document.
///
/// \throw engine::config_error If the document is not valid JSON or if its
///     top-level value is not an object.
static json
read_document(std::istream& input)
{
    json document;
    try {
        input >> document;
    } catch (const json::exception& e) {
        throw engine::config_error(F("Invalid JSON: %s") % e.what());
    }
    if (!document.is_object())
        throw engine::config_error("Invalid suite definition: top-level value "
                                   "must be an object");
    return document;
}


/// Opens a suite definition file.
///
/// \param file The file to open.
/// \param [out] input The stream to attach to the file.
///
/// \throw engine::config_error If the file cannot be opened.
static void
open_file(const fs::path& file, std::ifstream& input)
{
    input.open(file.c_str());
    if (!input)
        throw engine::config_error(F("Cannot open suite definition '%s'") %
                                   file);
}


/// Gets an optional string field of an object.
///
/// \param object The JSON object to query.
/// \param key The name of the field.
/// \param context Description of the object, for error reporting purposes.
///
/// \return The value of the field, or none if it is absent or null.
///
/// \throw engine::config_error If the field is not a string.
static optional< std::string >
get_optional_string(const json& object, const char* key,
                    const std::string& context)
{
    const json::const_iterator iter = object.find(key);
    if (iter == object.end() || iter->is_null())
        return none;
    if (!iter->is_string())
        throw engine::config_error(F("Invalid '%s' in %s: must be a string") %
                                   key % context);
    return utils::make_optional(iter->get< std::string >());
}


/// Gets an optional boolean field of an object.
///
/// \param object The JSON object to query.
/// \param key The name of the field.
/// \param context Description of the object, for error reporting purposes.
///
/// \return The value of the field, or false if it is absent.
///
/// \throw engine::config_error If the field is not a boolean.
static bool
get_optional_bool(const json& object, const char* key,
                  const std::string& context)
{
    const json::const_iterator iter = object.find(key);
    if (iter == object.end() || iter->is_null())
        return false;
    if (!iter->is_boolean())
        throw engine::config_error(F("Invalid '%s' in %s: must be a boolean") %
                                   key % context);
    return iter->get< bool >();
}


/// Converts a block of text into lines.
///
/// \param value The text.  An empty string yields no lines and a trailing
///     newline does not produce an empty last line.
///
/// \return The lines of the text.
static model::lines_vector
split_text(const std::string& value)
{
    model::lines_vector lines = text::split(value, '\n');
    if (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}


/// Gets the lines of the input or output of a test case.
///
/// \param object The JSON object describing the test case.
/// \param key The name of the field; either input or output.
/// \param context Description of the test case, for error reporting purposes.
///
/// \return The lines in the field, empty if the field is absent.
///
/// \throw engine::config_error If the field has an invalid type.
static model::lines_vector
get_lines(const json& object, const char* key, const std::string& context)
{
    const json::const_iterator iter = object.find(key);
    if (iter == object.end() || iter->is_null())
        return model::lines_vector();

    if (iter->is_string())
        return split_text(iter->get< std::string >());

    if (iter->is_array()) {
        model::lines_vector lines;
        for (json::const_iterator line = iter->begin(); line != iter->end();
             ++line) {
            if (!line->is_string())
                throw engine::config_error(F("Invalid '%s' in %s: array "
                                             "items must be strings") %
                                           key % context);
            lines.push_back(line->get< std::string >());
        }
        return lines;
    }

    throw engine::config_error(F("Invalid '%s' in %s: must be a string or an "
                                 "array of strings") % key % context);
}


/// Converts a timeout in seconds to a delta.
///
/// \param object The JSON object describing the test case.
/// \param context Description of the test case, for error reporting purposes.
///
/// \return The timeout of the test case.
///
/// \throw engine::config_error If the timeout is missing, not positive or
///     longer than max_timeout.
static datetime::delta
get_timeout(const json& object, const std::string& context)
{
    const json::const_iterator iter = object.find("timeout");
    if (iter == object.end() || iter->is_null())
        throw engine::config_error(F("Missing 'timeout' in %s") % context);
    if (!iter->is_number())
        throw engine::config_error(F("Invalid 'timeout' in %s: must be a "
                                     "number") % context);

    const double seconds = iter->get< double >();
    if (!(seconds > 0))
        throw engine::config_error(F("Invalid 'timeout' in %s: must be "
                                     "positive") % context);
    if (seconds > max_timeout)
        throw engine::config_error(F("Invalid 'timeout' in %s: must not "
                                     "exceed %s seconds") % context %
                                   static_cast< int >(max_timeout));
    const int64_t useconds = static_cast< int64_t >(
        std::floor(seconds * 1000000.0));
    if (useconds <= 0)
        throw engine::config_error(F("Invalid 'timeout' in %s: must be "
                                     "positive") % context);
    return datetime::delta::from_microseconds(useconds);
}


/// Builds a test case out of its JSON definition.
///
/// \param object The JSON value describing the test case.
/// \param index Zero-based position of the test case in the suite.
///
/// \return The parsed test case.
///
/// \throw engine::config_error If the definition is invalid.
static model::test_case
parse_test(const json& object, const std::size_t index)
{
    const std::string context = F("test #%s") % (index + 1);

    if (!object.is_object())
        throw engine::config_error(F("Invalid %s: must be an object") %
                                   context);

    model::test_case_builder builder;
    builder.set_input(get_lines(object, "input", context));
    builder.set_expected_output(get_lines(object, "output", context));
    builder.set_timeout(get_timeout(object, context));
    builder.set_interleaved(get_optional_bool(object, "interleaved", context));
    builder.set_unordered(get_optional_bool(object, "unordered", context));
    builder.set_use_regex(get_optional_bool(object, "use_regex", context));
    return builder.build();
}


/// Builds a suite definition out of its JSON document.
///
/// \param document The JSON document.
/// \param base_directory Directory against which to resolve a relative path.
///
/// \return The parsed suite definition.
///
/// \throw engine::config_error If the definition is invalid.
static model::submission_config
parse_document(const json& document, const fs::path& base_directory)
{
    const std::string context = "suite definition";

    const optional< std::string > command = get_optional_string(
        document, "command", context);
    const optional< std::string > run_command = get_optional_string(
        document, "run_command", context);
    const optional< std::string > compile_command = get_optional_string(
        document, "compile_command", context);
    if ((!command || command.get().empty()) &&
        (!run_command || run_command.get().empty()) &&
        (!compile_command || compile_command.get().empty()))
        throw engine::config_error("Missing 'command', 'run_command' or "
                                   "'compile_command' in suite definition");

    const optional< std::string > raw_path = get_optional_string(
        document, "path", context);
    if (!raw_path || raw_path.get().empty())
        throw engine::config_error("Missing 'path' in suite definition");
    fs::path path(".");
    try {
        path = fs::path(raw_path.get());
    } catch (const fs::error& e) {
        throw engine::config_error(F("Invalid 'path' in suite definition: %s")
                                   % e.what());
    }
    if (!path.is_absolute())
        path = base_directory / path;

    const json::const_iterator tests = document.find("tests");
    if (tests == document.end() || tests->is_null())
        throw engine::config_error("Missing 'tests' in suite definition");
    if (!tests->is_array() || tests->empty())
        throw engine::config_error("Invalid 'tests' in suite definition: must "
                                   "be a non-empty array");

    model::test_cases_vector test_cases;
    for (std::size_t i = 0; i < tests->size(); ++i)
        test_cases.push_back(parse_test((*tests)[i], i));

    return model::submission_config(command, run_command, compile_command,
                                    path, test_cases);
}


/// Reports keys of an object that are not part of the schema.
///
/// \param object The JSON object to scan.
/// \param known NULL-terminated list of valid keys.
/// \param context Description of the object, for reporting purposes.
/// \param [in,out] warnings The collection to which to add the warnings.
static void
check_unknown_keys(const json& object, const char* const* known,
                   const std::string& context,
                   engine::warnings_vector& warnings)
{
    std::set< std::string > valid;
    for (const char* const* iter = known; *iter != NULL; ++iter)
        valid.insert(*iter);

    for (json::const_iterator iter = object.begin(); iter != object.end();
         ++iter) {
        if (valid.find(iter.key()) == valid.end())
            warnings.push_back(F("Unknown key '%s' in %s") % iter.key() %
                               context);
    }
}


}  // anonymous namespace


/// Parses a suite definition file.
///
/// \param file The file to parse.  Relative program paths in the file are
///     resolved against the directory containing it.
///
/// \return The suite definition.
///
/// \throw config_error If the file cannot be read or is invalid.
model::submission_config
engine::parse_suite_config(const fs::path& file)
{
    LI(F("Loading suite definition from '%s'") % file);
    std::ifstream input;
    open_file(file, input);
    return parse_suite_config(input, file.branch_path());
}


/// Parses a suite definition from a stream.
///
/// \param input The stream to read the JSON document from.
/// \param base_directory Directory against which to resolve a relative path.
///
/// \return The suite definition.
///
/// \throw config_error If the definition is invalid.
model::submission_config
engine::parse_suite_config(std::istream& input, const fs::path& base_directory)
{
    return parse_document(read_document(input), base_directory);
}


/// Validates a suite definition file without running anything.
///
/// \param file The file to validate.
/// \param strict Whether to report questionable but valid test cases.
///
/// \return The non-fatal problems found in the definition.
///
/// \throw config_error If the file cannot be read or is invalid.
engine::warnings_vector
engine::validate_suite_config(const fs::path& file, const bool strict)
{
    std::ifstream input;
    open_file(file, input);
    return validate_suite_config(input, file.branch_path(), strict);
}


/// Validates a suite definition from a stream without running anything.
///
/// \param input The stream to read the JSON document from.
/// \param base_directory Directory against which to resolve a relative path.
/// \param strict Whether to report tests with no expected output and tests
///     with very long timeouts.
///
/// \return The non-fatal problems found in the definition.
///
/// \throw config_error If the definition is invalid.
engine::warnings_vector
engine::validate_suite_config(std::istream& input,
                              const fs::path& base_directory,
                              const bool strict)
{
    const json document = read_document(input);
    const model::submission_config config = parse_document(document,
                                                           base_directory);

    warnings_vector warnings;

    if (!fs::exists(config.path()))
        warnings.push_back(F("Path '%s' does not exist") % config.path());

    check_unknown_keys(document, known_suite_keys, "suite definition",
                       warnings);
    const json& tests = document["tests"];
    for (std::size_t i = 0; i < tests.size(); ++i)
        check_unknown_keys(tests[i], known_test_keys,
                           F("test #%s") % (i + 1), warnings);

    if (strict) {
        for (std::size_t i = 0; i < config.tests().size(); ++i) {
            const model::test_case& test = config.tests()[i];
            if (test.expected_output().empty())
                warnings.push_back(F("test #%s has no expected output") %
                                   (i + 1));
            if (test.timeout().to_seconds() > strict_max_timeout)
                warnings.push_back(F("test #%s has a timeout of %.2fs, above "
                                     "%.0fs") % (i + 1) %
                                   test.timeout().to_seconds() %
                                   strict_max_timeout);
        }
    }

    for (warnings_vector::const_iterator iter = warnings.begin();
         iter != warnings.end(); ++iter)
        LW(*iter);
    return warnings;
}


/// Expands the path of a suite definition into the programs to test.
///
/// \param config The suite definition.
///
/// \return The path itself if it is a file; otherwise, the regular, non-hidden
/// files in the directory sorted by name.
///
/// \throw config_error If the path does not exist or cannot be listed.
engine::paths_vector
engine::list_programs(const model::submission_config& config)
{
    const fs::path& path = config.path();

    if (!fs::exists(path))
        throw config_error(F("Path '%s' does not exist") % path);

    paths_vector programs;
    if (fs::is_directory(path)) {
        std::set< std::string > entries;
        try {
            entries = fs::list_directory(path);
        } catch (const fs::error& e) {
            throw config_error(F("Cannot list '%s': %s") % path % e.what());
        }
        for (std::set< std::string >::const_iterator iter = entries.begin();
             iter != entries.end(); ++iter) {
            if ((*iter)[0] == '.')
                continue;
            const fs::path entry = path / *iter;
            if (fs::is_regular_file(entry))
                programs.push_back(entry);
        }
    } else {
        programs.push_back(path);
    }
    return programs;
}
