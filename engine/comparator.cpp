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

#include "engine/comparator.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <regex>
#include <vector>

#include "model/test_case.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

using utils::none;
using utils::optional;


namespace {


/// Returns the line at a given position, if any.
///
/// \param lines The collection of lines.
/// \param index The position to query.
///
/// \return The line, or none if the collection is too short.
static optional< std::string >
line_at(const model::lines_vector& lines, const std::size_t index)
{
    if (index < lines.size())
        return utils::make_optional(lines[index]);
    else
        return none;
}


/// Builds the result of a failed comparison.
///
/// \param expected The expected lines.
/// \param actual The actual lines.
/// \param index Position of the first difference.
///
/// \return A mismatch pointing at the lines found at index.
static engine::comparison
mismatch_at(const model::lines_vector& expected,
            const model::lines_vector& actual, const std::size_t index)
{
    return engine::comparison(
        model::verdict_mismatch,
        utils::make_optional(model::output_diff(
            index, line_at(expected, index), line_at(actual, index))));
}


/// Builds the result of a successful comparison.
///
/// \return A match without differences.
static engine::comparison
match(void)
{
    return engine::comparison(model::verdict_match,
                              optional< model::output_diff >());
}


/// Compiles a regular expression, if valid.
///
/// \param pattern The ECMAScript regular expression.
///
/// \return The compiled expression, or none if the pattern is invalid.
static optional< std::regex >
compile(const std::string& pattern)
{
    if (pattern.length() > engine::max_regex_length) {
        LW(F("Regular expression of %s bytes exceeds the limit of %s") %
           pattern.length() % engine::max_regex_length);
        return none;
    }
    try {
        return utils::make_optional(std::regex(pattern,
                                               std::regex::ECMAScript));
    } catch (const std::regex_error& e) {
        LW(F("Invalid regular expression '%s': %s") % pattern % e.what());
        return none;
    }
}


/// Compiles a collection of regular expressions.
///
/// \param patterns The ECMAScript regular expressions.
///
/// \return The compiled expressions; invalid patterns yield none.
static std::vector< optional< std::regex > >
compile_all(const model::lines_vector& patterns)
{
    std::vector< optional< std::regex > > regexes;
    for (model::lines_vector::const_iterator iter = patterns.begin();
         iter != patterns.end(); ++iter)
        regexes.push_back(compile(*iter));
    return regexes;
}


/// Checks whether a line fully matches a compiled expression.
///
/// \param regex The compiled expression; none never matches.
/// \param line The line to check; lines above max_regex_length never match.
///
/// \return True if the expression matches the whole line.
static bool
matches(const optional< std::regex >& regex, const std::string& line)
{
    if (!regex)
        return false;
    if (line.length() > engine::max_regex_length) {
        LW(F("Not matching a line of %s bytes against a regular expression") %
           line.length());
        return false;
    }
    return std::regex_match(line, regex.get());
}


/// Compares two sequences of lines positionally.
static engine::comparison
compare_ordered(const model::lines_vector& expected,
                const model::lines_vector& actual, const bool use_regex)
{
    std::vector< optional< std::regex > > regexes;
    if (use_regex)
        regexes = compile_all(expected);

    const std::size_t common = std::min(expected.size(), actual.size());
    for (std::size_t i = 0; i < common; ++i) {
        const bool ok = use_regex ? matches(regexes[i], actual[i])
                                  : expected[i] == actual[i];
        if (!ok)
            return mismatch_at(expected, actual, i);
    }
    if (expected.size() != actual.size())
        return mismatch_at(expected, actual, common);
    return match();
}


/// Compares two sequences of lines as multisets.
///
/// On a mismatch, the difference points at the first expected line without
/// a counterpart or, if all of them have one, at the first surplus actual
/// line.
static engine::comparison
compare_multisets(const model::lines_vector& expected,
                  const model::lines_vector& actual)
{
    std::map< std::string, std::size_t > available;
    for (model::lines_vector::const_iterator iter = actual.begin();
         iter != actual.end(); ++iter)
        available[*iter]++;

    for (std::size_t i = 0; i < expected.size(); ++i) {
        std::map< std::string, std::size_t >::iterator iter =
            available.find(expected[i]);
        if (iter == available.end() || (*iter).second == 0)
            return engine::comparison(
                model::verdict_mismatch,
                utils::make_optional(model::output_diff(
                    i, utils::make_optional(expected[i]), none)));
        (*iter).second--;
    }

    for (std::size_t i = 0; i < actual.size(); ++i) {
        std::map< std::string, std::size_t >::iterator iter =
            available.find(actual[i]);
        INV(iter != available.end());
        if ((*iter).second > 0)
            return engine::comparison(
                model::verdict_mismatch,
                utils::make_optional(model::output_diff(
                    i, none, utils::make_optional(actual[i]))));
    }

    return match();
}


/// State of the search of a perfect matching between patterns and lines.
class bipartite_matcher {
    /// Adjacency matrix: _edges[i][j] iff pattern i matches line j.
    std::vector< std::vector< bool > > _edges;

    /// Pattern assigned to each line, or -1 if the line is free.
    std::vector< int > _owner;

    /// Lines visited during the current augmenting path search.
    std::vector< bool > _visited;

    /// Looks for an augmenting path starting at a pattern.
    ///
    /// \param pattern The pattern to assign.
    ///
    /// \return True if the pattern could be assigned a line.
    bool
    augment(const std::size_t pattern)
    {
        for (std::size_t line = 0; line < _owner.size(); ++line) {
            if (!_edges[pattern][line] || _visited[line])
                continue;
            _visited[line] = true;
            if (_owner[line] == -1 || augment(_owner[line])) {
                _owner[line] = pattern;
                return true;
            }
        }
        return false;
    }

public:
    /// Constructs the matcher for a set of patterns and lines.
    ///
    /// \param regexes The compiled patterns.
    /// \param lines The lines to assign to the patterns.
    bipartite_matcher(const std::vector< optional< std::regex > >& regexes,
                      const model::lines_vector& lines) :
        _edges(regexes.size(), std::vector< bool >(lines.size(), false)),
        _owner(lines.size(), -1)
    {
        for (std::size_t i = 0; i < regexes.size(); ++i)
            for (std::size_t j = 0; j < lines.size(); ++j)
                _edges[i][j] = matches(regexes[i], lines[j]);
    }

    /// Assigns a line to every pattern.
    ///
    /// \return The index of the first pattern that cannot be assigned a line
    /// in any perfect matching, or none if a perfect matching exists.
    optional< std::size_t >
    solve(void)
    {
        for (std::size_t pattern = 0; pattern < _edges.size(); ++pattern) {
            _visited.assign(_owner.size(), false);
            if (!augment(pattern))
                return utils::make_optional(pattern);
        }
        return none;
    }
};


/// Compares lines against patterns in any order.
static engine::comparison
compare_unordered_regex(const model::lines_vector& expected,
                        const model::lines_vector& actual)
{
    if (expected.size() != actual.size())
        return mismatch_at(expected, actual,
                           std::min(expected.size(), actual.size()));

    bipartite_matcher matcher(compile_all(expected), actual);
    const optional< std::size_t > unassigned = matcher.solve();
    if (unassigned)
        return engine::comparison(
            model::verdict_mismatch,
            utils::make_optional(model::output_diff(
                unassigned.get(),
                utils::make_optional(expected[unassigned.get()]), none)));
    return match();
}


}  // anonymous namespace


/// Judges the output of a program.
///
/// \param expected The expected output lines, or patterns if use_regex.
/// \param actual The lines printed by the program.
/// \param unordered Whether the order of the lines is irrelevant.
/// \param use_regex Whether the expected lines are regular expressions.
///
/// \return The verdict and, on a mismatch, the first difference found.
engine::comparison
engine::compare_output(const model::lines_vector& expected,
                       const model::lines_vector& actual,
                       const bool unordered, const bool use_regex)
{
    comparison result = match();
    if (unordered && use_regex)
        result = compare_unordered_regex(expected, actual);
    else if (unordered)
        result = compare_multisets(expected, actual);
    else
        result = compare_ordered(expected, actual, use_regex);

    POST((result.first == model::verdict_match && !result.second) ||
         (result.first == model::verdict_mismatch && result.second));
    return result;
}


/// Judges the output of a program against a test case.
///
/// \param test The test case that describes the expected output.
/// \param actual The lines printed by the program.
///
/// \return The verdict and, on a mismatch, the first difference found.
engine::comparison
engine::compare_output(const model::test_case& test,
                       const model::lines_vector& actual)
{
    return compare_output(test.expected_output(), actual, test.unordered(),
                          test.use_regex());
}
