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

#include "model/execution_result.hpp"

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace text = utils::text;

using utils::optional;


/// Returns the user-visible name of a verdict.
///
/// \param verdict The verdict to name.
///
/// \return One of MATCH, MISMATCH, TIMEOUT or ERROR.
std::string
model::verdict_name(const verdict_type verdict)
{
    switch (verdict) {
    case verdict_match: return "MATCH";
    case verdict_mismatch: return "MISMATCH";
    case verdict_timeout: return "TIMEOUT";
    case verdict_error: return "ERROR";
    }
    UNREACHABLE;
}


/// Constructs a new output difference.
///
/// \param index_ Zero-based index of the first mismatching line.
/// \param expected_ Expected line at that index, if any.
/// \param actual_ Actual line at that index, if any.
model::output_diff::output_diff(const std::size_t index_,
                                const optional< std::string >& expected_,
                                const optional< std::string >& actual_) :
    index(index_),
    expected(expected_),
    actual(actual_)
{
    PRE(expected_ || actual_);
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::output_diff::operator==(const output_diff& other) const
{
    return index == other.index && expected == other.expected &&
        actual == other.actual;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::output_diff::operator!=(const output_diff& other) const
{
    return !(*this == other);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const output_diff& object)
{
    output << F("output_diff{index=%s, expected=%s, actual=%s}")
        % object.index % object.expected % object.actual;
    return output;
}


/// Constructs a new execution result.
///
/// \param verdict_ The verdict of the test case.
/// \param actual_output_ Lines captured from the standard output.
/// \param error_ Error message, if any.
/// \param execution_time_ Wall-clock time taken by the program.
/// \param exit_code_ Exit code of the program, if it exited on its own.
/// \param diff_ First difference found by the comparison, if any.
model::execution_result::execution_result(
    const verdict_type verdict_,
    const lines_vector& actual_output_,
    const optional< std::string >& error_,
    const datetime::delta& execution_time_,
    const optional< int >& exit_code_,
    const optional< output_diff >& diff_) :
    _verdict(verdict_),
    _actual_output(actual_output_),
    _error(error_),
    _execution_time(execution_time_),
    _exit_code(exit_code_),
    _diff(diff_)
{
}


/// \return The verdict of the test case.
model::verdict_type
model::execution_result::verdict(void) const
{
    return _verdict;
}


/// \return The lines captured from the standard output of the program.
const model::lines_vector&
model::execution_result::actual_output(void) const
{
    return _actual_output;
}


/// \return The error message, if any.
const optional< std::string >&
model::execution_result::error(void) const
{
    return _error;
}


/// \return The wall-clock time taken by the program.
const datetime::delta&
model::execution_result::execution_time(void) const
{
    return _execution_time;
}


/// \return The exit code of the program, if it exited on its own.  This is
/// informational only and never affects the verdict.
const optional< int >&
model::execution_result::exit_code(void) const
{
    return _exit_code;
}


/// \return The first difference found by the comparison, if any.
const optional< model::output_diff >&
model::execution_result::diff(void) const
{
    return _diff;
}


/// Checks whether the test case passed.
///
/// \return True if the verdict is MATCH.
bool
model::execution_result::passed(void) const
{
    return _verdict == verdict_match;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::execution_result::operator==(const execution_result& other) const
{
    return (_verdict == other._verdict &&
            _actual_output == other._actual_output &&
            _error == other._error &&
            _execution_time == other._execution_time &&
            _exit_code == other._exit_code &&
            _diff == other._diff);
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::execution_result::operator!=(const execution_result& other) const
{
    return !(*this == other);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const execution_result& object)
{
    output << F("execution_result{verdict=%s, actual_output=%s, error=%s, "
                "execution_time=%s}")
        % verdict_name(object.verdict())
        % text::quote(text::join(object.actual_output(), "\\n"), '\'')
        % object.error()
        % object.execution_time();
    return output;
}
