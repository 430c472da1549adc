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

#include "utils/format/formatter.hpp"

#include <cctype>
#include <iomanip>
#include <string>

#include "utils/format/exceptions.hpp"
#include "utils/sanity.hpp"

namespace format = utils::format;


namespace {


/// Conversion letters accepted after the flags, width and precision.
static const std::string valid_conversions = "cdfsu";


/// Parsed representation of a single formatting placeholder.
struct placeholder {
    /// Length of the placeholder text, including the leading %.
    std::string::size_type length;

    /// Whether the value has to be aligned to the left of the field.
    bool left_align;

    /// Whether the field has to be padded with zeros instead of spaces.
    bool zero_fill;

    /// Minimum width of the field; 0 if unspecified.
    int width;

    /// Precision of floating point values; -1 if unspecified.
    int precision;

    placeholder(void) :
        length(0), left_align(false), zero_fill(false), width(0),
        precision(-1)
    {
    }
};


/// Locates the next placeholder in a string, skipping escaped % signs.
///
/// \param text The string to scan.
/// \param start Position from which to start scanning.
///
/// \return The position of the % that starts the placeholder, or npos.
static std::string::size_type
find_placeholder(const std::string& text, const std::string::size_type start)
{
    std::string::size_type pos = text.find('%', start);
    while (pos != std::string::npos && pos + 1 < text.length() &&
           text[pos + 1] == '%')
        pos = text.find('%', pos + 2);
    return pos;
}


/// Parses the placeholder that starts at a given position.
///
/// \param format The original format string, for error reporting.
/// \param text The string containing the placeholder.
/// \param pos Position of the % sign that starts the placeholder.
///
/// \return The parsed placeholder.
///
/// \throw bad_format_error If the placeholder is malformed.
static placeholder
parse_placeholder(const std::string& format, const std::string& text,
                  const std::string::size_type pos)
{
    PRE(text[pos] == '%');

    placeholder p;
    std::string::size_type i = pos + 1;
    for (; i < text.length() && (text[i] == '-' || text[i] == '0'); i++) {
        if (text[i] == '-')
            p.left_align = true;
        else
            p.zero_fill = true;
    }
    for (; i < text.length() && std::isdigit(text[i]); i++)
        p.width = p.width * 10 + (text[i] - '0');
    if (i < text.length() && text[i] == '.') {
        i++;
        if (i >= text.length() || !std::isdigit(text[i]))
            throw format::bad_format_error(format, "Missing precision");
        p.precision = 0;
        for (; i < text.length() && std::isdigit(text[i]); i++)
            p.precision = p.precision * 10 + (text[i] - '0');
    }

    if (i >= text.length())
        throw format::bad_format_error(format, "Trailing %");
    if (valid_conversions.find(text[i]) == std::string::npos)
        throw format::bad_format_error(format, "Unknown sequence '" +
                                       text.substr(pos, i - pos + 1) + "'");
    p.length = i - pos + 1;
    return p;
}


}  // anonymous namespace


/// Constructs a new formatter object (internal).
///
/// \param format The format string.
/// \param expansion The format string with any replacements performed so far.
/// \param last_pos The position from which to start looking for formatting
///     placeholders.  This must be maintained in case one of the replacements
///     introduced a new placeholder, which must be ignored.
format::formatter::formatter(const std::string& format,
                             const std::string& expansion,
                             const std::string::size_type last_pos) :
    _format(format),
    _expansion(expansion),
    _last_pos(last_pos)
{
}


/// Constructs a new formatter object.
///
/// \param format The format string.
///
/// \throw utils::format::bad_format_error If the format string is invalid.
format::formatter::formatter(const std::string& format) :
    _format(format),
    _expansion(format),
    _last_pos(0)
{
    std::string::size_type pos = find_placeholder(_format, 0);
    while (pos != std::string::npos) {
        const placeholder p = parse_placeholder(_format, _format, pos);
        pos = find_placeholder(_format, pos + p.length);
    }
}


/// Returns the formatted string.
///
/// \return The expansion with all escaped % signs collapsed.
std::string
format::formatter::str(void) const
{
    std::string out = _expansion;

    std::string::size_type pos = out.find("%%");
    while (pos != std::string::npos) {
        out.erase(pos, 1);
        pos = out.find("%%", pos + 1);
    }

    return out;
}


/// Automatic conversion of formatter objects to strings.
format::formatter::operator std::string(void) const
{
    return str();
}


/// Replaces the first format placeholder in a formatter with a boolean.
///
/// \param value The boolean to place in the string.
///
/// \return A new formatter with the placeholder replaced by "true" or "false".
format::formatter
format::formatter::operator%(const bool& value) const
{
    return replace(value ? "true" : "false");
}


/// Configures a stream according to the modifiers of the next placeholder.
///
/// Does nothing if there are no more placeholders; the subsequent call to
/// replace() reports the error in that case.
///
/// \param output The stream to configure.
void
format::formatter::init_stream(std::ostream& output) const
{
    const std::string::size_type pos = find_placeholder(_expansion, _last_pos);
    if (pos == std::string::npos)
        return;
    const placeholder p = parse_placeholder(_format, _expansion, pos);

    if (p.left_align)
        output << std::left;
    else if (p.zero_fill)
        output << std::setfill('0') << std::internal;
    if (p.width > 0)
        output << std::setw(p.width);
    if (p.precision >= 0)
        output << std::fixed << std::setprecision(p.precision);
}


/// Replaces the first formatting placeholder with a value.
///
/// \param arg The replacement string.
///
/// \return A new formatter in which the first formatting placeholder has been
///     replaced by arg and is ready to replace the next item.
///
/// \throw utils::format::extra_args_error If there are no more formatting
///     placeholders in the input string.
format::formatter
format::formatter::replace(const std::string& arg) const
{
    const std::string::size_type pos = find_placeholder(_expansion, _last_pos);
    if (pos == std::string::npos)
        throw extra_args_error(_format, arg);
    const placeholder p = parse_placeholder(_format, _expansion, pos);

    const std::string expansion = _expansion.substr(0, pos) + arg +
        _expansion.substr(pos + p.length);
    return formatter(_format, expansion, pos + arg.length());
}


/// Injects a formatter into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The formatter to expand.
///
/// \return The output stream.
std::ostream&
format::operator<<(std::ostream& output, const formatter& object)
{
    return (output << object.str());
}
