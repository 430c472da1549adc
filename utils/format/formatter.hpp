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

/// \file utils/format/formatter.hpp
/// Provides the definition of the utils::format::formatter class.
///
/// The utils::format::formatter class is a poor man's replacement for the
/// Boost.Format library, as it is much simpler and has less dependencies.

#if !defined(UTILS_FORMAT_FORMATTER_HPP)
#define UTILS_FORMAT_FORMATTER_HPP

#include <ostream>
#include <string>

namespace utils {
namespace format {


/// Mechanism to format strings similar to printf.
///
/// A formatter always maintains the original format string but also holds a
/// partial expansion.  The partial expansion is immutable in the context of a
/// formatter instance, but calls to operator% return new formatter objects with
/// one less formatting placeholder.
///
/// Placeholders follow the syntax %[-0][width][.precision]conversion, where
/// conversion is one of c, d, f, s or u.  The conversion letter itself is
/// only validated; the actual rendering is done by the stream operator of the
/// argument type, tuned by the flags, the width and the precision.  A
/// precision forces fixed-point notation for floating point arguments, which
/// allows writing ratios such as F("%.2f%%") % 33.3333.
///
/// In general, one can format a string in the following manner:
///
/// \code
/// const std::string s = (formatter("%s %d") % "foo" % 5).str();
/// \endcode
class formatter {
    /// The format string, as provided by the user.
    std::string _format;

    /// The format string with any replacements performed so far.
    std::string _expansion;

    /// Position from which to look for the next placeholder.
    std::string::size_type _last_pos;

    formatter replace(const std::string&) const;
    void init_stream(std::ostream&) const;

    formatter(const std::string&, const std::string&,
              const std::string::size_type);

public:
    explicit formatter(const std::string&);

    std::string str(void) const;
    operator std::string(void) const;

    template< typename Type > formatter operator%(const Type&) const;
    formatter operator%(const bool&) const;
};


std::ostream& operator<<(std::ostream&, const formatter&);


}  // namespace format
}  // namespace utils


#endif  // !defined(UTILS_FORMAT_FORMATTER_HPP)
