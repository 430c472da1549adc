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

/// \file engine/comparator.hpp
/// Judgement of the output of a program against its expected output.

#if !defined(ENGINE_COMPARATOR_HPP)
#define ENGINE_COMPARATOR_HPP

#include <cstddef>
#include <string>
#include <utility>

#include "model/execution_result.hpp"
#include "model/test_case_fwd.hpp"
#include "utils/optional.hpp"

namespace engine {


/// Result of a comparison: the verdict and the first difference, if any.
///
/// The verdict is always either verdict_match or verdict_mismatch, and the
/// difference is present if and only if the verdict is a mismatch.
typedef std::pair< model::verdict_type,
                   utils::optional< model::output_diff > > comparison;


/// Longest line or pattern, in bytes, that takes part in regex matching.
///
/// The regex engine recurses once per character, so longer lines never match
/// and longer patterns are treated as invalid.
const std::size_t max_regex_length = 4096;


comparison compare_output(const model::lines_vector&,
                          const model::lines_vector&,
                          const bool, const bool);
comparison compare_output(const model::test_case&,
                          const model::lines_vector&);


}  // namespace engine


#endif  // !defined(ENGINE_COMPARATOR_HPP)
