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

/// \file engine/io_director.hpp
/// Delivery of input to and capture of output from a running program.
///
/// The director drives exactly one process against one test case.  It owns
/// the deadline of the process, which starts when the director takes over,
/// and it reports how the interaction ended without judging the output.

#if !defined(ENGINE_IO_DIRECTOR_HPP)
#define ENGINE_IO_DIRECTOR_HPP

#include <cstddef>
#include <string>

#include "model/test_case_fwd.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.hpp"
#include "utils/process/status.hpp"

namespace utils {
namespace process {
class child;
}  // namespace process
}  // namespace utils

namespace engine {


class cancellation;


/// Terminal states of the interaction with a process.
enum io_state {
    io_done,
    io_timed_out,
    io_errored,
    io_cancelled,
};


/// Limits imposed on the interaction with a process.
struct io_limits {
    /// Maximum wall-clock time the process is allowed to run.
    utils::datetime::delta timeout;

    /// Silence after which an interactive process is fed its next line.
    utils::datetime::delta quiescence;

    /// Maximum number of bytes read from the process before killing it.
    std::size_t max_output_bytes;

    io_limits(const utils::datetime::delta&, const utils::datetime::delta&,
              const std::size_t);
};


/// Everything the director learnt about a process.
struct io_outcome {
    /// How the interaction ended.
    io_state state;

    /// Lines printed to stdout, normalized.
    model::lines_vector output;

    /// Raw contents printed to stderr.
    std::string error_output;

    /// Description of the failure if the state is io_errored.
    utils::optional< std::string > failure;

    /// Termination status of the process.
    utils::optional< utils::process::status > status;

    /// Wall-clock time the process ran for.
    utils::datetime::delta elapsed;

    io_outcome(void);
};


model::lines_vector split_output(const std::string&);

io_outcome drive(utils::process::child&, const model::lines_vector&,
                 const bool, const io_limits&, cancellation* = NULL);


}  // namespace engine


#endif  // !defined(ENGINE_IO_DIRECTOR_HPP)
