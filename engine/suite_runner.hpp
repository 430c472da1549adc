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

/// \file engine/suite_runner.hpp
/// Execution of all the test cases of a suite over a pool of workers.

#if !defined(ENGINE_SUITE_RUNNER_HPP)
#define ENGINE_SUITE_RUNNER_HPP

#include <cstddef>
#include <memory>
#include <string>

#include "engine/config.hpp"
#include "model/execution_result.hpp"
#include "model/submission_config.hpp"
#include "model/suite_report.hpp"
#include "model/test_case_fwd.hpp"
#include "utils/fs/path.hpp"
#include "utils/noncopyable.hpp"
#include "utils/optional.hpp"

namespace engine {


class cancellation;
class launcher;


/// Callbacks to report the progress of a run.
///
/// The callbacks are always invoked from the thread that called
/// suite_runner::run(), never from the workers.
class suite_hooks {
public:
    virtual ~suite_hooks(void) = 0;

    virtual void compiled_program(const utils::fs::path&,
                                  const utils::optional< std::string >&);
    virtual void got_result(const utils::fs::path&, const std::size_t,
                            const model::test_case&,
                            const model::execution_result&);
};


model::execution_result run_test(const launcher&,
                                 const utils::fs::path&,
                                 const model::test_case&,
                                 const engine::config&,
                                 cancellation* = NULL);


/// Runs every test case of a suite against every program of the suite.
class suite_runner : utils::noncopyable {
    struct impl;

    /// Pointer to the internal implementation.
    std::unique_ptr< impl > _pimpl;

public:
    suite_runner(const model::submission_config&, const engine::config&,
                 const utils::fs::path&);
    ~suite_runner(void);

    model::suite_report run(suite_hooks* = NULL);
    void cancel(void);
};


}  // namespace engine


#endif  // !defined(ENGINE_SUITE_RUNNER_HPP)
