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

#include "engine/suite_runner.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "engine/cancellation.hpp"
#include "engine/comparator.hpp"
#include "engine/exceptions.hpp"
#include "engine/io_director.hpp"
#include "engine/launcher.hpp"
#include "engine/suite_config.hpp"
#include "model/test_case.hpp"
#include "utils/datetime.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/child.hpp"
#include "utils/process/status.hpp"
#include "utils/sanity.hpp"
#include "utils/signals/exceptions.hpp"
#include "utils/signals/interrupts.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace process = utils::process;
namespace signals = utils::signals;

using utils::none;
using utils::optional;


namespace {


/// Period at which the coordinator checks for interrupts while waiting.
static const std::chrono::milliseconds check_period(100);


/// A unit of work: the compilation of a program or the run of a test case.
struct work_unit {
    /// Index of the program in the list of programs of the suite.
    std::size_t program;

    /// Index of the test case; none for a compilation.
    optional< std::size_t > test;

    /// Executable to run; the source file for a compilation.
    fs::path executable;

    /// Constructor.
    ///
    /// \param program_ Index of the program.
    /// \param test_ Index of the test case, if any.
    /// \param executable_ Executable to run or source file to compile.
    work_unit(const std::size_t program_,
              const optional< std::size_t >& test_,
              const fs::path& executable_) :
        program(program_), test(test_), executable(executable_)
    {
    }
};


/// Notification sent by a worker to the coordinator once a unit is done.
struct completion {
    /// The unit that completed.
    work_unit unit;

    /// Result of the test case; none for a compilation.
    optional< model::execution_result > result;

    /// Path to the compiled artifact, if the compilation succeeded.
    optional< fs::path > artifact;

    /// Reason for which the compilation failed, if it did.
    optional< std::string > compile_failure;

    /// Constructor.
    ///
    /// \param unit_ The unit that completed.
    explicit completion(const work_unit& unit_) : unit(unit_)
    {
    }
};


/// Joins the stderr of a program to the reason of a failure.
///
/// \param reason The reason of the failure.
/// \param error_output The captured stderr, possibly empty.
///
/// \return The message to attach to the result.
static std::string
with_error_output(const std::string& reason, const std::string& error_output)
{
    if (error_output.empty())
        return reason;
    else
        return reason + "\n" + error_output;
}


}  // anonymous namespace


/// Pure abstract destructor.
engine::suite_hooks::~suite_hooks(void)
{
}


/// Called when the compilation of a program finishes.
///
/// \param unused_program The program that was compiled.
/// \param unused_error The reason of the failure, if the compilation failed.
void
engine::suite_hooks::compiled_program(
    const fs::path& UTILS_UNUSED_PARAM(program),
    const optional< std::string >& UTILS_UNUSED_PARAM(error))
{
}


/// Called when a test case finishes.
///
/// \param unused_program The program that was tested.
/// \param unused_index Zero-based index of the test case in the suite.
/// \param unused_test_case The test case.
/// \param unused_result The result of the test case.
void
engine::suite_hooks::got_result(
    const fs::path& UTILS_UNUSED_PARAM(program),
    const std::size_t UTILS_UNUSED_PARAM(index),
    const model::test_case& UTILS_UNUSED_PARAM(test_case),
    const model::execution_result& UTILS_UNUSED_PARAM(result))
{
}


/// Runs a single test case against a program and judges its output.
///
/// \param launcher The launcher used to spawn the program.
/// \param executable The program to run.
/// \param test_case The test case to run.
/// \param config Settings of the engine.
/// \param cancellation Suite-wide cancellation; may be NULL.
///
/// \return The result of the test case.  Any failure is folded into a result
/// with the error verdict.
model::execution_result
engine::run_test(const launcher& launcher, const fs::path& executable,
                 const model::test_case& test_case,
                 const engine::config& config, cancellation* cancellation)
{
    const datetime::timestamp start = datetime::timestamp::now();

    std::unique_ptr< process::child > child;
    try {
        child = launcher.spawn(executable);
    } catch (const spawn_error& e) {
        LW(F("Cannot spawn %s: %s") % executable % e.what());
        return model::execution_result(
            model::verdict_error, model::lines_vector(),
            utils::make_optional(std::string(e.what())),
            datetime::timestamp::now() - start);
    }

    const io_outcome outcome = drive(
        *child, test_case.input(), test_case.interleaved(),
        io_limits(test_case.timeout(), config.quiescence,
                  config.max_output_bytes),
        cancellation);

    optional< int > exit_code;
    if (outcome.status && outcome.status.get().exited())
        exit_code = outcome.status.get().exitstatus();
    optional< std::string > error;
    if (!outcome.error_output.empty())
        error = outcome.error_output;

    switch (outcome.state) {
    case io_done: {
        const comparison verdict = compare_output(test_case, outcome.output);
        return model::execution_result(verdict.first, outcome.output, error,
                                       outcome.elapsed, exit_code,
                                       verdict.second);
    }

    case io_timed_out:
        return model::execution_result(
            model::verdict_timeout, outcome.output,
            utils::make_optional(with_error_output(
                F("Timed out after %.2fs") %
                (test_case.timeout().to_microseconds() / 1000000.0),
                outcome.error_output)),
            outcome.elapsed, exit_code);

    case io_errored:
        return model::execution_result(
            model::verdict_error, outcome.output,
            utils::make_optional(with_error_output(outcome.failure.get(),
                                                   outcome.error_output)),
            outcome.elapsed, exit_code);

    case io_cancelled:
        return model::execution_result(
            model::verdict_error, outcome.output,
            utils::make_optional(std::string("Cancelled")), outcome.elapsed,
            exit_code);
    }
    UNREACHABLE;
}


/// Internal implementation of the suite_runner.
struct engine::suite_runner::impl : utils::noncopyable {
    /// Definition of the suite.
    model::submission_config submission;

    /// Settings of the engine.
    engine::config config;

    /// Cancellation shared by all the units of work.
    engine::cancellation cancellation;

    /// Builds and spawns the programs.
    engine::launcher launcher;

    /// Protects the queues below.
    std::mutex mutex;

    /// Signaled when new units are queued or when the workers must exit.
    std::condition_variable work_available;

    /// Signaled when a unit completes.
    std::condition_variable work_done;

    /// Units waiting for a worker.
    std::deque< work_unit > pending;

    /// Units completed but not yet processed by the coordinator.
    std::deque< completion > completed;

    /// Whether the workers must exit.
    bool stopping;

    /// The worker threads.
    std::vector< std::thread > workers;

    /// Constructor.
    ///
    /// \param submission_ Definition of the suite.
    /// \param config_ Settings of the engine.
    /// \param build_root_ Directory in which to place compiled artifacts.
    impl(const model::submission_config& submission_,
         const engine::config& config_, const fs::path& build_root_) :
        submission(submission_),
        config(config_),
        launcher(submission_, config_, build_root_, &cancellation),
        stopping(false)
    {
    }

    /// Destructor.
    ///
    /// Aborts any units still in flight, which only happens if run() did not
    /// finish normally.
    ~impl(void)
    {
        if (!workers.empty())
            cancellation.cancel();
        stop();
    }

    /// Executes a single unit of work.
    ///
    /// \param unit The unit to execute.
    ///
    /// \return The completion notification for the unit.
    completion
    execute(const work_unit& unit)
    {
        completion done(unit);
        if (!unit.test) {
            try {
                done.artifact = launcher.compile(unit.executable);
            } catch (const engine::error& e) {
                done.compile_failure = std::string(e.what());
            }
        } else {
            const model::test_case& test_case =
                submission.tests()[unit.test.get()];
            done.result = run_test(launcher, unit.executable, test_case,
                                   config, &cancellation);
        }
        return done;
    }

    /// Body of the worker threads.
    void
    worker(void)
    {
        for (;;) {
            optional< work_unit > unit;
            {
                std::unique_lock< std::mutex > lock(mutex);
                while (pending.empty() && !stopping)
                    work_available.wait(lock);
                if (stopping)
                    return;
                unit = pending.front();
                pending.pop_front();
            }

            completion done = execute(unit.get());

            {
                std::lock_guard< std::mutex > guard(mutex);
                completed.push_back(done);
            }
            work_done.notify_one();
        }
    }

    /// Queues the units to run all the test cases against a program.
    ///
    /// \param program Index of the program.
    /// \param executable The executable to run.
    ///
    /// \return The number of queued units.
    std::size_t
    queue_tests(const std::size_t program, const fs::path& executable)
    {
        const std::size_t ntests = submission.tests().size();
        {
            std::lock_guard< std::mutex > guard(mutex);
            for (std::size_t i = 0; i < ntests; ++i)
                pending.push_back(work_unit(program, utils::make_optional(i),
                                            executable));
        }
        work_available.notify_all();
        return ntests;
    }

    /// Starts the worker threads.
    ///
    /// \param count Number of threads to start.
    void
    start(const std::size_t count)
    {
        PRE(workers.empty());
        for (std::size_t i = 0; i < count; ++i)
            workers.push_back(std::thread(&impl::worker, this));
        LI(F("Started %s workers") % count);
    }

    /// Tells the workers to exit and waits for them.
    ///
    /// Units in flight run to completion, so the cancellation must have been
    /// triggered beforehand to abort a run quickly.
    void
    stop(void)
    {
        {
            std::lock_guard< std::mutex > guard(mutex);
            stopping = true;
            pending.clear();
        }
        work_available.notify_all();
        for (std::vector< std::thread >::iterator iter = workers.begin();
             iter != workers.end(); ++iter)
            (*iter).join();
        workers.clear();
    }

    /// Waits until there are completion notifications to process.
    ///
    /// \return The notifications received.
    ///
    /// \throw signals::interrupted_error If a signal is received while
    ///     waiting.
    std::deque< completion >
    wait_for_completions(void)
    {
        std::deque< completion > batch;
        while (batch.empty()) {
            signals::check_interrupt();
            if (cancellation.cancelled())
                break;

            std::unique_lock< std::mutex > lock(mutex);
            if (completed.empty())
                work_done.wait_for(lock, check_period);
            batch.swap(completed);
        }
        return batch;
    }
};


/// Constructs a new runner.
///
/// \param submission Definition of the suite.
/// \param config Settings of the engine.
/// \param build_root Existing directory in which to place compiled artifacts.
engine::suite_runner::suite_runner(const model::submission_config& submission,
                                   const engine::config& config,
                                   const fs::path& build_root) :
    _pimpl(new impl(submission, config, build_root))
{
}


/// Destructor.
engine::suite_runner::~suite_runner(void)
{
}


/// Runs the suite.
///
/// Can only be called once.  Programs are compiled first, if needed, and
/// their test cases are queued as soon as their compilation succeeds.
///
/// \param hooks Callbacks to report progress; may be NULL.
///
/// \return The report of the suite, sorted by program and test index.
///
/// \throw config_error If the programs of the suite cannot be listed.
/// \throw interrupted_error If the run is cancelled through cancel().
/// \throw signals::interrupted_error If a signal interrupts the run.  All
///     the processes are killed and reaped before this is raised.
model::suite_report
engine::suite_runner::run(suite_hooks* hooks)
{
    const std::vector< fs::path > programs = list_programs(
        _pimpl->submission);
    const model::test_cases_vector& tests = _pimpl->submission.tests();
    LI(F("Running %s test cases against %s programs") % tests.size() %
       programs.size());

    std::map< std::pair< std::size_t, std::size_t >,
              model::execution_result > results;

    std::size_t outstanding = 0;
    {
        std::lock_guard< std::mutex > guard(_pimpl->mutex);
        for (std::size_t i = 0; i < programs.size(); ++i) {
            if (_pimpl->launcher.needs_compilation()) {
                _pimpl->pending.push_back(work_unit(i, none, programs[i]));
                ++outstanding;
            } else {
                for (std::size_t j = 0; j < tests.size(); ++j) {
                    _pimpl->pending.push_back(
                        work_unit(i, utils::make_optional(j), programs[i]));
                    ++outstanding;
                }
            }
        }
    }

    if (outstanding > 0)
        _pimpl->start(std::min(_pimpl->config.parallelism, outstanding));

    try {
        while (outstanding > 0) {
            std::deque< completion > batch = _pimpl->wait_for_completions();
            if (_pimpl->cancellation.cancelled())
                break;

            for (std::deque< completion >::const_iterator iter = batch.begin();
                 iter != batch.end(); ++iter) {
                const completion& done = *iter;
                const std::size_t program = done.unit.program;
                --outstanding;

                if (done.result) {
                    const std::size_t test = done.unit.test.get();
                    results.insert(std::make_pair(std::make_pair(program, test),
                                                  done.result.get()));
                    if (hooks != NULL)
                        hooks->got_result(programs[program], test,
                                          tests[test], done.result.get());
                } else if (done.artifact) {
                    if (hooks != NULL)
                        hooks->compiled_program(programs[program], none);
                    outstanding += _pimpl->queue_tests(program,
                                                       done.artifact.get());
                } else {
                    const std::string& reason = done.compile_failure.get();
                    LW(F("Not running tests for %s: %s") % programs[program] %
                       reason);
                    if (hooks != NULL)
                        hooks->compiled_program(programs[program],
                                                done.compile_failure);
                    for (std::size_t j = 0; j < tests.size(); ++j) {
                        const model::execution_result result(
                            model::verdict_error, model::lines_vector(),
                            utils::make_optional(reason), datetime::delta());
                        results.insert(std::make_pair(
                            std::make_pair(program, j), result));
                        if (hooks != NULL)
                            hooks->got_result(programs[program], j, tests[j],
                                              result);
                    }
                }
            }
        }
    } catch (const signals::interrupted_error& e) {
        LI(F("Run interrupted by signal %s; cancelling") % e.signo());
        _pimpl->cancellation.cancel();
        _pimpl->stop();
        throw;
    }

    if (_pimpl->cancellation.cancelled()) {
        _pimpl->stop();
        throw interrupted_error("Run cancelled");
    }
    _pimpl->stop();
    INV(results.size() == programs.size() * tests.size());

    model::program_reports_vector reports;
    for (std::size_t i = 0; i < programs.size(); ++i) {
        model::test_outcomes_vector outcomes;
        for (std::size_t j = 0; j < tests.size(); ++j) {
            const std::map< std::pair< std::size_t, std::size_t >,
                            model::execution_result >::const_iterator iter =
                results.find(std::make_pair(i, j));
            INV(iter != results.end());
            outcomes.push_back(std::make_pair(tests[j], (*iter).second));
        }
        reports.push_back(model::program_report(programs[i].leaf_name(),
                                                programs[i], outcomes));
    }
    return model::suite_report(reports);
}


/// Aborts an ongoing run.
///
/// Can be called from any thread, including from within the hooks.  All the
/// processes spawned by the run are killed and run() raises
/// interrupted_error once they have been reaped.
void
engine::suite_runner::cancel(void)
{
    LI("Cancelling run");
    _pimpl->cancellation.cancel();
}
