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

#include "engine/io_director.hpp"

#include <memory>

#include <atf-c++.hpp>

#include "engine/cancellation.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.ipp"
#include "utils/process/child.hpp"
#include "utils/process/operations.hpp"
#include "utils/process/status.hpp"

namespace datetime = utils::datetime;
namespace process = utils::process;

using utils::none;


namespace {


/// Spawns a shell script.
///
/// \param script The script to pass to /bin/sh -c.
///
/// \return The spawned process.
static std::unique_ptr< process::child >
spawn_script(const std::string& script)
{
    process::args_vector args;
    args.push_back("-c");
    args.push_back(script);
    return process::child::spawn("/bin/sh", args, none);
}


/// Builds limits with a given timeout and default values for the rest.
///
/// \param seconds The timeout, in seconds.
///
/// \return The limits.
static engine::io_limits
limits(const int seconds)
{
    return engine::io_limits(datetime::delta(seconds, 0),
                             datetime::delta(0, 100000), 1024 * 1024);
}


/// Builds a collection of lines.
///
/// \param l1 The first line, if not NULL.
/// \param l2 The second line, if not NULL.
/// \param l3 The third line, if not NULL.
///
/// \return The collection of lines.
static model::lines_vector
lines(const char* l1 = NULL, const char* l2 = NULL, const char* l3 = NULL)
{
    model::lines_vector result;
    if (l1 != NULL) result.push_back(l1);
    if (l2 != NULL) result.push_back(l2);
    if (l3 != NULL) result.push_back(l3);
    return result;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(split_output);
ATF_TEST_CASE_BODY(split_output)
{
    ATF_REQUIRE(lines() == engine::split_output(""));
    ATF_REQUIRE(lines("a") == engine::split_output("a"));
    ATF_REQUIRE(lines("a") == engine::split_output("a\n"));
    ATF_REQUIRE(lines("a", "b") == engine::split_output("a\r\nb\r\n"));
    ATF_REQUIRE(lines("a", "") == engine::split_output("a\n\n"));
    ATF_REQUIRE(lines("", "x") == engine::split_output("\nx"));
}


ATF_TEST_CASE(batch__sum);
ATF_TEST_CASE_HEAD(batch__sum)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(batch__sum)
{
    std::unique_ptr< process::child > child = spawn_script(
        "echo 'Hello World'; read a; read b; echo $((a + b)); "
        "echo $((a * b))");
    const engine::io_outcome outcome = engine::drive(
        *child, lines("5", "3"), false, limits(10));

    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE(lines("Hello World", "8", "15") == outcome.output);
    ATF_REQUIRE(outcome.error_output.empty());
    ATF_REQUIRE(!outcome.failure);
    ATF_REQUIRE(outcome.status.get().exited());
    ATF_REQUIRE_EQ(0, outcome.status.get().exitstatus());
}


ATF_TEST_CASE(batch__no_input);
ATF_TEST_CASE_HEAD(batch__no_input)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(batch__no_input)
{
    std::unique_ptr< process::child > child = spawn_script(
        "cat; echo eof");
    const engine::io_outcome outcome = engine::drive(
        *child, lines(), false, limits(10));

    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE(lines("eof") == outcome.output);
}


ATF_TEST_CASE(batch__unconsumed_input);
ATF_TEST_CASE_HEAD(batch__unconsumed_input)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(batch__unconsumed_input)
{
    model::lines_vector input;
    for (int i = 0; i < 50000; ++i)
        input.push_back("some input that nobody reads");

    std::unique_ptr< process::child > child = spawn_script(
        "exec 0<&-; echo ignored");
    const engine::io_outcome outcome = engine::drive(
        *child, input, false, limits(10));

    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE(lines("ignored") == outcome.output);
    ATF_REQUIRE(!outcome.failure);
}


ATF_TEST_CASE(batch__large_echo);
ATF_TEST_CASE_HEAD(batch__large_echo)
{
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(batch__large_echo)
{
    model::lines_vector input;
    for (int i = 0; i < 20000; ++i)
        input.push_back("line of text that goes through cat");

    std::unique_ptr< process::child > child = spawn_script("cat");
    const engine::io_outcome outcome = engine::drive(
        *child, input, false, limits(30));

    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE(input == outcome.output);
}


ATF_TEST_CASE(stderr_captured);
ATF_TEST_CASE_HEAD(stderr_captured)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(stderr_captured)
{
    std::unique_ptr< process::child > child = spawn_script(
        "echo out; echo oops >&2; exit 3");
    const engine::io_outcome outcome = engine::drive(
        *child, lines(), false, limits(10));

    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE(lines("out") == outcome.output);
    ATF_REQUIRE_EQ("oops\n", outcome.error_output);
    ATF_REQUIRE(outcome.status.get().exited());
    ATF_REQUIRE_EQ(3, outcome.status.get().exitstatus());
}


ATF_TEST_CASE(timeout__blocked_forever);
ATF_TEST_CASE_HEAD(timeout__blocked_forever)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(timeout__blocked_forever)
{
    const datetime::timestamp start = datetime::timestamp::now();
    std::unique_ptr< process::child > child = spawn_script(
        "echo partial; sleep 60");
    const engine::io_outcome outcome = engine::drive(
        *child, lines(), false, limits(1));
    const datetime::delta elapsed = datetime::timestamp::now() - start;

    ATF_REQUIRE_EQ(engine::io_timed_out, outcome.state);
    ATF_REQUIRE(lines("partial") == outcome.output);
    ATF_REQUIRE(outcome.status.get().signaled());
    ATF_REQUIRE(elapsed < datetime::delta(2, 0));
}


ATF_TEST_CASE(timeout__interleaved);
ATF_TEST_CASE_HEAD(timeout__interleaved)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(timeout__interleaved)
{
    const datetime::timestamp start = datetime::timestamp::now();
    std::unique_ptr< process::child > child = spawn_script(
        "read a; echo \"got $a\"; sleep 60");
    const engine::io_outcome outcome = engine::drive(
        *child, lines("1"), true, limits(1));
    const datetime::delta elapsed = datetime::timestamp::now() - start;

    ATF_REQUIRE_EQ(engine::io_timed_out, outcome.state);
    ATF_REQUIRE(lines("got 1") == outcome.output);
    ATF_REQUIRE(elapsed < datetime::delta(2, 0));
}


ATF_TEST_CASE(timeout__closed_output);
ATF_TEST_CASE_HEAD(timeout__closed_output)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(timeout__closed_output)
{
    const datetime::timestamp start = datetime::timestamp::now();
    std::unique_ptr< process::child > child = spawn_script(
        "exec >&- 2>&-; sleep 60");
    const engine::io_outcome outcome = engine::drive(
        *child, lines(), false, limits(1));
    const datetime::delta elapsed = datetime::timestamp::now() - start;

    ATF_REQUIRE_EQ(engine::io_timed_out, outcome.state);
    ATF_REQUIRE(elapsed < datetime::delta(2, 0));
}


ATF_TEST_CASE(interleaved__dialog);
ATF_TEST_CASE_HEAD(interleaved__dialog)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(interleaved__dialog)
{
    std::unique_ptr< process::child > child = spawn_script(
        "echo 'Enter a:'; read a; echo \"got $a\"; echo 'Enter b:'; "
        "read b; echo \"got $b\"; cat; echo end");
    const engine::io_outcome outcome = engine::drive(
        *child, lines("5", "3"), true, limits(10));

    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    model::lines_vector exp_output;
    exp_output.push_back("Enter a:");
    exp_output.push_back("got 5");
    exp_output.push_back("Enter b:");
    exp_output.push_back("got 3");
    exp_output.push_back("end");
    ATF_REQUIRE(exp_output == outcome.output);
}


ATF_TEST_CASE(interleaved__waits_for_quiescence);
ATF_TEST_CASE_HEAD(interleaved__waits_for_quiescence)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(interleaved__waits_for_quiescence)
{
    std::unique_ptr< process::child > child = spawn_script(
        "read a; echo \"got $a\"");
    const engine::io_outcome outcome = engine::drive(
        *child, lines("x"), true,
        engine::io_limits(datetime::delta(10, 0), datetime::delta(0, 300000),
                          1024));

    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE(lines("got x") == outcome.output);
    ATF_REQUIRE(!(outcome.elapsed < datetime::delta(0, 300000)));
}


ATF_TEST_CASE(interleaved__exit_with_pending_input);
ATF_TEST_CASE_HEAD(interleaved__exit_with_pending_input)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(interleaved__exit_with_pending_input)
{
    std::unique_ptr< process::child > child = spawn_script(
        "read a; echo \"got $a\"");
    const engine::io_outcome outcome = engine::drive(
        *child, lines("1", "2", "3"), true, limits(10));

    ATF_REQUIRE_EQ(engine::io_errored, outcome.state);
    ATF_REQUIRE(outcome.failure);
    ATF_REQUIRE_MATCH("terminated before reading all of its input",
                      outcome.failure.get());
    ATF_REQUIRE(lines("got 1") == outcome.output);
}


ATF_TEST_CASE(interleaved__repeatable_verdicts);
ATF_TEST_CASE_HEAD(interleaved__repeatable_verdicts)
{
    set_md_var("timeout", "120");
}
ATF_TEST_CASE_BODY(interleaved__repeatable_verdicts)
{
    for (int i = 0; i < 15; ++i) {
        std::unique_ptr< process::child > partial = spawn_script(
            "read a; echo \"got $a\"");
        const engine::io_outcome partial_outcome = engine::drive(
            *partial, lines("5", "3", "4"), true, limits(10));
        ATF_REQUIRE_EQ(engine::io_errored, partial_outcome.state);

        std::unique_ptr< process::child > deaf = spawn_script("echo hi");
        const engine::io_outcome deaf_outcome = engine::drive(
            *deaf, lines("5", "3"), true, limits(10));
        ATF_REQUIRE_EQ(engine::io_errored, deaf_outcome.state);
        ATF_REQUIRE(lines("hi") == deaf_outcome.output);

        std::unique_ptr< process::child > complete = spawn_script(
            "read a; echo \"got $a\"; read b; echo \"got $b\"");
        const engine::io_outcome complete_outcome = engine::drive(
            *complete, lines("5", "3"), true, limits(10));
        ATF_REQUIRE_EQ(engine::io_done, complete_outcome.state);
        ATF_REQUIRE(lines("got 5", "got 3") == complete_outcome.output);
    }
}


ATF_TEST_CASE(output_limit);
ATF_TEST_CASE_HEAD(output_limit)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(output_limit)
{
    std::unique_ptr< process::child > child = spawn_script(
        "while :; do echo aaaaaaaaaaaaaaaaaaaaaaaaaaaaaa; done");
    const engine::io_outcome outcome = engine::drive(
        *child, lines(), false,
        engine::io_limits(datetime::delta(10, 0), datetime::delta(0, 100000),
                          1000));

    ATF_REQUIRE_EQ(engine::io_errored, outcome.state);
    ATF_REQUIRE_MATCH("exceeded the limit of 1000 bytes",
                      outcome.failure.get());
}


ATF_TEST_CASE(background_children_killed);
ATF_TEST_CASE_HEAD(background_children_killed)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(background_children_killed)
{
    const datetime::timestamp start = datetime::timestamp::now();
    std::unique_ptr< process::child > child = spawn_script(
        "sleep 60 & echo done");
    const engine::io_outcome outcome = engine::drive(
        *child, lines(), false, limits(20));
    const datetime::delta elapsed = datetime::timestamp::now() - start;

    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE(lines("done") == outcome.output);
    ATF_REQUIRE(elapsed < datetime::delta(5, 0));
}


ATF_TEST_CASE(cancelled);
ATF_TEST_CASE_HEAD(cancelled)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(cancelled)
{
    engine::cancellation cancellation;
    cancellation.cancel();

    const datetime::timestamp start = datetime::timestamp::now();
    std::unique_ptr< process::child > child = spawn_script("sleep 60");
    const engine::io_outcome outcome = engine::drive(
        *child, lines(), false, limits(20), &cancellation);
    const datetime::delta elapsed = datetime::timestamp::now() - start;

    ATF_REQUIRE_EQ(engine::io_cancelled, outcome.state);
    ATF_REQUIRE(elapsed < datetime::delta(5, 0));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, split_output);

    ATF_ADD_TEST_CASE(tcs, batch__sum);
    ATF_ADD_TEST_CASE(tcs, batch__no_input);
    ATF_ADD_TEST_CASE(tcs, batch__unconsumed_input);
    ATF_ADD_TEST_CASE(tcs, batch__large_echo);
    ATF_ADD_TEST_CASE(tcs, stderr_captured);

    ATF_ADD_TEST_CASE(tcs, timeout__blocked_forever);
    ATF_ADD_TEST_CASE(tcs, timeout__interleaved);
    ATF_ADD_TEST_CASE(tcs, timeout__closed_output);

    ATF_ADD_TEST_CASE(tcs, interleaved__dialog);
    ATF_ADD_TEST_CASE(tcs, interleaved__waits_for_quiescence);
    ATF_ADD_TEST_CASE(tcs, interleaved__exit_with_pending_input);
    ATF_ADD_TEST_CASE(tcs, interleaved__repeatable_verdicts);

    ATF_ADD_TEST_CASE(tcs, output_limit);
    ATF_ADD_TEST_CASE(tcs, background_children_killed);
    ATF_ADD_TEST_CASE(tcs, cancelled);
}
