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

#include "engine/launcher.hpp"

#include <memory>

#include <atf-c++.hpp>

#include "engine/exceptions.hpp"
#include "engine/io_director.hpp"
#include "model/test_case.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/process/child.hpp"
#include "utils/process/status.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace process = utils::process;

using utils::none;
using utils::optional;


namespace {


/// Builds a suite definition without test cases.
///
/// \param run_command The run command, if any.
/// \param compile_command The compile command, if any.
///
/// \return The suite definition.
static model::submission_config
make_submission(const optional< std::string >& run_command,
                const optional< std::string >& compile_command)
{
    return model::submission_config(none, run_command, compile_command,
                                    fs::path("programs"),
                                    model::test_cases_vector());
}


/// Runs a spawned program in batch mode without input.
///
/// \param child The program to run.
///
/// \return The outcome of the execution.
static engine::io_outcome
run_to_completion(process::child& child)
{
    return engine::drive(child, model::lines_vector(), false,
                         engine::io_limits(datetime::delta(10, 0),
                                           datetime::delta(0, 100000),
                                           1024 * 1024));
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(build_command__direct);
ATF_TEST_CASE_BODY(build_command__direct)
{
    const process::args_vector command = engine::build_command(
        none, fs::path("/a/prog"));
    ATF_REQUIRE_EQ(1, command.size());
    ATF_REQUIRE_EQ("/a/prog", command[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(build_command__interpreter);
ATF_TEST_CASE_BODY(build_command__interpreter)
{
    const process::args_vector command = engine::build_command(
        utils::make_optional(std::string("python3 -u '-W ignore'")),
        fs::path("/a/prog.py"));
    ATF_REQUIRE_EQ(4, command.size());
    ATF_REQUIRE_EQ("python3", command[0]);
    ATF_REQUIRE_EQ("-u", command[1]);
    ATF_REQUIRE_EQ("-W ignore", command[2]);
    ATF_REQUIRE_EQ("/a/prog.py", command[3]);
}


ATF_TEST_CASE_WITHOUT_HEAD(build_command__invalid);
ATF_TEST_CASE_BODY(build_command__invalid)
{
    ATF_REQUIRE_THROW_RE(engine::spawn_error, "Invalid command.*quote",
                         engine::build_command(
                             utils::make_optional(std::string("sh 'oops")),
                             fs::path("/a/prog")));
}


ATF_TEST_CASE_WITHOUT_HEAD(expand_compile_command);
ATF_TEST_CASE_BODY(expand_compile_command)
{
    ATF_REQUIRE_EQ("cc -o /b/p /s/p.c && strip /b/p",
                   engine::expand_compile_command(
                       "cc -o {output} {source} && strip {output}",
                       fs::path("/s/p.c"), fs::path("/b/p")));
    ATF_REQUIRE_EQ("make", engine::expand_compile_command(
        "make", fs::path("/s/p.c"), fs::path("/b/p")));
}


ATF_TEST_CASE_WITHOUT_HEAD(needs_compilation);
ATF_TEST_CASE_BODY(needs_compilation)
{
    const engine::config config = engine::config::defaults();
    ATF_REQUIRE(!engine::launcher(make_submission(none, none), config,
                                  fs::path(".")).needs_compilation());
    ATF_REQUIRE(!engine::launcher(
        make_submission(none, utils::make_optional(std::string(""))), config,
        fs::path(".")).needs_compilation());
    ATF_REQUIRE(engine::launcher(
        make_submission(none, utils::make_optional(std::string("cc"))),
        config, fs::path(".")).needs_compilation());
}


ATF_TEST_CASE(compile_and_spawn);
ATF_TEST_CASE_HEAD(compile_and_spawn)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(compile_and_spawn)
{
    fs::mkdir(fs::path("src"), 0755);
    fs::mkdir(fs::path("build"), 0755);
    atf::utils::create_file("src/hello.txt", "echo compiled\n");

    const engine::launcher launcher(
        make_submission(none, utils::make_optional(std::string(
            "test -f hello.txt && "
            "{ echo '#! /bin/sh'; cat {source}; } >{output} && "
            "chmod +x {output}"))),
        engine::config::defaults(), fs::path("build"));
    const fs::path executable = launcher.compile(fs::path("src/hello.txt"));
    ATF_REQUIRE_EQ("hello", executable.leaf_name());
    ATF_REQUIRE(fs::exists(executable));

    std::unique_ptr< process::child > child = launcher.spawn(executable);
    const engine::io_outcome outcome = run_to_completion(*child);
    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE_EQ(1, outcome.output.size());
    ATF_REQUIRE_EQ("compiled", outcome.output[0]);
}


ATF_TEST_CASE(compile__fails);
ATF_TEST_CASE_HEAD(compile__fails)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(compile__fails)
{
    atf::utils::create_file("prog.c", "");
    const engine::launcher launcher(
        make_submission(none, utils::make_optional(std::string(
            "echo 'syntax error in {source}' >&2; exit 2"))),
        engine::config::defaults(), fs::path("."));
    ATF_REQUIRE_THROW_RE(engine::compile_error,
                         "failed with exit code 2.*syntax error in .*prog.c",
                         launcher.compile(fs::path("prog.c")));
}


ATF_TEST_CASE(compile__no_artifact);
ATF_TEST_CASE_HEAD(compile__no_artifact)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(compile__no_artifact)
{
    atf::utils::create_file("prog.c", "");
    const engine::launcher launcher(
        make_submission(none, utils::make_optional(std::string("true"))),
        engine::config::defaults(), fs::path("."));
    ATF_REQUIRE_THROW_RE(engine::compile_error, "did not produce",
                         launcher.compile(fs::path("prog.c")));
}


ATF_TEST_CASE(compile__timeout);
ATF_TEST_CASE_HEAD(compile__timeout)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(compile__timeout)
{
    atf::utils::create_file("prog.c", "");
    const engine::config defaults = engine::config::defaults();
    const engine::config config(defaults.parallelism, defaults.quiescence,
                                datetime::delta(1, 0),
                                defaults.max_output_bytes);
    const engine::launcher launcher(
        make_submission(none, utils::make_optional(std::string("sleep 60"))),
        config, fs::path("."));
    ATF_REQUIRE_THROW_RE(engine::compile_error, "timed out after 1 seconds",
                         launcher.compile(fs::path("prog.c")));
}


ATF_TEST_CASE(spawn__interpreter);
ATF_TEST_CASE_HEAD(spawn__interpreter)
{
    set_md_var("timeout", "30");
}
ATF_TEST_CASE_BODY(spawn__interpreter)
{
    atf::utils::create_file("script.sh", "echo \"args: $*\"\n");
    const engine::launcher launcher(
        make_submission(utils::make_optional(std::string("/bin/sh")), none),
        engine::config::defaults(), fs::path("."));

    std::unique_ptr< process::child > child = launcher.spawn(
        fs::path("script.sh"));
    const engine::io_outcome outcome = run_to_completion(*child);
    ATF_REQUIRE_EQ(engine::io_done, outcome.state);
    ATF_REQUIRE_EQ(1, outcome.output.size());
    ATF_REQUIRE_EQ("args: ", outcome.output[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(spawn__missing_program);
ATF_TEST_CASE_BODY(spawn__missing_program)
{
    const engine::launcher launcher(
        make_submission(none, none), engine::config::defaults(),
        fs::path("."));
    ATF_REQUIRE_THROW_RE(engine::spawn_error, "Failed to execute",
                         launcher.spawn(fs::path("does-not-exist")));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, build_command__direct);
    ATF_ADD_TEST_CASE(tcs, build_command__interpreter);
    ATF_ADD_TEST_CASE(tcs, build_command__invalid);
    ATF_ADD_TEST_CASE(tcs, expand_compile_command);
    ATF_ADD_TEST_CASE(tcs, needs_compilation);

    ATF_ADD_TEST_CASE(tcs, compile_and_spawn);
    ATF_ADD_TEST_CASE(tcs, compile__fails);
    ATF_ADD_TEST_CASE(tcs, compile__no_artifact);
    ATF_ADD_TEST_CASE(tcs, compile__timeout);

    ATF_ADD_TEST_CASE(tcs, spawn__interpreter);
    ATF_ADD_TEST_CASE(tcs, spawn__missing_program);
}
