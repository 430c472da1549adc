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

#include "utils/process/status.hpp"

extern "C" {
#include <sys/wait.h>

#include <signal.h>
#include <unistd.h>
}

#include <cstdlib>
#include <sstream>

#include <atf-c++.hpp>

namespace process = utils::process;


namespace {


/// Forks a subprocess that terminates in a given way and waits for it.
///
/// \param exit_code Exit code for the subprocess, if signo is 0.
/// \param signo Signal the subprocess sends to itself, or 0 for none.
///
/// \return The raw stat_loc returned by waitpid(2).
static int
run_subprocess(const int exit_code, const int signo)
{
    const pid_t pid = ::fork();
    ATF_REQUIRE(pid != -1);
    if (pid == 0) {
        if (signo != 0) {
            ::signal(signo, SIG_DFL);
            ::kill(::getpid(), signo);
        }
        ::_exit(exit_code);
    }
    int stat_loc;
    ATF_REQUIRE(::waitpid(pid, &stat_loc, 0) != -1);
    return stat_loc;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(fake_exited);
ATF_TEST_CASE_BODY(fake_exited)
{
    const process::status status = process::status::fake_exited(42);
    ATF_REQUIRE_EQ(-1, status.dead_pid());
    ATF_REQUIRE(status.exited());
    ATF_REQUIRE_EQ(42, status.exitstatus());
    ATF_REQUIRE(!status.signaled());
}


ATF_TEST_CASE_WITHOUT_HEAD(fake_signaled);
ATF_TEST_CASE_BODY(fake_signaled)
{
    const process::status status = process::status::fake_signaled(9, true);
    ATF_REQUIRE(!status.exited());
    ATF_REQUIRE(status.signaled());
    ATF_REQUIRE_EQ(9, status.termsig());
    ATF_REQUIRE(status.coredump());
}


ATF_TEST_CASE_WITHOUT_HEAD(real__exited);
ATF_TEST_CASE_BODY(real__exited)
{
    const process::status status(1234, run_subprocess(3, 0));
    ATF_REQUIRE_EQ(1234, status.dead_pid());
    ATF_REQUIRE(status.exited());
    ATF_REQUIRE_EQ(3, status.exitstatus());
    ATF_REQUIRE(!status.signaled());
    ATF_REQUIRE(status == process::status::fake_exited(3));
}


ATF_TEST_CASE_WITHOUT_HEAD(real__signaled);
ATF_TEST_CASE_BODY(real__signaled)
{
    const process::status status(1234, run_subprocess(0, SIGKILL));
    ATF_REQUIRE(!status.exited());
    ATF_REQUIRE(status.signaled());
    ATF_REQUIRE_EQ(SIGKILL, status.termsig());
    ATF_REQUIRE(!status.coredump());
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    {
        std::ostringstream str;
        str << process::status::fake_exited(8);
        ATF_REQUIRE_EQ("exited with code 8", str.str());
    }
    {
        std::ostringstream str;
        str << process::status::fake_signaled(9, false);
        ATF_REQUIRE_EQ("received signal 9", str.str());
    }
    {
        std::ostringstream str;
        str << process::status::fake_signaled(6, true);
        ATF_REQUIRE_EQ("received signal 6 (core dumped)", str.str());
    }
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, fake_exited);
    ATF_ADD_TEST_CASE(tcs, fake_signaled);
    ATF_ADD_TEST_CASE(tcs, real__exited);
    ATF_ADD_TEST_CASE(tcs, real__signaled);
    ATF_ADD_TEST_CASE(tcs, output);
}
