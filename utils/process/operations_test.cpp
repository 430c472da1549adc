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

#include "utils/process/operations.hpp"

extern "C" {
#include <signal.h>
#include <unistd.h>
}

#include <atf-c++.hpp>

#include "utils/optional.ipp"
#include "utils/process/child.hpp"
#include "utils/process/exceptions.hpp"
#include "utils/process/status.hpp"

namespace process = utils::process;

using utils::none;
using utils::optional;


namespace {


/// Forks a subprocess that leads its own process group.
///
/// \param exit_code If not negative, the exit code of the subprocess.
///     Otherwise, the subprocess sleeps until killed.
///
/// \return The PID of the subprocess.
static int
fork_group(const int exit_code)
{
    const pid_t pid = ::fork();
    ATF_REQUIRE(pid != -1);
    if (pid == 0) {
        ::setpgid(0, 0);
        if (exit_code >= 0)
            ::_exit(exit_code);
        for (;;)
            ::pause();
    }
    ::setpgid(pid, pid);
    return pid;
}


/// Spawns a shell script in the background.
///
/// \param script The script to pass to /bin/sh -c.
///
/// \return The new child.
static std::unique_ptr< process::child >
spawn_script(const std::string& script)
{
    process::args_vector args;
    args.push_back("-c");
    args.push_back(script);
    return process::child::spawn("/bin/sh", args, none);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(wait__exited);
ATF_TEST_CASE_BODY(wait__exited)
{
    const int pid = fork_group(15);
    const process::status status = process::wait(pid);
    ATF_REQUIRE(status.exited());
    ATF_REQUIRE_EQ(15, status.exitstatus());
    ATF_REQUIRE_EQ(pid, status.dead_pid());
}


ATF_TEST_CASE_WITHOUT_HEAD(wait__unknown_pid);
ATF_TEST_CASE_BODY(wait__unknown_pid)
{
    ATF_REQUIRE_THROW_RE(process::system_error, "Failed to wait for PID 1",
                         process::wait(1));
}


ATF_TEST_CASE_WITHOUT_HEAD(wait_nohang__running);
ATF_TEST_CASE_BODY(wait_nohang__running)
{
    const int pid = fork_group(-1);
    ATF_REQUIRE(!process::wait_nohang(pid));
    process::terminate_group(pid);
    const process::status status = process::wait(pid);
    ATF_REQUIRE(status.signaled());
    ATF_REQUIRE_EQ(SIGKILL, status.termsig());
}


ATF_TEST_CASE_WITHOUT_HEAD(wait_nohang__finished);
ATF_TEST_CASE_BODY(wait_nohang__finished)
{
    const int pid = fork_group(3);

    optional< process::status > status;
    while (!(status = process::wait_nohang(pid)))
        ::usleep(10000);
    ATF_REQUIRE(status.get().exited());
    ATF_REQUIRE_EQ(3, status.get().exitstatus());
}


ATF_TEST_CASE(terminate_group__kills_descendants);
ATF_TEST_CASE_HEAD(terminate_group__kills_descendants)
{
    set_md_var("timeout", "20");
}
ATF_TEST_CASE_BODY(terminate_group__kills_descendants)
{
    // The background sleep keeps a copy of the stdout pipe open, so EOF can
    // only be seen once it dies too.
    std::unique_ptr< process::child > child = spawn_script(
        "sleep 60 & echo started; wait");
    char buffer[16];
    ATF_REQUIRE(::read(child->stdout_fd(), buffer, sizeof(buffer)) > 0);

    process::terminate_group(child->pid());
    const process::status status = child->wait();
    ATF_REQUIRE(status.signaled());
    ATF_REQUIRE_EQ(SIGKILL, status.termsig());

    ATF_REQUIRE_EQ(0, ::read(child->stdout_fd(), buffer, sizeof(buffer)));
}


ATF_TEST_CASE_WITHOUT_HEAD(terminate_group__missing);
ATF_TEST_CASE_BODY(terminate_group__missing)
{
    const int pid = fork_group(0);
    (void)process::wait(pid);
    process::terminate_group(pid);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, wait__exited);
    ATF_ADD_TEST_CASE(tcs, wait__unknown_pid);
    ATF_ADD_TEST_CASE(tcs, wait_nohang__running);
    ATF_ADD_TEST_CASE(tcs, wait_nohang__finished);
    ATF_ADD_TEST_CASE(tcs, terminate_group__kills_descendants);
    ATF_ADD_TEST_CASE(tcs, terminate_group__missing);
}
