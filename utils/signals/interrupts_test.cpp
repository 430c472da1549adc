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

#include "utils/signals/interrupts.hpp"

extern "C" {
#include <sys/wait.h>

#include <signal.h>
#include <unistd.h>
}

#include <cstdlib>
#include <iostream>

#include <atf-c++.hpp>

#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/process/child.hpp"
#include "utils/process/status.hpp"
#include "utils/signals/exceptions.hpp"

namespace fs = utils::fs;
namespace process = utils::process;
namespace signals = utils::signals;

using utils::none;


namespace {


/// Checks that interrupts handling manages a particular signal.
///
/// The check runs in a subprocess because the interrupts handling cannot be
/// torn down once configured.
///
/// \param signo The signal to check.
static void
check_signal_handling(const int signo)
{
    const pid_t pid = ::fork();
    ATF_REQUIRE(pid != -1);
    if (pid == 0) {
        signals::setup_interrupts();

        signals::check_interrupt();  // Should not throw.

        ::kill(::getpid(), signo);
        atf::utils::create_file("interrupted.txt", "");

        bool detected = false;
        for (int tries = 0; !detected && tries < 10; ++tries) {
            try {
                signals::check_interrupt();
                ::sleep(1);
            } catch (const signals::interrupted_error& e) {
                if (e.signo() != signo)
                    std::exit(EXIT_FAILURE);
                detected = true;
            }
        }
        if (!detected) {
            std::cerr << "check_interrupt did not notice the signal\n";
            std::exit(EXIT_FAILURE);
        }

        try {
            signals::check_interrupt();
        } catch (const signals::interrupted_error& e) {
            std::cerr << "check_interrupt raised the same signal twice\n";
            std::exit(EXIT_FAILURE);
        }

        signals::redeliver_to_exit(signo);
        ::sleep(60);
        std::exit(EXIT_SUCCESS);
    }

    int status;
    ATF_REQUIRE(::waitpid(pid, &status, 0) != -1);
    ATF_REQUIRE(WIFSIGNALED(status));
    ATF_REQUIRE_EQ(signo, WTERMSIG(status));

    // If the cookie does not exist, the first signal delivery caused the
    // process to incorrectly exit.
    ATF_REQUIRE(fs::exists(fs::path("interrupted.txt")));
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(sighup);
ATF_TEST_CASE_BODY(sighup)
{
    check_signal_handling(SIGHUP);
}


ATF_TEST_CASE_WITHOUT_HEAD(sigint);
ATF_TEST_CASE_BODY(sigint)
{
    check_signal_handling(SIGINT);
}


ATF_TEST_CASE_WITHOUT_HEAD(sigterm);
ATF_TEST_CASE_BODY(sigterm)
{
    check_signal_handling(SIGTERM);
}


ATF_TEST_CASE_WITHOUT_HEAD(untrack_child_group__unknown);
ATF_TEST_CASE_BODY(untrack_child_group__unknown)
{
    signals::track_child_group(12345);
    signals::track_child_group(12345);
    signals::untrack_child_group(12345);
    signals::untrack_child_group(12345);
    signals::untrack_child_group(12345);
}


ATF_TEST_CASE(kill_children);
ATF_TEST_CASE_HEAD(kill_children)
{
    set_md_var("timeout", "10");
}
ATF_TEST_CASE_BODY(kill_children)
{
    const pid_t pid = ::fork();
    ATF_REQUIRE(pid != -1);
    if (pid == 0) {
        signals::setup_interrupts();

        process::args_vector args;
        args.push_back("60");
        std::unique_ptr< process::child > child1 = process::child::spawn(
            "sleep", args, none);
        std::unique_ptr< process::child > child2 = process::child::spawn(
            "sleep", args, none);

        // The children sleep for longer than the test timeout; interrupting
        // ourselves must cause them to be killed.
        ::kill(::getpid(), SIGHUP);

        const process::status status1 = child1->wait();
        const process::status status2 = child2->wait();
        if (!status1.signaled() || status1.termsig() != SIGKILL ||
            !status2.signaled() || status2.termsig() != SIGKILL)
            std::exit(EXIT_FAILURE);
        std::exit(EXIT_SUCCESS);
    }

    int status;
    ATF_REQUIRE(::waitpid(pid, &status, 0) != -1);
    ATF_REQUIRE(WIFEXITED(status));
    ATF_REQUIRE_EQ(EXIT_SUCCESS, WEXITSTATUS(status));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, sighup);
    ATF_ADD_TEST_CASE(tcs, sigint);
    ATF_ADD_TEST_CASE(tcs, sigterm);
    ATF_ADD_TEST_CASE(tcs, untrack_child_group__unknown);
    ATF_ADD_TEST_CASE(tcs, kill_children);
}
