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

#include "model/test_case.hpp"

#include <sstream>

#include <atf-c++.hpp>

#include "utils/datetime.hpp"

namespace datetime = utils::datetime;


ATF_TEST_CASE_WITHOUT_HEAD(test_case__defaults);
ATF_TEST_CASE_BODY(test_case__defaults)
{
    const model::test_case test_case = model::test_case_builder().build();
    ATF_REQUIRE(test_case.input().empty());
    ATF_REQUIRE(test_case.expected_output().empty());
    ATF_REQUIRE_EQ(datetime::delta(10, 0), test_case.timeout());
    ATF_REQUIRE(!test_case.interleaved());
    ATF_REQUIRE(!test_case.unordered());
    ATF_REQUIRE(!test_case.use_regex());
}


ATF_TEST_CASE_WITHOUT_HEAD(test_case__builder);
ATF_TEST_CASE_BODY(test_case__builder)
{
    const model::test_case test_case = model::test_case_builder()
        .add_input("5")
        .add_input("3")
        .add_expected_output("Hello World")
        .add_expected_output("8")
        .set_timeout(datetime::delta(2, 500000))
        .set_interleaved(true)
        .set_unordered(true)
        .set_use_regex(true)
        .build();

    model::lines_vector exp_input;
    exp_input.push_back("5");
    exp_input.push_back("3");
    ATF_REQUIRE(exp_input == test_case.input());
    ATF_REQUIRE_EQ(2, test_case.expected_output().size());
    ATF_REQUIRE_EQ("8", test_case.expected_output()[1]);
    ATF_REQUIRE_EQ(datetime::delta(2, 500000), test_case.timeout());
    ATF_REQUIRE(test_case.interleaved());
    ATF_REQUIRE(test_case.unordered());
    ATF_REQUIRE(test_case.use_regex());
}


ATF_TEST_CASE_WITHOUT_HEAD(test_case__builder_reuse);
ATF_TEST_CASE_BODY(test_case__builder_reuse)
{
    model::test_case_builder builder;
    builder.add_input("a");
    const model::test_case tc1 = builder.build();
    builder.add_input("b");
    const model::test_case tc2 = builder.build();

    ATF_REQUIRE_EQ(1, tc1.input().size());
    ATF_REQUIRE_EQ(2, tc2.input().size());
    ATF_REQUIRE(tc1 != tc2);
}


ATF_TEST_CASE_WITHOUT_HEAD(test_case__operators_eq_and_ne);
ATF_TEST_CASE_BODY(test_case__operators_eq_and_ne)
{
    model::lines_vector lines;
    lines.push_back("A");

    const model::test_case tc1 = model::test_case_builder()
        .set_expected_output(lines).build();
    const model::test_case tc2 = tc1;
    const model::test_case tc3 = model::test_case_builder()
        .set_expected_output(lines).build();
    const model::test_case tc4 = model::test_case_builder()
        .set_expected_output(lines).set_unordered(true).build();

    ATF_REQUIRE(  tc1 == tc2);
    ATF_REQUIRE(!(tc1 != tc2));
    ATF_REQUIRE(  tc1 == tc3);
    ATF_REQUIRE(!(tc1 == tc4));
    ATF_REQUIRE(  tc1 != tc4);
}


ATF_TEST_CASE_WITHOUT_HEAD(test_case__output);
ATF_TEST_CASE_BODY(test_case__output)
{
    const model::test_case test_case = model::test_case_builder()
        .add_input("1")
        .add_input("2")
        .add_expected_output("3")
        .set_timeout(datetime::delta(1, 0))
        .build();

    std::ostringstream str;
    str << test_case;
    ATF_REQUIRE_EQ("test_case{input='1\\n2', expected_output='3', "
                   "timeout=1000000us, interleaved=false, unordered=false, "
                   "use_regex=false}", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, test_case__defaults);
    ATF_ADD_TEST_CASE(tcs, test_case__builder);
    ATF_ADD_TEST_CASE(tcs, test_case__builder_reuse);
    ATF_ADD_TEST_CASE(tcs, test_case__operators_eq_and_ne);
    ATF_ADD_TEST_CASE(tcs, test_case__output);
}
