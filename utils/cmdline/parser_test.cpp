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

#include "utils/cmdline/parser.ipp"

#include <atf-c++.hpp>

#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"

namespace cmdline = utils::cmdline;


namespace {


/// Builds the options of a sample command.
///
/// \param [out] options The collection to fill in.
/// \param quiet Storage for the boolean option.
/// \param output Storage for the string option.
/// \param jobs Storage for the integer option.
/// \param property Storage for the property option.
static void
build_options(cmdline::options_vector& options,
              cmdline::bool_option& quiet,
              cmdline::string_option& output,
              cmdline::positive_int_option& jobs,
              cmdline::property_option& property)
{
    options.push_back(&quiet);
    options.push_back(&output);
    options.push_back(&jobs);
    options.push_back(&property);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(no_options_no_arguments);
ATF_TEST_CASE_BODY(no_options_no_arguments)
{
    cmdline::args_vector args;
    args.push_back("progname");
    const cmdline::parsed_cmdline cmdline = cmdline::parse(
        args, cmdline::options_vector());
    ATF_REQUIRE(cmdline.arguments().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(mixed);
ATF_TEST_CASE_BODY(mixed)
{
    cmdline::bool_option quiet('q', "quiet", "Quiet");
    cmdline::string_option output('o', "output", "Output", "file");
    cmdline::positive_int_option jobs("jobs", "Jobs", "n", "4");
    cmdline::property_option property('v', "variable", "Variable", "K=V");
    cmdline::options_vector options;
    build_options(options, quiet, output, jobs, property);

    const char* const argv[] = {"run", "-q", "--output=out.json", "-v", "a=1",
                                "--variable=b=2", "first", "second", NULL};
    const cmdline::parsed_cmdline cmdline = cmdline::parse(8, argv, options);

    ATF_REQUIRE(cmdline.has_option("quiet"));
    ATF_REQUIRE_EQ("out.json",
                   cmdline.get_option< cmdline::string_option >("output"));
    ATF_REQUIRE_EQ(4, cmdline.get_option< cmdline::positive_int_option >(
        "jobs"));

    const std::vector< cmdline::property_option::option_type > properties =
        cmdline.get_multi_option< cmdline::property_option >("variable");
    ATF_REQUIRE_EQ(2, properties.size());
    ATF_REQUIRE_EQ("a", properties[0].first);
    ATF_REQUIRE_EQ("1", properties[0].second);
    ATF_REQUIRE_EQ("b", properties[1].first);
    ATF_REQUIRE_EQ("2", properties[1].second);

    ATF_REQUIRE_EQ(2, cmdline.arguments().size());
    ATF_REQUIRE_EQ("first", cmdline.arguments()[0]);
    ATF_REQUIRE_EQ("second", cmdline.arguments()[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(last_value_wins);
ATF_TEST_CASE_BODY(last_value_wins)
{
    cmdline::options_vector options;
    cmdline::string_option output('o', "output", "Output", "file", "-");
    options.push_back(&output);

    {
        const char* const argv[] = {"run", NULL};
        const cmdline::parsed_cmdline cmdline = cmdline::parse(1, argv,
                                                               options);
        ATF_REQUIRE_EQ("-", cmdline.get_option< cmdline::string_option >(
            "output"));
    }
    {
        const char* const argv[] = {"run", "-o", "a", "-o", "b", NULL};
        const cmdline::parsed_cmdline cmdline = cmdline::parse(5, argv,
                                                               options);
        ATF_REQUIRE_EQ("b", cmdline.get_option< cmdline::string_option >(
            "output"));
        ATF_REQUIRE_EQ(2, cmdline.get_multi_option< cmdline::string_option >(
            "output").size());
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(stops_at_first_argument);
ATF_TEST_CASE_BODY(stops_at_first_argument)
{
    cmdline::options_vector options;
    cmdline::bool_option flag("flag", "Flag");
    options.push_back(&flag);

    const char* const argv[] = {"progname", "subcommand", "--flag", "arg",
                                NULL};
    const cmdline::parsed_cmdline cmdline = cmdline::parse(4, argv, options);
    ATF_REQUIRE(!cmdline.has_option("flag"));
    ATF_REQUIRE_EQ(3, cmdline.arguments().size());
    ATF_REQUIRE_EQ("subcommand", cmdline.arguments()[0]);
    ATF_REQUIRE_EQ("--flag", cmdline.arguments()[1]);

    const cmdline::parsed_cmdline cmdline2 = cmdline::parse(
        cmdline.arguments(), options);
    ATF_REQUIRE(cmdline2.has_option("flag"));
    ATF_REQUIRE_EQ(1, cmdline2.arguments().size());
    ATF_REQUIRE_EQ("arg", cmdline2.arguments()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(double_dash);
ATF_TEST_CASE_BODY(double_dash)
{
    cmdline::options_vector options;
    cmdline::bool_option flag('f', "flag", "Flag");
    options.push_back(&flag);

    const char* const argv[] = {"progname", "--", "-f", NULL};
    const cmdline::parsed_cmdline cmdline = cmdline::parse(3, argv, options);
    ATF_REQUIRE(!cmdline.has_option("flag"));
    ATF_REQUIRE_EQ(1, cmdline.arguments().size());
    ATF_REQUIRE_EQ("-f", cmdline.arguments()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(unknown_option);
ATF_TEST_CASE_BODY(unknown_option)
{
    cmdline::options_vector options;
    cmdline::bool_option flag('f', "flag", "Flag");
    options.push_back(&flag);

    {
        const char* const argv[] = {"progname", "-z", NULL};
        try {
            cmdline::parse(2, argv, options);
            fail("unknown_option_error not raised");
        } catch (const cmdline::unknown_option_error& e) {
            ATF_REQUIRE_EQ("-z", e.option());
        }
    }
    {
        const char* const argv[] = {"progname", "--foo-bar=3", NULL};
        try {
            cmdline::parse(2, argv, options);
            fail("unknown_option_error not raised");
        } catch (const cmdline::unknown_option_error& e) {
            ATF_REQUIRE_EQ("--foo-bar", e.option());
        }
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(missing_option_argument);
ATF_TEST_CASE_BODY(missing_option_argument)
{
    cmdline::options_vector options;
    cmdline::string_option output('o', "output", "Output", "file");
    options.push_back(&output);

    const char* const argv[] = {"progname", "--output", NULL};
    ATF_REQUIRE_THROW_RE(cmdline::missing_option_argument_error,
                         "argument for option --output",
                         cmdline::parse(2, argv, options));

    const char* const argv2[] = {"progname", "-o", NULL};
    ATF_REQUIRE_THROW_RE(cmdline::missing_option_argument_error,
                         "argument for option -o",
                         cmdline::parse(2, argv2, options));
}


ATF_TEST_CASE_WITHOUT_HEAD(option_argument_value);
ATF_TEST_CASE_BODY(option_argument_value)
{
    cmdline::options_vector options;
    cmdline::positive_int_option jobs('j', "jobs", "Jobs", "n");
    options.push_back(&jobs);

    const char* const argv[] = {"progname", "-j", "zero", NULL};
    ATF_REQUIRE_THROW_RE(cmdline::option_argument_value_error,
                         "'zero' for option --jobs",
                         cmdline::parse(3, argv, options));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, no_options_no_arguments);
    ATF_ADD_TEST_CASE(tcs, mixed);
    ATF_ADD_TEST_CASE(tcs, last_value_wins);
    ATF_ADD_TEST_CASE(tcs, stops_at_first_argument);
    ATF_ADD_TEST_CASE(tcs, double_dash);
    ATF_ADD_TEST_CASE(tcs, unknown_option);
    ATF_ADD_TEST_CASE(tcs, missing_option_argument);
    ATF_ADD_TEST_CASE(tcs, option_argument_value);
}
