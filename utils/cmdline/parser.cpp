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

#include "utils/cmdline/parser.hpp"

extern "C" {
#include <getopt.h>
}

#include <cstdlib>
#include <cstring>
#include <limits>
#include <set>

#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/format/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/sanity.hpp"

namespace cmdline = utils::cmdline;

namespace {


/// Auxiliary data to call getopt_long(3).
struct getopt_data : utils::noncopyable {
    /// Plain-text representation of the short options.
    ///
    /// This string follows the syntax expected by getopt_long(3) in the
    /// argument to describe the short options.
    std::string short_options;

    /// Representation of the long options as expected by getopt_long(3).
    std::vector< ::option > long_options;

    /// Auto-generated identifiers to be able to parse long options.
    std::map< int, const cmdline::base_option* > ids;
};


/// Converts a cmdline::options_vector to a getopt_data.
///
/// \param options The high-level definition of the options.
/// \param [out] data An object containing the necessary data to call
///     getopt_long(3) and interpret its results.
static void
options_to_getopt_data(const cmdline::options_vector& options,
                       getopt_data& data)
{
    data.short_options.clear();
    data.long_options.clear();

    // Leading '+' stops at the first non-option (subcommand names) and ':'
    // makes missing arguments distinguishable from unknown options.
    data.short_options = "+:";

    int cur_id = std::numeric_limits< char >::max() + 1;
    for (cmdline::options_vector::const_iterator iter = options.begin();
         iter != options.end(); ++iter) {
        const cmdline::base_option* option = *iter;

        ::option long_option;
        std::memset(&long_option, 0, sizeof(long_option));

        long_option.name = option->long_name().c_str();
        if (option->needs_arg())
            long_option.has_arg = required_argument;
        else
            long_option.has_arg = no_argument;

        int id = -1;
        if (option->has_short_name()) {
            data.short_options += option->short_name();
            if (option->needs_arg())
                data.short_options += ':';
            id = option->short_name();
        } else {
            id = cur_id++;
        }
        long_option.flag = NULL;
        long_option.val = id;
        data.ids[id] = option;

        data.long_options.push_back(long_option);
    }

    ::option last_long_option;
    std::memset(&last_long_option, 0, sizeof(last_long_option));
    data.long_options.push_back(last_long_option);
}


}  // anonymous namespace


/// Constructs a new parsed_cmdline.
///
/// Use the cmdline::parse() free functions to construct.
///
/// \param option_values_ A mapping of long option names to values.  This
///     contains a representation of the options provided by the user.  Note
///     that each value is actually a collection values: a user may specify a
///     flag multiple times, and depending on the case we want to honor one or
///     the other.  For those options that support no argument, the argument
///     value is the empty string.
/// \param arguments_ The list of non-option arguments in the command line.
cmdline::parsed_cmdline::parsed_cmdline(
    const options_map& option_values_,
    const cmdline::args_vector& arguments_) :
    _option_values(option_values_),
    _arguments(arguments_)
{
}


/// Returns the raw values given to an option.
///
/// \param name The option to query.
///
/// \return The raw values, in the order in which they were given.
const std::vector< std::string >&
cmdline::parsed_cmdline::get_option_raw(const std::string& name) const
{
    options_map::const_iterator iter = _option_values.find(name);
    PRE_MSG(iter != _option_values.end() && !(*iter).second.empty(),
            F("The option %s has not been given a value") % name);
    return (*iter).second;
}


/// Checks if the given option has been given in the command line.
///
/// \param name The long option name to check for presence.
///
/// \return True if the option has been given; false otherwise.
bool
cmdline::parsed_cmdline::has_option(const std::string& name) const
{
    return _option_values.find(name) != _option_values.end();
}


/// Gets the non-option arguments of the command line.
///
/// \return The list of non-option arguments.
const cmdline::args_vector&
cmdline::parsed_cmdline::arguments(void) const
{
    return _arguments;
}


/// Parses a command line.
///
/// \param args The command line to parse, broken down by words.
/// \param options The description of the supported options.
///
/// \return The parsed command line.
///
/// \pre args[0] must be the program or command name.
///
/// \throw cmdline::error See the description of parse(argc, argv, options) for
///     more details on the raised errors.
cmdline::parsed_cmdline
cmdline::parse(const cmdline::args_vector& args,
               const cmdline::options_vector& options)
{
    PRE_MSG(args.size() >= 1, "No progname or command name found");

    std::vector< const char* > argv;
    for (args_vector::const_iterator iter = args.begin(); iter != args.end();
         ++iter)
        argv.push_back(iter->c_str());
    argv.push_back(NULL);
    return parse(static_cast< int >(args.size()), &argv[0], options);
}


/// Parses a command line.
///
/// \param argc The number of arguments in argv, without counting the
///     terminating NULL.
/// \param argv The arguments to parse.  The array is NULL-terminated.
/// \param options The description of the supported options.
///
/// \return The parsed command line.
///
/// \pre args[0] must be the program or command name.
///
/// \throw cmdline::missing_option_argument_error If the user specified an
///     option that requires an argument, but no argument was provided.
/// \throw cmdline::unknown_option_error If the user specified an unknown
///     option (i.e. an option not defined in options).
/// \throw cmdline::option_argument_value_error If the user passed an invalid
///     argument to a supported option.
cmdline::parsed_cmdline
cmdline::parse(const int argc, const char* const* argv,
               const cmdline::options_vector& options)
{
    PRE_MSG(argc >= 1, "No progname or command name found");

    getopt_data data;
    options_to_getopt_data(options, data);

    std::set< std::string > given;
    std::map< std::string, std::vector< std::string > > option_values;

    // glibc only reinitializes its internal state when optind is 0.
    ::optind = 0;
    ::opterr = 0;
    int ch;
    while ((ch = ::getopt_long(argc, const_cast< char* const* >(argv),
                               data.short_options.c_str(),
                               &data.long_options[0], NULL)) != -1) {
        if (ch == ':') {
            throw cmdline::missing_option_argument_error(argv[::optind - 1]);
        } else if (ch == '?') {
            if (::optopt != 0 && ::optopt <= std::numeric_limits< char >::max())
                throw cmdline::unknown_option_error(F("-%s") %
                                                    static_cast< char >(
                                                        ::optopt));
            const std::string arg = argv[::optind - 1];
            throw cmdline::unknown_option_error(arg.substr(0, arg.find('=')));
        } else {
            std::map< int, const cmdline::base_option* >::const_iterator
                id = data.ids.find(ch);
            INV(id != data.ids.end());
            const cmdline::base_option* option = (*id).second;

            if (option->needs_arg()) {
                if (::optarg != NULL) {
                    option->validate(::optarg);
                    option_values[option->long_name()].push_back(::optarg);
                } else
                    INV(option->has_default_value());
            } else {
                option_values[option->long_name()].push_back("");
            }
            given.insert(option->long_name());
        }
    }

    for (cmdline::options_vector::const_iterator iter = options.begin();
         iter != options.end(); ++iter) {
        const cmdline::base_option* option = *iter;
        if (option->needs_arg() && option->has_default_value() &&
            given.find(option->long_name()) == given.end())
            option_values[option->long_name()].push_back(
                option->default_value());
    }

    args_vector args;
    for (int i = ::optind; i < argc; ++i)
        args.push_back(argv[i]);

    return parsed_cmdline(option_values, args);
}
