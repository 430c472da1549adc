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

#include "model/submission_config.hpp"

#include "model/test_case.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;

using utils::none;
using utils::optional;


/// Internal implementation for a submission_config.
struct model::submission_config::impl {
    /// Command to run the programs with; superseded by run_command.
    optional< std::string > command;

    /// Command to run the programs with.
    optional< std::string > run_command;

    /// Command to build each program before running it.
    optional< std::string > compile_command;

    /// Program or directory of programs to test.
    fs::path path;

    /// Test cases to run against every program.
    model::test_cases_vector tests;

    /// Constructor.
    ///
    /// \param command_ Command to run the programs with.
    /// \param run_command_ Command to run the programs with; takes precedence.
    /// \param compile_command_ Command to build each program.
    /// \param path_ Program or directory of programs to test.
    /// \param tests_ Test cases to run against every program.
    impl(const optional< std::string >& command_,
         const optional< std::string >& run_command_,
         const optional< std::string >& compile_command_,
         const fs::path& path_,
         const model::test_cases_vector& tests_) :
        command(command_),
        run_command(run_command_),
        compile_command(compile_command_),
        path(path_),
        tests(tests_)
    {
    }

    /// Equality comparator.
    ///
    /// \param other The other object to compare this one to.
    ///
    /// \return True if this object and other are equal; false otherwise.
    bool
    operator==(const impl& other) const
    {
        return (command == other.command &&
                run_command == other.run_command &&
                compile_command == other.compile_command &&
                path == other.path &&
                tests == other.tests);
    }
};


/// Constructs a new submission configuration.
///
/// \param command_ Command to run the programs with, if any.
/// \param run_command_ Command to run the programs with, if any; takes
///     precedence over command_.
/// \param compile_command_ Command to build each program, if any.  May contain
///     the {source} and {output} placeholders.
/// \param path_ Program or directory of programs to test.
/// \param tests_ Test cases to run against every program.
model::submission_config::submission_config(
    const optional< std::string >& command_,
    const optional< std::string >& run_command_,
    const optional< std::string >& compile_command_,
    const fs::path& path_,
    const model::test_cases_vector& tests_) :
    _pimpl(new impl(command_, run_command_, compile_command_, path_, tests_))
{
}


/// Destructor.
model::submission_config::~submission_config(void)
{
}


/// Gets the command given through the 'command' property.
///
/// \return The command, if any.
const optional< std::string >&
model::submission_config::command(void) const
{
    return _pimpl->command;
}


/// Gets the command given through the 'run_command' property.
///
/// \return The command, if any.
const optional< std::string >&
model::submission_config::run_command(void) const
{
    return _pimpl->run_command;
}


/// Gets the command to build each program.
///
/// \return The command with its placeholders unexpanded, if any.
const optional< std::string >&
model::submission_config::compile_command(void) const
{
    return _pimpl->compile_command;
}


/// Gets the program or directory of programs to test.
///
/// \return A path.
const fs::path&
model::submission_config::path(void) const
{
    return _pimpl->path;
}


/// Gets the test cases to run against every program.
///
/// \return The test cases in their definition order.
const model::test_cases_vector&
model::submission_config::tests(void) const
{
    return _pimpl->tests;
}


/// Gets the command to run the programs with.
///
/// \return run_command() if defined, command() otherwise.  None means that the
/// programs (or their build artifacts) are executed directly.
optional< std::string >
model::submission_config::effective_run_command(void) const
{
    if (_pimpl->run_command)
        return _pimpl->run_command;
    return _pimpl->command;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::submission_config::operator==(const submission_config& other) const
{
    return _pimpl == other._pimpl || *_pimpl == *other._pimpl;
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::submission_config::operator!=(const submission_config& other) const
{
    return !(*this == other);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const submission_config& object)
{
    output << F("submission_config{command=%s, run_command=%s, "
                "compile_command=%s, path=%s, tests=%s}")
        % object.command()
        % object.run_command()
        % object.compile_command()
        % object.path()
        % object.tests().size();
    return output;
}
