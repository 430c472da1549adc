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

#include "utils/fs/auto_cleaners.hpp"

#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"

namespace fs = utils::fs;


/// Creates a new scratch directory.
///
/// \param name_template Template for the directory name; must end in XXXXXX.
///
/// \throw fs::system_error If the directory cannot be created.
fs::scratch_directory::scratch_directory(const path& name_template) :
    _directory(fs::mkdtemp(name_template)),
    _removed(false)
{
    LD(F("Created scratch directory %s") % _directory);
}


/// Removes the scratch directory if still present.
fs::scratch_directory::~scratch_directory(void)
{
    try {
        cleanup();
    } catch (const fs::error& e) {
        LW(F("Leaving scratch directory %s behind: %s") % _directory %
           e.what());
    }
}


/// \return The path to the created directory.
const fs::path&
fs::scratch_directory::directory(void) const
{
    return _directory;
}


/// Builds the path to an entry within the scratch directory.
///
/// \param name Relative name of the entry.
///
/// \return The joined path.
fs::path
fs::scratch_directory::operator/(const std::string& name) const
{
    return _directory / name;
}


/// Deletes the directory tree.  Calling this more than once is a no-op.
///
/// \throw fs::error If any entry cannot be removed.
void
fs::scratch_directory::cleanup(void)
{
    if (_removed)
        return;
    _removed = true;
    fs::cleanup(_directory);
}
