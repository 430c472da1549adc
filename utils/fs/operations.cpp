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

#include "utils/fs/operations.hpp"

extern "C" {
#include <sys/stat.h>

#include <dirent.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;

using utils::none;
using utils::optional;


namespace {


/// Stats a file, without following links.
///
/// Errors are logged and reported to the caller in the form of a return
/// value; no exceptions are raised.
///
/// \param path The file to stat.
///
/// \return The stat structure on success; none on failure.
static optional< struct ::stat >
try_stat(const fs::path& path)
{
    struct ::stat sb;

retry:
    if (::lstat(path.c_str(), &sb) == -1) {
        const int original_errno = errno;
        if (original_errno == EINTR)
            goto retry;
        LW(F("Cannot get information about %s: %s") % path %
           std::strerror(original_errno));
        return none;
    } else
        return utils::make_optional(sb);
}


/// Stats a file following links, raising an error on failure.
///
/// \param path The file to stat.
///
/// \return The stat structure, or none if the file does not exist.
///
/// \throw fs::system_error If stat(2) fails for any other reason.
static optional< struct ::stat >
safe_stat(const fs::path& path)
{
    struct ::stat sb;
    if (::stat(path.c_str(), &sb) == -1) {
        const int original_errno = errno;
        if (original_errno == ENOENT || original_errno == ENOTDIR)
            return none;
        throw fs::system_error(F("Cannot get information about %s") % path,
                               original_errno);
    }
    return utils::make_optional(sb);
}


/// Recursively deletes a file or directory without raising errors.
///
/// Directories are made writable before descending into them so that
/// read-only trees left behind by compilers or programs can be removed.
///
/// \param current_path The file or directory to remove.
///
/// \return True on success; false otherwise.
static bool
recursive_cleanup(const fs::path& current_path)
{
    const optional< struct ::stat > current_sb = try_stat(current_path);
    if (!current_sb)
        return false;

    bool ok = true;
    if (S_ISDIR(current_sb.get().st_mode)) {
        if (::chmod(current_path.c_str(), 0700) == -1)
            LW(F("Failed to unprotect %s: %s") % current_path %
               std::strerror(errno));

        std::set< std::string > entries;
        try {
            entries = fs::list_directory(current_path);
        } catch (const fs::error& e) {
            LW(e.what());
            ok = false;
        }
        for (std::set< std::string >::const_iterator iter = entries.begin();
             iter != entries.end(); ++iter)
            ok &= recursive_cleanup(current_path / *iter);

        if (::rmdir(current_path.c_str()) == -1) {
            LW(F("Failed to remove directory %s: %s") % current_path %
               std::strerror(errno));
            ok = false;
        }
    } else {
        if (::unlink(current_path.c_str()) == -1) {
            LW(F("Failed to remove file %s: %s") % current_path %
               std::strerror(errno));
            ok = false;
        }
    }
    return ok;
}


}  // anonymous namespace


/// Recursively removes a directory.
///
/// This operation simulates a "rm -r".  No effort is made to forcibly delete
/// files and no attention is paid to mount points.
///
/// \param root The directory or file to remove.
///
/// \throw fs::error If there is a problem removing any directory or file.
void
fs::cleanup(const fs::path& root)
{
    LD(F("Starting cleanup of '%s'") % root);
    if (!recursive_cleanup(root))
        throw fs::error(F("Failed to clean up '%s'") % root);
}


/// Queries the path to the current directory.
///
/// \return The path to the current directory.
///
/// \throw fs::error If there is a problem querying the current directory.
fs::path
fs::current_path(void)
{
    char* cwd = ::getcwd(NULL, 0);
    if (cwd == NULL) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to get current working directory"),
                               original_errno);
    }

    try {
        const fs::path result(cwd);
        std::free(cwd);
        return result;
    } catch (...) {
        std::free(cwd);
        throw;
    }
}


/// Checks if a file exists.
///
/// Be aware that this is racy in the same way as access(2) is.
///
/// \param path The file to check the existance of.
///
/// \return True if the file exists; false otherwise.
bool
fs::exists(const fs::path& path)
{
    return ::access(path.c_str(), F_OK) == 0;
}


/// Checks if a path names a directory, following symbolic links.
///
/// \param path The path to check.
///
/// \return True if the path exists and is a directory.
///
/// \throw fs::system_error If the file cannot be queried.
bool
fs::is_directory(const fs::path& path)
{
    const optional< struct ::stat > sb = safe_stat(path);
    return sb && S_ISDIR(sb.get().st_mode);
}


/// Checks if a path names a regular file, following symbolic links.
///
/// \param path The path to check.
///
/// \return True if the path exists and is a regular file.
///
/// \throw fs::system_error If the file cannot be queried.
bool
fs::is_regular_file(const fs::path& path)
{
    const optional< struct ::stat > sb = safe_stat(path);
    return sb && S_ISREG(sb.get().st_mode);
}


/// Lists the entries of a directory.
///
/// \param directory The directory to scan.
///
/// \return The names of the entries, sorted, excluding "." and "..".
///
/// \throw fs::system_error If the directory cannot be opened.
std::set< std::string >
fs::list_directory(const fs::path& directory)
{
    DIR* dirp = ::opendir(directory.c_str());
    if (dirp == NULL) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to open directory %s") % directory,
                               original_errno);
    }

    std::set< std::string > entries;
    ::dirent* dp;
    while ((dp = ::readdir(dirp)) != NULL) {
        const std::string name = dp->d_name;
        if (name == "." || name == "..")
            continue;
        entries.insert(name);
    }
    ::closedir(dirp);
    return entries;
}


/// Creates a directory.
///
/// \param dir The path to the directory to create.
/// \param mode The permissions for the new directory.
///
/// \throw system_error If the call to mkdir(2) fails.
void
fs::mkdir(const fs::path& dir, const int mode)
{
    if (::mkdir(dir.c_str(), static_cast< mode_t >(mode)) == -1) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to create directory %s") % dir,
                               original_errno);
    }
}


/// Creates a directory and any missing parents.
///
/// \param dir The path to the directory to create.
/// \param mode The permissions for the new directories.
///
/// \throw system_error If any call to mkdir(2) fails.
void
fs::mkdir_p(const fs::path& dir, const int mode)
{
    try {
        fs::mkdir(dir, mode);
    } catch (const fs::system_error& e) {
        if (e.original_errno() == ENOENT) {
            fs::mkdir_p(dir.branch_path(), mode);
            fs::mkdir(dir, mode);
        } else if (e.original_errno() != EEXIST)
            throw;
    }
}


/// Creates a temporary directory.
///
/// \param path_template The template for the temporary path.  Must contain the
///     XXXXXX pattern, which is atomically replaced by a random unique string.
///
/// \return The generated path for the temporary directory.
///
/// \throw fs::system_error If the call to mkdtemp(3) fails.
fs::path
fs::mkdtemp(const path& path_template)
{
    PRE(path_template.str().find("XXXXXX") != std::string::npos);

    std::vector< char > buf(path_template.str().begin(),
                            path_template.str().end());
    buf.push_back('\0');
    if (::mkdtemp(&buf[0]) == NULL) {
        const int original_errno = errno;
        throw fs::system_error(F("Cannot create temporary directory using "
                                 "template %s") % path_template,
                               original_errno);
    }
    return fs::path(&buf[0]);
}
