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

#include "utils/logging/operations.hpp"

extern "C" {
#include <unistd.h>
}

#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace logging = utils::logging;

using utils::none;
using utils::optional;


namespace {


/// Protects all the global state of this module.
///
/// Log entries are generated concurrently by the workers of the suite runner.
static std::recursive_mutex log_mutex;


/// First time recorded by the logging module.
static optional< datetime::timestamp > first_timestamp = none;


/// In-memory record of log entries before persistency is enabled.
static std::deque< std::string > backlog;


/// Maximum number of entries kept in the backlog; older ones are discarded.
static const std::size_t max_backlog_entries = 10000;


/// Stream to the currently open log file.
static std::unique_ptr< std::ofstream > logfile;


/// Whether the module has been told to keep entries in memory forever.
static bool inmemory = false;


/// Most verbose level that reaches the log file.
static logging::level persistency_level = logging::level_debug;


/// Constant string to strftime to format timestamps.
static const char* timestamp_format = "%Y%m%d-%H%M%S";


/// Converts a level to the single-letter identifier written to the log.
///
/// \param level_ The level to convert.
///
/// \return One of D, E, I or W.
static char
level_to_char(const logging::level level_)
{
    switch (level_) {
    case logging::level_error: return 'E';
    case logging::level_warning: return 'W';
    case logging::level_info: return 'I';
    case logging::level_debug: return 'D';
    }
    UNREACHABLE;
}


}  // anonymous namespace


/// Generates a standard log name.
///
/// This always adds the same timestamp to the log name for a particular run.
/// The timestamp corresponds to the first entry recorded by the module, not
/// necessarily to the current value of "now".
///
/// \param logdir The path to the directory in which to place the log.
/// \param progname The name of the program that is generating the log.
///
/// \return The path to the log file.
fs::path
logging::generate_log_name(const fs::path& logdir, const std::string& progname)
{
    std::lock_guard< std::recursive_mutex > lock(log_mutex);
    if (!first_timestamp)
        first_timestamp = datetime::timestamp::now();
    return logdir / (F("%s.%s.log") % progname %
                     first_timestamp.get().strftime(timestamp_format)).str();
}


/// Logs an entry to the log file.
///
/// If the log is not yet set to persistent mode, the entry is recorded in the
/// in-memory backlog.  Otherwise, it is written to disk if its level is
/// within the configured verbosity.
///
/// \param level_ The severity of the entry.
/// \param file The file from which the log message is generated.
/// \param line The line from which the log message is generated.
/// \param user_message The raw message to store.
void
logging::log(const level level_, const char* file, const int line,
             const std::string& user_message)
{
    const datetime::timestamp now = datetime::timestamp::now();

    std::lock_guard< std::recursive_mutex > lock(log_mutex);
    if (!first_timestamp)
        first_timestamp = now;

    if (logfile.get() != NULL && level_ > persistency_level)
        return;

    const std::string message = F("%s %c %d %s:%d: %s") %
        now.strftime(timestamp_format) % level_to_char(level_) % ::getpid() %
        file % line % user_message;
    if (logfile.get() == NULL) {
        backlog.push_back(message);
        if (!inmemory && backlog.size() > max_backlog_entries)
            backlog.pop_front();
    } else {
        INV(backlog.empty());
        (*logfile) << message << '\n';
        (*logfile).flush();
    }
}


/// Converts a textual level name to its enumerated value.
///
/// \param name One of debug, info, warning or error.
///
/// \return The matching level.
///
/// \throw std::range_error If the name is not valid.
logging::level
logging::parse_level(const std::string& name)
{
    if (name == "debug")
        return level_debug;
    else if (name == "info")
        return level_info;
    else if (name == "warning")
        return level_warning;
    else if (name == "error")
        return level_error;
    else
        throw std::range_error(F("Unrecognized log level '%s'") % name);
}


/// Keeps all log entries in memory without ever discarding them.
///
/// Only useful for short-lived programs, such as tests, that want to inspect
/// the log once they are done.
void
logging::set_inmemory(void)
{
    std::lock_guard< std::recursive_mutex > lock(log_mutex);
    inmemory = true;
}


/// Makes the log persistent.
///
/// Calling this function flushes the in-memory log to disk and sets the
/// logging module to send log entries to disk from this point onwards.  There
/// is no way back, and the caller program should execute this function as
/// early as possible.  Backlog entries are all written regardless of the
/// level, as they were recorded before the verbosity was known.
///
/// \param level_name The most verbose level to record; see parse_level().
/// \param path The file to write the logs to.
///
/// \throw std::range_error If the level is not valid.
/// \throw std::runtime_error If the given file cannot be created.
void
logging::set_persistency(const std::string& level_name, const fs::path& path)
{
    const level new_level = parse_level(level_name);

    std::lock_guard< std::recursive_mutex > lock(log_mutex);
    PRE(logfile.get() == NULL);

    std::unique_ptr< std::ofstream > new_logfile(
        new std::ofstream(path.c_str()));
    if (!(*new_logfile))
        throw std::runtime_error(F("Failed to create log file %s") % path);

    for (std::deque< std::string >::const_iterator iter = backlog.begin();
         iter != backlog.end(); ++iter)
        (*new_logfile) << *iter << '\n';
    new_logfile->flush();
    backlog.clear();

    persistency_level = new_level;
    logfile = std::move(new_logfile);
}
