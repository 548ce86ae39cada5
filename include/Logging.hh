/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>

#include "IoUtility.hh"

namespace Shuffling {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance
    DEBUG     ///< Verbose debugging logging
};

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
std::ostream& logStream();

template<typename FormatIterator>
void log(FormatIterator first, FormatIterator last)
{
    if (first != last) {
        logStream().write(std::addressof(*first), last - first);
    }
}

template<typename FormatIterator, typename First, typename... Rest>
void log(
    FormatIterator first, FormatIterator last, const First& arg,
    const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        log(first, iter);
    } else {
        logStream().write(std::addressof(*first), iter - first);
        // Brings the operator<< for optional defined in IoUtility.hh into
        // consideration
        {
            using Shuffling::operator<<;
            logStream() << arg;
        }
        log(std::next(iter, 2), last, rest...);
    }
}

}

/// \endcond

/** \brief Logging utility
 *
 * Log message if \p level is at least the minimum logging level set by
 * setupLogging().
 *
 * The \p format string is inspired by the standard C formatting string, but
 * the type given by a specifier is ignored. Each \p ts is streamed as is in
 * place of the next two character specifier (\% followed by any character).
 *
 * \note This utility is not thread safe. Only one thread should log at a
 * time.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename... Ts>
void log(LogLevel level, std::string_view format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        Impl::log(format.begin(), format.end(), ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Default mapping between verbosity and logging level
 *
 * \param verbosity the number of times the -v flag is given on the command
 * line
 *
 * \return LogLevel corresponding the verbosity (0 warning, 1 info, >=2 debug)
 */
LogLevel getLogLevel(int verbosity);

/** \brief Parse logging level from its name
 *
 * The names are case sensitive lower case names of the levels: "none",
 * "fatal", "error", "warning", "info" and "debug".
 *
 * \param name the name
 *
 * \return the logging level, or none if \p name is not a name of a level
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/** \brief Setup logging utility
 *
 * This function sets up the (global) minimum logging level and the stream to
 * which the log is output.
 *
 * If this method is not called, the default logging level is LogLevel::WARNING
 * and the default stream is std::cerr. If the logging level is set to
 * LogLevel::NONE, no logs are produced.
 *
 * The application is responsible for ensuring that no logging takes place after
 * the lifetime of \p stream has ended until another stream has been setup using
 * this method.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
