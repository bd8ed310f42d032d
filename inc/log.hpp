//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_LOG__
#define __SIMPLE_UIKIT_LOG__

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace su { // simple uikit
namespace log {

/**
 * @brief severity of a log line
 *
 * Lines with a severity below the current threshold are discarded before any
 * formatting takes place. `none` as a threshold silences everything.
 */
enum class level {
    debug = 0,
    info,
    warning,
    error,
    none
};

/**
 * @return the current severity threshold
 */
level threshold();

/**
 * @brief set the severity threshold
 * @param lvl lines with a severity below this value are discarded
 */
void threshold(level lvl);

/**
 * @brief redirect log output
 * @param os stream to write to, `nullptr` restores the default (`std::cerr`)
 */
void sink(std::ostream* os);

/**
 * @return the textual name of a severity level
 */
const char* name(level lvl);

/**
 * @brief parse a severity name ("debug", "info", "warning", "error", "none")
 * @param s text to parse
 * @param lvl reference to write the result to
 * @return `true` on success, `false` if the text names no level
 */
bool parse(const std::string& s, level& lvl);

namespace detail {

std::unique_lock<std::mutex> lock();
std::ostream& stream();

inline void write(std::ostream& os) {
    os << std::endl << std::flush;
}

template <typename T, typename... As>
inline void write(std::ostream& os, T&& t, As&&... as) {
    os << t;
    write(os, std::forward<As>(as)...);
}

}

/**
 * @brief write a line to the log
 *
 * prints in the format:
 * [level][tag] arguments...
 *
 * All arguments are streamed with `operator<<`. Writes from different threads
 * are serialized so lines never interleave.
 *
 * @param lvl severity of the line
 * @param tag typically the calling function
 * @param as values to print
 */
template <typename... As>
void write(level lvl, const char* tag, As&&... as) {
    if(lvl < threshold() || lvl >= level::none) {
        return;
    }

    // format outside the lock
    std::stringstream ss;
    detail::write(ss, "[", name(lvl), "][", tag, "] ", std::forward<As>(as)...);

    auto lk = detail::lock();
    detail::stream() << ss.str() << std::flush;
}

template <typename... As>
void debug(const char* tag, As&&... as) {
    write(level::debug, tag, std::forward<As>(as)...);
}

template <typename... As>
void info(const char* tag, As&&... as) {
    write(level::info, tag, std::forward<As>(as)...);
}

template <typename... As>
void warning(const char* tag, As&&... as) {
    write(level::warning, tag, std::forward<As>(as)...);
}

template <typename... As>
void error(const char* tag, As&&... as) {
    write(level::error, tag, std::forward<As>(as)...);
}

}
}

#endif
