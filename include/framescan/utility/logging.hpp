// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

// time a block, reported at warn when it takes longer than a second.
#ifdef FRAMESCAN_DEBUG
#define START_SLOW_WATCHER() spdlog::stopwatch _sw;
#define CHECK_SLOW_WATCHER()                                                                   \
    spdlog::log(                                                                               \
        _sw.elapsed().count() > 1.0 ? spdlog::level::warn : spdlog::level::debug,              \
        "{}@{} Sec: {:.3f}",                                                                   \
        __PRETTY_FUNCTION__,                                                                   \
        __LINE__,                                                                              \
        _sw);
#else
#define START_SLOW_WATCHER()                                                                   \
    {}
#define CHECK_SLOW_WATCHER()                                                                   \
    {}
#endif

namespace framescan {
namespace utility {

    /*! Start logger, replacing any earlier framescan logger.

      \param lvl - level of messages written to stderr
      \param logfile - optional rotating log file, always written at debug

    */
    void start_logger(
        const spdlog::level::level_enum lvl = spdlog::level::info,
        const std::string &logfile          = "");

    //! Change the level of stderr output of the running logger.
    void set_log_level(const spdlog::level::level_enum lvl);

    //! Level for names "trace" .. "off", empty for anything else.
    std::optional<spdlog::level::level_enum> parse_log_level(const std::string &name);

    //! Flush and stop logger
    void stop_logger();

} // namespace utility
} // namespace framescan
