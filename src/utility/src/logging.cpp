// SPDX-License-Identifier: Apache-2.0
#include "framescan/utility/logging.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using namespace framescan::utility;

namespace {

constexpr size_t log_file_size  = 1024 * 1024 * 10;
constexpr size_t log_file_count = 10;

// stderr sink of the current framescan logger.
std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink;
bool has_file_sink = false;

} // namespace

void framescan::utility::start_logger(
    const spdlog::level::level_enum lvl, const std::string &logfile) {
    stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{stderr_sink};

    has_file_sink = not logfile.empty();
    if (has_file_sink) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logfile, log_file_size, log_file_count);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    }

    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>("framescan", sinks.begin(), sinks.end()));
    set_log_level(lvl);
}

void framescan::utility::set_log_level(const spdlog::level::level_enum lvl) {
    if (stderr_sink)
        stderr_sink->set_level(lvl);
    // the logger gates before its sinks, keep it open for the file.
    spdlog::set_level(has_file_sink ? std::min(lvl, spdlog::level::debug) : lvl);
}

std::optional<spdlog::level::level_enum>
framescan::utility::parse_log_level(const std::string &name) {
    static const std::map<std::string, spdlog::level::level_enum> levels{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"err", spdlog::level::err},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}};

    auto it = levels.find(name);
    if (it == levels.end())
        return {};
    return it->second;
}

void framescan::utility::stop_logger() { spdlog::default_logger()->flush(); }
