// SPDX-License-Identifier: Apache-2.0
#include <filesystem>
#include <fstream>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "framescan/error.hpp"
#include "framescan/global_store/global_store.hpp"
#include "framescan/utility/string_helpers.hpp"

using namespace framescan;
using namespace framescan::utility;
using namespace framescan::global_store;
namespace fs = std::filesystem;

namespace {

nlohmann::json read_json(const fs::path &path) {
    std::ifstream i(path);
    if (not i)
        throw framescan_err(fmt::format("Can't open {}", path.string()));
    return nlohmann::json::parse(i);
}

// json files of a directory in name order, or the file itself.
std::vector<fs::path> json_files(const fs::path &path) {
    if (not fs::is_directory(path))
        return std::vector<fs::path>({path});

    std::set<fs::path> files;
    for (const auto &entry : fs::directory_iterator(path)) {
        if (entry.is_regular_file() and entry.path().extension() == ".json")
            files.insert(entry.path());
    }
    return std::vector<fs::path>(files.begin(), files.end());
}

// one json per line, relative to the list, '#' starts a comment line.
std::vector<fs::path> listed_files(const fs::path &path) {
    std::ifstream i(path);
    if (not i)
        throw framescan_err(fmt::format("Can't open {}", path.string()));

    std::vector<fs::path> files;
    std::string line;
    while (std::getline(i, line)) {
        line = trim(line);
        if (line.empty() or line[0] == '#')
            continue;
        fs::path file(line);
        files.push_back(file.is_relative() ? path.parent_path() / file : file);
    }
    return files;
}

} // namespace

Preferences::Preferences(nlohmann::json json) : json_(std::move(json)) {}

void Preferences::load(const std::string &path) {
    try {
        for (const auto &file : json_files(path)) {
            try {
                json_.merge_patch(read_json(file));
                spdlog::debug("Loaded preferences {}", file.string());
            } catch (const std::exception &err) {
                spdlog::warn("Failed to load preferences {} {}", file.string(), err.what());
            }
        }
    } catch (const std::exception &err) {
        spdlog::warn("Failed to read preference path {} {}", path, err.what());
    }
}

void Preferences::load_overrides(const std::string &path) {
    try {
        const fs::path p(path);
        const auto files = p.extension() == ".lst" ? listed_files(p) : json_files(p);
        for (const auto &file : files)
            apply_override(file.string());
    } catch (const std::exception &err) {
        spdlog::warn("Failed to read preference override {} {}", path, err.what());
    }
}

void Preferences::apply_override(const std::string &file) {
    nlohmann::json overrides;
    try {
        overrides = read_json(file);
    } catch (const std::exception &err) {
        spdlog::warn("Failed to read preference override {} {}", file, err.what());
        return;
    }

    for (const auto &[key, value] : overrides.items()) {
        if (not ends_with(key, "/value")) {
            spdlog::warn("Only values can be overridden {} {}", key, file);
            continue;
        }

        const nlohmann::json::json_pointer pref(key.substr(0, key.size() - 6));
        if (not json_.contains(pref) or not json_.at(pref).is_object()) {
            spdlog::warn("Unknown preference {} {}", key, file);
            continue;
        }

        json_.at(pref)["value"]           = value;
        json_.at(pref)["overridden_path"] = file;
        spdlog::debug("Preference overridden {} {} {}", key, value.dump(), file);
    }
}

std::string Preferences::overridden_path(const std::string &path) const {
    const nlohmann::json::json_pointer ptr(path + "/overridden_path");
    return json_.contains(ptr) ? json_.at(ptr).get<std::string>() : std::string();
}

Preferences framescan::global_store::load_preferences(
    const std::vector<std::string> &paths, const std::vector<std::string> &override_paths) {
    Preferences prefs;
    for (const auto &i : paths)
        prefs.load(i);
    for (const auto &i : override_paths)
        prefs.load_overrides(i);
    return prefs;
}

SequenceSettings framescan::global_store::sequence_settings(const Preferences &prefs) {
    SequenceSettings settings;

    try {
        const auto placeholder = prefs.value<std::string>("/core/sequence/placeholder");
        if (placeholder.size() != 1 or is_digit(placeholder[0]))
            throw framescan_err(fmt::format("Invalid placeholder \"{}\"", placeholder));
        settings.placeholder_ = placeholder[0];
    } catch (const std::exception &err) {
        spdlog::warn("Preference placeholder: {}", err.what());
    }

    try {
        const auto format = prefs.value<std::string>("/core/sequence/output_format");
        if (format != "text" and format != "json")
            throw framescan_err(fmt::format("Unsupported output format \"{}\"", format));
        settings.output_format_ = format;
    } catch (const std::exception &err) {
        spdlog::warn("Preference output format: {}", err.what());
    }

    try {
        const auto name  = prefs.value<std::string>("/core/logging/level");
        const auto level = parse_log_level(name);
        if (not level)
            throw framescan_err(fmt::format("Unknown log level \"{}\"", name));
        settings.log_level_ = *level;
    } catch (const std::exception &err) {
        spdlog::warn("Preference log level: {}", err.what());
    }

    return settings;
}
