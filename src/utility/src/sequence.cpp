// SPDX-License-Identifier: Apache-2.0
#include <filesystem>
#include <map>

#include "framescan/utility/filename_template.hpp"
#include "framescan/utility/logging.hpp"
#include "framescan/utility/sequence.hpp"
#include "framescan/utility/string_helpers.hpp"

namespace fs = std::filesystem;

namespace framescan::utility {

std::vector<std::string> find_matching_images(const std::string &image_name) {
    const fs::path image_path(image_name);
    const auto directory = image_path.parent_path();
    const auto match     = template_from_filename(image_path.filename().string());

    if (not match.template_) {
        spdlog::debug("{} no template {}", __PRETTY_FUNCTION__, image_name);
        return std::vector<std::string>({image_name});
    }

    const auto &tmpl = *(match.template_);
    std::map<int64_t, std::string> frames;

    START_SLOW_WATCHER()
    // a single snapshot, files created after this point are not seen.
    for (const auto &entry :
         fs::directory_iterator(directory.empty() ? fs::path(".") : directory)) {
        const auto name  = entry.path().filename().string();
        const auto index = tmpl.index_of(name);
        if (index)
            frames[*index] = name;
    }
    CHECK_SLOW_WATCHER()

    std::vector<std::string> result;
    result.reserve(frames.size());
    for (const auto &[index, name] : frames) {
        if (directory.empty())
            result.push_back(name);
        else
            result.push_back((directory / name).string());
    }

    spdlog::debug(
        "{} {} matched {} of {}",
        __PRETTY_FUNCTION__,
        image_name,
        result.size(),
        tmpl.to_string());

    return result;
}

std::string make_frame_sequence(const int64_t start, const int64_t end, const int64_t offset) {
    // check for single entry
    if (start == end)
        return std::to_string(start);

    if (offset == 1) {
        return std::to_string(start) + "-" + std::to_string(end);
    }
    if (end == start + offset) {
        return std::to_string(start) + "," + std::to_string(end);
    }

    return std::to_string(start) + "-" + std::to_string(end) + "x" + std::to_string(offset);
}

std::string frame_sequence(const std::set<int64_t> &frames) {
    if (frames.empty())
        return "";

    std::vector<std::string> fragments;
    int64_t start = 0, end = 0, offset = 0;

    for (const auto &frame : frames) {
        // new range
        if (!offset) {
            start  = frame;
            end    = frame;
            offset = 1;
        } else {
            // simple, one element in current frag.
            if (start == end) {
                end    = frame;
                offset = end - start;
                // easy we`re part of the current sequence
            } else if ((end + offset) == frame) {
                end = frame;
            } else {
                // new frag..
                fragments.push_back(make_frame_sequence(start, end, offset));
                start  = frame;
                end    = frame;
                offset = 1;
            }
        }
    }
    fragments.push_back(make_frame_sequence(start, end, offset));

    return join_as_string(fragments, ",");
}

std::string pad_spec(const int pad) { return "%0" + std::to_string(pad) + "d"; }

std::string escape_percentage(const std::string &str) { return replace_all(str, "%", "%%"); }

} // namespace framescan::utility
