// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <map>
#include <set>

#include "framescan/error.hpp"
#include "framescan/utility/imageset.hpp"
#include "framescan/utility/logging.hpp"
#include "framescan/utility/sequence.hpp"
#include "framescan/utility/string_helpers.hpp"

using namespace framescan::utility;

std::string Imageset::frames() const {
    std::set<int64_t> frames;
    for (const auto &i : indices_) {
        if (i)
            frames.insert(*i);
    }
    return frame_sequence(frames);
}

std::vector<Imageset> framescan::utility::group_files_by_imageset(
    const std::vector<std::string> &filenames, const char placeholder) {
    if (is_digit(placeholder))
        throw framescan::framescan_err(
            std::string("Placeholder can't be a digit: ") + placeholder);

    std::vector<Imageset> result;
    std::map<std::string, size_t> lookup;

    for (const auto &filename : filenames) {
        const auto match = template_from_filename(filename);
        const auto name = match.template_ ? match.template_->to_string(placeholder) : filename;

        auto it = lookup.find(name);
        if (it == std::end(lookup)) {
            it = lookup.emplace(name, result.size()).first;
            result.emplace_back(Imageset(name));
            result.back().template_ = match.template_;
        }

        if (match.template_)
            result[it->second].indices_.emplace_back(match.index_);
        else
            result[it->second].indices_.emplace_back(std::nullopt);
    }

    spdlog::debug(
        "{} {} files in {} imagesets", __PRETTY_FUNCTION__, filenames.size(), result.size());

    return result;
}

std::optional<Imageset> framescan::utility::find_imageset(
    const std::vector<Imageset> &imagesets, const std::string &name) {
    auto it = std::find_if(imagesets.begin(), imagesets.end(), [&name](const auto &i) {
        return i.name_ == name;
    });
    if (it == imagesets.end())
        return {};
    return *it;
}

void framescan::utility::to_json(nlohmann::json &j, const Imageset &imageset) {
    j["name"] = imageset.name_;
    if (imageset.template_)
        j["template"] = *(imageset.template_);
    else
        j["template"] = nullptr;

    j["indices"] = nlohmann::json::array();
    for (const auto &i : imageset.indices_) {
        if (i)
            j["indices"].push_back(*i);
        else
            j["indices"].push_back(nullptr);
    }
    j["frames"] = imageset.frames();
}
