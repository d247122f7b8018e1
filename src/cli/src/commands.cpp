// SPDX-License-Identifier: Apache-2.0
#include <cstdlib>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "framescan/cli/commands.hpp"
#include "framescan/error.hpp"
#include "framescan/utility/filename_template.hpp"
#include "framescan/utility/imageset.hpp"
#include "framescan/utility/logging.hpp"
#include "framescan/utility/sequence.hpp"
#include "framescan/utility/string_helpers.hpp"

using namespace framescan;
using namespace framescan::cli;
using namespace framescan::utility;

void framescan::cli::set_placeholder(
    global_store::SequenceSettings &settings, const char placeholder) {
    if (is_digit(placeholder))
        throw framescan_err(fmt::format("Placeholder can't be a digit: {}", placeholder));
    settings.placeholder_ = placeholder;
}

int framescan::cli::show_templates(
    const std::vector<std::string> &paths,
    const global_store::SequenceSettings &settings,
    std::ostream &out) {
    const bool as_json = settings.output_format_ == "json";
    auto result        = nlohmann::json::array();

    for (const auto &path : paths) {
        const auto match = template_from_filename(path);
        if (as_json) {
            nlohmann::json j{{"path", path}, {"template", nullptr}, {"index", nullptr}};
            if (match.template_) {
                j["template"] = *(match.template_);
                j["index"]    = match.index_;
            }
            result.push_back(j);
        } else if (match.template_) {
            out << match.template_->to_string(settings.placeholder_) << " " << match.index_
                << "\n";
        } else {
            out << path << " -\n";
        }
    }

    if (as_json)
        out << result.dump(2) << std::endl;

    return EXIT_SUCCESS;
}

int framescan::cli::group(
    const std::vector<std::string> &paths,
    const global_store::SequenceSettings &settings,
    std::ostream &out) {
    const auto imagesets = group_files_by_imageset(paths, settings.placeholder_);

    if (settings.output_format_ == "json") {
        out << nlohmann::json(imagesets).dump(2) << std::endl;
    } else {
        for (const auto &i : imagesets) {
            if (i.is_sequence())
                out << i.name_ << " " << i.frames() << "\n";
            else
                out << i.name_ << "\n";
        }
    }

    return EXIT_SUCCESS;
}

int framescan::cli::expand(
    const std::vector<std::string> &paths,
    const global_store::SequenceSettings &settings,
    std::ostream &out) {
    const bool as_json = settings.output_format_ == "json";
    int status         = EXIT_SUCCESS;
    auto result        = nlohmann::json::object();

    for (const auto &path : paths) {
        try {
            const auto images = find_matching_images(path);
            if (as_json) {
                result[path] = images;
            } else {
                for (const auto &i : images)
                    out << i << "\n";
            }
        } catch (const std::exception &err) {
            spdlog::error("Failed to expand {}: {}", path, err.what());
            status = EXIT_FAILURE;
        }
    }

    if (as_json)
        out << result.dump(2) << std::endl;

    return status;
}

int framescan::cli::run(
    const Mode mode,
    const std::vector<std::string> &paths,
    const global_store::SequenceSettings &settings,
    std::ostream &out) {
    try {
        switch (mode) {
        case Mode::EXPAND:
            return expand(paths, settings, out);
        case Mode::TEMPLATE:
            return show_templates(paths, settings, out);
        case Mode::GROUP:
            break;
        }
        return group(paths, settings, out);
    } catch (const std::exception &err) {
        spdlog::error("{}", err.what());
    }
    return EXIT_FAILURE;
}
