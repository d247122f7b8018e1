// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "framescan/utility/filename_template.hpp"

namespace framescan {
namespace utility {

    /**
     *  @brief Files believed to belong to one acquisition.
     *
     *  @details
     *   name_ is the canonical template string, or the filename itself for
     *   a file that is not part of a numbered sequence. indices_ holds one
     *   entry per grouped file in input order, empty for those without a
     *   template.
     */
    struct Imageset {
        std::string name_;
        std::optional<FilenameTemplate> template_;
        std::vector<std::optional<int64_t>> indices_;

        Imageset(std::string name = "") : name_(std::move(name)) {}

        [[nodiscard]] bool is_sequence() const { return template_.has_value(); }

        [[nodiscard]] size_t count() const { return indices_.size(); }

        //! Distinct indices in range notation, empty for non sequences.
        [[nodiscard]] std::string frames() const;
    };

    /**
     *  @brief Group filenames by their inferred template.
     *
     *  @param filenames  Bare filenames or paths, nothing is read from disk.
     *  @param placeholder  Digit placeholder used in group names.
     *  @result One Imageset per distinct name, in order of first appearance.
     */
    std::vector<Imageset> group_files_by_imageset(
        const std::vector<std::string> &filenames, const char placeholder = '#');

    std::optional<Imageset>
    find_imageset(const std::vector<Imageset> &imagesets, const std::string &name);

    void to_json(nlohmann::json &j, const Imageset &imageset);

} // namespace utility
} // namespace framescan
