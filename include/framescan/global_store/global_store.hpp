// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "framescan/utility/logging.hpp"

namespace framescan {
namespace global_store {

    /**
     *  @brief Preference document.
     *
     *  @details
     *   Each preference is an object at a json pointer with a "value" and a
     *   "default_value", e.g. /core/sequence/placeholder. Default files are
     *   merged in load order. Override files are flat maps of
     *   "<pointer>/value" to a new value and may only change preferences
     *   that already exist.
     */
    class Preferences {
      public:
        Preferences(nlohmann::json json = nlohmann::json::object());

        //! Merge a json file, or every json file of a directory in name order.
        void load(const std::string &path);

        //! Apply a json override file, a directory of them or a .lst listing them.
        void load_overrides(const std::string &path);

        //! value, or default_value when value is null.
        template <typename result_type>
        [[nodiscard]] result_type value(const std::string &path) const {
            const auto &pref = json_.at(nlohmann::json::json_pointer(path));
            if (not pref.contains("value") or pref.at("value").is_null())
                return pref.at("default_value").get<result_type>();
            return pref.at("value").get<result_type>();
        }

        //! File that last overrode path, empty if none did.
        [[nodiscard]] std::string overridden_path(const std::string &path) const;

        [[nodiscard]] const nlohmann::json &json() const { return json_; }

      private:
        void apply_override(const std::string &file);

        nlohmann::json json_;
    };

    Preferences load_preferences(
        const std::vector<std::string> &paths,
        const std::vector<std::string> &override_paths = std::vector<std::string>());

    /**
     *  @brief Typed view of the preferences the sequence tools use.
     */
    struct SequenceSettings {
        char placeholder_{'#'};
        std::string output_format_{"text"};
        spdlog::level::level_enum log_level_{spdlog::level::info};
    };

    //! Invalid or missing preferences are logged and keep the built in value.
    SequenceSettings sequence_settings(const Preferences &prefs);

} // namespace global_store
} // namespace framescan
