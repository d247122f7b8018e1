// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "framescan/global_store/global_store.hpp"

namespace framescan {
namespace cli {

    enum class Mode { GROUP, EXPAND, TEMPLATE };

    //! Throws framescan_err for a digit placeholder.
    void set_placeholder(global_store::SequenceSettings &settings, const char placeholder);

    //! template and index of each path, "-" when it has none.
    int show_templates(
        const std::vector<std::string> &paths,
        const global_store::SequenceSettings &settings,
        std::ostream &out);

    //! imageset name and frame ranges in first seen order.
    int group(
        const std::vector<std::string> &paths,
        const global_store::SequenceSettings &settings,
        std::ostream &out);

    /**
     *  @brief List the files on disk in the sequence of each path.
     *
     *  @details
     *   Failures are logged and the remaining paths still expanded.
     *
     *  @return EXIT_FAILURE if any path could not be expanded.
     */
    int expand(
        const std::vector<std::string> &paths,
        const global_store::SequenceSettings &settings,
        std::ostream &out);

    int run(
        const Mode mode,
        const std::vector<std::string> &paths,
        const global_store::SequenceSettings &settings,
        std::ostream &out);

} // namespace cli
} // namespace framescan
