// SPDX-License-Identifier: Apache-2.0
// expand a single frame into the files of its sequence.
#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace framescan {
namespace utility {

    /*!
     *  @brief Every file on disk sharing the template of image_name.
     *
     *  @details
     *   Lists the directory of image_name once and returns the entries that
     *   are instances of its template, ordered by frame index. Paths keep
     *   the directory component of image_name, bare names stay bare. A name
     *   without a template is returned on its own.
     *
     *  @throws std::filesystem::filesystem_error if the directory can't be listed.
     */
    std::vector<std::string> find_matching_images(const std::string &image_name);

    std::string make_frame_sequence(const int64_t start, const int64_t end, const int64_t offset);

    //! Collapse frames into range notation, e.g. "1-10,12,20-30x2".
    std::string frame_sequence(const std::set<int64_t> &frames);

    std::string pad_spec(const int pad);
    std::string escape_percentage(const std::string &str);

} // namespace utility
} // namespace framescan
