// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace framescan {
namespace utility {

    /**
     *  @brief Value of a run of frame digits.
     *
     *  @details
     *   Leading zeros don't count towards the limit, so "0000000000000000000007"
     *   is 7. Empty when the value doesn't fit a signed 64 bit index.
     */
    std::optional<int64_t> parse_index(const std::string &digits);

    /**
     *  @brief Filename pattern of a numbered file sequence.
     *
     *  @details
     *   A literal prefix, a fixed width run of zero padded digits and a
     *   literal suffix. "foo_0001.cbf" is an instance of prefix "foo_", four
     *   digits and suffix ".cbf".
     */
    class FilenameTemplate {
      public:
        FilenameTemplate() = default;
        FilenameTemplate(std::string prefix, const size_t digit_count, std::string suffix);

        [[nodiscard]] const std::string &prefix() const { return prefix_; }
        [[nodiscard]] size_t digit_count() const { return digit_count_; }
        [[nodiscard]] const std::string &suffix() const { return suffix_; }

        /**
         *  @brief Canonical form, e.g. "foo_####.cbf".
         *  @param placeholder  Character repeated once per digit.
         */
        [[nodiscard]] std::string to_string(const char placeholder = '#') const;

        //! printf form, e.g. "foo_%04d.cbf", literal '%' escaped.
        [[nodiscard]] std::string printf_spec() const;

        //! Name of frame index, zero padded to digit_count.
        [[nodiscard]] std::string render(const int64_t index) const;

        /**
         *  @brief Frame index of name if it is an instance of this template.
         *  @param name  Bare filename.
         *  @result Index, or empty when name does not have exactly
         *   prefix + digit_count digits + suffix.
         */
        [[nodiscard]] std::optional<int64_t> index_of(const std::string &name) const;

        //! Largest index representable in digit_count digits, capped at INT64_MAX.
        [[nodiscard]] int64_t max_index() const;

        bool operator==(const FilenameTemplate &other) const {
            return prefix_ == other.prefix_ and digit_count_ == other.digit_count_ and
                   suffix_ == other.suffix_;
        }
        bool operator!=(const FilenameTemplate &other) const { return not(*this == other); }

      private:
        std::string prefix_;
        size_t digit_count_{1};
        std::string suffix_;
    };

    struct TemplateMatch {
        std::optional<FilenameTemplate> template_;
        int64_t index_{0};

        [[nodiscard]] bool is_sequence() const { return template_.has_value(); }
    };

    /**
     *  @brief Infer the sequence template of a single filename.
     *
     *  @details
     *   Tries, in order: a bare numeric extension ("image.0001"), digits
     *   between "_" and "." ("foo_0001.cbf") and digits directly before a
     *   "." ("foo0001.cbf"). The first that fits wins. Names without any of
     *   these shapes give an empty template and index 0.
     *
     *  @param filename  Bare filename, no directory component.
     */
    TemplateMatch template_from_filename(const std::string &filename);

    std::string to_string(const FilenameTemplate &tmpl);

    void to_json(nlohmann::json &j, const FilenameTemplate &tmpl);
    void from_json(const nlohmann::json &j, FilenameTemplate &tmpl);

} // namespace utility
} // namespace framescan
