// SPDX-License-Identifier: Apache-2.0
#include <array>
#include <limits>
#include <fmt/format.h>

#include "framescan/error.hpp"
#include "framescan/utility/filename_template.hpp"
#include "framescan/utility/logging.hpp"
#include "framescan/utility/sequence.hpp"
#include "framescan/utility/string_helpers.hpp"

using namespace framescan::utility;

namespace {

// Filename cut into the literal text either side of the frame number.
struct FrameSplit {
    std::string head_;
    std::string digits_;
    std::string tail_;
};

using SplitFunc = std::optional<FrameSplit> (*)(const std::string &);

// start of the maximal digit run ending just before pos.
size_t digit_run_start(const std::string &name, size_t pos) {
    while (pos > 0 and is_digit(name[pos - 1]))
        --pos;
    return pos;
}

// image.0001
std::optional<FrameSplit> bare_number_split(const std::string &name) {
    const auto start = digit_run_start(name, name.size());
    if (start == name.size() or start == 0 or name[start - 1] != '.')
        return {};

    return FrameSplit{name.substr(0, start), name.substr(start), ""};
}

// foo_0001.cbf, the first "." with "_<digits>" in front of it.
std::optional<FrameSplit> underscore_number_split(const std::string &name) {
    for (auto dot = name.find('.'); dot != std::string::npos; dot = name.find('.', dot + 1)) {
        const auto start = digit_run_start(name, dot);
        if (start == dot or start == 0 or name[start - 1] != '_')
            continue;

        return FrameSplit{
            name.substr(0, start), name.substr(start, dot - start), name.substr(dot)};
    }
    return {};
}

// foo0001.cbf, the first "." with digits in front of it.
std::optional<FrameSplit> number_split(const std::string &name) {
    for (auto dot = name.find('.'); dot != std::string::npos; dot = name.find('.', dot + 1)) {
        const auto start = digit_run_start(name, dot);
        if (start == dot)
            continue;

        return FrameSplit{
            name.substr(0, start), name.substr(start, dot - start), name.substr(dot)};
    }
    return {};
}

// digits of INT64_MAX.
const std::string max_index_digits = std::to_string(std::numeric_limits<int64_t>::max());

// priority order, first match wins.
const std::array<SplitFunc, 3> frame_splitters{
    bare_number_split, underscore_number_split, number_split};

} // namespace

FilenameTemplate::FilenameTemplate(
    std::string prefix, const size_t digit_count, std::string suffix)
    : prefix_(std::move(prefix)), digit_count_(digit_count), suffix_(std::move(suffix)) {
    if (not digit_count_)
        throw framescan::framescan_err(fmt::format(
            "Invalid digit count {} for template {}{}", digit_count_, prefix_, suffix_));
}

std::string FilenameTemplate::to_string(const char placeholder) const {
    return prefix_ + std::string(digit_count_, placeholder) + suffix_;
}

std::string FilenameTemplate::printf_spec() const {
    return escape_percentage(prefix_) + pad_spec(static_cast<int>(digit_count_)) +
           escape_percentage(suffix_);
}

std::string FilenameTemplate::render(const int64_t index) const {
    return fmt::format("{}{:0{}d}{}", prefix_, index, digit_count_, suffix_);
}

std::optional<int64_t> FilenameTemplate::index_of(const std::string &name) const {
    if (name.size() != prefix_.size() + digit_count_ + suffix_.size() or
        not starts_with(name, prefix_) or not ends_with(name, suffix_) or
        not all_digits(name, prefix_.size(), digit_count_))
        return {};

    return parse_index(name.substr(prefix_.size(), digit_count_));
}

int64_t FilenameTemplate::max_index() const {
    if (digit_count_ >= max_index_digits.size())
        return std::numeric_limits<int64_t>::max();

    int64_t result = 1;
    for (size_t i = 0; i < digit_count_; i++)
        result *= 10;
    return result - 1;
}

std::optional<int64_t> framescan::utility::parse_index(const std::string &digits) {
    if (not all_digits(digits))
        return {};

    const auto significant = digits.substr(std::min(digits.find_first_not_of('0'), digits.size()));
    if (significant.size() > max_index_digits.size() or
        (significant.size() == max_index_digits.size() and significant > max_index_digits))
        return {};

    return significant.empty() ? 0 : std::stoll(significant);
}

TemplateMatch framescan::utility::template_from_filename(const std::string &filename) {
    TemplateMatch result;

    for (const auto &splitter : frame_splitters) {
        auto split = splitter(filename);
        if (not split)
            continue;

        const auto index = parse_index(split->digits_);
        if (not index) {
            spdlog::debug(
                "{} frame number out of range {} {}",
                __PRETTY_FUNCTION__,
                filename,
                split->digits_);
            break;
        }

        result.template_ =
            FilenameTemplate(split->head_, split->digits_.size(), split->tail_);
        result.index_ = *index;
        break;
    }

    return result;
}

std::string framescan::utility::to_string(const FilenameTemplate &tmpl) {
    return tmpl.to_string();
}

void framescan::utility::to_json(nlohmann::json &j, const FilenameTemplate &tmpl) {
    j = nlohmann::json{
        {"prefix", tmpl.prefix()}, {"digits", tmpl.digit_count()}, {"suffix", tmpl.suffix()}};
}

void framescan::utility::from_json(const nlohmann::json &j, FilenameTemplate &tmpl) {
    tmpl = FilenameTemplate(
        j.at("prefix").get<std::string>(),
        j.at("digits").get<size_t>(),
        j.at("suffix").get<std::string>());
}
