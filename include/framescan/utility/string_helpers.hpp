// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <vector>

namespace framescan {
namespace utility {

    // ASCII only, locale digits never form part of a frame number.
    inline bool is_digit(const char c) { return c >= '0' and c <= '9'; }

    //! True if str[pos, pos + len) is non empty and only digits.
    inline bool
    all_digits(const std::string &str, size_t pos = 0, size_t len = std::string::npos) {
        const auto end = std::min(str.size(), len == std::string::npos ? str.size() : pos + len);
        if (pos >= end)
            return false;
        return std::all_of(str.begin() + pos, str.begin() + end, is_digit);
    }

    inline bool starts_with(const std::string &str, const std::string &head) {
        return str.size() >= head.size() and str.compare(0, head.size(), head) == 0;
    }

    inline bool ends_with(const std::string &str, const std::string &tail) {
        return str.size() >= tail.size() and
               str.compare(str.size() - tail.size(), tail.size(), tail) == 0;
    }

    // strip ascii whitespace, bytes of multibyte characters are kept.
    inline std::string trim(const std::string &str) {
        auto space = [](const char c) { return std::isspace(static_cast<unsigned char>(c)); };
        auto first = std::find_if_not(str.begin(), str.end(), space);
        auto last  = std::find_if_not(str.rbegin(), std::make_reverse_iterator(first), space);
        return std::string(first, last.base());
    }

    inline std::string
    replace_all(std::string str, const std::string &from, const std::string &to) {
        for (auto pos = str.find(from); pos != std::string::npos;
             pos      = str.find(from, pos + to.size()))
            str.replace(pos, from.size(), to);
        return str;
    }

    inline std::string
    join_as_string(const std::vector<std::string> &items, const std::string &separator) {
        std::string result;
        for (size_t i = 0; i < items.size(); i++) {
            if (i)
                result += separator;
            result += items[i];
        }
        return result;
    }

} // namespace utility
} // namespace framescan
