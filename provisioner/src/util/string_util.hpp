#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace util {

    inline bool startsWith(std::string_view target, std::string_view prefix) {
        if(prefix.length() > target.length()) {
            return false;
        }
        return target.substr(0, prefix.length()) == prefix;
    }

    inline bool endsWith(std::string_view target, std::string_view suffix) {
        if(suffix.length() > target.length()) {
            return false;
        }
        return target.substr(target.length() - suffix.length(), suffix.length()) == suffix;
    }

    inline char lowerChar(char c) {
        // important: ignore Locale to ensure portability
        if(c >= 'A' && c <= 'Z') {
            return static_cast<char>(c - 'A' + 'a');
        } else {
            return c;
        }
    }

    inline char upperChar(char c) {
        if(c >= 'a' && c <= 'z') {
            return static_cast<char>(c - 'a' + 'A');
        } else {
            return c;
        }
    }

    inline std::string lower(std::string_view source) {
        std::string target;
        target.resize(source.size());
        std::transform(source.begin(), source.end(), target.begin(), lowerChar);
        return target;
    }

    inline std::string upper(std::string_view source) {
        std::string target;
        target.resize(source.size());
        std::transform(source.begin(), source.end(), target.begin(), upperChar);
        return target;
    }

    /**
     * Locale-independent, case-insensitive comparison, used for record keys.
     */
    inline bool iequals(std::string_view left, std::string_view right) {
        if(left.length() != right.length()) {
            return false;
        }
        return std::equal(left.begin(), left.end(), right.begin(), [](char l, char r) {
            return lowerChar(l) == lowerChar(r);
        });
    }

    inline std::string join(const std::vector<std::string> &items, std::string_view separator) {
        std::string result;
        bool first = true;
        for(const auto &item : items) {
            if(!first) {
                result.append(separator);
            }
            result.append(item);
            first = false;
        }
        return result;
    }
} // namespace util
