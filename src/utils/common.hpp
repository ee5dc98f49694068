#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>

namespace scriptbox::utils {

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline long long ToEpochMs(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

inline long long NowMs() {
    return ToEpochMs(Now());
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Single-quotes a word for /bin/sh; embedded quotes become '\''.
inline std::string ShellQuote(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

}  // namespace scriptbox::utils
