#include "run/run_request.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace scriptbox::run {

bool IsValidFileName(const std::string& file_name) {
    if (file_name.empty() || file_name.size() > kMaxFileNameLength) {
        return false;
    }
    if (file_name.find("..") != std::string::npos) {
        return false;
    }
    return std::none_of(file_name.begin(), file_name.end(), [](char c) {
        return c == '/' || c == '\\' || c == '\0';
    });
}

int ClampTimeout(long long seconds) {
    return static_cast<int>(std::clamp<long long>(seconds, kMinTimeoutSeconds, kMaxTimeoutSeconds));
}

int ParseTimeout(const std::string& text) {
    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }
    const auto digits_start = pos;
    long long value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (value < std::numeric_limits<long long>::max() / 10) {
            value = value * 10 + (text[pos] - '0');
        }
        ++pos;
    }
    if (pos == digits_start) {
        return kDefaultTimeoutSeconds;
    }
    return ClampTimeout(negative ? -value : value);
}

int ParseTimeout(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return ClampTimeout(value.get<long long>());
    }
    if (value.is_number_float()) {
        const auto number = value.get<double>();
        if (!std::isfinite(number)) {
            return kDefaultTimeoutSeconds;
        }
        return ClampTimeout(static_cast<long long>(std::clamp(number, -1e9, 1e9)));
    }
    if (value.is_string()) {
        return ParseTimeout(value.get<std::string>());
    }
    return kDefaultTimeoutSeconds;
}

}  // namespace scriptbox::run
