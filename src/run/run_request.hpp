#pragma once

#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"

namespace scriptbox::run {

constexpr int kDefaultTimeoutSeconds = 30;
constexpr int kMinTimeoutSeconds = 1;
constexpr int kMaxTimeoutSeconds = 300;
constexpr std::size_t kMaxFileNameLength = 300;

struct RunRequest {
    std::string file_name;
    int timeout_seconds = kDefaultTimeoutSeconds;
};

// Rejects empty names, names over kMaxFileNameLength, ".." anywhere, path
// separators and NUL bytes. Stored files live flat in one directory.
bool IsValidFileName(const std::string& file_name);

int ClampTimeout(long long seconds);

// Absent, null or non-numeric values give kDefaultTimeoutSeconds; strings are
// read by their leading integer. The result is always clamped.
int ParseTimeout(const nlohmann::json& value);
int ParseTimeout(const std::string& text);

}  // namespace scriptbox::run
