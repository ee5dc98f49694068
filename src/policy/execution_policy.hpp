#pragma once

#include <string>

namespace scriptbox::policy {

constexpr const char* kFilePlaceholder = "{file}";
constexpr const char* kDefaultImage = "alpine:3.18";

struct ExecutionPolicy {
    std::string sandbox_image;
    std::string command_template;
};

// Lower-cased extension including the dot, or "" when the name has none.
std::string ExtensionOf(const std::string& file_name);

// Picks image and command by extension. Never fails: unknown extensions get
// the direct-execution policy.
ExecutionPolicy Resolve(const std::string& file_name);

std::string RenderCommand(const ExecutionPolicy& policy, const std::string& file_name);

}  // namespace scriptbox::policy
