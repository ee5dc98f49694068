#include "policy/execution_policy.hpp"

#include <array>

#include "utils/common.hpp"

namespace scriptbox::policy {
namespace {

struct PolicyEntry {
    const char* extension;
    const char* image;
    const char* command;
};

constexpr std::array<PolicyEntry, 4> kPolicyTable = {{
    {".py", "python:3.11-slim", "python {file}"},
    {".js", "node:18-slim", "node {file}"},
    {".sh", "alpine:3.18", "sh {file}"},
    {".pl", "perl:5.36", "perl {file}"},
}};

constexpr const char* kDirectCommand = "./{file}";

}  // namespace

std::string ExtensionOf(const std::string& file_name) {
    const auto slash = file_name.find_last_of('/');
    const auto base_start = slash == std::string::npos ? 0 : slash + 1;
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot <= base_start) {
        return {};
    }
    return utils::ToLower(file_name.substr(dot));
}

ExecutionPolicy Resolve(const std::string& file_name) {
    const auto extension = ExtensionOf(file_name);
    for (const auto& entry : kPolicyTable) {
        if (extension == entry.extension) {
            return ExecutionPolicy{entry.image, entry.command};
        }
    }
    return ExecutionPolicy{kDefaultImage, kDirectCommand};
}

std::string RenderCommand(const ExecutionPolicy& policy, const std::string& file_name) {
    const std::string placeholder = kFilePlaceholder;
    const auto quoted = utils::ShellQuote(file_name);
    std::string command = policy.command_template;
    std::size_t pos = 0;
    while ((pos = command.find(placeholder, pos)) != std::string::npos) {
        command.replace(pos, placeholder.size(), quoted);
        pos += quoted.size();
    }
    return command;
}

}  // namespace scriptbox::policy
