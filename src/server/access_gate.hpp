#pragma once

#include <string>

namespace scriptbox::server {

// Admin token check in front of run, cancel and delete requests.
class AccessGate {
public:
    explicit AccessGate(std::string token);

    // Constant-time with respect to the token contents.
    bool IsAuthorized(const std::string& presented) const;
    bool UsesDefaultToken() const;

private:
    std::string token_;
};

}  // namespace scriptbox::server
