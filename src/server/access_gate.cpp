#include "server/access_gate.hpp"

#include <utility>

#include "config/config_schema.hpp"

namespace scriptbox::server {

AccessGate::AccessGate(std::string token)
    : token_(std::move(token)) {}

bool AccessGate::IsAuthorized(const std::string& presented) const {
    if (token_.empty()) {
        return false;
    }
    unsigned char diff = presented.size() == token_.size() ? 0 : 1;
    for (std::size_t i = 0; i < token_.size(); ++i) {
        const auto other = i < presented.size() ? presented[i] : '\0';
        diff |= static_cast<unsigned char>(token_[i] ^ other);
    }
    return diff == 0;
}

bool AccessGate::UsesDefaultToken() const {
    return token_ == config::kDefaultAdminToken;
}

}  // namespace scriptbox::server
