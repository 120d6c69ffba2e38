#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Credential Store
// ============================================================================
// Brokerage credentials per user, loaded from configuration
// A user with credentials runs against live data, everyone else simulates
// ============================================================================

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace quorum::storage {

struct Credentials {
    std::string api_key;
    std::string api_secret;

    [[nodiscard]] bool complete() const noexcept { return !api_key.empty() && !api_secret.empty(); }
};

class CredentialStore {
public:
    CredentialStore() = default;
    explicit CredentialStore(std::map<std::string, Credentials> by_user)
        : by_user_(std::move(by_user)) {}

    /// Only complete key/secret pairs count
    [[nodiscard]] std::optional<Credentials> credentials_for(const std::string& user_id) const {
        auto it = by_user_.find(user_id);
        if (it == by_user_.end() || !it->second.complete()) return std::nullopt;
        return it->second;
    }

    void set(const std::string& user_id, Credentials credentials) {
        by_user_[user_id] = std::move(credentials);
    }

    [[nodiscard]] size_t size() const noexcept { return by_user_.size(); }

private:
    std::map<std::string, Credentials> by_user_;
};

}  // namespace quorum::storage
