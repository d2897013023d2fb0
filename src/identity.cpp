#include "identity.h"
#include "logger.h"

namespace peerdrop {

nlohmann::json identity_to_json(const Identity& identity) {
    return {{"id", identity.user_id}, {"username", identity.username}, {"email", identity.email}};
}

bool StaticIdentityResolver::add_user(const std::string& token, const Identity& identity) {
    if (token.empty() || identity.user_id.empty()) {
        LOG_WARN("identity", "Refusing user entry with empty token or id");
        return false;
    }
    users_[token] = identity;
    return true;
}

std::optional<Identity> StaticIdentityResolver::resolve(const std::string& token) const {
    auto it = users_.find(token);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace peerdrop
