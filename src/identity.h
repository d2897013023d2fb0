#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace peerdrop {

/**
 * Authenticated caller, as vouched for by the token lookup at connect time.
 */
struct Identity {
    std::string user_id;
    std::string username;
    std::string email;

    Identity() = default;
    Identity(const std::string& id, const std::string& name, const std::string& mail)
        : user_id(id), username(name), email(mail) {}
};

/**
 * Entry of a room_users list: {id, username, email}
 */
nlohmann::json identity_to_json(const Identity& identity);

/**
 * Maps a connect-time token to an identity.
 */
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;
    virtual std::optional<Identity> resolve(const std::string& token) const = 0;
};

/**
 * Fixed token table loaded from the relay configuration.
 */
class StaticIdentityResolver : public IdentityResolver {
public:
    StaticIdentityResolver() = default;

    /**
     * Register a token. Empty tokens and empty user ids are refused.
     * @return true if the entry was added or replaced
     */
    bool add_user(const std::string& token, const Identity& identity);

    std::optional<Identity> resolve(const std::string& token) const override;

    size_t size() const { return users_.size(); }

private:
    std::unordered_map<std::string, Identity> users_;
};

} // namespace peerdrop
