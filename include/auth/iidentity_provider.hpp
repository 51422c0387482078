#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace llmshield {

struct ActorGroup {
    std::string id;
    std::unordered_set<Capability> grants;
};

/**
 * @brief The identity behind the current request, as supplied by the host
 */
struct Actor {
    std::string id;
    std::string display_name;
    bool is_admin = false;
    std::unordered_set<Capability> grants;
    std::vector<ActorGroup> groups;
    std::unordered_set<std::string> scopes;     // tenant/site memberships
    std::string source_address;
    std::string user_agent;

    Actor() = default;
    Actor(std::string i, std::string name)
        : id(std::move(i)), display_name(std::move(name)) {}
};

/**
 * @brief Interface to the host application's user/session system
 *
 * Queried per call; implementations are responsible for request scoping.
 */
class IIdentityProvider {
public:
    virtual ~IIdentityProvider() = default;

    // nullopt when no authenticated actor is attached to the request
    [[nodiscard]] virtual std::optional<Actor> current_actor() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace llmshield
