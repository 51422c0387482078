#include "auth/static_identity_provider.hpp"

namespace llmshield {

StaticIdentityProvider::StaticIdentityProvider(std::vector<Actor> actors) {
    for (auto& actor : actors) {
        std::string id = actor.id;
        actors_.insert_or_assign(std::move(id), std::move(actor));
    }
}

std::optional<Actor> StaticIdentityProvider::current_actor() const {
    std::lock_guard lock(mutex_);
    return current_;
}

bool StaticIdentityProvider::set_current(const std::string& actor_id) {
    std::lock_guard lock(mutex_);
    const auto it = actors_.find(actor_id);
    if (it == actors_.end()) {
        current_.reset();
        return false;
    }
    current_ = it->second;
    return true;
}

void StaticIdentityProvider::set_current(Actor actor) {
    std::lock_guard lock(mutex_);
    current_ = std::move(actor);
}

void StaticIdentityProvider::clear() {
    std::lock_guard lock(mutex_);
    current_.reset();
}

void StaticIdentityProvider::add_actor(Actor actor) {
    std::lock_guard lock(mutex_);
    std::string id = actor.id;
    actors_.insert_or_assign(std::move(id), std::move(actor));
}

bool StaticIdentityProvider::has_actor(const std::string& actor_id) const {
    std::lock_guard lock(mutex_);
    return actors_.contains(actor_id);
}

size_t StaticIdentityProvider::actor_count() const {
    std::lock_guard lock(mutex_);
    return actors_.size();
}

} // namespace llmshield
