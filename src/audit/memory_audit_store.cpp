#include "audit/memory_audit_store.hpp"

#include <algorithm>
#include <mutex>

namespace llmshield {

int64_t MemoryAuditStore::append(const AuditEvent& event) {
    AuditEvent stored = event;

    std::unique_lock lock(mutex_);
    stored.id = next_id_++;
    events_.push_back(std::move(stored));
    return events_.back().id;
}

std::vector<AuditEvent> MemoryAuditStore::query(
    const AuditFilter& filter, size_t limit, size_t offset) const {

    std::vector<AuditEvent> result;
    std::shared_lock lock(mutex_);

    // Walk backwards: newest first. Equal timestamps fall back to id order.
    std::vector<const AuditEvent*> matched;
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (filter.matches(*it)) matched.push_back(&*it);
    }
    std::stable_sort(matched.begin(), matched.end(),
        [](const AuditEvent* a, const AuditEvent* b) {
            return a->created_at > b->created_at;
        });

    for (size_t i = offset; i < matched.size() && result.size() < limit; ++i) {
        result.push_back(*matched[i]);
    }
    return result;
}

size_t MemoryAuditStore::anonymize_before(std::chrono::system_clock::time_point threshold) {
    size_t count = 0;
    std::unique_lock lock(mutex_);
    for (auto& event : events_) {
        if (!event.anonymized && event.created_at < threshold) {
            event.clear_actor();
            ++count;
        }
    }
    return count;
}

size_t MemoryAuditStore::anonymize_actor(const std::string& actor_id) {
    if (actor_id.empty()) return 0;

    size_t count = 0;
    std::unique_lock lock(mutex_);
    for (auto& event : events_) {
        if (!event.anonymized && event.actor_id == actor_id) {
            event.clear_actor();
            ++count;
        }
    }
    return count;
}

size_t MemoryAuditStore::purge_before(std::chrono::system_clock::time_point threshold) {
    std::unique_lock lock(mutex_);
    const auto before = events_.size();
    std::erase_if(events_, [&](const AuditEvent& event) {
        return event.created_at < threshold;
    });
    return before - events_.size();
}

size_t MemoryAuditStore::size() const {
    std::shared_lock lock(mutex_);
    return events_.size();
}

} // namespace llmshield
