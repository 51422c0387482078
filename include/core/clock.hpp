#pragma once

#include <atomic>
#include <chrono>

namespace llmshield {

/**
 * @brief Wall-clock collaborator (quota windows, retention thresholds)
 */
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

// Test clock: time only moves when told to
class ManualClock final : public IClock {
public:
    explicit ManualClock(std::chrono::system_clock::time_point start)
        : ticks_(start.time_since_epoch().count()) {}

    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::time_point(
            std::chrono::system_clock::duration(ticks_.load(std::memory_order_relaxed)));
    }

    void advance(std::chrono::system_clock::duration d) {
        ticks_.fetch_add(d.count(), std::memory_order_relaxed);
    }

    void set(std::chrono::system_clock::time_point tp) {
        ticks_.store(tp.time_since_epoch().count(), std::memory_order_relaxed);
    }

private:
    std::atomic<std::chrono::system_clock::rep> ticks_;
};

} // namespace llmshield
