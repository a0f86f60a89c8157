#pragma once

#include <chrono>
#include <mutex>

namespace piishield {

/**
 * @brief Abstract time source
 *
 * Injected into the vault and the orchestrator so expiry can be driven
 * deterministically (ManualClock in tests, SystemClock in production).
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

/**
 * @brief Clock that only moves when told to
 */
class ManualClock final : public IClock {
public:
    ManualClock() : now_(std::chrono::system_clock::now()) {}
    explicit ManualClock(std::chrono::system_clock::time_point start) : now_(start) {}

    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::system_clock::duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

    void set(std::chrono::system_clock::time_point tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = tp;
    }

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point now_;
};

} // namespace piishield
