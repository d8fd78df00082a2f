#pragma once

#include <atomic>
#include <chrono>

namespace sr {

using Clock = std::chrono::steady_clock;

// One deadline shared by every tier of a resolution call.
// `cancel` is optional and observed cooperatively.
struct Budget {
    Clock::time_point        deadline{};
    const std::atomic<bool>* cancel{nullptr};

    static Budget after(std::chrono::milliseconds timeout,
                        const std::atomic<bool>* cancel = nullptr)
    {
        return Budget{Clock::now() + timeout, cancel};
    }

    bool cancelled() const
    {
        return cancel && cancel->load(std::memory_order_relaxed);
    }

    std::chrono::milliseconds remaining() const
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

    bool expired() const { return cancelled() || Clock::now() >= deadline; }
};

} // namespace sr
