#pragma once

#include <cstdint>
#include <functional>

namespace graphlens {

/**
 * @brief Single-shot cancellable timer polled from the frame loop
 *
 * Scheduling replaces any pending callback. Every schedule() and cancel()
 * bumps a generation counter, so a callback that was superseded can never
 * fire even if poll() runs late.
 */
class DebounceTimer {
public:
    using Callback = std::function<void()>;

    explicit DebounceTimer(double delayMs) : delayMs_(delayMs) {}

    void schedule(double nowMs, Callback callback);
    void cancel();

    /// Fire the pending callback if its deadline has passed.
    /// @return true if a callback ran
    bool poll(double nowMs);

    bool isPending() const { return static_cast<bool>(pending_); }
    double delayMs() const { return delayMs_; }
    uint64_t generation() const { return generation_; }

private:
    double delayMs_;
    double deadline_ = 0.0;
    uint64_t generation_ = 0;
    Callback pending_;
};

}  // namespace graphlens
