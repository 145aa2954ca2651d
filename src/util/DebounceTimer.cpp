#include "graphlens/util/DebounceTimer.h"

#include <utility>

namespace graphlens {

void DebounceTimer::schedule(double nowMs, Callback callback) {
    ++generation_;
    deadline_ = nowMs + delayMs_;
    pending_ = std::move(callback);
}

void DebounceTimer::cancel() {
    ++generation_;
    pending_ = nullptr;
}

bool DebounceTimer::poll(double nowMs) {
    if (!pending_ || nowMs < deadline_) {
        return false;
    }

    // Detach first: the callback may schedule again
    Callback callback = std::move(pending_);
    pending_ = nullptr;
    callback();
    return true;
}

}  // namespace graphlens
