#pragma once

#include "common.h"
#include <atomic>
#include <memory>
#include <optional>

namespace vortex_l0 {

/**
 * @brief Shared cancel flag with an optional deadline
 *
 * Copies share state: cancelling one copy cancels all of them. A token is
 * scoped to a single outbound call; cancelling it has no effect on other
 * calls or queries.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    /// Token that expires timeout_ms from now. timeout_ms <= 0 means no deadline.
    static CancellationToken with_timeout(int timeout_ms) {
        CancellationToken token;
        if (timeout_ms > 0) {
            token.state_->deadline = std::chrono::steady_clock::now()
                + std::chrono::milliseconds(timeout_ms);
        }
        return token;
    }

    void cancel() { state_->cancelled.store(true); }

    bool is_cancelled() const { return state_->cancelled.load(); }

    bool has_deadline() const { return state_->deadline.has_value(); }

    bool deadline_passed() const {
        return state_->deadline && std::chrono::steady_clock::now() >= *state_->deadline;
    }

    /// True once cancelled or past the deadline.
    bool should_stop() const { return is_cancelled() || deadline_passed(); }

    /// Milliseconds left before the deadline (0 when passed, -1 when none).
    int64_t remaining_ms() const {
        if (!state_->deadline) return -1;
        auto left = std::chrono::duration_cast<Duration>(
            *state_->deadline - std::chrono::steady_clock::now()).count();
        return left > 0 ? left : 0;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<TimePoint> deadline;
    };
    std::shared_ptr<State> state_;
};

} // namespace vortex_l0
