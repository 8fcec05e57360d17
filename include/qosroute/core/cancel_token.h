// core/cancel_token.h - Cooperative cancellation flag
// Part of the QoS route search library (C++20)
//
// Solvers poll the token once per outer iteration (generation, swarm
// iteration, cooling step, episode).  A cancelled search stops at the next
// poll and returns the best route found so far, or a cancelled status if
// it has none.  The token may be set from any thread.

#ifndef QOSROUTE_CORE_CANCEL_TOKEN_H
#define QOSROUTE_CORE_CANCEL_TOKEN_H

#include <atomic>

namespace qosroute {

class cancel_token {
public:
    cancel_token() = default;
    cancel_token(cancel_token const&) = delete;
    cancel_token& operator=(cancel_token const&) = delete;

    void request_cancel() noexcept { flag_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { flag_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool cancelled() const noexcept {
        return flag_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> flag_{false};
};

/// Null-tolerant poll: a search without a token is never cancelled.
[[nodiscard]] inline bool is_cancelled(cancel_token const* token) noexcept {
    return token != nullptr && token->cancelled();
}

} // namespace qosroute

#endif // QOSROUTE_CORE_CANCEL_TOKEN_H
