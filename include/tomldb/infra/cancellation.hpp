/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation signal shared between a transaction and its owner.
 *
 * @details
 * A `CancellationToken` is a cheap, copyable handle to shared state. Any copy may
 * call `cancel()`; every copy then reports `is_cancelled()`. Waiters that cannot
 * poll (a thread blocked on a condition variable) register a callback that is run
 * exactly once when the token fires.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace tomldb::infra {

/**
 * @class CancellationToken
 * @brief Copyable handle to a one-shot cancellation flag.
 */
class CancellationToken {
  public:
    /// @brief Identifier returned by `subscribe`, used to unsubscribe.
    using Subscription = uint64_t;

    /// @brief Creates a fresh, not-yet-cancelled token.
    CancellationToken();

    // Copy-only: a moved-from token would lose its shared state.
    CancellationToken(const CancellationToken&) = default;
    CancellationToken& operator=(const CancellationToken&) = default;

    /**
     * @brief Fires the token.
     *
     * Idempotent. Callbacks registered before the call run on the calling thread,
     * outside the token's internal lock.
     */
    void cancel();

    /// @brief True once any copy of this token has been cancelled.
    bool is_cancelled() const;

    /**
     * @brief Registers a callback to run when the token fires.
     *
     * If the token is already cancelled the callback runs immediately.
     *
     * @param callback The action to perform on cancellation.
     * @return Subscription A handle for `unsubscribe`.
     */
    Subscription subscribe(std::function<void()> callback);

    /// @brief Removes a callback that has not run yet. Unknown handles are ignored.
    void unsubscribe(Subscription id);

  private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        Subscription next_id = 1;
        std::map<Subscription, std::function<void()>> callbacks;
    };

    std::shared_ptr<State> state_;
};

} // namespace tomldb::infra
