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
 * @file cancellation.cpp
 * @brief Implementation of the cooperative cancellation token.
 */

#include "tomldb/infra/cancellation.hpp"

#include <utility>
#include <vector>

namespace tomldb::infra {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel()
{
    std::vector<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true)) {
            return;
        }
        for (auto& [id, callback] : state_->callbacks) {
            pending.push_back(std::move(callback));
        }
        state_->callbacks.clear();
    }

    // Callbacks may take their own locks; run them after releasing ours.
    for (auto& callback : pending) {
        callback();
    }
}

bool CancellationToken::is_cancelled() const
{
    return state_->cancelled.load();
}

CancellationToken::Subscription CancellationToken::subscribe(std::function<void()> callback)
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            Subscription id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void CancellationToken::unsubscribe(Subscription id)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

} // namespace tomldb::infra
