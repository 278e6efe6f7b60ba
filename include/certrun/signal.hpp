/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace certrun {

// Synchronous, single-threaded observer list. Handlers run in connection order.
template <typename Event>
class Signal {
public:
    using Handler = std::function<void(const Event&)>;
    using ConnectionId = std::size_t;

    ConnectionId connect(Handler handler) {
        ConnectionId id = nextId_++;
        handlers_.emplace_back(id, std::move(handler));
        return id;
    }

    bool disconnect(ConnectionId id) {
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == id) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    void emit(const Event& event) const {
        // Copy so a handler may disconnect itself.
        auto handlers = handlers_;
        for (const auto& entry : handlers) {
            entry.second(event);
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return handlers_.size(); }

private:
    std::vector<std::pair<ConnectionId, Handler>> handlers_;
    ConnectionId nextId_ = 1;
};

}
