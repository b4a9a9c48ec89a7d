#pragma once

#include "dispatch_node.hpp"
#include "dispatcher.hpp"
#include "filter.hpp"
#include "path_builder.hpp"
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>
#include <any>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

namespace dtree {

// Owns a dispatch tree and publishes events through it.
//
// Uses RCU-style snapshot swapping: publish() reads a shared_ptr<const
// dispatch_node> without locking, add_path() clones the root (children stay
// shared), extends the clone under a mutex and atomically swaps it in.
// A publish already in flight keeps walking the snapshot it started with.
class router {
public:
    // Receives each error left uncaught by a publish, most recent first.
    using uncaught_handler = std::function<asio::awaitable<void>(std::exception_ptr)>;

    struct stats {
        uint64_t published = 0;
        uint64_t uncaught = 0;
        uint64_t paths = 0;
        dispatcher::stats dispatch;
    };

    router(std::shared_ptr<spdlog::logger> log, uncaught_handler on_uncaught = {});
    router(dispatch_node tree, std::shared_ptr<spdlog::logger> log,
           uncaught_handler on_uncaught = {});

    // Register a path. Safe to call while events are being published.
    // Throws std::invalid_argument on a step without a filter.
    void add_path(const path& p);
    void add_path(const path_builder& b) { add_path(b.steps()); }

    // Dispatch one event through the current tree, then hand every
    // remaining error to the uncaught handler. Errors thrown by the handler
    // propagate to the caller.
    asio::awaitable<void> publish(std::any event);

    // Get an immutable snapshot of the tree for lock-free reads.
    std::shared_ptr<const dispatch_node> snapshot() const;

    stats get_stats() const;

private:
    std::shared_ptr<spdlog::logger> m_log;
    uncaught_handler m_on_uncaught;
    dispatcher m_dispatcher;
    filter_ptr m_root_edge;

    // Serializes add_path().
    std::mutex m_write_mutex;

    // Current snapshot; atomic load/store for lock-free reader access.
    std::shared_ptr<const dispatch_node> m_snapshot;

    std::atomic<uint64_t> m_published{0};
    std::atomic<uint64_t> m_uncaught{0};
    std::atomic<uint64_t> m_paths{0};
};

} // namespace dtree
