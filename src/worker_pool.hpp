#pragma once

#include "config.hpp"
#include "router.hpp"
#include <asio/io_context.hpp>
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace dtree {

// Decodes raw JSON lines on worker threads and spawns a publish for each
// decoded event on the io_context.
class worker_pool {
public:
    struct stats {
        uint64_t received = 0;
        uint64_t decoded = 0;
        uint64_t decode_failures = 0;
        uint64_t dispatched = 0;
        uint64_t dispatch_errors = 0;
        std::size_t queue_depth = 0;
    };

    worker_pool(asio::io_context& ioc, const config& cfg, router& r,
                std::shared_ptr<spdlog::logger> log);
    ~worker_pool();

    // Spawn N worker threads. Must be called once.
    void start();

    // Let workers drain the queue, then join them.
    void stop();

    // Enqueue one input line. Blank lines are ignored.
    void enqueue(std::string line);

    // Approximate queue depth.
    std::size_t queue_depth() const;

    // Atomically read aggregate stats from all workers.
    stats get_stats() const;

private:
    void worker_loop(unsigned int worker_id);

    asio::io_context& m_ioc;
    router& m_router;
    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    moodycamel::BlockingConcurrentQueue<std::string> m_queue;
    std::vector<std::thread> m_threads;

    // Aggregate stats (relaxed atomics)
    std::atomic<uint64_t> m_received{0};
    std::atomic<uint64_t> m_decoded{0};
    std::atomic<uint64_t> m_decode_failures{0};
    std::atomic<uint64_t> m_dispatched{0};
    std::atomic<uint64_t> m_dispatch_errors{0};
};

} // namespace dtree
