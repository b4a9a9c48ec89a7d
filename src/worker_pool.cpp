#include "worker_pool.hpp"
#include "error_stack.hpp"
#include <asio/co_spawn.hpp>
#include <nlohmann/json.hpp>
#include <any>

namespace dtree {

worker_pool::worker_pool(asio::io_context& ioc, const config& cfg, router& r,
                         std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_router(r), m_log(std::move(log)),
      m_thread_count(cfg.parser_threads > 0 ? cfg.parser_threads
                                            : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&worker_pool::worker_loop, this, i);
    }
    m_log->info("Worker pool started with {} threads", m_thread_count);
}

void worker_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Poison pills (empty strings) queue up behind the pending lines
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queue.enqueue(std::string{});
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_log->info("Worker pool stopped");
}

void worker_pool::enqueue(std::string line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) return;
    m_received.fetch_add(1, std::memory_order_relaxed);
    m_queue.enqueue(std::move(line));
}

std::size_t worker_pool::queue_depth() const {
    return m_queue.size_approx();
}

worker_pool::stats worker_pool::get_stats() const {
    return {
        m_received.load(std::memory_order_relaxed),
        m_decoded.load(std::memory_order_relaxed),
        m_decode_failures.load(std::memory_order_relaxed),
        m_dispatched.load(std::memory_order_relaxed),
        m_dispatch_errors.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

void worker_pool::worker_loop(unsigned int worker_id) {
    m_log->debug("Worker {} started", worker_id);

    std::string line;
    while (true) {
        m_queue.wait_dequeue(line);

        // Empty line = poison pill
        if (line.empty()) break;

        nlohmann::json event;
        try {
            event = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            m_decode_failures.fetch_add(1, std::memory_order_relaxed);
            m_log->warn("Worker {}: skipping undecodable line: {}", worker_id, e.what());
            continue;
        }
        m_decoded.fetch_add(1, std::memory_order_relaxed);

        // Dispatch runs on the io_context threads
        asio::co_spawn(m_ioc,
            m_router.publish(std::any(std::move(event))),
            [this](std::exception_ptr e) {
                if (e) {
                    m_dispatch_errors.fetch_add(1, std::memory_order_relaxed);
                    m_log->error("Publish failed: {}", describe_error(e));
                } else {
                    m_dispatched.fetch_add(1, std::memory_order_relaxed);
                }
            }
        );
    }

    m_log->debug("Worker {} stopped", worker_id);
}

} // namespace dtree
