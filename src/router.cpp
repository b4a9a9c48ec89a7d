#include "router.hpp"
#include "error_stack.hpp"
#include "filters.hpp"

namespace dtree {

router::router(std::shared_ptr<spdlog::logger> log, uncaught_handler on_uncaught)
    : router(dispatch_node{}, std::move(log), std::move(on_uncaught))
{}

router::router(dispatch_node tree, std::shared_ptr<spdlog::logger> log,
               uncaught_handler on_uncaught)
    : m_log(std::move(log)),
      m_on_uncaught(std::move(on_uncaught)),
      m_dispatcher(m_log),
      m_root_edge(unit()),
      m_snapshot(std::make_shared<const dispatch_node>(std::move(tree)))
{}

void router::add_path(const path& p) {
    std::lock_guard<std::mutex> lock(m_write_mutex);

    // Extend a one-level copy; nodes reachable from the published snapshot
    // are only ever shared into it, never changed.
    auto next = std::make_shared<dispatch_node>(std::atomic_load(&m_snapshot)->clone());
    extend(*next, p);
    auto nodes = count_nodes(*next);

    std::atomic_store(&m_snapshot, std::shared_ptr<const dispatch_node>(std::move(next)));
    m_paths.fetch_add(1, std::memory_order_relaxed);

    m_log->info("router: added path of {} steps ({} nodes)",
               p.size(), nodes);
}

asio::awaitable<void> router::publish(std::any event) {
    auto root = snapshot();
    m_published.fetch_add(1, std::memory_order_relaxed);

    error_stack caught;
    co_await m_dispatcher.run_and(*root, *m_root_edge, context(std::move(event)), caught);

    auto remaining = caught.entries();
    if (remaining.empty()) co_return;

    m_uncaught.fetch_add(remaining.size(), std::memory_order_relaxed);

    if (!m_on_uncaught) {
        m_log->debug("router: discarding {} uncaught errors", remaining.size());
        co_return;
    }

    for (auto it = remaining.rbegin(); it != remaining.rend(); ++it) {
        co_await m_on_uncaught(*it);
    }
}

std::shared_ptr<const dispatch_node> router::snapshot() const {
    return std::atomic_load(&m_snapshot);
}

router::stats router::get_stats() const {
    return {
        m_published.load(std::memory_order_relaxed),
        m_uncaught.load(std::memory_order_relaxed),
        m_paths.load(std::memory_order_relaxed),
        m_dispatcher.get_stats()
    };
}

} // namespace dtree
