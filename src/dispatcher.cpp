#include "dispatcher.hpp"
#include <asio/co_spawn.hpp>
#include <asio/deferred.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/experimental/parallel_group.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dtree {

using namespace asio::experimental::awaitable_operators;

namespace {

using task_list = std::vector<asio::awaitable<void>>;

// Run all tasks concurrently on the current executor and wait for every one.
// A task failing does not cancel its siblings.
asio::awaitable<void> join_all(task_list tasks) {
    if (tasks.empty()) co_return;
    if (tasks.size() == 1) {
        co_await std::move(tasks.front());
        co_return;
    }

    auto ex = co_await asio::this_coro::executor;

    using op_type = decltype(asio::co_spawn(ex, std::declval<asio::awaitable<void>>(), asio::deferred));
    std::vector<op_type> ops;
    ops.reserve(tasks.size());
    for (auto& t : tasks) {
        ops.push_back(asio::co_spawn(ex, std::move(t), asio::deferred));
    }

    auto result = co_await asio::experimental::make_parallel_group(std::move(ops))
        .async_wait(asio::experimental::wait_for_all(), asio::use_awaitable);

    for (auto& e : std::get<1>(result)) {
        if (e) std::rethrow_exception(e);
    }
}

bool drops_reserved(const delta& d) {
    return d.count(keys::event) != 0 || d.count(keys::error) != 0;
}

} // namespace

dispatcher::dispatcher(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

asio::awaitable<outcome> dispatcher::evaluate(const filter& f, context ctx) {
    m_evaluations.fetch_add(1, std::memory_order_relaxed);

    outcome result;
    try {
        result = co_await f.evaluate(std::move(ctx));
    } catch (...) {
        result = outcome::fail(std::current_exception());
    }

    switch (result.kind) {
        case verdict::pass:
            if (drops_reserved(result.values)) {
                m_log->debug("dispatcher: '{}' returned reserved keys, ignored", f.describe());
            }
            break;
        case verdict::no_match:
            m_no_matches.fetch_add(1, std::memory_order_relaxed);
            break;
        case verdict::fail:
            if (!result.error) {
                result.error = std::make_exception_ptr(
                    std::runtime_error(f.describe() + " failed without an error"));
            }
            m_failures.fetch_add(1, std::memory_order_relaxed);
            m_log->debug("dispatcher: '{}' failed: {}", f.describe(), describe_error(result.error));
            break;
    }
    co_return result;
}

asio::awaitable<void> dispatcher::run_and(const dispatch_node& node, const filter& edge,
                                          context ctx, error_stack& caught) {
    auto result = co_await evaluate(edge, ctx);

    switch (result.kind) {
        case verdict::pass: {
            auto merged = ctx.merged(result.values);
            task_list tasks;
            tasks.reserve(node.ands().size() + node.ors().size());
            for (const auto& [f, child] : node.ands()) {
                tasks.push_back(run_and(child.view(), *f, merged, caught));
            }
            for (const auto& [f, child] : node.ors()) {
                tasks.push_back(run_or(child.view(), merged, caught));
            }
            co_await join_all(std::move(tasks));
            break;
        }

        case verdict::no_match: {
            task_list tasks;
            tasks.reserve(node.ors().size());
            for (const auto& [f, child] : node.ors()) {
                tasks.push_back(run_and(child.view(), *f, ctx, caught));
            }
            co_await join_all(std::move(tasks));
            break;
        }

        case verdict::fail: {
            caught.push(result.error);
            auto err_ctx = ctx.with_error(result.error);

            task_list tasks;
            tasks.reserve(node.ands().size() + node.ors().size());
            for (const auto& [f, child] : node.ands()) {
                tasks.push_back(run_and(child.view(), *f, err_ctx, caught));
            }
            for (const auto& [f, child] : node.ors()) {
                tasks.push_back(run_or(child.view(), err_ctx, caught));
            }

            // CATCH branches and AND/OR branches run side by side; only the
            // CATCH side decides the retraction.
            co_await (recover(node, err_ctx, caught) && join_all(std::move(tasks)));
            break;
        }
    }
}

asio::awaitable<void> dispatcher::recover(const dispatch_node& node, context err_ctx,
                                          error_stack& caught) {
    if (node.catches().empty()) co_return;

    task_list tasks;
    tasks.reserve(node.catches().size());
    for (const auto& [f, child] : node.catches()) {
        tasks.push_back(run_and(child.view(), *f, err_ctx, caught));
    }
    co_await join_all(std::move(tasks));

    // Retracts on the presence of a CATCH edge, whether or not any of the
    // catch filters matched.
    if (auto err = caught.pop()) {
        m_retractions.fetch_add(1, std::memory_order_relaxed);
        m_log->trace("dispatcher: retracted '{}'", describe_error(*err));
    }
}

asio::awaitable<void> dispatcher::run_or(const dispatch_node& node, context ctx,
                                         error_stack& caught) {
    task_list tasks;
    tasks.reserve(node.ands().size());
    for (const auto& [f, child] : node.ands()) {
        tasks.push_back(run_and(child.view(), *f, ctx, caught));
    }
    co_await join_all(std::move(tasks));
}

asio::awaitable<void> dispatcher::run_catch(const dispatch_node& node, context ctx,
                                            error_stack& caught) {
    task_list tasks;
    tasks.reserve(node.edge_count());
    for (const auto& [f, child] : node.ands()) {
        tasks.push_back(run_catch(child.view(), ctx, caught));
    }
    for (const auto& [f, child] : node.ors()) {
        tasks.push_back(run_catch(child.view(), ctx, caught));
    }
    for (const auto& [f, child] : node.catches()) {
        tasks.push_back(run_and(child.view(), *f, ctx, caught));
    }
    co_await join_all(std::move(tasks));
}

dispatcher::stats dispatcher::get_stats() const {
    return {
        m_evaluations.load(std::memory_order_relaxed),
        m_no_matches.load(std::memory_order_relaxed),
        m_failures.load(std::memory_order_relaxed),
        m_retractions.load(std::memory_order_relaxed)
    };
}

} // namespace dtree
