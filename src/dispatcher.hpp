#pragma once

#include "context.hpp"
#include "dispatch_node.hpp"
#include "error_stack.hpp"
#include "filter.hpp"
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>

namespace dtree {

// Walks a dispatch tree for one event.
//
// Every set of siblings runs as concurrent tasks on the caller's executor and
// is joined before the call returns. No run_* coroutine throws for a filter
// failure: failures land on the shared error_stack and may be retracted by
// CATCH edges. The tree must not be modified while a run is in progress.
class dispatcher {
public:
    struct stats {
        uint64_t evaluations = 0;
        uint64_t no_matches = 0;
        uint64_t failures = 0;
        uint64_t retractions = 0;
    };

    explicit dispatcher(std::shared_ptr<spdlog::logger> log);

    // Evaluate `edge` against `ctx`. On pass, AND children continue with the
    // merged context and OR children are entered without evaluation. On no
    // match, OR children are evaluated. On failure the error is pushed, and
    // AND, OR and CATCH children all run with `error` set; if the node has any
    // CATCH edge, the most recent error is popped once they finish.
    asio::awaitable<void> run_and(const dispatch_node& node, const filter& edge,
                                  context ctx, error_stack& caught);

    // Entered through an OR edge whose filter was skipped: evaluate AND children.
    asio::awaitable<void> run_or(const dispatch_node& node, context ctx, error_stack& caught);

    // Skip AND/OR filters below `node`, evaluating only CATCH edges.
    asio::awaitable<void> run_catch(const dispatch_node& node, context ctx, error_stack& caught);

    stats get_stats() const;

private:
    asio::awaitable<outcome> evaluate(const filter& f, context ctx);

    // Run CATCH children of a failed node, then retract the latest error.
    asio::awaitable<void> recover(const dispatch_node& node, context err_ctx,
                                  error_stack& caught);

    std::shared_ptr<spdlog::logger> m_log;

    std::atomic<uint64_t> m_evaluations{0};
    std::atomic<uint64_t> m_no_matches{0};
    std::atomic<uint64_t> m_failures{0};
    std::atomic<uint64_t> m_retractions{0};
};

} // namespace dtree
