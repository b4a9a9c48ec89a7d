#include "error_stack.hpp"
#include "filters.hpp"
#include "router.hpp"
#include "test_helpers.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <gtest/gtest.h>
#include <any>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using dtree::context;
using dtree::outcome;
using dtree::path_builder;

namespace {

// Uncaught-error sink collecting what it receives.
struct sink {
    std::mutex mutex;
    std::vector<std::exception_ptr> errors;

    dtree::router::uncaught_handler handler() {
        return [this](std::exception_ptr err) -> asio::awaitable<void> {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(std::move(err));
            co_return;
        };
    }
};

dtree::filter_ptr raising_runtime(const std::string& message) {
    return dtree::call("raise_runtime", [message](context) -> asio::awaitable<outcome> {
        throw std::runtime_error(message);
        co_return outcome::pass();
    });
}

dtree::filter_ptr raising_logic(const std::string& message) {
    return dtree::call("raise_logic", [message](context) -> asio::awaitable<outcome> {
        throw std::logic_error(message);
        co_return outcome::pass();
    });
}

dtree::filter_ptr capture_event(std::vector<std::any>& seen) {
    return dtree::call("capture", [&seen](context ctx) -> asio::awaitable<outcome> {
        seen.push_back(ctx.event());
        co_return outcome::no_match();
    });
}

dtree::filter_ptr capture_error(std::vector<std::exception_ptr>& seen) {
    return dtree::call("capture_error", [&seen](context ctx) -> asio::awaitable<outcome> {
        seen.push_back(ctx.error());
        co_return outcome::no_match();
    });
}

} // namespace

TEST(router, publish_reaches_string_and_int_handlers) {
    std::vector<std::any> seen;
    dtree::router r(test::make_log());
    r.add_path(path_builder()
        .and_then(dtree::type_is<std::string>())
        .or_else(dtree::type_is<int>())
        .and_then(capture_event(seen)));

    test::run_sync(r.publish(std::string("x")));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(std::any_cast<std::string>(seen[0]), "x");

    test::run_sync(r.publish(42));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(std::any_cast<int>(seen[1]), 42);

    test::run_sync(r.publish(std::vector<std::string>{}));
    EXPECT_EQ(seen.size(), 2u);
}

TEST(router, publishes_through_prebuilt_tree) {
    std::vector<std::any> seen;
    dtree::dispatch_node tree;
    path_builder().and_then(dtree::type_is<int>()).and_then(capture_event(seen)).end(tree);

    dtree::router r(std::move(tree), test::make_log());
    EXPECT_EQ(dtree::count_nodes(*r.snapshot()), 3u);

    test::run_sync(r.publish(5));
    test::run_sync(r.publish(std::string("skip")));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(std::any_cast<int>(seen[0]), 5);
}

TEST(router, caught_error_is_not_delivered) {
    sink s;
    std::vector<std::exception_ptr> caught;
    dtree::router r(test::make_log(), s.handler());
    r.add_path(path_builder()
        .and_then(dtree::type_is<std::string>())
        .and_then(raising_runtime("boom"))
        .on_error(dtree::error_is<std::runtime_error>())
        .and_then(capture_error(caught)));

    test::run_sync(r.publish(std::string("test")));

    ASSERT_EQ(caught.size(), 1u);
    EXPECT_TRUE(dtree::holds_error<std::runtime_error>(caught[0]));
    EXPECT_EQ(dtree::describe_error(caught[0]), "boom");
    EXPECT_TRUE(s.errors.empty());

    test::run_sync(r.publish(123));
    EXPECT_EQ(caught.size(), 1u);
    EXPECT_TRUE(s.errors.empty());
}

TEST(router, non_matching_catch_edge_still_suppresses) {
    sink s;
    std::vector<std::exception_ptr> caught;
    dtree::router r(test::make_log(), s.handler());
    r.add_path(path_builder()
        .and_then(dtree::type_is<std::string>())
        .and_then(raising_logic("wrong kind"))
        .on_error(dtree::error_is<std::runtime_error>())
        .and_then(capture_error(caught)));

    test::run_sync(r.publish(std::string("test")));

    EXPECT_TRUE(caught.empty());
    EXPECT_TRUE(s.errors.empty());
    EXPECT_EQ(r.get_stats().uncaught, 0u);
}

TEST(router, reraised_error_reaches_sink) {
    sink s;
    dtree::router r(test::make_log(), s.handler());
    r.add_path(path_builder()
        .and_then(dtree::type_is<std::string>())
        .and_then(raising_runtime("boom"))
        .on_error(dtree::error_is<std::invalid_argument>())
        .or_else(dtree::reraise()));

    test::run_sync(r.publish(std::string("test")));

    ASSERT_EQ(s.errors.size(), 1u);
    EXPECT_TRUE(dtree::holds_error<std::runtime_error>(s.errors[0]));

    test::run_sync(r.publish(123));
    EXPECT_EQ(s.errors.size(), 1u);
}

TEST(router, sink_receives_most_recent_first) {
    sink s;
    dtree::router r(test::make_log(), s.handler());
    r.add_path(path_builder()
        .and_then(raising_runtime("first"))
        .and_then(raising_runtime("second")));

    test::run_sync(r.publish(1));

    ASSERT_EQ(s.errors.size(), 2u);
    EXPECT_EQ(dtree::describe_error(s.errors[0]), "second");
    EXPECT_EQ(dtree::describe_error(s.errors[1]), "first");
    EXPECT_EQ(r.get_stats().uncaught, 2u);
}

TEST(router, uncaught_errors_without_sink_are_discarded) {
    dtree::router r(test::make_log());
    r.add_path(path_builder().and_then(raising_runtime("lost")));

    EXPECT_NO_THROW(test::run_sync(r.publish(1)));
    EXPECT_EQ(r.get_stats().uncaught, 1u);
}

TEST(router, sink_failure_propagates_to_publisher) {
    dtree::router r(test::make_log(),
        [](std::exception_ptr err) -> asio::awaitable<void> {
            std::rethrow_exception(err);
            co_return;
        });
    r.add_path(path_builder().and_then(raising_runtime("rethrown")));

    EXPECT_THROW(test::run_sync(r.publish(1)), std::runtime_error);
}

TEST(router, shared_subtree_runs_once_per_path) {
    std::vector<std::any> seen;
    auto subtree = std::make_shared<dtree::dispatch_node>();
    dtree::extend(*subtree, path_builder().and_then(capture_event(seen)).steps());

    auto left = dtree::when("left", [](const context&) { return true; });
    auto right = dtree::when("right", [](const context&) { return true; });
    auto join = dtree::unit();

    dtree::router r(test::make_log());
    r.add_path(path_builder().and_then(left).and_then(join, subtree));
    r.add_path(path_builder().and_then(right).and_then(join, subtree));

    test::run_sync(r.publish(7));

    EXPECT_EQ(seen.size(), 2u);
}

TEST(router, extending_one_path_leaves_shared_sibling_alone) {
    std::vector<std::any> extra_seen;
    auto subtree = std::make_shared<dtree::dispatch_node>();
    dtree::extend(*subtree, path_builder().and_then(dtree::unit()).steps());

    auto left = dtree::when("left", [](const context&) { return true; });
    auto right = dtree::when("right", [](const context&) { return true; });
    auto join = dtree::type_is<int>();

    dtree::router r(test::make_log());
    r.add_path(path_builder().and_then(left).and_then(join, subtree));
    r.add_path(path_builder().and_then(right).and_then(join, subtree));
    r.add_path(path_builder().and_then(left).and_then(join).and_then(dtree::unit()).and_then(capture_event(extra_seen)));

    test::run_sync(r.publish(7));

    // Only the left path carries the extension
    EXPECT_EQ(extra_seen.size(), 1u);
    EXPECT_TRUE(subtree->ands().begin()->second.view().empty());

    auto root = r.snapshot();
    const auto& right_join = root->ands().at(right).view().ands().at(join);
    EXPECT_EQ(right_join.get(), subtree);
}

TEST(router, old_snapshot_unchanged_by_add_path) {
    dtree::router r(test::make_log());
    auto before = r.snapshot();

    r.add_path(path_builder().and_then(dtree::type_is<int>()).and_then(dtree::unit()));
    auto middle = r.snapshot();
    r.add_path(path_builder().and_then(dtree::type_is<int>()).and_then(dtree::reraise()));
    auto after = r.snapshot();

    EXPECT_EQ(dtree::count_nodes(*before), 1u);
    EXPECT_EQ(dtree::count_nodes(*middle), 3u);
    EXPECT_EQ(dtree::count_nodes(*after), 4u);
    EXPECT_EQ(r.get_stats().paths, 2u);
}

TEST(router, idempotent_registration) {
    dtree::router r(test::make_log());
    path_builder b;
    b.and_then(dtree::type_is<std::string>()).or_else(dtree::type_is<int>()).and_then(dtree::unit());

    r.add_path(b);
    auto once = dtree::count_nodes(*r.snapshot());
    r.add_path(b);

    EXPECT_EQ(dtree::count_nodes(*r.snapshot()), once);
}

TEST(router, publish_in_flight_keeps_its_snapshot) {
    std::vector<std::any> first;
    std::vector<std::any> late;

    auto gate = dtree::call("gate", [](context) -> asio::awaitable<outcome> {
        asio::steady_timer timer(co_await asio::this_coro::executor, std::chrono::milliseconds(20));
        co_await timer.async_wait(asio::use_awaitable);
        co_return outcome::pass();
    });

    dtree::router r(test::make_log());
    r.add_path(path_builder().and_then(gate).and_then(capture_event(first)));

    asio::io_context ioc;
    asio::co_spawn(ioc, r.publish(1), asio::detached);
    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        r.add_path(path_builder().and_then(gate).and_then(capture_event(late)));
        co_return;
    }, asio::detached);
    ioc.run();

    EXPECT_EQ(first.size(), 1u);
    EXPECT_TRUE(late.empty());

    test::run_sync(r.publish(2));
    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(late.size(), 1u);
}

TEST(router, multithreaded_publish_counts_every_failure) {
    sink s;
    dtree::router r(test::make_log(), s.handler());
    for (int i = 0; i < 32; ++i) {
        r.add_path(path_builder().and_then(raising_runtime("branch " + std::to_string(i))));
    }

    test::run_sync(r.publish(1), 4);

    EXPECT_EQ(s.errors.size(), 32u);
    EXPECT_EQ(r.get_stats().published, 1u);
}
