#include "config.hpp"
#include "error_stack.hpp"
#include "routes.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <any>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using dtree::combinator;
using dtree::filter_kind;
using json = nlohmann::json;

namespace {

const char* orders_yaml = R"(
log_level: debug
dispatch_threads: 2
stats_interval_seconds: 0
routes:
  - name: big-orders
    steps:
      - filter: kind
        kind: object
      - filter: field_equals
        field: type
        value: order
      - filter: log
  - name: refunds
    steps:
      - filter: kind
        kind: object
      - op: or
        filter: has_field
        field: /refund/id
      - filter: log
        label: refund-desk
)";

struct sink {
    std::mutex mutex;
    std::vector<std::string> messages;

    dtree::router::uncaught_handler handler() {
        return [this](std::exception_ptr err) -> asio::awaitable<void> {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(dtree::describe_error(err));
            co_return;
        };
    }
};

} // namespace

TEST(config, parses_routes_and_operational_settings) {
    auto cfg = dtree::parse_config(orders_yaml);

    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.dispatch_threads, 2u);
    EXPECT_EQ(cfg.stats_interval_seconds, 0);
    EXPECT_EQ(cfg.parser_threads, 0u);

    ASSERT_EQ(cfg.routes.size(), 2u);
    const auto& big = cfg.routes[0];
    EXPECT_EQ(big.name, "big-orders");
    ASSERT_EQ(big.steps.size(), 3u);
    EXPECT_EQ(big.steps[0].op, combinator::and_op);
    EXPECT_EQ(big.steps[0].filter.kind, filter_kind::kind);
    EXPECT_EQ(big.steps[0].filter.arg, "object");
    EXPECT_EQ(big.steps[1].filter.value, json("order"));
    EXPECT_EQ(big.steps[2].filter.kind, filter_kind::log);
    EXPECT_TRUE(big.steps[2].filter.arg.empty());

    const auto& refunds = cfg.routes[1];
    EXPECT_EQ(refunds.steps[1].op, combinator::or_op);
    EXPECT_EQ(refunds.steps[1].filter.arg, "/refund/id");
    EXPECT_EQ(refunds.steps[2].filter.arg, "refund-desk");
}

TEST(config, defaults) {
    auto cfg = dtree::parse_config(R"(
routes:
  - steps:
      - filter: reraise
)");

    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.stats_interval_seconds, 10);
    EXPECT_EQ(cfg.dispatch_threads, 0u);
    ASSERT_EQ(cfg.routes.size(), 1u);
    EXPECT_EQ(cfg.routes[0].name, "route-1");
}

TEST(config, plain_and_quoted_values) {
    auto cfg = dtree::parse_config(R"(
routes:
  - steps:
      - filter: field_equals
        field: amount
        value: 42
      - filter: field_equals
        field: amount
        value: "42"
      - filter: field_equals
        field: paid
        value: true
      - filter: field_equals
        field: ratio
        value: 0.5
      - filter: field_equals
        field: tags
        value: [a, b]
)");

    const auto& steps = cfg.routes[0].steps;
    EXPECT_EQ(steps[0].filter.value, json(42));
    EXPECT_EQ(steps[1].filter.value, json("42"));
    EXPECT_EQ(steps[2].filter.value, json(true));
    EXPECT_EQ(steps[3].filter.value, json(0.5));
    EXPECT_EQ(steps[4].filter.value, json::array({"a", "b"}));
}

TEST(config, missing_routes_throws) {
    EXPECT_THROW(dtree::parse_config("log_level: info\n"), std::runtime_error);
    EXPECT_THROW(dtree::parse_config("routes: []\n"), std::runtime_error);
}

TEST(config, invalid_step_throws) {
    EXPECT_THROW(dtree::parse_config(R"(
routes:
  - steps:
      - op: xor
        filter: reraise
)"), std::runtime_error);

    EXPECT_THROW(dtree::parse_config(R"(
routes:
  - steps:
      - filter: regex
)"), std::runtime_error);

    // field_equals without a value
    EXPECT_THROW(dtree::parse_config(R"(
routes:
  - steps:
      - filter: field_equals
        field: type
)"), std::runtime_error);

    EXPECT_THROW(dtree::parse_config(R"(
routes:
  - name: empty
    steps: []
)"), std::runtime_error);
}

TEST(config, parse_filter_kind) {
    EXPECT_EQ(dtree::parse_filter_kind("has_field"), filter_kind::has_field);
    EXPECT_EQ(dtree::parse_filter_kind("error_contains"), filter_kind::error_contains);
    EXPECT_FALSE(dtree::parse_filter_kind("HAS_FIELD").has_value());
}

TEST(config, load_missing_file_throws) {
    EXPECT_THROW(dtree::load_config("/nonexistent/routes.yaml"), std::exception);
}

TEST(routes, shared_prefix_shares_nodes) {
    auto log = test::make_log();
    auto cfg = dtree::parse_config(orders_yaml);

    dtree::router r(log);
    dtree::register_routes(r, cfg, log);

    // root, kind(object), type == "order", log(big-orders),
    // has_field (or), log(refund-desk)
    EXPECT_EQ(dtree::count_nodes(*r.snapshot()), 6u);
    EXPECT_EQ(r.snapshot()->ands().size(), 1u);
    EXPECT_EQ(r.get_stats().paths, 2u);
}

TEST(routes, unlabelled_log_uses_route_name) {
    auto log = test::make_log();
    auto cfg = dtree::parse_config(orders_yaml);

    auto p = dtree::build_route(cfg.routes[0], log);
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[2].filter->describe(), "log(big-orders)");
}

TEST(routes, raised_error_reaches_sink) {
    auto log = test::make_log();
    auto cfg = dtree::parse_config(R"(
routes:
  - name: payments
    steps:
      - filter: has_field
        field: card
      - filter: raise
        message: card declined
)");

    sink s;
    dtree::router r(log, s.handler());
    dtree::register_routes(r, cfg, log);

    test::run_sync(r.publish(std::any(json{{"card", "4111"}})));
    test::run_sync(r.publish(std::any(json{{"cash", 10}})));

    ASSERT_EQ(s.messages.size(), 1u);
    EXPECT_EQ(s.messages[0], "card declined");
}

TEST(routes, catch_step_suppresses_error) {
    auto log = test::make_log();
    auto cfg = dtree::parse_config(R"(
routes:
  - name: payments
    steps:
      - filter: raise
        message: upstream timeout
      - op: catch
        filter: error_contains
        text: timeout
      - filter: log
        label: retry-queue
)");

    sink s;
    dtree::router r(log, s.handler());
    dtree::register_routes(r, cfg, log);

    test::run_sync(r.publish(std::any(json{{"id", 1}})));

    EXPECT_TRUE(s.messages.empty());
    EXPECT_EQ(r.get_stats().uncaught, 0u);
    EXPECT_EQ(r.get_stats().dispatch.retractions, 1u);
}

TEST(routes, reraise_step_surfaces_error) {
    auto log = test::make_log();
    auto cfg = dtree::parse_config(R"(
routes:
  - steps:
      - filter: raise
        message: disk full
      - op: catch
        filter: error_contains
        text: timeout
      - op: or
        filter: reraise
)");

    sink s;
    dtree::router r(log, s.handler());
    dtree::register_routes(r, cfg, log);

    test::run_sync(r.publish(std::any(json::object())));

    ASSERT_EQ(s.messages.size(), 1u);
    EXPECT_EQ(s.messages[0], "disk full");
}
