#include "config.hpp"
#include "error_stack.hpp"
#include "router.hpp"
#include "routes.hpp"
#include "worker_pool.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

// Periodic stats logging; ends when the timer is cancelled.
asio::awaitable<void> stats_loop(asio::steady_timer& timer, int interval_seconds,
                                 const dtree::router& r, const dtree::worker_pool& pool,
                                 std::shared_ptr<spdlog::logger> log) {
    while (true) {
        timer.expires_after(std::chrono::seconds(interval_seconds));
        std::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) co_return;

        auto rs = r.get_stats();
        auto ws = pool.get_stats();
        log->info("stats: received={} decoded={} decode_failures={} published={} uncaught={} evaluations={} failures={} retracted={} queue_depth={}",
                  ws.received, ws.decoded, ws.decode_failures, rs.published, rs.uncaught,
                  rs.dispatch.evaluations, rs.dispatch.failures, rs.dispatch.retractions,
                  ws.queue_depth);
    }
}

unsigned int resolve_threads(unsigned int configured) {
    unsigned int n = configured > 0 ? configured : std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("dtree_route",
        "Route JSON-lines events through a dispatch tree");

    options.add_options()
        ("c,config", "Path to YAML routes file", cxxopts::value<std::string>())
        ("i,input", "Read events from file instead of stdin", cxxopts::value<std::string>())
        ("t,threads", "Dispatch threads (overrides config)", cxxopts::value<unsigned int>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("dtree");

    // Load config
    dtree::config cfg;
    try {
        cfg = dtree::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("threads")) cfg.dispatch_threads = result["threads"].as<unsigned int>();
    if (result.count("verbose")) cfg.log_level = "debug";

    // Set log level
    if (cfg.log_level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (cfg.log_level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (cfg.log_level == "error") spdlog::set_level(spdlog::level::err);
    else                               spdlog::set_level(spdlog::level::info);

    std::ifstream file;
    if (result.count("input")) {
        file.open(result["input"].as<std::string>());
        if (!file) {
            console->error("Cannot open input '{}'", result["input"].as<std::string>());
            return 1;
        }
    }
    std::istream& input = file.is_open() ? static_cast<std::istream&>(file) : std::cin;

    unsigned int dispatch_threads = resolve_threads(cfg.dispatch_threads);

    console->info("dtree_route starting");
    console->info("  routes: {}", cfg.routes.size());
    console->info("  dispatch threads: {}", dispatch_threads);
    console->info("  parser threads: {}", resolve_threads(cfg.parser_threads));

    asio::io_context ioc(static_cast<int>(dispatch_threads));
    auto work = asio::make_work_guard(ioc);

    dtree::router router(console,
        [console](std::exception_ptr err) -> asio::awaitable<void> {
            console->error("Uncaught: {}", dtree::describe_error(err));
            co_return;
        });

    try {
        dtree::register_routes(router, cfg, console);
    } catch (const std::exception& e) {
        console->error("Invalid route: {}", e.what());
        return 1;
    }

    dtree::worker_pool pool(ioc, cfg, router, console);

    // Stop reading on SIGINT/SIGTERM; events already queued still drain
    std::atomic<bool> interrupted{false};
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int) {
        if (ec) return;
        console->info("Shutting down...");
        interrupted = true;
    });

    asio::steady_timer stats_timer(ioc);
    if (cfg.stats_interval_seconds > 0) {
        asio::co_spawn(ioc,
            stats_loop(stats_timer, cfg.stats_interval_seconds, router, pool, console),
            asio::detached);
    }

    std::vector<std::thread> io_threads;
    io_threads.reserve(dispatch_threads);
    for (unsigned int i = 0; i < dispatch_threads; ++i) {
        io_threads.emplace_back([&ioc] { ioc.run(); });
    }

    pool.start();

    std::string line;
    while (!interrupted && std::getline(input, line)) {
        pool.enqueue(std::move(line));
    }

    // Shutdown ordering:
    // 1. Drain the queue and join parser threads (all publishes are spawned)
    pool.stop();

    // 2. Let the io_context run out of work (pending publishes complete)
    asio::post(ioc, [&] {
        stats_timer.cancel();
        signals.cancel();
    });
    work.reset();
    for (auto& t : io_threads) {
        if (t.joinable()) t.join();
    }

    auto rs = router.get_stats();
    auto ws = pool.get_stats();
    console->info("dtree_route stopped: published={} uncaught={} decode_failures={} dispatch_errors={}",
                  rs.published, rs.uncaught, ws.decode_failures, ws.dispatch_errors);
    return ws.dispatch_errors == 0 ? 0 : 2;
}
