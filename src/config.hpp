#pragma once

#include "dispatch_node.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dtree {

// Filters available to routes declared in the config file
enum class filter_kind {
    kind,
    has_field,
    field_equals,
    log,
    raise,
    reraise,
    error_contains
};

struct filter_def {
    filter_kind kind;
    // kind: json type name; has_field/field_equals: field; log: label;
    // raise: message; error_contains: text
    std::string arg;
    nlohmann::json value;  // field_equals only
};

struct step_def {
    combinator op;
    filter_def filter;
};

struct route_def {
    std::string name;
    std::vector<step_def> steps;
};

struct config {
    // Routes, registered in file order
    std::vector<route_def> routes;

    // Operational
    std::string log_level = "info";
    int stats_interval_seconds = 10;  // 0 disables periodic stats

    // Threads running dispatch on the io_context (0 = hardware_concurrency)
    unsigned int dispatch_threads = 0;

    // Threads decoding input lines (0 = hardware_concurrency)
    unsigned int parser_threads = 0;
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse config from YAML text. Throws on error.
config parse_config(const std::string& yaml);

// Parse filter_kind from string. Returns nullopt if invalid.
std::optional<filter_kind> parse_filter_kind(const std::string& s);

} // namespace dtree
