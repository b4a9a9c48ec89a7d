#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <stdexcept>

namespace dtree {

std::optional<filter_kind> parse_filter_kind(const std::string& s) {
    if (s == "kind")           return filter_kind::kind;
    if (s == "has_field")      return filter_kind::has_field;
    if (s == "field_equals")   return filter_kind::field_equals;
    if (s == "log")            return filter_kind::log;
    if (s == "raise")          return filter_kind::raise;
    if (s == "reraise")        return filter_kind::reraise;
    if (s == "error_contains") return filter_kind::error_contains;
    return std::nullopt;
}

namespace {

// Quoted scalars stay strings; plain ones are typed the way YAML reads them.
nlohmann::json to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;

        case YAML::NodeType::Scalar: {
            if (node.Tag() == "!") return node.as<std::string>();
            int64_t i;
            if (YAML::convert<int64_t>::decode(node, i)) return i;
            double d;
            if (YAML::convert<double>::decode(node, d)) return d;
            bool b;
            if (YAML::convert<bool>::decode(node, b)) return b;
            return node.as<std::string>();
        }

        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) arr.push_back(to_json(item));
            return arr;
        }

        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

std::string required(const YAML::Node& step, const char* key, const std::string& where) {
    if (auto n = step[key]) return n.as<std::string>();
    throw std::runtime_error("config: " + where + " requires '" + key + "'");
}

step_def parse_step(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) throw std::runtime_error("config: " + where + " must be a map");

    step_def step;

    auto op_name = node["op"] ? node["op"].as<std::string>() : std::string("and");
    auto op = parse_combinator(op_name);
    if (!op) throw std::runtime_error("config: " + where + ": invalid 'op': " + op_name);
    step.op = *op;

    auto kind_name = required(node, "filter", where);
    auto kind = parse_filter_kind(kind_name);
    if (!kind) throw std::runtime_error("config: " + where + ": invalid 'filter': " + kind_name);
    step.filter.kind = *kind;

    switch (*kind) {
        case filter_kind::kind:
            step.filter.arg = required(node, "kind", where);
            break;
        case filter_kind::has_field:
            step.filter.arg = required(node, "field", where);
            break;
        case filter_kind::field_equals:
            step.filter.arg = required(node, "field", where);
            if (!node["value"]) throw std::runtime_error("config: " + where + " requires 'value'");
            step.filter.value = to_json(node["value"]);
            break;
        case filter_kind::log:
            if (auto n = node["label"]) step.filter.arg = n.as<std::string>();
            break;
        case filter_kind::raise:
            step.filter.arg = required(node, "message", where);
            break;
        case filter_kind::reraise:
            break;
        case filter_kind::error_contains:
            step.filter.arg = required(node, "text", where);
            break;
    }
    return step;
}

config from_root(const YAML::Node& root) {
    config cfg;

    // Routes (required)
    if (auto routes = root["routes"]) {
        if (!routes.IsSequence()) throw std::runtime_error("config: 'routes' must be a list");
        for (const auto& item : routes) {
            route_def route;
            route.name = item["name"] ? item["name"].as<std::string>()
                                      : "route-" + std::to_string(cfg.routes.size() + 1);

            auto steps = item["steps"];
            if (!steps || !steps.IsSequence() || steps.size() == 0) {
                throw std::runtime_error("config: route '" + route.name + "' needs a non-empty 'steps' list");
            }
            for (std::size_t i = 0; i < steps.size(); ++i) {
                auto where = "route '" + route.name + "' step " + std::to_string(i + 1);
                route.steps.push_back(parse_step(steps[i], where));
            }
            cfg.routes.push_back(std::move(route));
        }
    } else {
        throw std::runtime_error("config: 'routes' is required");
    }

    if (cfg.routes.empty()) {
        throw std::runtime_error("config: 'routes' must not be empty");
    }

    // Operational
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["dispatch_threads"])       cfg.dispatch_threads = n.as<unsigned int>();
    if (auto n = root["parser_threads"])         cfg.parser_threads = n.as<unsigned int>();

    return cfg;
}

} // namespace

config load_config(const std::string& path) {
    return from_root(YAML::LoadFile(path));
}

config parse_config(const std::string& yaml) {
    return from_root(YAML::Load(yaml));
}

} // namespace dtree
