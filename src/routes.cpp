#include "routes.hpp"
#include "filters.hpp"
#include "json_filters.hpp"

namespace dtree {

filter_ptr make_filter(const filter_def& def, std::shared_ptr<spdlog::logger> log) {
    switch (def.kind) {
        case filter_kind::kind:           return std::make_shared<json_kind_filter>(def.arg);
        case filter_kind::has_field:      return std::make_shared<has_field_filter>(def.arg);
        case filter_kind::field_equals:   return std::make_shared<field_equals_filter>(def.arg, def.value);
        case filter_kind::log:            return std::make_shared<log_filter>(def.arg, std::move(log));
        case filter_kind::raise:          return std::make_shared<raise_filter>(def.arg);
        case filter_kind::reraise:        return reraise();
        case filter_kind::error_contains: return std::make_shared<error_contains_filter>(def.arg);
    }
    return nullptr;
}

path build_route(const route_def& route, std::shared_ptr<spdlog::logger> log) {
    path_builder builder;
    for (const auto& s : route.steps) {
        // Unlabelled log handlers report under the route name
        if (s.filter.kind == filter_kind::log && s.filter.arg.empty()) {
            builder.step(s.op, std::make_shared<log_filter>(route.name, log));
            continue;
        }
        builder.step(s.op, make_filter(s.filter, log));
    }
    return builder.steps();
}

void register_routes(router& r, const config& cfg, std::shared_ptr<spdlog::logger> log) {
    for (const auto& route : cfg.routes) {
        r.add_path(build_route(route, log));
        log->debug("Registered route '{}' ({} steps)", route.name, route.steps.size());
    }
}

} // namespace dtree
