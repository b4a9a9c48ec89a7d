#pragma once

#include "config.hpp"
#include "filter.hpp"
#include "path_builder.hpp"
#include "router.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace dtree {

// Build the filter a config step declares. `log` is used by log filters.
filter_ptr make_filter(const filter_def& def, std::shared_ptr<spdlog::logger> log);

// Translate one declared route into a dispatch path.
path build_route(const route_def& route, std::shared_ptr<spdlog::logger> log);

// Register every route of `cfg` with `r`, in file order. Routes sharing a
// prefix of equal steps share the corresponding nodes.
void register_routes(router& r, const config& cfg, std::shared_ptr<spdlog::logger> log);

} // namespace dtree
