#pragma once

#include <drogon/HttpAppFramework.h>

#include "engine.hpp"

namespace peckwatch {

// GET /api/status, GET /api/sounds, POST /api/analyze and
// GET <url_prefix>/{category}/{file}
void register_http_routes(drogon::HttpAppFramework& app, const Engine& engine);

} // namespace peckwatch
