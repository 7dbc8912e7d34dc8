#pragma once

#include <string>

#include "engine.hpp"

namespace peckwatch::protocol {

// Transport-neutral HTTP answer; http_routes copies it into a Drogon response
struct HttpReply {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

// GET /api/status
HttpReply status_reply(const Engine& engine);

// GET /api/sounds
HttpReply sounds_reply(const Engine& engine);

// GET <url_prefix>/{category}/{filename}: the file with its media type,
// or 404 {"error":"not_found"}
HttpReply asset_reply(const Engine& engine, const std::string& category, const std::string& filename);

// POST /api/analyze: classifies an uploaded WAV clip. 400 decode_error
// for an empty or unreadable upload, 503 not_ready before a clean start,
// 500 inference_error when the classifier fails.
HttpReply analyze_reply(const Engine& engine, const std::string& wav_bytes);

} // namespace peckwatch::protocol
