#include "http_routes.hpp"
#include "api_handlers.hpp"

#include <drogon/HttpResponse.h>
#include <drogon/MultiPart.h>

namespace peckwatch {

using drogon::HttpRequestPtr;
using drogon::HttpResponse;
using drogon::HttpResponsePtr;
using Callback = std::function<void(const HttpResponsePtr&)>;

static HttpResponsePtr to_response(protocol::HttpReply&& reply) {
    auto resp = HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(reply.status));
    resp->setContentTypeString(reply.content_type);
    resp->setBody(std::move(reply.body));
    return resp;
}

// A multipart form carries the clip as its first file; anything else is
// taken as the raw WAV body.
static std::string uploaded_audio(const HttpRequestPtr& req) {
    drogon::MultiPartParser parser;
    if (parser.parse(req) == 0 && !parser.getFiles().empty()) {
        const auto& file = parser.getFiles().front();
        return std::string(file.fileData(), file.fileLength());
    }
    return std::string(req->bodyData(), req->bodyLength());
}

void register_http_routes(drogon::HttpAppFramework& app, const Engine& engine) {
    const Engine* e = &engine;

    app.registerHandler(
        "/api/status",
        [e](const HttpRequestPtr&, Callback&& callback) { callback(to_response(protocol::status_reply(*e))); },
        {drogon::Get});

    app.registerHandler(
        "/api/sounds",
        [e](const HttpRequestPtr&, Callback&& callback) { callback(to_response(protocol::sounds_reply(*e))); },
        {drogon::Get});

    app.registerHandler(
        "/api/analyze",
        [e](const HttpRequestPtr& req, Callback&& callback) {
            callback(to_response(protocol::analyze_reply(*e, uploaded_audio(req))));
        },
        {drogon::Post});

    std::string prefix = engine.get_config().catalog.url_prefix;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    app.registerHandler(
        prefix + "/{1}/{2}",
        [e](const HttpRequestPtr&, Callback&& callback, const std::string& category, const std::string& filename) {
            callback(to_response(protocol::asset_reply(*e, category, filename)));
        },
        {drogon::Get});
}

} // namespace peckwatch
