#pragma once

#include <drogon/WebSocketController.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "engine.hpp"

namespace peckwatch {

// WebSocket endpoint that binds one Session to each connection. Messages
// of a connection arrive on that connection's event loop, so a Session is
// never touched from two threads except by the idle sweep.
class SessionGateway : public drogon::WebSocketController<SessionGateway, false> {
public:
    explicit SessionGateway(Engine& engine);

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/ws");
    WS_PATH_LIST_END

    void handleNewConnection(const drogon::HttpRequestPtr& req,
                             const drogon::WebSocketConnectionPtr& conn) override;
    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                          std::string&& message,
                          const drogon::WebSocketMessageType& type) override;
    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override;

    // Sends a timeout notice to every session idle for the configured time
    void sweep_idle();

    size_t connection_count() const;

private:
    Engine& engine_;
    mutable std::mutex mutex_;
    struct Live {
        drogon::WebSocketConnectionPtr conn;
        std::shared_ptr<Session> session;
    };
    std::map<uint64_t, Live> connections_;
};

} // namespace peckwatch
