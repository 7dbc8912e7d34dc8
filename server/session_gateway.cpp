#include "session_gateway.hpp"
#include "connection_handler.hpp"
#include "protocol.hpp"

#include <trantor/utils/Logger.h>

#include <vector>

namespace peckwatch {

using drogon::WebSocketConnectionPtr;
using drogon::WebSocketMessageType;

SessionGateway::SessionGateway(Engine& engine) : engine_(engine) {}

void SessionGateway::handleNewConnection(const drogon::HttpRequestPtr& req, const WebSocketConnectionPtr& conn) {
    std::weak_ptr<drogon::WebSocketConnection> weak = conn;
    protocol::SendFn send = [weak](const std::string& text) {
        if (auto c = weak.lock()) c->send(text);
    };

    Status st = Status::Ok;
    auto session = protocol::open_client_session(engine_, std::move(send), req->peerAddr().toIpPort(), st);
    if (!session) {
        conn->shutdown(drogon::CloseCode::kUnexpectedCondition, "not ready");
        return;
    }

    conn->setContext(session);
    std::lock_guard<std::mutex> lock(mutex_);
    connections_[session->id()] = Live{conn, session};
}

void SessionGateway::handleNewMessage(const WebSocketConnectionPtr& conn, std::string&& message,
                                      const WebSocketMessageType& type) {
    auto session = conn->getContext<Session>();
    if (!session) return;

    if (type == WebSocketMessageType::Text) {
        protocol::handle_client_text(*session, message, [&conn](const std::string& text) { conn->send(text); });
    } else if (type == WebSocketMessageType::Binary) {
        // Raw PCM16LE frames skip the JSON/base64 envelope
        session->on_audio_bytes(message);
    }
}

void SessionGateway::handleConnectionClosed(const WebSocketConnectionPtr& conn) {
    auto session = conn->getContext<Session>();
    if (!session) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.erase(session->id());
    }
    const SessionSnapshot snap = session->stats().snapshot();
    engine_.close_session(*session);
    conn->clearContext();
    LOG_INFO << "Session " << snap.id << " closed: " << snap.windows << " windows, " << snap.triggers
             << " triggers, " << snap.sounds_played << " sounds";
}

void SessionGateway::sweep_idle() {
    const double timeout = engine_.get_config().server.idle_timeout_seconds;
    if (timeout <= 0.0) return;

    std::vector<Live> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.reserve(connections_.size());
        for (const auto& kv : connections_) live.push_back(kv.second);
    }
    const double now = engine_.now();
    for (const auto& l : live) {
        if (l.session->check_idle(now, timeout)) {
            LOG_DEBUG << "Session " << l.session->id() << " idle for " << timeout << " s";
            l.conn->send(protocol::encode_timeout(timeout));
        }
    }
}

size_t SessionGateway::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

} // namespace peckwatch
