#include "connection_handler.hpp"
#include "protocol.hpp"

#include <trantor/utils/Logger.h>

namespace peckwatch::protocol {

std::shared_ptr<Session> open_client_session(Engine& engine, SendFn send, const std::string& peer,
                                             Status& status) {
    SessionCallbacks cb;
    cb.on_result = [send](const WindowResult& r) { send(encode_result(r)); };
    cb.on_play = [send](const PlayInstruction& p) { send(encode_play(p)); };
    cb.on_warning = [send, peer](Status code, const std::string& message) {
        LOG_WARN << "Session " << peer << ": " << status_name(code) << ": " << message;
        send(encode_warning(code, message));
    };

    auto session = engine.open_session(std::move(cb), status);
    if (!session) {
        LOG_WARN << "Refusing connection from " << peer << ": engine not ready";
        send(encode_error(status, "detector is not ready"));
        return nullptr;
    }
    LOG_INFO << "Session " << session->id() << " opened from " << peer << " (mode "
             << reaction_mode_name(session->mode()) << ")";
    send(encode_mode(session->mode()));
    return session;
}

void handle_client_text(Session& session, const std::string& text, const SendFn& send) {
    InboundMessage msg;
    std::string error;
    Status st = parse_message(text, msg, error);
    if (!ok(st)) {
        LOG_DEBUG << "Session " << session.id() << ": dropped message: " << error;
        send(encode_warning(st, error));
        return;
    }

    switch (msg.type) {
        case MessageType::Audio:
            session.on_audio_bytes(msg.pcm);
            break;
        case MessageType::Mode:
            session.set_mode(msg.mode);
            LOG_INFO << "Session " << session.id() << " mode -> " << reaction_mode_name(msg.mode);
            send(encode_mode(msg.mode));
            break;
        case MessageType::Test: {
            PlayInstruction play;
            if (ok(session.request_test(play))) {
                LOG_INFO << "Session " << session.id() << " test sound " << play.category << "/" << play.asset;
            }
            break;
        }
        case MessageType::Ping:
            send(encode_pong());
            break;
    }
}

} // namespace peckwatch::protocol
