#pragma once

#include <functional>
#include <memory>
#include <string>

#include "engine.hpp"

namespace peckwatch::protocol {

// Delivers one outbound text frame to the client
using SendFn = std::function<void(const std::string&)>;

// Creates the session for a new client with every session callback
// routed through `send`, then acknowledges the starting mode. When the
// engine is not ready it sends the not_ready error instead and returns
// nullptr; closing the transport is left to the caller.
std::shared_ptr<Session> open_client_session(Engine& engine, SendFn send, const std::string& peer,
                                             Status& status);

// Decodes and executes one client text frame: audio, mode, test or ping.
// A malformed frame is answered with a warning and otherwise ignored.
void handle_client_text(Session& session, const std::string& text, const SendFn& send);

} // namespace peckwatch::protocol
