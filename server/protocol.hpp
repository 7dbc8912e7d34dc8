#pragma once

#include <json/json.h>
#include <string>

#include "engine.hpp"
#include "reaction_dispatcher.hpp"
#include "session.hpp"
#include "sound_catalog.hpp"
#include "stats_aggregator.hpp"
#include "status_codes.hpp"
#include "status_service.hpp"

namespace peckwatch::protocol {

enum class MessageType { Audio, Mode, Test, Ping };

struct InboundMessage {
    MessageType type = MessageType::Ping;
    std::string pcm;     // Audio: decoded base64 payload
    ReactionMode mode = ReactionMode::Predators;  // Mode
};

// Decodes one client text frame. DecodeError (with `error` set) for
// malformed JSON, an unknown type, a missing or non-base64 audio field,
// or an unknown mode name.
Status parse_message(const std::string& text, InboundMessage& out, std::string& error);

std::string encode_result(const WindowResult& result);
std::string encode_play(const PlayInstruction& play);
std::string encode_warning(Status code, const std::string& message);
std::string encode_error(Status code, const std::string& message);
std::string encode_mode(ReactionMode mode);
std::string encode_pong();
std::string encode_timeout(double idle_seconds);

Json::Value status_to_json(const StatusSnapshot& status);
Json::Value session_to_json(const SessionSnapshot& session);
Json::Value listing_to_json(const SoundCatalog::Listing& listing);
Json::Value analysis_to_json(const ClipAnalysis& analysis);

std::string to_text(const Json::Value& value);

} // namespace peckwatch::protocol
