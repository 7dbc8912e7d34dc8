#include "protocol.hpp"

#include <drogon/utils/Utilities.h>

#include <memory>

namespace peckwatch::protocol {

std::string to_text(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

// drogon::utils::isBase64 only knows the alphabet, so the '=' padding a
// browser btoa() appends is checked here.
static bool is_padded_base64(const std::string& s) {
    size_t len = s.size();
    size_t pad = 0;
    while (pad < 2 && len > 0 && s[len - 1] == '=') {
        --len;
        ++pad;
    }
    if (len == 0 || len % 4 == 1) return false;
    if (pad > 0 && s.size() % 4 != 0) return false;
    if (s.find('=') < len) return false;
    return drogon::utils::isBase64(s.substr(0, len));
}

Status parse_message(const std::string& text, InboundMessage& out, std::string& error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs) || !root.isObject()) {
        error = "message is not a JSON object";
        return Status::DecodeError;
    }
    const Json::Value& type = root["type"];
    if (!type.isString()) {
        error = "message has no type";
        return Status::DecodeError;
    }

    const std::string t = type.asString();
    if (t == "audio") {
        const Json::Value& audio = root["audio"];
        if (!audio.isString() || audio.asString().empty()) {
            error = "audio message without payload";
            return Status::DecodeError;
        }
        const std::string encoded = audio.asString();
        if (!is_padded_base64(encoded)) {
            error = "audio payload is not valid base64";
            return Status::DecodeError;
        }
        out.type = MessageType::Audio;
        out.pcm = drogon::utils::base64Decode(encoded);
        return Status::Ok;
    }
    if (t == "mode") {
        const Json::Value& mode = root["mode"];
        if (!mode.isString() || !parse_reaction_mode(mode.asString(), out.mode)) {
            error = "unknown mode";
            return Status::DecodeError;
        }
        out.type = MessageType::Mode;
        return Status::Ok;
    }
    if (t == "test") {
        out.type = MessageType::Test;
        return Status::Ok;
    }
    if (t == "ping") {
        out.type = MessageType::Ping;
        return Status::Ok;
    }
    error = "unknown message type '" + t + "'";
    return Status::DecodeError;
}

std::string encode_result(const WindowResult& result) {
    Json::Value v(Json::objectValue);
    v["type"] = "result";
    v["window"] = Json::UInt64(result.event.window_index);
    v["confidence"] = result.event.confidence;
    v["detected"] = result.event.triggered;
    v["suppressed"] = result.event.suppressed;
    v["chunk_count"] = Json::UInt64(result.chunk_count);
    v["detections"] = Json::UInt64(result.detections);
    v["sounds_played"] = Json::UInt64(result.sounds_played);
    if (result.last_category.empty()) v["last_category"] = Json::Value(Json::nullValue);
    else v["last_category"] = result.last_category;
    return to_text(v);
}

std::string encode_play(const PlayInstruction& play) {
    Json::Value v(Json::objectValue);
    v["type"] = "play";
    v["category"] = play.category;
    v["asset"] = play.asset;
    v["url"] = play.url;
    return to_text(v);
}

std::string encode_warning(Status code, const std::string& message) {
    Json::Value v(Json::objectValue);
    v["type"] = "warning";
    v["code"] = status_name(code);
    v["message"] = message;
    return to_text(v);
}

std::string encode_error(Status code, const std::string& message) {
    Json::Value v(Json::objectValue);
    v["type"] = "error";
    v["code"] = status_name(code);
    v["message"] = message;
    return to_text(v);
}

std::string encode_mode(ReactionMode mode) {
    Json::Value v(Json::objectValue);
    v["type"] = "mode";
    v["mode"] = reaction_mode_name(mode);
    return to_text(v);
}

std::string encode_pong() {
    Json::Value v(Json::objectValue);
    v["type"] = "pong";
    return to_text(v);
}

std::string encode_timeout(double idle_seconds) {
    Json::Value v(Json::objectValue);
    v["type"] = "timeout";
    v["message"] = "no audio received";
    v["idle_seconds"] = idle_seconds;
    return to_text(v);
}

Json::Value session_to_json(const SessionSnapshot& s) {
    Json::Value v(Json::objectValue);
    v["id"] = Json::UInt64(s.id);
    v["mode"] = reaction_mode_name(s.mode);
    v["chunks"] = Json::UInt64(s.chunks);
    v["windows"] = Json::UInt64(s.windows);
    v["detections"] = Json::UInt64(s.detections);
    v["triggers"] = Json::UInt64(s.triggers);
    v["sounds_played"] = Json::UInt64(s.sounds_played);
    v["last_confidence"] = s.last_confidence;
    if (s.last_category.empty()) v["last_category"] = Json::Value(Json::nullValue);
    else v["last_category"] = s.last_category;
    return v;
}

Json::Value status_to_json(const StatusSnapshot& s) {
    Json::Value v(Json::objectValue);
    v["status"] = s.ready ? "running" : "not_ready";
    v["ready"] = s.ready;
    v["model_loaded"] = s.classifier_loaded;
    v["catalog_loaded"] = s.catalog_loaded;
    v["sample_rate"] = s.sample_rate;
    v["threshold"] = s.threshold;
    v["cooldown_seconds"] = s.cooldown_seconds;
    v["window_seconds"] = s.window_seconds;
    v["default_mode"] = s.default_mode;

    Json::Value cats(Json::arrayValue);
    for (const auto& c : s.categories) cats.append(c);
    v["sound_categories"] = cats;
    v["total_sounds"] = Json::UInt64(s.total_assets);

    Json::Value t(Json::objectValue);
    t["active_sessions"] = Json::UInt64(s.totals.active_sessions);
    t["sessions_opened"] = Json::UInt64(s.totals.sessions_opened);
    t["chunks"] = Json::UInt64(s.totals.chunks);
    t["windows"] = Json::UInt64(s.totals.windows);
    t["detections"] = Json::UInt64(s.totals.detections);
    t["triggers"] = Json::UInt64(s.totals.triggers);
    t["sounds_played"] = Json::UInt64(s.totals.sounds_played);
    v["totals"] = t;

    if (!s.problems.empty()) {
        Json::Value p(Json::arrayValue);
        for (const auto& e : s.problems) p.append(e);
        v["problems"] = p;
    }
    return v;
}

Json::Value listing_to_json(const SoundCatalog::Listing& listing) {
    Json::Value v(Json::objectValue);
    for (const auto& kv : listing) {
        Json::Value files(Json::arrayValue);
        for (const auto& f : kv.second) files.append(f);
        v[kv.first] = files;
    }
    return v;
}

Json::Value analysis_to_json(const ClipAnalysis& analysis) {
    Json::Value v(Json::objectValue);
    v["detected"] = analysis.detected;
    v["probability"] = analysis.probability;
    v["windows"] = analysis.windows;
    v["duration_seconds"] = analysis.duration_seconds;
    Json::Value conf(Json::arrayValue);
    for (float c : analysis.confidences) conf.append(c);
    v["confidences"] = conf;
    return v;
}

} // namespace peckwatch::protocol
