#include "api_handlers.hpp"
#include "protocol.hpp"
#include "wav_reader.hpp"

#include <trantor/utils/Logger.h>

namespace peckwatch::protocol {

static HttpReply json_reply(const Json::Value& body, int status = 200) {
    HttpReply r;
    r.status = status;
    r.body = to_text(body);
    return r;
}

static HttpReply error_reply(int http_status, Status code, const std::string& message) {
    Json::Value body(Json::objectValue);
    body["error"] = status_name(code);
    if (!message.empty()) body["message"] = message;
    return json_reply(body, http_status);
}

HttpReply status_reply(const Engine& engine) {
    return json_reply(status_to_json(engine.status().snapshot()));
}

HttpReply sounds_reply(const Engine& engine) {
    return json_reply(listing_to_json(engine.catalog().listing()));
}

HttpReply asset_reply(const Engine& engine, const std::string& category, const std::string& filename) {
    HttpReply r;
    Status st = engine.catalog().read_asset(category, filename, r.body);
    if (!ok(st)) {
        LOG_DEBUG << "Sound not found: " << category << "/" << filename;
        return error_reply(404, st, "");
    }
    r.content_type = SoundCatalog::media_type(filename);
    return r;
}

HttpReply analyze_reply(const Engine& engine, const std::string& wav_bytes) {
    if (!engine.ready()) return error_reply(503, Status::NotReady, "detector is not ready");
    if (wav_bytes.empty()) return error_reply(400, Status::DecodeError, "no audio uploaded");

    dsp::WavAudio wav;
    std::string error;
    Status st = dsp::decode_wav(wav_bytes, wav, error);
    if (!ok(st)) return error_reply(400, st, error);

    const int rate = engine.get_config().features.sample_rate;
    std::vector<float> samples = dsp::resample_linear(wav.samples, wav.sample_rate, rate);

    ClipAnalysis analysis;
    st = engine.analyze_clip(samples, analysis, error);
    if (st == Status::NotReady) return error_reply(503, st, error);
    if (!ok(st)) {
        LOG_ERROR << "Clip analysis failed: " << error;
        return error_reply(500, st, error);
    }

    Json::Value body = analysis_to_json(analysis);
    body["threshold"] = engine.get_config().detection.threshold;
    body["source_sample_rate"] = wav.sample_rate;
    body["source_channels"] = wav.channels;
    LOG_INFO << "Analyzed " << analysis.duration_seconds << " s clip: " << analysis.windows << " windows, p="
             << analysis.probability;
    return json_reply(body);
}

} // namespace peckwatch::protocol
