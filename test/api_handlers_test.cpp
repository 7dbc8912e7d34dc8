#include "api_handlers.hpp"
#include "fake_classifier.hpp"
#include "test_check.hpp"

#include <json/json.h>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace peckwatch;
using namespace peckwatch::protocol;
namespace fs = std::filesystem;

static fs::path make_sounds(const std::string& name) {
    fs::path root = fs::temp_directory_path() / name;
    fs::remove_all(root);
    fs::create_directories(root / "predator_owl");
    fs::create_directories(root / "woodpecker_calls");
    std::ofstream(root / "predator_owl" / "hoot.mp3") << "owl";
    std::ofstream(root / "woodpecker_calls" / "call.wav") << "call";
    return root;
}

static EngineConfig config_for(const fs::path& sounds) {
    EngineConfig cfg;
    cfg.catalog.sounds_dir = sounds.string();
    return cfg;
}

static Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value v;
    std::string errs;
    reader->parse(text.data(), text.data() + text.size(), &v, &errs);
    return v;
}

static void put16(std::string& s, uint16_t v) {
    s.push_back(static_cast<char>(v & 0xFF));
    s.push_back(static_cast<char>(v >> 8));
}

static void put32(std::string& s, uint32_t v) {
    for (int i = 0; i < 4; ++i) s.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

// Mono 16-bit PCM WAV of a quiet tone
static std::string tone_wav(int sample_rate, double seconds) {
    std::string data;
    const int n = static_cast<int>(sample_rate * seconds);
    for (int i = 0; i < n; ++i) {
        const double v = 0.2 * std::sin(2.0 * M_PI * 440.0 * i / sample_rate);
        put16(data, static_cast<uint16_t>(static_cast<int16_t>(v * 32767.0)));
    }
    std::string file = "RIFF";
    put32(file, static_cast<uint32_t>(36 + data.size()));
    file += "WAVEfmt ";
    put32(file, 16);
    put16(file, 1);
    put16(file, 1);
    put32(file, static_cast<uint32_t>(sample_rate));
    put32(file, static_cast<uint32_t>(sample_rate * 2));
    put16(file, 2);
    put16(file, 16);
    file += "data";
    put32(file, static_cast<uint32_t>(data.size()));
    return file + data;
}

static void status_and_sounds_are_json() {
    fs::path root = make_sounds("peckwatch_api_listing");
    Engine engine(config_for(root), std::make_unique<ScriptedClassifier>());
    std::vector<std::string> errors;
    CHECK(engine.start(errors));

    HttpReply st = status_reply(engine);
    CHECK_EQ(st.status, 200);
    CHECK(st.content_type == "application/json");
    Json::Value status = parse(st.body);
    CHECK(status["ready"].asBool());
    CHECK(status["status"].asString() == "running");
    CHECK_EQ(status["total_sounds"].asUInt64(), 2u);

    HttpReply sounds = sounds_reply(engine);
    CHECK_EQ(sounds.status, 200);
    Json::Value listing = parse(sounds.body);
    CHECK(listing.isMember("predator_owl"));
    CHECK(listing["woodpecker_calls"][0].asString() == "call.wav");
    fs::remove_all(root);
}

static void assets_are_served_or_missing() {
    fs::path root = make_sounds("peckwatch_api_assets");
    Engine engine(config_for(root), std::make_unique<ScriptedClassifier>());
    std::vector<std::string> errors;
    CHECK(engine.start(errors));

    HttpReply hoot = asset_reply(engine, "predator_owl", "hoot.mp3");
    CHECK_EQ(hoot.status, 200);
    CHECK(hoot.body == "owl");
    CHECK(hoot.content_type == SoundCatalog::media_type("hoot.mp3"));
    CHECK(hoot.content_type != "application/json");

    for (const auto& miss : {std::make_pair("predator_owl", "nope.mp3"), std::make_pair("unknown", "hoot.mp3"),
                             std::make_pair("predator_owl", "..")}) {
        HttpReply r = asset_reply(engine, miss.first, miss.second);
        CHECK_EQ(r.status, 404);
        CHECK(r.content_type == "application/json");
        CHECK(parse(r.body)["error"].asString() == "not_found");
    }
    fs::remove_all(root);
}

static void analyze_classifies_uploaded_wav() {
    fs::path root = make_sounds("peckwatch_api_analyze");
    auto clf = std::make_unique<ScriptedClassifier>();
    clf->script({0.3f, 0.8f});
    Engine engine(config_for(root), std::move(clf));
    std::vector<std::string> errors;
    CHECK(engine.start(errors));

    // 1.5 s at 44.1 kHz is resampled to the feature rate: two windows
    HttpReply r = analyze_reply(engine, tone_wav(44100, 1.5));
    CHECK_EQ(r.status, 200);
    Json::Value v = parse(r.body);
    CHECK(v["detected"].asBool());
    CHECK_NEAR(v["probability"].asDouble(), 0.8, 1e-6);
    CHECK_NEAR(v["threshold"].asDouble(), 0.75, 1e-6);
    CHECK_EQ(v["windows"].asInt(), 2);
    CHECK_EQ(v["confidences"].size(), 2u);
    CHECK_NEAR(v["duration_seconds"].asDouble(), 1.5, 1e-3);
    CHECK_EQ(v["source_sample_rate"].asInt(), 44100);
    CHECK_EQ(engine.stats().totals().triggers, 0u);
    fs::remove_all(root);
}

static void analyze_reports_errors() {
    fs::path root = make_sounds("peckwatch_api_analyze_err");
    auto clf = std::make_unique<ScriptedClassifier>();
    clf->script({-1.0f});
    Engine engine(config_for(root), std::move(clf));
    std::vector<std::string> errors;
    CHECK(engine.start(errors));

    HttpReply empty = analyze_reply(engine, "");
    CHECK_EQ(empty.status, 400);
    CHECK(parse(empty.body)["error"].asString() == "decode_error");

    HttpReply garbage = analyze_reply(engine, "this is not audio at all");
    CHECK_EQ(garbage.status, 400);
    CHECK(parse(garbage.body)["error"].asString() == "decode_error");
    CHECK(!parse(garbage.body)["message"].asString().empty());

    HttpReply failed = analyze_reply(engine, tone_wav(22050, 0.5));
    CHECK_EQ(failed.status, 500);
    CHECK(parse(failed.body)["error"].asString() == "inference_error");
    fs::remove_all(root);
}

static void analyze_refused_when_not_ready() {
    fs::path root = make_sounds("peckwatch_api_noload");
    auto clf = std::make_unique<ScriptedClassifier>();
    clf->fail_load = true;
    Engine engine(config_for(root), std::move(clf));
    std::vector<std::string> errors;
    CHECK(!engine.start(errors));

    HttpReply r = analyze_reply(engine, tone_wav(22050, 1.0));
    CHECK_EQ(r.status, 503);
    CHECK(parse(r.body)["error"].asString() == "not_ready");

    HttpReply st = status_reply(engine);
    CHECK_EQ(st.status, 200);
    CHECK(!parse(st.body)["ready"].asBool());
    fs::remove_all(root);
}

int main() {
    RUN_TEST(status_and_sounds_are_json);
    RUN_TEST(assets_are_served_or_missing);
    RUN_TEST(analyze_classifies_uploaded_wav);
    RUN_TEST(analyze_reports_errors);
    RUN_TEST(analyze_refused_when_not_ready);
    return test_check::finish("api_handlers_test");
}
