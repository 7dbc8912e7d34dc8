#include "fake_classifier.hpp"
#include "server_app.hpp"
#include "test_check.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace peckwatch;
namespace fs = std::filesystem;

static void log_levels_by_name() {
    for (const char* level : {"trace", "debug", "info", "warn", "error"}) CHECK(apply_log_level(level));
    CHECK(!apply_log_level("loud"));
    CHECK(!apply_log_level(""));
    CHECK(apply_log_level("warn"));
}

// The event loop can be started once per process, so start and stop are
// checked together.
static void quit_from_another_thread_stops_run() {
    fs::path root = fs::temp_directory_path() / "peckwatch_server_app";
    fs::remove_all(root);
    fs::create_directories(root / "predator_owl");
    std::ofstream(root / "predator_owl" / "hoot.mp3") << "owl";

    EngineConfig cfg;
    cfg.catalog.sounds_dir = root.string();
    cfg.server.listen_address = "127.0.0.1";
    cfg.server.port = 18787;
    cfg.server.io_threads = 1;
    cfg.server.log_level = "warn";
    Engine engine(cfg, std::make_unique<ScriptedClassifier>());
    std::vector<std::string> errors;
    CHECK(engine.start(errors));

    ServerApp server(engine);
    CHECK(!server.running());
    CHECK(server.gateway() != nullptr);

    std::thread loop([&server]() { server.run(); });
    server.wait_until_running();
    CHECK(server.running());
    server.quit();
    loop.join();
    fs::remove_all(root);
}

int main() {
    RUN_TEST(log_levels_by_name);
    RUN_TEST(quit_from_another_thread_stops_run);
    return test_check::finish("server_app_test");
}
