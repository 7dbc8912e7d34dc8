#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "engine.hpp"

namespace peckwatch {

class SessionGateway;

// Wires an Engine into the Drogon application: listener, event loop
// threads, log level, routes, WebSocket gateway and the idle sweep.
class ServerApp {
public:
    explicit ServerApp(Engine& engine);
    ~ServerApp();

    // Blocks until quit() or a termination signal.
    void run();
    // Safe from any thread. Has no effect before the main loop runs; call
    // wait_until_running() first when run() was started on another thread.
    void quit();

    // Blocks until the main event loop has started.
    void wait_until_running();
    bool running() const;

    std::shared_ptr<SessionGateway> gateway() const { return gateway_; }

private:
    Engine& engine_;
    std::shared_ptr<SessionGateway> gateway_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool running_ = false;

    void configure();
};

// Maps "trace".."error" onto the Trantor logger; false for unknown names.
bool apply_log_level(const std::string& level);

} // namespace peckwatch
