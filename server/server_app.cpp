#include "server_app.hpp"
#include "http_routes.hpp"
#include "session_gateway.hpp"

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <algorithm>

namespace peckwatch {

bool apply_log_level(const std::string& level) {
    trantor::Logger::LogLevel l;
    if (level == "trace") l = trantor::Logger::kTrace;
    else if (level == "debug") l = trantor::Logger::kDebug;
    else if (level == "info") l = trantor::Logger::kInfo;
    else if (level == "warn") l = trantor::Logger::kWarn;
    else if (level == "error") l = trantor::Logger::kError;
    else return false;
    drogon::app().setLogLevel(l);
    trantor::Logger::setLogLevel(l);
    return true;
}

ServerApp::ServerApp(Engine& engine)
    : engine_(engine), gateway_(std::make_shared<SessionGateway>(engine)) {
    configure();
}

ServerApp::~ServerApp() = default;

void ServerApp::configure() {
    const ServerConfig& sc = engine_.get_config().server;
    if (!apply_log_level(sc.log_level)) {
        LOG_WARN << "Unknown log level '" << sc.log_level << "', using info";
        apply_log_level("info");
    }

    auto& app = drogon::app();
    app.addListener(sc.listen_address, static_cast<uint16_t>(sc.port));
    app.setThreadNum(static_cast<size_t>(sc.io_threads));
    app.setClientMaxBodySize(static_cast<size_t>(sc.max_upload_bytes));
    app.registerController(gateway_);
    register_http_routes(app, engine_);

    app.registerBeginningAdvice([this]() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            running_ = true;
        }
        state_cv_.notify_all();
    });

    if (sc.idle_timeout_seconds > 0.0f) {
        std::weak_ptr<SessionGateway> weak = gateway_;
        // Sweep four times per idle period
        const double every = std::max(1.0, static_cast<double>(sc.idle_timeout_seconds) / 4.0);
        app.registerBeginningAdvice([weak, every]() {
            drogon::app().getLoop()->runEvery(every, [weak]() {
                if (auto g = weak.lock()) g->sweep_idle();
            });
        });
    }
}

void ServerApp::run() {
    const ServerConfig& sc = engine_.get_config().server;
    if (engine_.ready()) {
        LOG_INFO << "peckwatch listening on " << sc.listen_address << ":" << sc.port << " with " << sc.io_threads
                 << " event loops";
    } else {
        LOG_ERROR << "peckwatch listening on " << sc.listen_address << ":" << sc.port
                  << " but NOT READY; sessions will be refused";
    }
    drogon::app().run();
}

void ServerApp::quit() {
    drogon::app().quit();
}

void ServerApp::wait_until_running() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this]() { return running_; });
}

bool ServerApp::running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

} // namespace peckwatch
