#include "classifier.hpp"
#include "command_line.hpp"
#include "engine.hpp"
#include "engine_config_io.hpp"
#include "server_app.hpp"

#include <trantor/utils/Logger.h>

#include <iostream>
#include <string>
#include <vector>

using namespace peckwatch;

int main(int argc, char* argv[]) {
    CommandLine cl;
    std::string error;
    if (!parse_command_line(argc, argv, cl, error)) {
        std::cerr << error << "\n";
        print_usage(argv[0], std::cerr);
        return 2;
    }
    if (cl.help) {
        std::cout << "peckwatch - woodpecker detection and deterrence server\n";
        print_usage(argv[0], std::cout);
        return 0;
    }

    EngineConfig cfg;
    if (!load_effective_config(cl, cfg, error)) {
        std::cerr << error << std::endl;
        return 2;
    }
    if (!cl.write_config_path.empty()) {
        if (!save_engine_config(cl.write_config_path, cfg)) {
            std::cerr << "Cannot write " << cl.write_config_path << std::endl;
            return 1;
        }
        std::cout << "Wrote " << cl.write_config_path << std::endl;
        return 0;
    }

    Engine engine(cfg, createClassifier(cfg.classifier));
    ServerApp server(engine);

    std::vector<std::string> problems;
    if (engine.start(problems)) {
        LOG_INFO << "Detector ready: threshold " << cfg.detection.threshold << ", cooldown "
                 << cfg.detection.cooldown_seconds << " s, default mode " << cfg.catalog.default_mode;
    } else {
        for (const auto& p : problems) LOG_ERROR << p;
    }

    server.run();
    return 0;
}
