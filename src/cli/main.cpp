// File: src/cli/main.cpp
//
// Usage: aase_cli [--config engine.yaml] [--db path.db]

#include "cli/aase_cli.hpp"
#include "config/engine_config.hpp"
#include "core/logging.hpp"
#include <iostream>
#include <string>

using namespace aase;

int main(int argc, char** argv) {
    EngineConfig config = EngineConfig::Default();
    std::string db_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            auto loaded = EngineConfig::LoadFromFile(argv[++i]);
            if (!loaded) {
                std::cerr << "Could not load configuration\n";
                return 1;
            }
            config = *loaded;
        } else if (arg == "--db" && i + 1 < argc) {
            db_override = argv[++i];
        } else {
            std::cerr << "Usage: " << argv[0] << " [--config engine.yaml] [--db path.db]\n";
            return 2;
        }
    }
    if (!db_override.empty()) {
        config.storage.sqlite.db_path = db_override;
    }

    try {
        HybridEngine engine(config);
        AaseCli cli(engine);
        cli.Run();
    } catch (const std::exception& e) {
        log::Get()->critical("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
