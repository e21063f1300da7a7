#include "../include/bridge_app.hpp"
#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <string>

static volatile std::sig_atomic_t g_stop = 0;

static void onSignal(int) { g_stop = 1; }

int main(int argc, char** argv) {
    std::string config_file = "config/config.json";
    if (const char* env_path = std::getenv("TUYA_BRIDGE_CONFIG")) config_file = env_path;
    if (argc > 1) config_file = argv[1];

    ConfigManager config;
    try {
        config.load(config_file);
    } catch (const ConfigException& e) {
        Logger::error("Configuration error: %s", e.what());
        return 1;
    }
    Logger::begin(config.getLoggingConfig());

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    BridgeApp app;
    try {
        app.setup(config);
    } catch (const StorageException& e) {
        Logger::error("Storage error: %s", e.what());
        return 1;
    } catch (const HttpException& e) {
        Logger::error("HTTP client error: %s", e.what());
        return 1;
    }
    if (!app.start()) {
        Logger::error("Startup failed");
        return 1;
    }

    uint32_t ticks = 0;
    while (!g_stop) {
        app.loop();
        // Statistics every ~5 minutes
        if (++ticks % 1500 == 0) {
            char stats[256];
            app.getStatistics(stats, sizeof(stats));
            Logger::info("Stats: %s", stats);
        }
    }

    app.stop();
    Logger::info("Shutdown complete");
    Logger::shutdown();
    return 0;
}
