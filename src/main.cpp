#include "core/config_loader.h"
#include "core/errors.h"
#include "core/logger.h"
#include "core/random_source.h"
#include "core/readiness_state.h"
#include "dns/address_pool.h"
#include "dns/query_responder.h"
#include "monitoring/http_metrics_server.h"
#include "server/query_log.h"
#include "server/udp_server.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = ConfigLoader::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << ConfigLoader::usage();
        return 1;
    }
    if (cmd.help) {
        std::cout << ConfigLoader::usage();
        return 0;
    }

    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // 1) Configuration: --config, then CONFIG_PATH, then config/sinkhole.yml if present
        std::string configPath;
        if (cmd.configPath) {
            configPath = *cmd.configPath;
        } else if (const char* envConfig = std::getenv("CONFIG_PATH")) {
            configPath = envConfig;
        } else if (std::filesystem::exists("config/sinkhole.yml")) {
            configPath = "config/sinkhole.yml";
        }

        SinkholeConfig cfg = configPath.empty()
            ? SinkholeConfig{}
            : ConfigLoader::loadFromFile(configPath);
        ConfigLoader::applyOverrides(cfg, cmd);
        ConfigLoader::validateConfig(cfg);

        // 2) Logging
        LogLevel level = LogLevel::Info;
        logLevelFromString(cfg.logLevel, level);
        Logger::instance().setLevel(level);
        Logger::instance().setFile(cfg.logFile);
        if (!configPath.empty())
            Logger::instance().log(LogLevel::Info, "Loaded configuration from " + configPath);

        // 3) Address pool: an unusable network aborts startup
        AddressPool pool = AddressPool::fromCidr(cfg.cidr);
        Logger::instance().log(LogLevel::Info,
            "Answering from " + pool.toString() + " (" +
            pool.firstUsable().toString() + " - " + pool.lastUsable().toString() + ")");

        std::unique_ptr<RandomSource> rng;
        if (cfg.seed != 0) {
            rng = std::make_unique<SeededRandom>(cfg.seed);
            Logger::instance().log(LogLevel::Warn,
                "Using seeded random source (seed " + std::to_string(cfg.seed) + ")");
        } else {
            rng = std::make_unique<SecureRandom>();
        }
        PoolAddressSupplier supplier(pool, *rng);

        std::unique_ptr<QueryLog> queryLog;
        if (!cfg.queryLogFile.empty()) {
            queryLog = std::make_unique<QueryLog>(cfg.queryLogFile);
            Logger::instance().log(LogLevel::Info, "Query log: " + cfg.queryLogFile);
        }

        // 4) Monitoring
        HttpMetricsServer metrics;
        if (cfg.metricsEnabled && !metrics.start(cfg.metricsHost, cfg.metricsPort)) {
            return 2;
        }

        // 5) DNS listener
        UdpServer server(cfg.host, cfg.port, cfg.workers, supplier, queryLog.get());
        if (!server.start()) {
            return 2;
        }
        ReadinessStateMachine::instance().setState(ReadinessState::READY);

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // 6) Shutdown
        ReadinessStateMachine::instance().setState(ReadinessState::STOPPING, "signal received");
        server.stop();
        metrics.stop();
        Logger::instance().log(LogLevel::Info, "Sinkhole stopped");
        return 0;
    }
    catch (const SinkholeError& ex) {
        Logger::instance().log(LogLevel::Error,
            std::string("Cannot build address pool: ") + ex.what());
        return 1;
    }
    catch (const std::exception& ex) {
        Logger::instance().log(LogLevel::Error, std::string("Fatal error: ") + ex.what());
        return 1;
    }
}
