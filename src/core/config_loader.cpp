#include "core/config_loader.h"
#include "core/logger.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

static void applyYaml(const YAML::Node& root, SinkholeConfig& cfg) {
    if (root["server"]) {
        auto s = root["server"];
        if (s["host"])    cfg.host    = s["host"].as<std::string>();
        if (s["port"])    cfg.port    = s["port"].as<int>();
        if (s["workers"]) cfg.workers = s["workers"].as<int>();
        if (s["listen"]) {
            std::string listen = s["listen"].as<std::string>();
            if (!ConfigLoader::parseListenAddress(listen, cfg.host, cfg.port))
                throw std::runtime_error("server.listen must be HOST:PORT, got '" + listen + "'");
        }
    }

    if (root["pool"]) {
        auto p = root["pool"];
        if (p["cidr"]) cfg.cidr = p["cidr"].as<std::string>();
        if (p["seed"]) cfg.seed = p["seed"].as<uint32_t>();
    }

    if (root["logging"]) {
        auto l = root["logging"];
        if (l["file"])      cfg.logFile      = l["file"].as<std::string>();
        if (l["level"])     cfg.logLevel     = l["level"].as<std::string>();
        if (l["query_log"]) cfg.queryLogFile = l["query_log"].as<std::string>();
    }

    if (root["metrics"]) {
        auto m = root["metrics"];
        if (m["enabled"]) cfg.metricsEnabled = m["enabled"].as<bool>();
        if (m["host"])    cfg.metricsHost    = m["host"].as<std::string>();
        if (m["port"])    cfg.metricsPort    = m["port"].as<int>();
    }
}

SinkholeConfig ConfigLoader::loadFromFile(const std::string& path) {
    SinkholeConfig cfg;

    try {
        applyYaml(YAML::LoadFile(path), cfg);
    } catch (const std::exception& ex) {
        Logger::instance().log(
            LogLevel::Error,
            "Failed to load config " + path + ": " + ex.what());
        throw;
    }

    return cfg;
}

SinkholeConfig ConfigLoader::loadFromString(const std::string& yaml) {
    SinkholeConfig cfg;
    applyYaml(YAML::Load(yaml), cfg);
    return cfg;
}

bool ConfigLoader::parseListenAddress(const std::string& listen, std::string& host, int& port) {
    size_t colon = listen.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == listen.size())
        return false;

    std::string portText = listen.substr(colon + 1);
    if (portText.size() > 5 ||
        !std::all_of(portText.begin(), portText.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
        return false;

    host = listen.substr(0, colon);
    port = std::stoi(portText);
    return true;
}

static int parseCount(const std::string& option, const std::string& value) {
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size())
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    return n;
}

CommandLine ConfigLoader::parseCommandLine(const std::vector<std::string>& args) {
    CommandLine cmd;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
            continue;
        }

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size())
                throw std::invalid_argument("missing value for " + arg);
            return args[++i];
        };

        if (arg == "--config")                      cmd.configPath = value();
        else if (arg == "-c" || arg == "--cidr")    cmd.cidr = value();
        else if (arg == "-l" || arg == "--listen")  cmd.listen = value();
        else if (arg == "-w" || arg == "--workers") cmd.workers = parseCount(arg, value());
        else if (arg == "--log-level")              cmd.logLevel = value();
        else
            throw std::invalid_argument("unknown option " + arg);
    }

    return cmd;
}

void ConfigLoader::applyOverrides(SinkholeConfig& cfg, const CommandLine& cmd) {
    if (cmd.cidr)     cfg.cidr = *cmd.cidr;
    if (cmd.workers)  cfg.workers = *cmd.workers;
    if (cmd.logLevel) cfg.logLevel = *cmd.logLevel;
    if (cmd.listen) {
        if (!parseListenAddress(*cmd.listen, cfg.host, cfg.port))
            throw std::invalid_argument("--listen must be HOST:PORT, got '" + *cmd.listen + "'");
    }
}

void ConfigLoader::validateConfig(const SinkholeConfig& cfg) {
    std::vector<std::string> errors;

    if (cfg.cidr.empty()) {
        errors.push_back("pool.cidr is required (or pass --cidr)");
    }
    if (cfg.host.empty()) {
        errors.push_back("server.host is required");
    }

    if (cfg.port <= 0 || cfg.port > 65535) {
        errors.push_back("server.port must be between 1-65535");
    }
    if (cfg.workers < 1 || cfg.workers > 64) {
        errors.push_back("server.workers must be between 1-64");
    }

    LogLevel level = LogLevel::Info;
    if (!logLevelFromString(cfg.logLevel, level)) {
        errors.push_back("logging.level must be one of: debug, info, warn, error");
    }

    if (cfg.metricsEnabled) {
        if (cfg.metricsHost.empty()) {
            errors.push_back("metrics.host cannot be empty");
        }
        if (cfg.metricsPort <= 0 || cfg.metricsPort > 65535) {
            errors.push_back("metrics.port must be between 1-65535");
        }
        if (cfg.metricsPort == cfg.port) {
            errors.push_back("metrics.port and server.port must be different");
        }
    }

    if (!errors.empty()) {
        std::string errorMsg = "Configuration validation failed:\n";
        for (const auto& error : errors) {
            errorMsg += "  - " + error + "\n";
        }
        throw std::runtime_error("Invalid configuration: " + errorMsg);
    }
}

const char* ConfigLoader::usage() {
    return
        "Usage: sinkholed [options]\n"
        "  --config PATH          YAML configuration file\n"
        "  -c, --cidr CIDR        address block to answer from, e.g. 192.167.0.0/16\n"
        "  -l, --listen HOST:PORT UDP address to listen on\n"
        "  -w, --workers N        number of receive threads\n"
        "      --log-level LEVEL  debug, info, warn or error\n"
        "  -h, --help             show this help\n";
}
