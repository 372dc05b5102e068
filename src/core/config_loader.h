#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct SinkholeConfig {
    std::string host = "0.0.0.0";
    int port = 53;
    int workers = 1;

    std::string cidr;
    uint32_t seed = 0;                 // 0 = OpenSSL random source

    std::string logFile;               // empty = stdout
    std::string logLevel = "info";
    std::string queryLogFile;          // empty = disabled

    bool metricsEnabled = false;
    std::string metricsHost = "127.0.0.1";   // kept off the DNS interface by default
    int metricsPort = 9153;
};

// Options given on the command line; unset fields keep the file's values
struct CommandLine {
    std::optional<std::string> configPath;
    std::optional<std::string> cidr;
    std::optional<std::string> listen;
    std::optional<int> workers;
    std::optional<std::string> logLevel;
    bool help = false;
};

class ConfigLoader {
public:
    static SinkholeConfig loadFromFile(const std::string& path);
    static SinkholeConfig loadFromString(const std::string& yaml);

    // Throws std::invalid_argument on unknown options or missing values
    static CommandLine parseCommandLine(const std::vector<std::string>& args);
    static void applyOverrides(SinkholeConfig& cfg, const CommandLine& cmd);

    // Splits "host:port"; false if either part is missing or the port is not numeric
    static bool parseListenAddress(const std::string& listen, std::string& host, int& port);

    static void validateConfig(const SinkholeConfig& cfg);

    static const char* usage();
};
