#include <catch2/catch.hpp>

#include "core/config_loader.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

TEST_CASE("config sections are read from YAML", "[config]") {
    SinkholeConfig cfg = ConfigLoader::loadFromString(R"(
server:
  host: 127.0.0.1
  port: 5300
  workers: 4
pool:
  cidr: 10.20.0.0/16
  seed: 42
logging:
  level: debug
  query_log: /tmp/queries.jsonl
metrics:
  enabled: true
  host: 0.0.0.0
  port: 9300
)");

    CHECK(cfg.host == "127.0.0.1");
    CHECK(cfg.port == 5300);
    CHECK(cfg.workers == 4);
    CHECK(cfg.cidr == "10.20.0.0/16");
    CHECK(cfg.seed == 42);
    CHECK(cfg.logLevel == "debug");
    CHECK(cfg.logFile.empty());
    CHECK(cfg.queryLogFile == "/tmp/queries.jsonl");
    CHECK(cfg.metricsEnabled);
    CHECK(cfg.metricsHost == "0.0.0.0");
    CHECK(cfg.metricsPort == 9300);
    CHECK_NOTHROW(ConfigLoader::validateConfig(cfg));
}

TEST_CASE("missing sections keep defaults", "[config]") {
    SinkholeConfig cfg = ConfigLoader::loadFromString("pool:\n  cidr: 192.167.0.0/16\n");
    CHECK(cfg.host == "0.0.0.0");
    CHECK(cfg.port == 53);
    CHECK(cfg.workers == 1);
    CHECK(cfg.seed == 0);
    CHECK_FALSE(cfg.metricsEnabled);
}

TEST_CASE("metrics endpoint binds loopback unless configured", "[config]") {
    SinkholeConfig cfg = ConfigLoader::loadFromString(R"(
server:
  host: 0.0.0.0
pool:
  cidr: 192.167.0.0/16
metrics:
  enabled: true
)");
    CHECK(cfg.host == "0.0.0.0");
    CHECK(cfg.metricsHost == "127.0.0.1");
    CHECK_NOTHROW(ConfigLoader::validateConfig(cfg));

    cfg.metricsHost.clear();
    CHECK_THROWS_WITH(ConfigLoader::validateConfig(cfg),
                      Catch::Contains("metrics.host"));
}

TEST_CASE("server.listen sets host and port together", "[config]") {
    SinkholeConfig cfg = ConfigLoader::loadFromString("server:\n  listen: 127.0.0.2:1053\n");
    CHECK(cfg.host == "127.0.0.2");
    CHECK(cfg.port == 1053);

    CHECK_THROWS_AS(ConfigLoader::loadFromString("server:\n  listen: nowhere\n"), std::runtime_error);
}

TEST_CASE("loadFromFile reads the file and fails on a missing one", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "sinkhole_config_test.yml";
    {
        std::ofstream out(path);
        out << "pool:\n  cidr: 10.0.0.0/8\nserver:\n  port: 8053\n";
    }
    SinkholeConfig cfg = ConfigLoader::loadFromFile(path.string());
    CHECK(cfg.cidr == "10.0.0.0/8");
    CHECK(cfg.port == 8053);
    std::filesystem::remove(path);

    CHECK_THROWS(ConfigLoader::loadFromFile("/nonexistent/sinkhole.yml"));
}

TEST_CASE("listen addresses split into host and port", "[config]") {
    std::string host;
    int port = 0;

    REQUIRE(ConfigLoader::parseListenAddress("0.0.0.0:53", host, port));
    CHECK(host == "0.0.0.0");
    CHECK(port == 53);

    CHECK_FALSE(ConfigLoader::parseListenAddress("0.0.0.0", host, port));
    CHECK_FALSE(ConfigLoader::parseListenAddress(":53", host, port));
    CHECK_FALSE(ConfigLoader::parseListenAddress("0.0.0.0:", host, port));
    CHECK_FALSE(ConfigLoader::parseListenAddress("0.0.0.0:dns", host, port));
}

TEST_CASE("command line options override the file", "[config]") {
    CommandLine cmd = ConfigLoader::parseCommandLine(
        {"--config", "my.yml", "-c", "10.1.0.0/16", "--listen", "127.0.0.1:5353",
         "-w", "3", "--log-level", "warn"});

    REQUIRE(cmd.configPath);
    CHECK(*cmd.configPath == "my.yml");
    CHECK_FALSE(cmd.help);

    SinkholeConfig cfg;
    cfg.cidr = "192.167.0.0/16";
    ConfigLoader::applyOverrides(cfg, cmd);
    CHECK(cfg.cidr == "10.1.0.0/16");
    CHECK(cfg.host == "127.0.0.1");
    CHECK(cfg.port == 5353);
    CHECK(cfg.workers == 3);
    CHECK(cfg.logLevel == "warn");
}

TEST_CASE("command line errors are reported", "[config]") {
    CHECK(ConfigLoader::parseCommandLine({"-h"}).help);
    CHECK_THROWS_AS(ConfigLoader::parseCommandLine({"--bogus"}), std::invalid_argument);
    CHECK_THROWS_AS(ConfigLoader::parseCommandLine({"--cidr"}), std::invalid_argument);
    CHECK_THROWS_AS(ConfigLoader::parseCommandLine({"-w", "many"}), std::invalid_argument);

    SinkholeConfig cfg;
    CHECK_THROWS_AS(ConfigLoader::applyOverrides(cfg, ConfigLoader::parseCommandLine({"-l", "localhost"})),
                    std::invalid_argument);
}

TEST_CASE("validation lists every problem", "[config]") {
    SinkholeConfig cfg;
    cfg.port = 70000;
    cfg.workers = 0;
    cfg.logLevel = "loud";
    cfg.metricsEnabled = true;
    cfg.metricsPort = 70000;

    try {
        ConfigLoader::validateConfig(cfg);
        FAIL("validation passed");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        CHECK(msg.find("pool.cidr") != std::string::npos);
        CHECK(msg.find("server.port") != std::string::npos);
        CHECK(msg.find("server.workers") != std::string::npos);
        CHECK(msg.find("logging.level") != std::string::npos);
        CHECK(msg.find("metrics.port") != std::string::npos);
    }

    SinkholeConfig clash;
    clash.cidr = "10.0.0.0/8";
    clash.metricsEnabled = true;
    clash.metricsPort = clash.port;
    CHECK_THROWS_WITH(ConfigLoader::validateConfig(clash),
                      Catch::Contains("must be different"));
}
