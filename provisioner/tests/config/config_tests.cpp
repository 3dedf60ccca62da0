#include "../test_tools.hpp"
#include <catch2/catch_all.hpp>
#include <config/engine_config.hpp>
#include <errors/errors.hpp>

// NOLINTBEGIN
SCENARIO("Engine configuration is read from YAML", "[config]") {
    GIVEN("The sample configuration") {
        auto config = config::loadConfig(test::samples() / "config.yaml");
        THEN("Provisioner settings are read") {
            REQUIRE(config.fileRoot == "/srv/tftpboot");
            REQUIRE(config.provisionerUrl == "http://192.168.124.10:8091");
            REQUIRE(config.commandUrl == "https://192.168.124.10:3000");
            REQUIRE(config.storeRoot == "/srv/provisioner");
            REQUIRE(config.explodeIsoCommand == "/usr/local/bin/explode_iso.sh");
        }
        THEN("Logging settings are kept as written") {
            auto logConfig = config.logging.toLogConfig();
            REQUIRE(logConfig.level == "DEBUG");
            REQUIRE(logConfig.format == "json");
            REQUIRE_FALSE(logConfig.outputDirectory.has_value());
        }
    }
    GIVEN("A configuration that sets only the provisioner URL") {
        test::TempDir tempDir;
        auto path = tempDir.getDir() / "config.yaml";
        test::writeFile(path, "provisioner:\n  provisionerUrl: http://10.0.0.1:8091\n");
        auto config = config::loadConfig(path);
        THEN("Everything else keeps its default") {
            REQUIRE(config.provisionerUrl == "http://10.0.0.1:8091");
            REQUIRE(config.fileRoot == "/tftpboot");
            REQUIRE(config.storeRoot == "/var/lib/provisioner");
            REQUIRE(config.explodeIsoCommand == "/explode_iso.sh");
            REQUIRE_FALSE(config.logging.level.has_value());
        }
    }
    GIVEN("A missing configuration file") {
        THEN("A configuration error is raised") {
            REQUIRE_THROWS_AS(
                config::loadConfig("/nonexistent/provisioner.yaml"), errors::ConfigError);
        }
    }
    GIVEN("A configuration that is not YAML") {
        test::TempDir tempDir;
        auto path = tempDir.getDir() / "config.yaml";
        test::writeFile(path, "provisioner: [unterminated\n");
        THEN("A configuration error is raised") {
            REQUIRE_THROWS_AS(config::loadConfig(path), errors::ConfigError);
        }
    }
}
// NOLINTEND
