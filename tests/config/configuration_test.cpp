#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

#include "faastel/core/config/configuration.hpp"

namespace {

std::filesystem::path write_temp_config(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream output(path, std::ios::trunc);
    output << content;
    return path;
}

}  // namespace

TEST_CASE("Configuration file parsing", "[config]") {
    using faastel::core::config::Configuration;

    auto path = write_temp_config("faastel_configuration_test.toml", R"(
# leading comment
top_level = 7

[export]
base_endpoint = "https://api.openobserve.ai/"   # trailing comment
organization = "acme"
stream = "lambda # not a comment"
verify_tls = false

[functions]
simulated_latency_ms = 25
names = ["demo", "api"]

[[logging.sinks]]
type = "console"

[[logging.sinks]]
type = "file"
path = "/tmp/faastel.log"
)");

    auto config = Configuration::load_from_file(path);
    REQUIRE(config.source_path() == path);

    SECTION("Sections become dotted keys") {
        REQUIRE(config.get_int("top_level") == 7);
        REQUIRE(config.get_string("export.base_endpoint") == "https://api.openobserve.ai/");
        REQUIRE(config.get_string("export.organization") == "acme");
        REQUIRE(config.get_int("functions.simulated_latency_ms") == 25);
    }

    SECTION("Comments") {
        REQUIRE(config.get_string("export.stream") == "lambda # not a comment");
        REQUIRE_FALSE(config.contains("# leading comment"));
    }

    SECTION("Booleans and defaults") {
        REQUIRE(config.get_bool("export.verify_tls", true) == false);
        REQUIRE(config.get_bool("export.flush_on_span_end", true) == true);
        REQUIRE(config.get_int("export.missing", 42) == 42);
        REQUIRE(config.get_string("export.missing", "fallback") == "fallback");
    }

    SECTION("Lists") {
        auto names = config.get_list("functions.names");
        REQUIRE(names.size() == 2);
        REQUIRE(names[0] == "demo");
        REQUIRE(names[1] == "api");
        REQUIRE(config.get_list("export.organization").empty());
    }

    SECTION("Array tables are indexed") {
        REQUIRE(config.get_string("logging.sinks[0].type") == "console");
        REQUIRE(config.get_string("logging.sinks[1].type") == "file");
        REQUIRE(config.get_string("logging.sinks[1].path") == "/tmp/faastel.log");
        REQUIRE_FALSE(config.contains("logging.sinks[2].type"));
    }

    std::filesystem::remove(path);
}

TEST_CASE("Configuration errors", "[config]") {
    using faastel::core::config::Configuration;

    SECTION("Missing file throws") {
        auto missing = std::filesystem::temp_directory_path() / "faastel_does_not_exist.toml";
        std::filesystem::remove(missing);
        REQUIRE_THROWS_AS(Configuration::load_from_file(missing), std::runtime_error);
    }

    SECTION("Malformed integers fall back to the default") {
        Configuration config;
        config.set("export.request_timeout_ms", "2s");
        REQUIRE(config.get_int("export.request_timeout_ms", 2000) == 2000);
    }
}

TEST_CASE("Environment overlay", "[config]") {
    using faastel::core::config::Configuration;
    using faastel::core::config::EnvironmentBinding;

    std::map<std::string, std::string> environment{
        {"OPENOBSERVE_ORGANIZATION", "from-env"},
        {"OPENOBSERVE_STREAM", ""},
    };
    auto lookup = [&environment](const char* name) -> const char* {
        auto it = environment.find(name);
        return it == environment.end() ? nullptr : it->second.c_str();
    };

    Configuration config;
    config.set("export.organization", "\"from-file\"");
    config.set("export.stream", "\"default\"");

    auto applied = config.overlay_environment(Configuration::default_environment_bindings(), lookup);

    REQUIRE(applied == 1);
    REQUIRE(config.get_string("export.organization") == "from-env");
    // Empty variables do not override
    REQUIRE(config.get_string("export.stream") == "default");
    REQUIRE_FALSE(config.contains("export.username"));

    SECTION("Custom bindings") {
        std::vector<EnvironmentBinding> bindings{{"runtime.region", "OPENOBSERVE_ORGANIZATION"}};
        REQUIRE(config.overlay_environment(bindings, lookup) == 1);
        REQUIRE(config.get_string("runtime.region") == "from-env");
    }
}

TEST_CASE("String helpers", "[config]") {
    using faastel::core::config::Configuration;

    REQUIRE(Configuration::trim("  value \t") == "value");
    REQUIRE(Configuration::trim("   ").empty());
    REQUIRE(Configuration::strip_quotes("\"quoted\"") == "quoted");
    REQUIRE(Configuration::strip_quotes("'single'") == "single");
    REQUIRE(Configuration::strip_quotes("\"") == "\"");
}
