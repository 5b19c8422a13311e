// beacon_core ConfigManager tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <beacon/core/config.hpp>
#include <cstdlib>
#include <string>
#include <vector>

using namespace beacon_core;

// =============================================================================
// Value Parsing
// =============================================================================

TEST_CASE("parse_config_value", "[core][config]") {
    SECTION("booleans") {
        REQUIRE(std::get<bool>(parse_config_value("true")) == true);
        REQUIRE(std::get<bool>(parse_config_value("false")) == false);
    }

    SECTION("integers") {
        REQUIRE(std::get<std::int64_t>(parse_config_value("42")) == 42);
        REQUIRE(std::get<std::int64_t>(parse_config_value("-7")) == -7);
    }

    SECTION("floats") {
        REQUIRE(std::get<double>(parse_config_value("2.5")) == Catch::Approx(2.5));
    }

    SECTION("strings") {
        REQUIRE(std::get<std::string>(parse_config_value("debug")) == "debug");
        REQUIRE(std::get<std::string>(parse_config_value("12abc")) == "12abc");
        REQUIRE(std::get<std::string>(parse_config_value("")).empty());
    }
}

// =============================================================================
// Layers
// =============================================================================

TEST_CASE("ConfigLayer: basic operations", "[core][config]") {
    ConfigLayer layer("test", ConfigLayerPriority::Default);
    REQUIRE(layer.name() == "test");
    REQUIRE(layer.priority() == ConfigLayerPriority::Default);
    REQUIRE(layer.empty());

    layer.set("a", ConfigValue{std::int64_t(1)});
    layer.set("b", ConfigValue{true});
    REQUIRE(layer.size() == 2);
    REQUIRE(layer.contains("a"));
    REQUIRE(layer.get("a").has_value());
    REQUIRE_FALSE(layer.get("c").has_value());

    REQUIRE(layer.remove("a"));
    REQUIRE_FALSE(layer.remove("a"));
    REQUIRE(layer.keys() == std::vector<std::string>{"b"});

    layer.clear();
    REQUIRE(layer.empty());
}

TEST_CASE("ConfigManager: layer priority", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();
    REQUIRE(config.layer_count() == 4);

    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "info");

    config.set_string(config_keys::LOG_LEVEL, "warn", "environment");
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "warn");

    config.set_string(config_keys::LOG_LEVEL, "debug", "cmdline");
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "debug");

    config.set_string(config_keys::LOG_LEVEL, "trace");
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "trace");

    REQUIRE(config.remove_layer("runtime"));
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "debug");
}

TEST_CASE("ConfigManager: typed getters", "[core][config]") {
    ConfigManager config;
    config.create_default_layers();

    SECTION("missing keys fall back") {
        REQUIRE_FALSE(config.contains("missing"));
        REQUIRE(config.get_bool("missing", true));
        REQUIRE(config.get_int("missing", 9) == 9);
        REQUIRE(config.get_string("missing", "x") == "x");
        REQUIRE(config.get_string_array("missing").empty());
    }

    SECTION("string values are converted") {
        config.set_string("flag", "yes");
        config.set_string("count", "12");
        config.set_string("ratio", "0.25");
        REQUIRE(config.get_bool("flag"));
        REQUIRE(config.get_int("count") == 12);
        REQUIRE(config.get_float("ratio") == Catch::Approx(0.25));
    }

    SECTION("numeric values are converted") {
        config.set_int("count", 3);
        REQUIRE(config.get_string("count") == "3");
        REQUIRE(config.get_float("count") == Catch::Approx(3.0));
        REQUIRE(config.get_bool("count"));
    }

    SECTION("string arrays") {
        config.set("names", ConfigValue{std::vector<std::string>{"tick", "tock"}});
        REQUIRE(config.get_string_array("names").size() == 2);
    }
}

TEST_CASE("ConfigManager: change callbacks", "[core][config]") {
    ConfigManager config;
    config.create_default_layers();

    std::vector<std::string> changed;
    config.on_change([&changed](const std::string& key, const ConfigValue&) {
        changed.push_back(key);
    });

    config.set_bool(config_keys::CENTER_LOG_POSTS, true);
    config.set_int(config_keys::CENTER_MAX_OBSERVERS, 8);

    REQUIRE(changed == std::vector<std::string>{"center.log_posts", "center.max_observers"});
}

// =============================================================================
// Command Line and Environment
// =============================================================================

TEST_CASE("ConfigManager: parse_args", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("key=value, key value and bare flags") {
        auto result = config.parse_args(std::vector<std::string>{
            "program-input", "--log-level=debug", "--center-max_observers", "3", "--center-log_posts"});
        REQUIRE(result.is_ok());

        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "debug");
        REQUIRE(config.get_int(config_keys::CENTER_MAX_OBSERVERS) == 3);
        REQUIRE(config.get_bool(config_keys::CENTER_LOG_POSTS));
        REQUIRE_FALSE(config.contains("program-input"));
    }

    SECTION("argc/argv form skips the program name") {
        char program[] = "beacon";
        char option[] = "--center-name=ticks";
        char* argv[] = {program, option};
        REQUIRE(config.parse_args(2, argv).is_ok());
        REQUIRE(config.get_string(config_keys::CENTER_NAME) == "ticks");
    }

    SECTION("empty option name is rejected") {
        auto result = config.parse_args(std::vector<std::string>{"--=5"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE(result.error().is<ConfigError>());
    }
}

TEST_CASE("ConfigManager: load_environment", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    ::setenv("BEACON_TEST_CENTER_NAME", "from-env", 1);
    config.load_environment("BEACON_TEST_");
    ::unsetenv("BEACON_TEST_CENTER_NAME");

    REQUIRE(config.get_string(config_keys::CENTER_NAME) == "from-env");
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "info");
}
