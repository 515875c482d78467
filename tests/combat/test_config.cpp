// skirmish_combat encounter configuration tests

#include <catch2/catch_test_macros.hpp>
#include <skirmish/combat/config.hpp>
#include <skirmish/core/log.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace skirmish_combat;
using skirmish_core::ConfigError;
using skirmish_core::ErrorCode;

TEST_CASE("EncounterConfig: defaults", "[combat][config]") {
    EncounterConfig config;
    REQUIRE_FALSE(config.seed.has_value());
    REQUIRE(config.initiative_order.empty());
    REQUIRE(config.verbose);
    REQUIRE(config.max_stalled_decisions == 0);
    REQUIRE(config.log_level.empty());
}

TEST_CASE("EncounterConfig: parse from JSON", "[combat][config]") {
    SECTION("all fields") {
        auto result = parse_encounter_config(R"({
            "seed": 42,
            "initiative": ["hero", "boar"],
            "verbose": false,
            "max_stalled_decisions": 16,
            "log_level": "debug"
        })");

        REQUIRE(result.is_ok());
        const EncounterConfig& config = *result;
        REQUIRE(config.seed == 42u);
        REQUIRE(config.initiative_order == std::vector<CombatantId>{"hero", "boar"});
        REQUIRE_FALSE(config.verbose);
        REQUIRE(config.max_stalled_decisions == 16);
        REQUIRE(config.log_level == "debug");
    }

    SECTION("empty object keeps defaults") {
        auto result = parse_encounter_config("{}");
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result->seed.has_value());
        REQUIRE(result->verbose);
    }

    SECTION("serialized config parses back") {
        EncounterConfig config;
        config.seed = 7;
        config.initiative_order = {"a", "b"};
        config.max_stalled_decisions = 4;

        auto result = parse_encounter_config(encounter_config_to_json(config));
        REQUIRE(result.is_ok());
        REQUIRE(result->seed == 7u);
        REQUIRE(result->initiative_order == config.initiative_order);
        REQUIRE(result->max_stalled_decisions == 4);
    }
}

TEST_CASE("EncounterConfig: parse errors", "[combat][config]") {
    SECTION("malformed JSON") {
        auto result = parse_encounter_config("{ \"seed\": ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("root is not an object") {
        auto result = parse_encounter_config("[1, 2, 3]");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("negative seed") {
        auto result = parse_encounter_config(R"({"seed": -1})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(result.error().as<ConfigError>()->field == "seed");
    }

    SECTION("initiative with a non-string id") {
        auto result = parse_encounter_config(R"({"initiative": ["hero", 3]})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->field == "initiative");
    }

    SECTION("verbose not a boolean") {
        auto result = parse_encounter_config(R"({"verbose": "yes"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->field == "verbose");
    }

    SECTION("unknown log level") {
        auto result = parse_encounter_config(R"({"log_level": "chatty"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->field == "log_level");
    }
}

TEST_CASE("EncounterConfig: load from file", "[combat][config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto result = load_encounter_config("does/not/exist/encounter.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("valid file") {
        fs::path path = fs::temp_directory_path() / "skirmish_test_encounter.json";
        {
            std::ofstream out(path);
            out << R"({"seed": 3, "verbose": false})";
        }

        auto result = load_encounter_config(path);
        fs::remove(path);

        REQUIRE(result.is_ok());
        REQUIRE(result->seed == 3u);
        REQUIRE_FALSE(result->verbose);
    }

    SECTION("invalid field in file carries the path") {
        fs::path path = fs::temp_directory_path() / "skirmish_test_bad_encounter.json";
        {
            std::ofstream out(path);
            out << R"({"max_stalled_decisions": "many"})";
        }

        auto result = load_encounter_config(path);
        fs::remove(path);

        REQUIRE(result.is_err());
        const std::string* file = result.error().get_context("file");
        REQUIRE(file != nullptr);
        REQUIRE(*file == path.string());
    }
}

TEST_CASE("EncounterConfig: log level", "[combat][config]") {
    auto previous = skirmish_core::get_global_log_level();

    EncounterConfig config;
    REQUIRE(apply_log_level(config));

    config.log_level = "warn";
    REQUIRE(apply_log_level(config));
    REQUIRE(skirmish_core::get_global_log_level() == spdlog::level::warn);

    config.log_level = "loud";
    REQUIRE_FALSE(apply_log_level(config));

    skirmish_core::set_global_log_level(previous);
}
