// skirmish_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <skirmish/core/error.hpp>
#include <string>
#include <vector>

using namespace skirmish_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("CombatError::action_not_available") {
        Error err = CombatError::action_not_available("hero", "FIREBALL");
        REQUIRE(err.code() == ErrorCode::NotAvailable);
        REQUIRE(err.is<CombatError>());
        const auto* combat = err.as<CombatError>();
        REQUIRE(combat != nullptr);
        REQUIRE(combat->kind == CombatError::Kind::ActionNotAvailable);
        REQUIRE(combat->combatant_id == "hero");
        REQUIRE(combat->action_id == "FIREBALL");
    }

    SECTION("CombatError::invalid_roster") {
        Error err = CombatError::invalid_roster("empty party");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message().find("empty party") != std::string::npos);
    }

    SECTION("CombatError::invalid_state") {
        Error err = CombatError::invalid_state("not started");
        REQUIRE(err.code() == ErrorCode::InvalidState);
    }

    SECTION("CombatError::stalled") {
        Error err = CombatError::stalled("boar", 8);
        REQUIRE(err.code() == ErrorCode::Stalled);
        REQUIRE(err.as<CombatError>()->combatant_id == "boar");
    }

    SECTION("ConfigError::file_not_found") {
        Error err = ConfigError::file_not_found("missing.json");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.as<ConfigError>()->source == "missing.json");
    }

    SECTION("ConfigError::malformed") {
        Error err = ConfigError::malformed("<string>", "unexpected end");
        REQUIRE(err.code() == ErrorCode::ParseError);
    }

    SECTION("ConfigError::invalid_field") {
        Error err = ConfigError::invalid_field("seed", "expected a number");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.as<ConfigError>()->field == "seed");
        REQUIRE_FALSE(err.is<CombatError>());
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    std::string chain = build_error_chain(CombatError::action_not_available("hero", "FIREBALL"));
    REQUIRE(chain.find("[NotAvailable]") != std::string::npos);
    REQUIRE(chain.find("[CombatError]") != std::string::npos);
    REQUIRE(chain.find("combatant: hero") != std::string::npos);
    REQUIRE(chain.find("action: FIREBALL") != std::string::npos);
    REQUIRE(chain.find("with") == std::string::npos);

    Error config_error = ConfigError::invalid_field("verbose", "expected a boolean");
    config_error.with_context("file", "duel.json");
    std::string config_chain = build_error_chain(config_error);
    REQUIRE(config_chain.find("[ValidationError]") != std::string::npos);
    REQUIRE(config_chain.find("field: verbose") != std::string::npos);
    REQUIRE(config_chain.find("file=duel.json") != std::string::npos);

    REQUIRE(build_error_chain(Error("plain")) == "[Unknown] plain");
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    debug::record_error(CombatError::invalid_state("x"));
    debug::record_error(CombatError::invalid_state("y"));
    debug::record_error(ConfigError::malformed("y", "z"));
    debug::record_error(Error("plain"));

    REQUIRE(debug::total_error_count() == 4);
    REQUIRE(debug::error_count(ErrorCode::InvalidState) == 2);
    REQUIRE(debug::error_count(ErrorCode::ParseError) == 1);
    REQUIRE(debug::error_count(ErrorCode::Stalled) == 0);

    std::string summary = debug::error_stats_summary();
    REQUIRE(summary.find("InvalidState: 2") != std::string::npos);
    REQUIRE(summary.find("Stalled") == std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err void with combat error") {
        Result<void> r = Err(CombatError::invalid_roster("duplicate id"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("bool result keeps false as a value") {
        Result<bool> r = Ok(false);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(*r);
    }
}

TEST_CASE("Result moves its value out", "[core][result]") {
    Result<std::string> r = Ok(std::string("SLASH"));
    std::string taken = std::move(r).value();
    REQUIRE(taken == "SLASH");

    Result<void> failed = Err(Error(ErrorCode::InvalidState, "closed"));
    REQUIRE_FALSE(failed);
    REQUIRE(failed.error().message() == "closed");
}

TEST_CASE("Result with complex types", "[core][result]") {
    Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
    REQUIRE(r.is_ok());
    REQUIRE(r->size() == 3);
}
