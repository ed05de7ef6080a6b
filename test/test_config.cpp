// Liquid - Configuration Tests

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "fixture.hpp"

using namespace liquid;
using namespace liquid::testing;

TEST_CASE("ConfigStore defaults", "[config]") {
    ConfigStore config;

    FeeConfig fees = config.fee_config();
    REQUIRE(fees.total_fee_bps == 100);
    REQUIRE(fees.creator_fee_bps == 5000);
    REQUIRE(fees.burn_bps + fees.protocol_bps + fees.referrer_bps == 10000);
    REQUIRE(config.min_order_size() > 0);
    REQUIRE_FALSE(addresses::is_zero(config.protocol_fee_recipient()));
    REQUIRE(config.lp_tick_lower() < config.lp_tick_upper());
    REQUIRE(config.burn_accumulator() == nullptr);
    REQUIRE(config.log_level() == "info");
    REQUIRE_NOTHROW(ConfigStore::validate(fees));
}

TEST_CASE("ConfigStore validates on write", "[config]") {
    ConfigStore config;
    const FeeConfig original = config.fee_config();

    SECTION("Split must total 100%") {
        REQUIRE_THROWS_AS(config.set_fee_config(FeeConfig{100, 5000, 3000, 3000, 3000}),
                          ConfigError);
        REQUIRE_THROWS_AS(config.set_fee_config(FeeConfig{100, 5000, 5000, 5000, 5000}),
                          ConfigError);
        // Rejected writes leave the store untouched
        REQUIRE(config.fee_config().protocol_bps == original.protocol_bps);
        REQUIRE(config.fee_config().burn_bps == original.burn_bps);
    }

    SECTION("Rates above 100%") {
        REQUIRE_THROWS_AS(config.set_fee_config(FeeConfig{10001, 5000, 0, 5000, 5000}),
                          ConfigError);
        REQUIRE_THROWS_AS(config.set_fee_config(FeeConfig{100, 10001, 0, 5000, 5000}),
                          ConfigError);
        REQUIRE_THROWS_AS(config.set_burner_max_slippage_bps(10001), ConfigError);
    }

    SECTION("Accepted write takes effect") {
        config.set_fee_config(FeeConfig{250, 2000, 1000, 6000, 3000});
        REQUIRE(config.fee_config().total_fee_bps == 250);
        REQUIRE(config.fee_config().burn_bps == 1000);
    }

    SECTION("Pool parameters") {
        REQUIRE_THROWS_AS(config.set_pool_params(10000, 200, 184200, 138200), ConfigError);
        REQUIRE_THROWS_AS(config.set_pool_params(10000, 200, 138100, 184200), ConfigError);
        REQUIRE_THROWS_AS(config.set_pool_params(10000, 0, 138200, 184200), ConfigError);
        REQUIRE_THROWS_AS(config.set_pool_params(fees::FEE_MAX + 1, 200, 138200, 184200),
                          ConfigError);
        config.set_pool_params(3000, 60, -600, 600);
        REQUIRE(config.tick_spacing() == 60);
        REQUIRE(config.lp_tick_lower() == -600);
    }

    SECTION("Other fields") {
        REQUIRE_THROWS_AS(config.set_min_order_size(-1), ConfigError);
        REQUIRE_THROWS_AS(config.set_protocol_fee_recipient(addresses::ZERO), ConfigError);
        REQUIRE_THROWS_AS(config.set_log_level("loud"), ConfigError);
        config.set_log_level("debug");
        REQUIRE(config.log_level() == "debug");
    }
}

TEST_CASE("ConfigStore JSON loading", "[config][json]") {
    SECTION("Full document") {
        auto j = nlohmann::json::parse(R"({
            "total_fee_bps": 200,
            "creator_fee_bps": 4000,
            "burn_bps": 2500,
            "protocol_bps": 5000,
            "referrer_bps": 2500,
            "min_order_size_wei": "1000000000000000",
            "protocol_fee_recipient": "0x00000000000000000000000000000000000000Aa",
            "pool_fee": 3000,
            "tick_spacing": 60,
            "lp_tick_lower": -6000,
            "lp_tick_upper": 6000,
            "burner_max_slippage_bps": 300,
            "log_level": "warn"
        })");
        ConfigStore config = ConfigStore::from_json(j);

        REQUIRE(config.fee_config().total_fee_bps == 200);
        REQUIRE(config.fee_config().creator_fee_bps == 4000);
        REQUIRE(config.fee_config().burn_bps == 2500);
        REQUIRE(config.min_order_size() == 1000000000000000LL);
        REQUIRE(config.protocol_fee_recipient() == addresses::from_id(0xaa));
        REQUIRE(config.pool_fee() == 3000);
        REQUIRE(config.tick_spacing() == 60);
        REQUIRE(config.lp_tick_lower() == -6000);
        REQUIRE(config.burner_max_slippage_bps() == 300);
        REQUIRE(config.log_level() == "warn");
    }

    SECTION("Missing keys keep defaults") {
        ConfigStore config = ConfigStore::from_json(nlohmann::json::object());
        REQUIRE(config.fee_config().total_fee_bps == ConfigStore().fee_config().total_fee_bps);
        REQUIRE(config.lp_tick_upper() == ConfigStore().lp_tick_upper());
    }

    SECTION("Invalid documents") {
        REQUIRE_THROWS_AS(ConfigStore::from_json(nlohmann::json{{"burn_bps", 9000}}), ConfigError);
        REQUIRE_THROWS_AS(ConfigStore::from_json(nlohmann::json{{"total_fee_bps", "lots"}}),
                          ConfigError);
        REQUIRE_THROWS_AS(ConfigStore::from_json(nlohmann::json{{"protocol_fee_recipient", "0x12"}}),
                          ConfigError);
        REQUIRE_THROWS_AS(ConfigStore::from_json(nlohmann::json{{"min_order_size_wei", "1e18"}}),
                          ConfigError);
    }

    SECTION("From file") {
        const std::string path = "liquid_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"total_fee_bps": 50, "log_level": "error"})";
        }
        ConfigStore config = ConfigStore::from_file(path);
        REQUIRE(config.fee_config().total_fee_bps == 50);
        REQUIRE(config.log_level() == "error");
        std::remove(path.c_str());

        REQUIRE_THROWS_AS(ConfigStore::from_file("does/not/exist.json"), ConfigError);
    }
}

TEST_CASE("Address and integer text", "[config][types]") {
    Address addr = addresses::from_id(0xdeadbeef);
    REQUIRE(addresses::to_hex(addr) == "0x00000000000000000000000000000000deadbeef");
    REQUIRE(addresses::from_hex("0x00000000000000000000000000000000DEADBEEF") == addr);
    REQUIRE_THROWS_AS(addresses::from_hex("0xzz000000000000000000000000000000deadbeef"), ConfigError);

    REQUIRE(to_string(parse_i128("-170141183460469231731687303715884105727")) ==
            "-170141183460469231731687303715884105727");
    REQUIRE(to_string(X18_ONE * 1000000000) == "1000000000000000000000000000");
    REQUIRE_THROWS_AS(parse_i128("170141183460469231731687303715884105728"), ConfigError);
}
