// Liquid - Configuration Implementation

#include "liquid/config.hpp"
#include "liquid/errors.hpp"
#include "liquid/math.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <fstream>
#include <sstream>

namespace liquid {

namespace {

constexpr I128 DEFAULT_MIN_ORDER_WEI = 100000000000000LL;  // 0.0001 ether

void validate_pool_params(uint32_t fee, int32_t spacing, int32_t lower, int32_t upper) {
    if (fee > fees::FEE_MAX) {
        throw ConfigError("pool_fee above maximum");
    }
    if (spacing <= 0) {
        throw ConfigError("tick_spacing must be positive");
    }
    if (lower >= upper) {
        throw ConfigError("lp_tick_lower must be below lp_tick_upper");
    }
    if (lower < tick_math::MIN_TICK || upper > tick_math::MAX_TICK) {
        throw ConfigError("lp tick range outside supported ticks");
    }
    if (lower % spacing != 0 || upper % spacing != 0) {
        throw ConfigError("lp ticks must be multiples of tick_spacing");
    }
}

// Amounts may be given as JSON numbers or decimal strings (wei exceeds 2^53)
I128 read_amount(const nlohmann::json& value) {
    if (value.is_string()) {
        return parse_i128(value.get<std::string>());
    }
    if (value.is_number_integer()) {
        return static_cast<I128>(value.get<int64_t>());
    }
    throw ConfigError("amount must be an integer or decimal string");
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

ConfigStore::ConfigStore()
    : min_order_size_(DEFAULT_MIN_ORDER_WEI),
      protocol_fee_recipient_(addresses::from_id(0xfee)),
      pool_fee_(fees::FEE_100),
      tick_spacing_(tick_spacings::TICK_SPACING_100),
      lp_tick_lower_(138200),
      lp_tick_upper_(184200),
      burner_max_slippage_bps_(500),
      log_level_("info") {}

ConfigStore ConfigStore::from_json(const nlohmann::json& j) {
    ConfigStore config;
    try {
        FeeConfig fees = config.fees_;
        if (j.contains("total_fee_bps")) fees.total_fee_bps = j.at("total_fee_bps").get<uint32_t>();
        if (j.contains("creator_fee_bps")) fees.creator_fee_bps = j.at("creator_fee_bps").get<uint32_t>();
        if (j.contains("burn_bps")) fees.burn_bps = j.at("burn_bps").get<uint32_t>();
        if (j.contains("protocol_bps")) fees.protocol_bps = j.at("protocol_bps").get<uint32_t>();
        if (j.contains("referrer_bps")) fees.referrer_bps = j.at("referrer_bps").get<uint32_t>();
        config.set_fee_config(fees);

        if (j.contains("min_order_size_wei")) {
            config.set_min_order_size(read_amount(j.at("min_order_size_wei")));
        }
        if (j.contains("protocol_fee_recipient")) {
            config.set_protocol_fee_recipient(
                addresses::from_hex(j.at("protocol_fee_recipient").get<std::string>()));
        }

        uint32_t fee = j.value("pool_fee", config.pool_fee_);
        int32_t spacing = j.value("tick_spacing", config.tick_spacing_);
        int32_t lower = j.value("lp_tick_lower", config.lp_tick_lower_);
        int32_t upper = j.value("lp_tick_upper", config.lp_tick_upper_);
        config.set_pool_params(fee, spacing, lower, upper);

        if (j.contains("burner_max_slippage_bps")) {
            config.set_burner_max_slippage_bps(j.at("burner_max_slippage_bps").get<uint32_t>());
        }
        if (j.contains("log_level")) {
            config.set_log_level(j.at("log_level").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }
    return config;
}

ConfigStore ConfigStore::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse config file " + path_str + ": " + e.what());
    }
    return from_json(j);
}

// =============================================================================
// Validation
// =============================================================================

void ConfigStore::validate(const FeeConfig& fees) {
    if (fees.total_fee_bps > bps::DENOMINATOR) {
        throw ConfigError("total_fee_bps above 100%");
    }
    if (fees.creator_fee_bps > bps::DENOMINATOR) {
        throw ConfigError("creator_fee_bps above 100%");
    }
    uint64_t split = static_cast<uint64_t>(fees.burn_bps) + fees.protocol_bps + fees.referrer_bps;
    if (split != bps::DENOMINATOR) {
        throw ConfigError("burn_bps + protocol_bps + referrer_bps must equal 10000");
    }
}

// =============================================================================
// Writers
// =============================================================================

void ConfigStore::set_fee_config(const FeeConfig& fees) {
    validate(fees);
    fees_ = fees;
}

void ConfigStore::set_min_order_size(I128 wei) {
    if (wei < 0) {
        throw ConfigError("min_order_size must not be negative");
    }
    min_order_size_ = wei;
}

void ConfigStore::set_protocol_fee_recipient(const Address& recipient) {
    if (addresses::is_zero(recipient)) {
        throw ConfigError("protocol_fee_recipient must not be the zero address");
    }
    protocol_fee_recipient_ = recipient;
}

void ConfigStore::set_pool_params(uint32_t fee, int32_t tick_spacing,
                                  int32_t tick_lower, int32_t tick_upper) {
    validate_pool_params(fee, tick_spacing, tick_lower, tick_upper);
    pool_fee_ = fee;
    tick_spacing_ = tick_spacing;
    lp_tick_lower_ = tick_lower;
    lp_tick_upper_ = tick_upper;
}

void ConfigStore::set_burner_max_slippage_bps(uint32_t slippage_bps) {
    if (slippage_bps > bps::DENOMINATOR) {
        throw ConfigError("burner_max_slippage_bps above 100%");
    }
    burner_max_slippage_bps_ = slippage_bps;
}

void ConfigStore::set_burn_accumulator(IBurnAccumulator* accumulator) {
    burn_accumulator_ = accumulator;
}

void ConfigStore::set_log_level(const std::string& level) {
    if (level != "off" && spdlog::level::from_str(level) == spdlog::level::off) {
        throw ConfigError("unknown log_level: " + level);
    }
    log_level_ = level;
}

}  // namespace liquid
