#ifndef LIQUID_CONFIG_HPP
#define LIQUID_CONFIG_HPP

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace liquid {

class IBurnAccumulator;

// =============================================================================
// Fee Configuration
// =============================================================================

struct FeeConfig {
    uint32_t total_fee_bps{100};      // fee charged on every trade
    uint32_t creator_fee_bps{5000};   // creator share of the fee
    uint32_t burn_bps{0};             // shares of the remainder; sum to 10000
    uint32_t protocol_bps{5000};
    uint32_t referrer_bps{5000};
};

// =============================================================================
// IConfigSource - read contract consumed by trades and the burner.
// Values are read on every operation; nothing is cached by consumers.
// =============================================================================

class IConfigSource {
public:
    virtual ~IConfigSource() = default;

    virtual FeeConfig fee_config() const = 0;
    virtual I128 min_order_size() const = 0;
    virtual Address protocol_fee_recipient() const = 0;

    // Venue position for new tokens
    virtual uint32_t pool_fee() const = 0;
    virtual int32_t tick_spacing() const = 0;
    virtual int32_t lp_tick_lower() const = 0;
    virtual int32_t lp_tick_upper() const = 0;

    virtual uint32_t burner_max_slippage_bps() const = 0;

    // May be null: burn shares then go to protocol
    virtual IBurnAccumulator* burn_accumulator() const = 0;

    virtual std::string log_level() const = 0;
};

// =============================================================================
// ConfigStore - validated, writable configuration
// =============================================================================

class ConfigStore : public IConfigSource {
public:
    ConfigStore();

    // Load from JSON; missing keys keep their defaults. Throws ConfigError.
    static ConfigStore from_json(const nlohmann::json& j);
    static ConfigStore from_file(std::string_view path);

    // IConfigSource
    FeeConfig fee_config() const override { return fees_; }
    I128 min_order_size() const override { return min_order_size_; }
    Address protocol_fee_recipient() const override { return protocol_fee_recipient_; }
    uint32_t pool_fee() const override { return pool_fee_; }
    int32_t tick_spacing() const override { return tick_spacing_; }
    int32_t lp_tick_lower() const override { return lp_tick_lower_; }
    int32_t lp_tick_upper() const override { return lp_tick_upper_; }
    uint32_t burner_max_slippage_bps() const override { return burner_max_slippage_bps_; }
    IBurnAccumulator* burn_accumulator() const override { return burn_accumulator_; }
    std::string log_level() const override { return log_level_; }

    // Writers validate first; a rejected write leaves the store unchanged
    void set_fee_config(const FeeConfig& fees);
    void set_min_order_size(I128 wei);
    void set_protocol_fee_recipient(const Address& recipient);
    void set_pool_params(uint32_t fee, int32_t tick_spacing,
                         int32_t tick_lower, int32_t tick_upper);
    void set_burner_max_slippage_bps(uint32_t slippage_bps);
    void set_burn_accumulator(IBurnAccumulator* accumulator);
    void set_log_level(const std::string& level);

    static void validate(const FeeConfig& fees);

private:
    FeeConfig fees_;
    I128 min_order_size_;
    Address protocol_fee_recipient_;
    uint32_t pool_fee_;
    int32_t tick_spacing_;
    int32_t lp_tick_lower_;
    int32_t lp_tick_upper_;
    uint32_t burner_max_slippage_bps_;
    IBurnAccumulator* burn_accumulator_{nullptr};
    std::string log_level_;
};

} // namespace liquid

#endif // LIQUID_CONFIG_HPP
