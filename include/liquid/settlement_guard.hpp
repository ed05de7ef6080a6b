#ifndef LIQUID_SETTLEMENT_GUARD_HPP
#define LIQUID_SETTLEMENT_GUARD_HPP

#include <optional>
#include <vector>

#include "types.hpp"

namespace liquid {

// =============================================================================
// Settlement Context
// =============================================================================

enum class SettlementKind : uint8_t {
    Buy = 1,
    Sell = 2,
    Seed = 3,
    Harvest = 4,
    Flush = 5,
};

const char* settlement_kind_name(SettlementKind kind);

struct SettlementContext {
    SettlementKind kind;
    I128 amount;          // exact input (buy/sell/flush), liquidity (seed)
    I128 price_limit;     // Q64.96, 0 = none
    Address requester;
    I128 min_out;

    bool operator==(const SettlementContext& other) const {
        return kind == other.kind && amount == other.amount &&
               price_limit == other.price_limit && requester == other.requester &&
               min_out == other.min_out;
    }
    bool operator!=(const SettlementContext& other) const { return !(*this == other); }
};

// =============================================================================
// Payload Codec (opaque bytes passed through PoolManager::unlock)
// =============================================================================

namespace payload {

std::vector<uint8_t> encode(const SettlementContext& ctx);

// nullopt when the bytes are not a well-formed context
std::optional<SettlementContext> decode(const std::vector<uint8_t>& data);

// Callback results travel back the same way
std::vector<uint8_t> encode_delta(const BalanceDelta& delta);
BalanceDelta decode_delta(const std::vector<uint8_t>& data);

} // namespace payload

// =============================================================================
// SettlementGuard - single-flight context for venue callbacks
// States: Idle, Armed(ctx). in_flight() stays set until the venue call
// returns, so a second arm inside the callback is still rejected.
// =============================================================================

class SettlementGuard {
public:
    explicit SettlementGuard(const Address& venue);

    // Throws GuardViolation(REENTRANCY) if armed or in flight
    void arm(const SettlementContext& ctx);

    // Verifies the callback and moves Armed -> Idle. Checks, in order:
    // caller is the venue, a context is armed, payload decodes to it.
    // A rejected call leaves the guard untouched.
    SettlementContext consume(const Address& caller, const std::vector<uint8_t>& data);

    // Back to Idle with nothing in flight
    void clear() noexcept;

    bool armed() const { return context_.has_value(); }
    bool in_flight() const { return in_flight_; }
    const Address& venue() const { return venue_; }

    // Arms on construction, clears on destruction (whether or not a
    // callback fired)
    class Scope {
    public:
        Scope(SettlementGuard& guard, const SettlementContext& ctx);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        const std::vector<uint8_t>& payload() const { return payload_; }

    private:
        SettlementGuard& guard_;
        std::vector<uint8_t> payload_;
    };

private:
    Address venue_;
    std::optional<SettlementContext> context_;
    bool in_flight_{false};
};

} // namespace liquid

#endif // LIQUID_SETTLEMENT_GUARD_HPP
