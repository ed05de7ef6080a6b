#ifndef LIQUID_TYPES_HPP
#define LIQUID_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <cstring>
#include <vector>

namespace liquid {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Venue singleton (v4-style pool manager)
constexpr Address POOL_MANAGER = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x90,0x10};

// Irrecoverable sink: 0x000000000000000000000000000000000000dEaD
constexpr Address BURN_SINK = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xde,0xad};

// Build an address whose low 8 bytes hold `id` (test fixtures, simulator)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// 0x-prefixed lowercase hex
std::string to_hex(const Address& addr);

// Parses 40 hex digits with optional 0x prefix; throws ConfigError otherwise
Address from_hex(const std::string& text);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18 (1 ether in wei)

namespace x18 {

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

} // namespace x18

// Decimal rendering of 128-bit integers (fmt and iostreams lack overloads)
std::string to_string(I128 value);

// Parses a decimal integer literal; throws ConfigError on junk or overflow
I128 parse_i128(const std::string& text);

// =============================================================================
// Basis Points
// =============================================================================

namespace bps {
constexpr uint32_t DENOMINATOR = 10000;  // 100%
constexpr uint32_t HALF = 5000;          // 50%
}

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const {
        for (auto b : addr) if (b != 0) return false;
        return true;
    }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// Native funding asset (address(0))
inline const Currency NATIVE{};

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;            // Fee in hundredths of a bip (3000 = 0.30%)
    int32_t tick_spacing;
    Address hooks;           // Always zero here; kept for key identity

    uint64_t id() const {
        uint64_t h = 0;
        for (auto b : currency0.addr) h = h * 31 + b;
        for (auto b : currency1.addr) h = h * 31 + b;
        h = h * 31 + fee;
        h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_spacing));
        for (auto b : hooks) h = h * 31 + b;
        return h;
    }

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
};

// Standard fee tiers (in hundredths of a bip)
namespace fees {
constexpr uint32_t FEE_030 = 3000;    // 0.30%
constexpr uint32_t FEE_100 = 10000;   // 1.00%
constexpr uint32_t FEE_MAX = 100000;  // 10.00%
constexpr uint32_t DENOMINATOR = 1000000;
}

// Standard tick spacings
namespace tick_spacings {
constexpr int32_t TICK_SPACING_030 = 60;
constexpr int32_t TICK_SPACING_100 = 200;
}

// =============================================================================
// Balance Delta (Signed Token Amounts)
// Positive = owed to the pool by the locker, negative = owed to the locker.
// =============================================================================

struct BalanceDelta {
    I128 amount0;
    I128 amount1;

    BalanceDelta operator-(const BalanceDelta& other) const {
        return {amount0 - other.amount0, amount1 - other.amount1};
    }

    BalanceDelta operator-() const {
        return {-amount0, -amount1};
    }

    bool operator==(const BalanceDelta& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
};

// =============================================================================
// Swap Parameters (exact input only)
// =============================================================================

struct SwapParams {
    bool zero_for_one;       // true = sell currency0 for currency1
    I128 amount_in;          // exact input amount, > 0
    I128 sqrt_price_limit;   // Q64.96; 0 = no limit
};

// =============================================================================
// Modify Liquidity Parameters
// =============================================================================

struct ModifyLiquidityParams {
    int32_t tick_lower;
    int32_t tick_upper;
    I128 liquidity_delta;    // positive = add, negative = remove, 0 = poke
    uint64_t salt;
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t POOL_NOT_INITIALIZED = -1;
constexpr int32_t POOL_ALREADY_INITIALIZED = -2;
constexpr int32_t INVALID_TICK_RANGE = -3;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -4;
constexpr int32_t PRICE_LIMIT_EXCEEDED = -5;
constexpr int32_t CURRENCIES_NOT_SORTED = -7;
constexpr int32_t INVALID_FEE = -8;
constexpr int32_t INVALID_PRICE = -9;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t TRANSFER_FAILED = -11;
constexpr int32_t CURRENCY_NOT_SETTLED = -12;
constexpr int32_t ZERO_AMOUNT = -13;
constexpr int32_t ORDER_TOO_SMALL = -14;
constexpr int32_t ZERO_ADDRESS = -15;
constexpr int32_t SLIPPAGE_EXCEEDED = -16;
constexpr int32_t PARTIAL_FILL = -17;
constexpr int32_t ALREADY_INITIALIZED = -18;
constexpr int32_t NOT_INITIALIZED = -19;
constexpr int32_t INVALID_CONFIG = -20;
constexpr int32_t MANAGER_LOCKED = -21;
constexpr int32_t MANAGER_NOT_UNLOCKED = -22;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t UNAUTHORIZED_CALLBACK = -31;
constexpr int32_t NO_ACTIVE_SETTLEMENT = -32;
constexpr int32_t PAYLOAD_MISMATCH = -33;
constexpr int32_t UNAUTHORIZED = -40;
}

} // namespace liquid

#endif // LIQUID_TYPES_HPP
