// =============================================================================
// settlement_guard.cpp - Single-flight callback guard and payload codec
// =============================================================================

#include "liquid/settlement_guard.hpp"
#include "liquid/errors.hpp"
#include "liquid/log.hpp"

#include <algorithm>

namespace liquid {

namespace {

constexpr uint8_t PAYLOAD_TAG = 0x4c;
constexpr size_t CONTEXT_SIZE = 1 + 1 + 16 + 16 + 20 + 16;
constexpr size_t DELTA_SIZE = 32;

void put_i128(std::vector<uint8_t>& out, I128 value) {
    U128 bits = static_cast<U128>(value);
    for (int i = 15; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((bits >> (8 * i)) & 0xFF));
    }
}

I128 get_i128(const std::vector<uint8_t>& data, size_t offset) {
    U128 bits = 0;
    for (size_t i = 0; i < 16; ++i) {
        bits = (bits << 8) | data[offset + i];
    }
    return static_cast<I128>(bits);
}

} // anonymous namespace

const char* settlement_kind_name(SettlementKind kind) {
    switch (kind) {
        case SettlementKind::Buy: return "buy";
        case SettlementKind::Sell: return "sell";
        case SettlementKind::Seed: return "seed";
        case SettlementKind::Harvest: return "harvest";
        case SettlementKind::Flush: return "flush";
    }
    return "unknown";
}

// =============================================================================
// Payload Codec
// =============================================================================

namespace payload {

std::vector<uint8_t> encode(const SettlementContext& ctx) {
    std::vector<uint8_t> out;
    out.reserve(CONTEXT_SIZE);
    out.push_back(PAYLOAD_TAG);
    out.push_back(static_cast<uint8_t>(ctx.kind));
    put_i128(out, ctx.amount);
    put_i128(out, ctx.price_limit);
    out.insert(out.end(), ctx.requester.begin(), ctx.requester.end());
    put_i128(out, ctx.min_out);
    return out;
}

std::optional<SettlementContext> decode(const std::vector<uint8_t>& data) {
    if (data.size() != CONTEXT_SIZE || data[0] != PAYLOAD_TAG) {
        return std::nullopt;
    }
    uint8_t kind = data[1];
    if (kind < static_cast<uint8_t>(SettlementKind::Buy) ||
        kind > static_cast<uint8_t>(SettlementKind::Flush)) {
        return std::nullopt;
    }

    SettlementContext ctx{};
    ctx.kind = static_cast<SettlementKind>(kind);
    ctx.amount = get_i128(data, 2);
    ctx.price_limit = get_i128(data, 18);
    std::copy(data.begin() + 34, data.begin() + 54, ctx.requester.begin());
    ctx.min_out = get_i128(data, 54);
    return ctx;
}

std::vector<uint8_t> encode_delta(const BalanceDelta& delta) {
    std::vector<uint8_t> out;
    out.reserve(DELTA_SIZE);
    put_i128(out, delta.amount0);
    put_i128(out, delta.amount1);
    return out;
}

BalanceDelta decode_delta(const std::vector<uint8_t>& data) {
    if (data.size() != DELTA_SIZE) {
        throw VenueError(errors::PAYLOAD_MISMATCH, "malformed settlement result");
    }
    return BalanceDelta{get_i128(data, 0), get_i128(data, 16)};
}

} // namespace payload

// =============================================================================
// SettlementGuard
// =============================================================================

SettlementGuard::SettlementGuard(const Address& venue) : venue_(venue) {}

void SettlementGuard::arm(const SettlementContext& ctx) {
    if (context_ || in_flight_) {
        log::get()->error("settlement guard: {} attempted while another settlement is live",
                          settlement_kind_name(ctx.kind));
        throw GuardViolation(errors::REENTRANCY, "SettlementGuard: already armed");
    }
    context_ = ctx;
    in_flight_ = true;
}

SettlementContext SettlementGuard::consume(const Address& caller,
                                           const std::vector<uint8_t>& data) {
    if (caller != venue_) {
        log::get()->error("settlement guard: callback from {} rejected (not the venue)",
                          addresses::to_hex(caller));
        throw GuardViolation(errors::UNAUTHORIZED_CALLBACK,
                             "SettlementGuard: caller is not the venue");
    }
    if (!context_) {
        log::get()->error("settlement guard: callback with no active settlement");
        throw GuardViolation(errors::NO_ACTIVE_SETTLEMENT,
                             "SettlementGuard: no active settlement");
    }
    auto decoded = payload::decode(data);
    if (!decoded || *decoded != *context_) {
        log::get()->error("settlement guard: payload does not match armed {} context",
                          settlement_kind_name(context_->kind));
        throw GuardViolation(errors::PAYLOAD_MISMATCH,
                             "SettlementGuard: payload mismatch");
    }

    SettlementContext ctx = *context_;
    context_.reset();
    return ctx;
}

void SettlementGuard::clear() noexcept {
    context_.reset();
    in_flight_ = false;
}

SettlementGuard::Scope::Scope(SettlementGuard& guard, const SettlementContext& ctx)
    : guard_(guard), payload_(payload::encode(ctx)) {
    guard_.arm(ctx);
}

SettlementGuard::Scope::~Scope() {
    guard_.clear();
}

} // namespace liquid
