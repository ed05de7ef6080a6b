// =============================================================================
// fees.cpp - Fee waterfall and distribution
// =============================================================================

#include "liquid/fees.hpp"
#include "liquid/math.hpp"
#include "liquid/errors.hpp"
#include "liquid/log.hpp"

namespace liquid {

I128 compute_fee(I128 amount, uint32_t fee_bps) {
    if (amount <= 0 || fee_bps == 0) return 0;
    return full_math::mul_div(amount, fee_bps, bps::DENOMINATOR);
}

FeeShares split_fee(I128 gross_fee, uint32_t creator_bps, uint32_t burn_bps,
                    uint32_t protocol_bps, uint32_t referrer_bps,
                    bool referrer_present) {
    (void)protocol_bps;  // protocol is the residual

    FeeShares shares{0, 0, 0, 0};
    if (gross_fee <= 0) return shares;

    shares.creator = full_math::mul_div(gross_fee, creator_bps, bps::DENOMINATOR);
    I128 remainder = gross_fee - shares.creator;

    shares.burn = full_math::mul_div(remainder, burn_bps, bps::DENOMINATOR);
    shares.referrer = referrer_present
        ? full_math::mul_div(remainder, referrer_bps, bps::DENOMINATOR)
        : 0;
    shares.protocol = remainder - shares.burn - shares.referrer;
    return shares;
}

// =============================================================================
// FeeDistributor
// =============================================================================

FeeDistributor::FeeDistributor(Chain& chain, const Currency& currency, const Address& payer)
    : chain_(chain), currency_(currency), payer_(payer) {}

bool FeeDistributor::try_pay(const Address& to, I128 amount, const char* role) {
    if (amount == 0) return true;
    if (addresses::is_zero(to)) return false;

    int32_t result = chain_.try_transfer(currency_, payer_, to, amount);
    if (result != errors::OK) {
        log::get()->warn("{} fee of {} to {} failed ({}), redirecting to protocol",
                         role, to_string(amount), addresses::to_hex(to), result);
        return false;
    }
    return true;
}

bool FeeDistributor::try_credit_burn(IBurnAccumulator* accumulator, I128 amount) {
    if (!accumulator || !currency_.is_native()) {
        log::get()->warn("burn credit of {} unavailable, redirecting to protocol",
                         to_string(amount));
        return false;
    }

    // A throwing deposit unwinds only its own effects. A declined one moves
    // nothing and keeps its outcome event.
    Chain::Checkpoint checkpoint(chain_);
    bool credited = false;
    try {
        credited = accumulator->deposit(payer_, amount);
    } catch (const GuardViolation&) {
        throw;
    } catch (const LiquidError& e) {
        log::get()->warn("burn accumulator deposit threw: {} (code {})", e.what(), e.code());
        log::get()->warn("burn credit of {} rejected, redirecting to protocol",
                         to_string(amount));
        return false;
    }
    checkpoint.commit();
    if (!credited) {
        log::get()->warn("burn credit of {} declined, redirecting to protocol",
                         to_string(amount));
    }
    return credited;
}

FeeDistribution FeeDistributor::distribute(const FeeShares& shares,
                                           const FeeRecipients& recipients,
                                           IBurnAccumulator* accumulator) {
    FeeDistribution out{0, 0, 0, 0, true};
    I128 protocol = shares.protocol;

    if (try_pay(recipients.creator, shares.creator, "creator")) {
        out.creator_paid = shares.creator;
    } else {
        protocol += shares.creator;
    }

    if (try_pay(recipients.referrer, shares.referrer, "referrer")) {
        out.referrer_paid = shares.referrer;
    } else {
        protocol += shares.referrer;
    }

    if (shares.burn > 0) {
        if (try_credit_burn(accumulator, shares.burn)) {
            out.burn_credited = shares.burn;
        } else {
            out.burn_credit_ok = false;
            protocol += shares.burn;
        }
    }

    // Final recipient: no further fallback
    if (protocol > 0) {
        int32_t result = errors::TRANSFER_FAILED;
        if (!addresses::is_zero(recipients.protocol)) {
            result = chain_.try_transfer(currency_, payer_, recipients.protocol, protocol);
        }
        if (result != errors::OK) {
            log::get()->error("protocol fee of {} to {} failed ({})", to_string(protocol),
                              addresses::to_hex(recipients.protocol), result);
            throw TransferError(errors::TRANSFER_FAILED, "protocol fee transfer failed");
        }
    }
    out.protocol_paid = protocol;
    return out;
}

} // namespace liquid
