#ifndef LIQUID_FEES_HPP
#define LIQUID_FEES_HPP

#include "types.hpp"
#include "chain.hpp"

namespace liquid {

// =============================================================================
// Burn Accumulator (deposit side)
// =============================================================================

class IBurnAccumulator {
public:
    virtual ~IBurnAccumulator() = default;

    virtual const Address& address() const = 0;

    // Pull `amount` of the native currency from `from` into the pending
    // balance. Returns false (and moves nothing) when the deposit cannot be
    // taken; callers redirect the funds instead.
    virtual bool deposit(const Address& from, I128 amount) = 0;
};

// =============================================================================
// Fee Waterfall
// =============================================================================

struct FeeShares {
    I128 creator;
    I128 burn;
    I128 protocol;
    I128 referrer;

    I128 total() const { return creator + burn + protocol + referrer; }
};

// floor(amount * fee_bps / 10000); the single fee formula for trades and quotes
I128 compute_fee(I128 amount, uint32_t fee_bps);

// Splits gross_fee: creator takes its share off the top, the remainder is
// divided between burn, referrer (only when present) and protocol. Protocol
// absorbs the rounding dust, so total() == gross_fee for every input.
// The split bps are trusted to sum to 10000 (ConfigStore enforces it).
FeeShares split_fee(I128 gross_fee, uint32_t creator_bps, uint32_t burn_bps,
                    uint32_t protocol_bps, uint32_t referrer_bps,
                    bool referrer_present);

// =============================================================================
// Fee Distributor - pays shares out with fallback to protocol
// =============================================================================

struct FeeRecipients {
    Address creator;
    Address referrer;    // zero = none
    Address protocol;
};

struct FeeDistribution {
    I128 creator_paid;
    I128 referrer_paid;
    I128 burn_credited;
    I128 protocol_paid;     // includes every redirected share
    bool burn_credit_ok;    // false when a non-zero burn share went to protocol
};

class FeeDistributor {
public:
    // Pays out of `payer`'s balance of `currency`
    FeeDistributor(Chain& chain, const Currency& currency, const Address& payer);

    // Attempts creator, referrer, then the burn credit; each failure adds its
    // share to protocol. Protocol is paid last, once. Throws TransferError if
    // the protocol payment fails.
    FeeDistribution distribute(const FeeShares& shares, const FeeRecipients& recipients,
                               IBurnAccumulator* accumulator);

private:
    bool try_pay(const Address& to, I128 amount, const char* role);
    bool try_credit_burn(IBurnAccumulator* accumulator, I128 amount);

    Chain& chain_;
    Currency currency_;
    Address payer_;
};

} // namespace liquid

#endif // LIQUID_FEES_HPP
