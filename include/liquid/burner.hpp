#ifndef LIQUID_BURNER_HPP
#define LIQUID_BURNER_HPP

#include "types.hpp"
#include "chain.hpp"
#include "pool.hpp"
#include "fees.hpp"
#include "settlement_guard.hpp"

namespace liquid {

// =============================================================================
// Burn Events
// =============================================================================

struct BurnDeposit {
    Address from;
    I128 amount;
    bool success;
};

struct BurnFlush {
    Address caller;
    I128 amount_in;     // native currency swapped
    I128 burned;        // target currency sent to the sink
    bool success;
};

class IBurnListener {
public:
    virtual ~IBurnListener() = default;
    virtual void on_burn_deposit(const BurnDeposit& event) { (void)event; }
    virtual void on_burn_flush(const BurnFlush& event) { (void)event; }
};

// =============================================================================
// BurnAccumulator - buffers the burn share of fees and periodically swaps it
// into the target currency, which is sent to an unrecoverable sink
// =============================================================================

class BurnAccumulator : public IBurnAccumulator, public IUnlockCallback, public Journaled {
public:
    // `pool` pairs the native currency (currency0) with the target (currency1)
    BurnAccumulator(Chain& chain, PoolManager& manager, const Address& self,
                    const Address& owner, const PoolKey& pool,
                    uint32_t max_slippage_bps = 500);
    ~BurnAccumulator() override;

    BurnAccumulator(const BurnAccumulator&) = delete;
    BurnAccumulator& operator=(const BurnAccumulator&) = delete;

    // IBurnAccumulator
    const Address& address() const override { return self_; }
    bool deposit(const Address& from, I128 amount) override;

    // Swap the whole pending balance and send the output to the sink.
    // No-op (returns 0) when nothing is pending or the accumulator is
    // disabled. On failure throws and pending is left unchanged.
    I128 flush(const Address& caller);

    // flush() for implicit triggers: failures are logged, not thrown
    bool try_flush(const Address& caller);

    I128 pending_balance() const { return state_.pending; }
    I128 total_deposited() const { return state_.total_deposited; }
    I128 total_converted() const { return state_.total_converted; }
    I128 total_burned() const { return state_.total_burned; }

    bool enabled() const { return state_.enabled; }
    const PoolKey& pool() const { return state_.pool; }
    const Currency& target() const { return state_.pool.currency1; }
    const Address& sink() const { return state_.sink; }
    const Address& owner() const { return owner_; }
    uint32_t max_slippage_bps() const { return state_.max_slippage_bps; }
    bool flush_on_deposit() const { return state_.flush_on_deposit; }

    // =========================================================================
    // Owner-only configuration (throws Unauthorized)
    // =========================================================================

    void set_enabled(const Address& caller, bool enabled);
    void set_pool(const Address& caller, const PoolKey& pool);
    void set_max_slippage_bps(const Address& caller, uint32_t slippage_bps);
    void set_quoter(const Address& caller, const IQuoter* quoter);  // null = no floor
    void set_flush_on_deposit(const Address& caller, bool flush);
    void set_sink(const Address& caller, const Address& sink);

    void set_listener(IBurnListener* listener) { listener_ = listener; }

    // Venue entry point
    std::vector<uint8_t> unlock_callback(const Address& sender,
                                         const std::vector<uint8_t>& data) override;

    std::function<void()> checkpoint() override;

private:
    struct State {
        I128 pending;
        bool enabled;
        PoolKey pool;
        Address sink;
        uint32_t max_slippage_bps;
        const IQuoter* quoter;
        bool flush_on_deposit;
        I128 total_deposited;
        I128 total_converted;
        I128 total_burned;
    };

    void require_owner(const Address& caller, const char* op) const;
    I128 slippage_floor(I128 amount_in) const;
    void emit(const BurnDeposit& event);
    void emit(const BurnFlush& event);

    Chain& chain_;
    PoolManager& manager_;
    Address self_;
    Address owner_;
    State state_;
    SettlementGuard guard_;
    IBurnListener* listener_{nullptr};
};

} // namespace liquid

#endif // LIQUID_BURNER_HPP
