#ifndef LIQUID_CHAIN_HPP
#define LIQUID_CHAIN_HPP

#include <map>
#include <set>
#include <vector>
#include <functional>
#include <utility>

#include "types.hpp"

namespace liquid {

// =============================================================================
// Journaled - state that participates in all-or-nothing operations
// =============================================================================

class Journaled {
public:
    virtual ~Journaled() = default;

    // Capture the current state; invoking the result puts it back
    virtual std::function<void()> checkpoint() = 0;
};

// =============================================================================
// Chain - Custody of every currency plus world-state checkpoints
// =============================================================================

class Chain : public Journaled {
public:
    Chain();
    ~Chain() override = default;

    // Non-copyable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    // =========================================================================
    // Balances
    // =========================================================================

    I128 balance_of(const Address& owner, const Currency& currency) const;
    I128 total_supply(const Currency& currency) const;

    // Create/destroy supply (token contracts, test funding)
    void mint(const Currency& currency, const Address& to, I128 amount);
    void burn(const Currency& currency, const Address& from, I128 amount);

    // Returns errors::OK, errors::INSUFFICIENT_BALANCE or errors::TRANSFER_FAILED
    // (native recipient refuses value). Nothing moves unless OK.
    int32_t try_transfer(const Currency& currency, const Address& from,
                         const Address& to, I128 amount);

    // Same as try_transfer but throws TransferError on failure
    void transfer(const Currency& currency, const Address& from,
                  const Address& to, I128 amount);

    // Mark an address as unable to receive the native currency
    void set_rejects_native(const Address& addr, bool rejects);
    bool rejects_native(const Address& addr) const;

    // =========================================================================
    // Checkpoints
    // =========================================================================

    // Components attach themselves so a Checkpoint covers their state too
    void attach(Journaled* component);
    void detach(Journaled* component);

    std::function<void()> checkpoint() override;

    // Runs `notify` when the outermost open Checkpoint commits, or right away
    // when none is open. Dropped if the enclosing Checkpoint rolls back.
    void defer(std::function<void()> notify);

    // Snapshot of chain + attached components, restored on scope exit
    // unless commit() was called.
    class Checkpoint {
    public:
        explicit Checkpoint(Chain& chain);
        ~Checkpoint();

        Checkpoint(const Checkpoint&) = delete;
        Checkpoint& operator=(const Checkpoint&) = delete;

        // Outermost commit also delivers deferred notifications
        void commit();

    private:
        Chain& chain_;
        std::vector<std::function<void()>> restorers_;
        size_t deferred_mark_;
        bool committed_{false};
    };

private:
    struct State {
        // (owner, currency address) -> balance
        std::map<std::pair<Address, Address>, I128> balances;
        std::map<Address, I128> supplies;
        std::set<Address> native_rejecters;
    };

    State state_;
    std::vector<Journaled*> components_;

    // Not journaled: owned by the open Checkpoints
    std::vector<std::function<void()>> deferred_;
    int open_checkpoints_{0};
};

} // namespace liquid

#endif // LIQUID_CHAIN_HPP
