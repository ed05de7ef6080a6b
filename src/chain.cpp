// =============================================================================
// chain.cpp - Custody and checkpoint implementation
// =============================================================================

#include "liquid/chain.hpp"
#include "liquid/errors.hpp"
#include "liquid/log.hpp"

#include <algorithm>

namespace liquid {

// =============================================================================
// Constructor
// =============================================================================

Chain::Chain() = default;

// =============================================================================
// Balances
// =============================================================================

I128 Chain::balance_of(const Address& owner, const Currency& currency) const {
    auto it = state_.balances.find({owner, currency.addr});
    return it != state_.balances.end() ? it->second : 0;
}

I128 Chain::total_supply(const Currency& currency) const {
    auto it = state_.supplies.find(currency.addr);
    return it != state_.supplies.end() ? it->second : 0;
}

void Chain::mint(const Currency& currency, const Address& to, I128 amount) {
    if (amount < 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "Chain: negative mint");
    }
    if (addresses::is_zero(to)) {
        throw ValidationError(errors::ZERO_ADDRESS, "Chain: mint to zero address");
    }
    state_.balances[{to, currency.addr}] += amount;
    state_.supplies[currency.addr] += amount;
}

void Chain::burn(const Currency& currency, const Address& from, I128 amount) {
    if (amount < 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "Chain: negative burn");
    }
    auto it = state_.balances.find({from, currency.addr});
    if (it == state_.balances.end() || it->second < amount) {
        throw TransferError(errors::INSUFFICIENT_BALANCE, "Chain: burn exceeds balance");
    }
    it->second -= amount;
    state_.supplies[currency.addr] -= amount;
}

int32_t Chain::try_transfer(const Currency& currency, const Address& from,
                            const Address& to, I128 amount) {
    if (amount < 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "Chain: negative transfer");
    }
    if (currency.is_native() && rejects_native(to)) {
        return errors::TRANSFER_FAILED;
    }
    if (amount == 0) {
        return errors::OK;
    }

    auto it = state_.balances.find({from, currency.addr});
    if (it == state_.balances.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    it->second -= amount;
    state_.balances[{to, currency.addr}] += amount;
    return errors::OK;
}

void Chain::transfer(const Currency& currency, const Address& from,
                     const Address& to, I128 amount) {
    int32_t result = try_transfer(currency, from, to, amount);
    if (result != errors::OK) {
        log::get()->debug("transfer of {} from {} to {} failed ({})",
                          to_string(amount), addresses::to_hex(from),
                          addresses::to_hex(to), result);
        throw TransferError(result, result == errors::INSUFFICIENT_BALANCE
            ? "Chain: insufficient balance"
            : "Chain: recipient rejected transfer");
    }
}

void Chain::set_rejects_native(const Address& addr, bool rejects) {
    if (rejects) {
        state_.native_rejecters.insert(addr);
    } else {
        state_.native_rejecters.erase(addr);
    }
}

bool Chain::rejects_native(const Address& addr) const {
    return state_.native_rejecters.count(addr) != 0;
}

// =============================================================================
// Checkpoints
// =============================================================================

void Chain::attach(Journaled* component) {
    if (!component || component == this) return;
    if (std::find(components_.begin(), components_.end(), component) == components_.end()) {
        components_.push_back(component);
    }
}

void Chain::detach(Journaled* component) {
    components_.erase(std::remove(components_.begin(), components_.end(), component),
                      components_.end());
}

std::function<void()> Chain::checkpoint() {
    State saved = state_;
    return [this, saved]() { state_ = saved; };
}

void Chain::defer(std::function<void()> notify) {
    if (open_checkpoints_ == 0) {
        notify();
        return;
    }
    deferred_.push_back(std::move(notify));
}

Chain::Checkpoint::Checkpoint(Chain& chain)
    : chain_(chain), deferred_mark_(chain.deferred_.size()) {
    restorers_.reserve(chain.components_.size() + 1);
    restorers_.push_back(chain.checkpoint());
    for (Journaled* component : chain.components_) {
        restorers_.push_back(component->checkpoint());
    }
    ++chain_.open_checkpoints_;
}

void Chain::Checkpoint::commit() {
    if (committed_) return;
    committed_ = true;
    if (chain_.open_checkpoints_ > 1) return;

    // Listeners may start new operations; hand them a drained queue
    std::vector<std::function<void()>> ready;
    ready.swap(chain_.deferred_);
    --chain_.open_checkpoints_;
    try {
        for (auto& notify : ready) {
            notify();
        }
    } catch (...) {
        ++chain_.open_checkpoints_;
        throw;
    }
    ++chain_.open_checkpoints_;
}

Chain::Checkpoint::~Checkpoint() {
    --chain_.open_checkpoints_;
    if (committed_) return;
    for (auto it = restorers_.rbegin(); it != restorers_.rend(); ++it) {
        (*it)();
    }
    if (chain_.deferred_.size() > deferred_mark_) {
        chain_.deferred_.resize(deferred_mark_);
    }
}

} // namespace liquid
