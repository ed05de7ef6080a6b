// Liquid - Trade Engine Tests

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace liquid;
using namespace liquid::testing;

namespace {

// 0.01 ether: 1% of 1 ether
constexpr I128 ONE_PERCENT = 10000000000000000LL;

template <typename Fn>
int32_t error_code(Fn&& fn) {
    try {
        fn();
    } catch (const LiquidError& e) {
        return e.code();
    }
    return errors::OK;
}

struct Snapshot {
    I128 alice_eth;
    I128 alice_tokens;
    I128 token_eth;
    I128 token_tokens;
    I128 venue_eth;
    I128 venue_tokens;
    I128 sqrt_price;

    bool operator==(const Snapshot& o) const {
        return alice_eth == o.alice_eth && alice_tokens == o.alice_tokens &&
               token_eth == o.token_eth && token_tokens == o.token_tokens &&
               venue_eth == o.venue_eth && venue_tokens == o.venue_tokens &&
               sqrt_price == o.sqrt_price;
    }
};

Snapshot snapshot(const World& w) {
    const Address venue = w.manager.address();
    return Snapshot{w.eth(ALICE), w.tokens(ALICE), w.eth(TOKEN), w.tokens(TOKEN),
                    w.eth(venue), w.tokens(venue), w.token->current_sqrt_price()};
}

} // namespace

TEST_CASE("Token initialization", "[token][init]") {
    World w;
    const TokenState& state = w.token->token_state();

    REQUIRE(state.initialized);
    REQUIRE(state.creator == CREATOR);
    REQUIRE(w.token->total_supply() == 1000000000 * ETHER);
    REQUIRE(w.tokens(CREATOR) == 100000000 * ETHER);
    REQUIRE(state.seed_allocation == 900000000 * ETHER);
    REQUIRE(state.seed_liquidity > 0);
    REQUIRE(w.manager.pool_exists(w.token_pool()));
    REQUIRE(w.token_pool().currency0 == NATIVE);
    REQUIRE(w.token_pool().currency1 == w.token->currency());

    // The seed lands in the venue apart from rounding dust
    REQUIRE(w.tokens(TOKEN) < ETHER);
    REQUIRE(w.tokens(w.manager.address()) + w.tokens(TOKEN) == state.seed_allocation);

    SECTION("Runs once") {
        REQUIRE(error_code([&] { w.token->initialize(CREATOR); }) == errors::ALREADY_INITIALIZED);
    }

    SECTION("Trading before initialize") {
        LiquidToken fresh(w.chain, w.manager, w.config, addresses::from_id(0x70d),
                          TokenParams{"Fresh", "FRS", 1000 * ETHER, 0});
        REQUIRE(error_code([&] { fresh.buy(ALICE, ETHER, ALICE, addresses::ZERO, 0); }) ==
                errors::NOT_INITIALIZED);
        REQUIRE(error_code([&] { fresh.initialize(addresses::ZERO); }) == errors::ZERO_ADDRESS);
    }

    SECTION("Bad supply") {
        REQUIRE_THROWS_AS(LiquidToken(w.chain, w.manager, w.config, addresses::from_id(0x70e),
                                      TokenParams{"Bad", "BAD", ETHER, ETHER}),
                          ValidationError);
    }
}

TEST_CASE("Buy", "[token][buy]") {
    World w;

    SECTION("1% fee split between creator and protocol") {
        I128 creator_before = w.eth(CREATOR);
        BuyQuote quote = w.token->quote_buy(ETHER);

        I128 out = w.token->buy(ALICE, ETHER, ALICE, addresses::ZERO, 0);

        REQUIRE(out == quote.tokens_out);
        REQUIRE(out > 0);
        REQUIRE(w.tokens(ALICE) == out);
        REQUIRE(w.eth(ALICE) == 99 * ETHER);
        REQUIRE(w.eth(CREATOR) - creator_before == ONE_PERCENT / 2);
        REQUIRE(w.eth(PROTOCOL) == ONE_PERCENT / 2);
        REQUIRE(w.eth(TOKEN) == 0);

        REQUIRE(w.recorder.trades.size() == 1);
        const TradeSettled& t = w.recorder.trades.back();
        REQUIRE(t.side == TradeSide::Buy);
        REQUIRE(t.gross == ETHER);
        REQUIRE(t.fee == ONE_PERCENT);
        REQUIRE(t.net == ETHER - ONE_PERCENT);
        REQUIRE(t.creator_fee == ONE_PERCENT / 2);
        REQUIRE(t.protocol_fee == ONE_PERCENT / 2);
        REQUIRE(t.referrer_fee == 0);
        REQUIRE(t.burn_fee == 0);
        REQUIRE(t.sqrt_price_after_x96 < t.sqrt_price_before_x96);
        REQUIRE(t.sqrt_price_after_x96 == quote.sqrt_price_after_x96);
    }

    SECTION("Referrer takes half of the remainder") {
        w.token->buy(ALICE, ETHER, ALICE, BOB, 0);
        REQUIRE(w.eth(BOB) == ONE_PERCENT / 4);
        REQUIRE(w.eth(PROTOCOL) == ONE_PERCENT / 4);
        REQUIRE(w.recorder.trades.back().referrer_fee == ONE_PERCENT / 4);
    }

    SECTION("Tokens can go to another recipient") {
        I128 out = w.token->buy(ALICE, ETHER, BOB, addresses::ZERO, 0);
        REQUIRE(w.tokens(BOB) == out);
        REQUIRE(w.tokens(ALICE) == 0);
    }

    SECTION("Price moves against repeated buys") {
        I128 first = w.token->buy(ALICE, ETHER, ALICE, addresses::ZERO, 0);
        I128 second = w.token->buy(ALICE, ETHER, ALICE, addresses::ZERO, 0);
        REQUIRE(second < first);
    }

    SECTION("Fee config changes apply to the next trade") {
        w.config.set_fee_config(FeeConfig{200, 5000, 0, 5000, 5000});
        REQUIRE(w.token->quote_buy(ETHER).fee_bps == 200);
        w.token->buy(ALICE, ETHER, ALICE, addresses::ZERO, 0);
        REQUIRE(w.recorder.trades.back().fee == 2 * ONE_PERCENT);
    }
}

TEST_CASE("Buy validation", "[token][buy]") {
    World w;
    const Snapshot before = snapshot(w);
    const Address none = addresses::ZERO;

    REQUIRE(error_code([&] { w.token->buy(ALICE, 0, ALICE, none, 0); }) == errors::ZERO_AMOUNT);
    REQUIRE(error_code([&] { w.token->buy(ALICE, 99999999999999LL, ALICE, none, 0); }) ==
            errors::ORDER_TOO_SMALL);
    REQUIRE(error_code([&] { w.token->buy(ALICE, ETHER, addresses::ZERO, none, 0); }) ==
            errors::ZERO_ADDRESS);
    REQUIRE(error_code([&] { w.token->buy(BOB, ETHER, BOB, none, 0); }) ==
            errors::INSUFFICIENT_BALANCE);

    BuyQuote quote = w.token->quote_buy(ETHER);
    REQUIRE(error_code([&] { w.token->buy(ALICE, ETHER, ALICE, none, quote.tokens_out + 1); }) ==
            errors::SLIPPAGE_EXCEEDED);

    REQUIRE(snapshot(w) == before);
    REQUIRE(w.recorder.trades.empty());
}

TEST_CASE("Buy price limits", "[token][buy][slippage]") {
    World w;
    const Address none = addresses::ZERO;

    SECTION("Limit at the quoted price fills exactly") {
        BuyQuote quote = w.token->quote_buy(ETHER);
        I128 out = w.token->buy(ALICE, ETHER, ALICE, none, 0, quote.sqrt_price_after_x96);
        REQUIRE(out == quote.tokens_out);
        REQUIRE(w.token->current_sqrt_price() == quote.sqrt_price_after_x96);
    }

    SECTION("Front-run past a tight limit is rejected") {
        BuyQuote quote = w.token->quote_buy(ETHER);
        I128 limit = quote.sqrt_price_after_x96 * 1002 / 1000;

        w.token->buy(WHALE, 20 * ETHER, WHALE, none, 0);
        const Snapshot before = snapshot(w);

        REQUIRE_THROWS_AS(w.token->buy(ALICE, ETHER, ALICE, none, 0, limit), SlippageError);
        REQUIRE(snapshot(w) == before);
    }

    SECTION("Partial fills are rejected without residue") {
        const Snapshot before = snapshot(w);
        for (int i = 0; i < 5; ++i) {
            I128 current = w.token->current_sqrt_price();
            I128 limit = current - current / 1000;
            REQUIRE(error_code([&] { w.token->buy(ALICE, ETHER, ALICE, none, 0, limit); }) ==
                    errors::PARTIAL_FILL);
        }
        REQUIRE(snapshot(w) == before);
        REQUIRE(w.eth(PROTOCOL) == 0);
        REQUIRE(w.recorder.trades.empty());
        REQUIRE_FALSE(w.manager.is_unlocked());
    }
}

TEST_CASE("Quotes for orders the pool cannot fill", "[token][quote]") {
    World w;
    const Address none = addresses::ZERO;

    SECTION("Buy larger than the whole range") {
        w.chain.mint(NATIVE, WHALE, 500000 * ETHER);
        BuyQuote quote = w.token->quote_buy(500000 * ETHER);
        REQUIRE_FALSE(quote.fillable);
        REQUIRE(quote.tokens_out == 0);
        REQUIRE(quote.fee == 5000 * ETHER);

        REQUIRE(error_code([&] { w.token->buy(WHALE, 500000 * ETHER, WHALE, none, 0); }) ==
                errors::PARTIAL_FILL);
        REQUIRE(w.tokens(WHALE) == 0);
    }

    SECTION("Sell beyond the top of the range") {
        w.token->buy(ALICE, ETHER, ALICE, none, 0);
        const I128 everything = w.tokens(CREATOR);
        SellQuote quote = w.token->quote_sell(everything);
        REQUIRE_FALSE(quote.fillable);
        REQUIRE(quote.payout == 0);
        REQUIRE(quote.fee == 0);

        REQUIRE(error_code([&] { w.token->sell(CREATOR, everything, CREATOR, none, 0); }) ==
                errors::PARTIAL_FILL);
        REQUIRE(w.tokens(CREATOR) == everything);
    }

    SECTION("Fillable orders say so") {
        REQUIRE(w.token->quote_buy(ETHER).fillable);
        I128 bought = w.token->buy(ALICE, ETHER, ALICE, none, 0);
        REQUIRE(w.token->quote_sell(bought).fillable);
    }
}

TEST_CASE("Sell", "[token][sell]") {
    World w;
    const Address none = addresses::ZERO;
    const I128 bought = w.token->buy(ALICE, ETHER, ALICE, none, 0);
    const I128 protocol_before = w.eth(PROTOCOL);

    SECTION("Payout matches the quote after fee") {
        SellQuote quote = w.token->quote_sell(bought / 2);
        REQUIRE(quote.payout > 0);
        REQUIRE(quote.fee == compute_fee(quote.payout + quote.fee, 100));

        I128 eth_before = w.eth(ALICE);
        I128 payout = w.token->sell(ALICE, bought / 2, ALICE, none, quote.payout);

        REQUIRE(payout == quote.payout);
        REQUIRE(w.eth(ALICE) - eth_before == payout);
        REQUIRE(w.tokens(ALICE) == bought - bought / 2);
        REQUIRE(w.eth(PROTOCOL) - protocol_before == quote.fee - quote.fee / 2);

        const TradeSettled& t = w.recorder.trades.back();
        REQUIRE(t.side == TradeSide::Sell);
        REQUIRE(t.gross == payout + t.fee);
        REQUIRE(t.tokens == bought / 2);
        REQUIRE(t.sqrt_price_after_x96 > t.sqrt_price_before_x96);
    }

    SECTION("Minimum payout applies after the fee") {
        SellQuote quote = w.token->quote_sell(bought / 2);
        const Snapshot before = snapshot(w);
        REQUIRE(error_code([&] {
            w.token->sell(ALICE, bought / 2, ALICE, none, quote.payout + 1);
        }) == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(snapshot(w) == before);
    }

    SECTION("Price limit reached before the full amount") {
        const Snapshot before = snapshot(w);
        const I128 current = w.token->current_sqrt_price();
        const I128 limit = current + current / 100000;
        REQUIRE(error_code([&] { w.token->sell(ALICE, bought / 2, ALICE, none, 0, limit); }) ==
                errors::PARTIAL_FILL);
        REQUIRE(snapshot(w) == before);
        REQUIRE(w.recorder.trades.size() == 1);
        REQUIRE_FALSE(w.manager.is_unlocked());
    }

    SECTION("Tiny sells are below the minimum order") {
        REQUIRE(error_code([&] { w.token->sell(ALICE, 1000 * ETHER, ALICE, none, 0); }) ==
                errors::ORDER_TOO_SMALL);
    }

    SECTION("Validation") {
        REQUIRE(error_code([&] { w.token->sell(ALICE, 0, ALICE, none, 0); }) ==
                errors::ZERO_AMOUNT);
        REQUIRE(error_code([&] { w.token->sell(ALICE, bought, addresses::ZERO, none, 0); }) ==
                errors::ZERO_ADDRESS);
        REQUIRE(error_code([&] { w.token->sell(ALICE, bought + 1, ALICE, none, 0); }) ==
                errors::INSUFFICIENT_BALANCE);
    }

    SECTION("Recipient that refuses the payout") {
        w.chain.set_rejects_native(BOB, true);
        const Snapshot before = snapshot(w);
        REQUIRE_THROWS_AS(w.token->sell(ALICE, bought / 2, BOB, none, 0), TransferError);
        REQUIRE(snapshot(w) == before);
    }
}

TEST_CASE("Fee fallbacks", "[token][fees]") {
    World w;
    const Address none = addresses::ZERO;

    SECTION("Creator refusing native goes to protocol") {
        w.chain.set_rejects_native(CREATOR, true);
        w.token->buy(ALICE, ETHER, ALICE, none, 0);
        REQUIRE(w.eth(CREATOR) == 0);
        REQUIRE(w.eth(PROTOCOL) == ONE_PERCENT);
        REQUIRE(w.recorder.trades.back().creator_fee == 0);
        REQUIRE(w.recorder.trades.back().protocol_fee == ONE_PERCENT);
    }

    SECTION("Protocol refusing native unwinds the trade") {
        w.chain.set_rejects_native(PROTOCOL, true);
        const Snapshot before = snapshot(w);
        REQUIRE(error_code([&] { w.token->buy(ALICE, ETHER, ALICE, none, 0); }) ==
                errors::TRANSFER_FAILED);
        REQUIRE(snapshot(w) == before);
        REQUIRE(w.eth(CREATOR) == 0);
    }

    SECTION("Burn share is credited to the accumulator") {
        w.use_burn_split();
        w.token->buy(ALICE, ETHER, ALICE, BOB, 0);
        // 5e15 creator, then 20/40/40 of the other 5e15
        REQUIRE(w.burner->pending_balance() == ONE_PERCENT / 10);
        REQUIRE(w.eth(BURNER) == ONE_PERCENT / 10);
        REQUIRE(w.eth(BOB) == ONE_PERCENT / 5);
        REQUIRE(w.eth(PROTOCOL) == ONE_PERCENT / 5);
        REQUIRE(w.recorder.trades.back().burn_credited);
        REQUIRE(w.recorder.deposits.size() == 1);
        REQUIRE(w.recorder.deposits.back().success);
    }

    SECTION("Disabled accumulator sends the burn share to protocol") {
        w.use_burn_split();
        w.burner->set_enabled(BURNER_OWNER, false);
        w.token->buy(ALICE, ETHER, ALICE, BOB, 0);
        REQUIRE(w.burner->pending_balance() == 0);
        REQUIRE(w.eth(PROTOCOL) == ONE_PERCENT / 5 + ONE_PERCENT / 10);
        REQUIRE_FALSE(w.recorder.trades.back().burn_credited);
        REQUIRE(w.recorder.trades.back().burn_fee == 0);
    }

    SECTION("No accumulator configured") {
        w.use_burn_split();
        w.config.set_burn_accumulator(nullptr);
        w.token->buy(ALICE, ETHER, ALICE, none, 0);
        // Burn and the absent referrer's share both land with protocol
        REQUIRE(w.eth(PROTOCOL) == ONE_PERCENT / 2);
        REQUIRE_FALSE(w.recorder.trades.back().burn_credited);
    }
}

TEST_CASE("Harvest", "[token][harvest]") {
    World w;
    const Address none = addresses::ZERO;

    SECTION("Nothing accrued") {
        HarvestResult r = w.token->harvest(ALICE);
        REQUIRE(r.eth_collected == 0);
        REQUIRE(r.tokens_collected == 0);
    }

    SECTION("LP fees split evenly") {
        w.token->buy(ALICE, ETHER, ALICE, none, 0);
        const I128 creator_before = w.eth(CREATOR);
        const I128 protocol_before = w.eth(PROTOCOL);

        HarvestResult r = w.token->harvest(BOB);

        // 1% LP fee on the 0.99 ether that reached the pool
        const I128 lp_fee = (ETHER - ONE_PERCENT) / 100;
        REQUIRE(r.eth_collected <= lp_fee + 2);
        REQUIRE(r.eth_collected > lp_fee - 1000);
        REQUIRE(r.tokens_collected == 0);
        REQUIRE(r.creator_eth == r.eth_collected / 2);
        REQUIRE(r.protocol_eth == r.eth_collected - r.creator_eth);
        REQUIRE(w.eth(CREATOR) - creator_before == r.creator_eth);
        REQUIRE(w.eth(PROTOCOL) - protocol_before == r.protocol_eth);
        REQUIRE(w.recorder.harvests.size() == 1);

        HarvestResult again = w.token->harvest(BOB);
        REQUIRE(again.eth_collected == 0);
        REQUIRE(again.creator_eth == 0);
    }

    SECTION("Token-side fees from sells") {
        I128 bought = w.token->buy(ALICE, 10 * ETHER, ALICE, none, 0);
        w.token->sell(ALICE, bought / 2, ALICE, none, 0);
        HarvestResult r = w.token->harvest(ALICE);
        REQUIRE(r.tokens_collected > 0);
        REQUIRE(r.creator_tokens == r.tokens_collected / 2);
        REQUIRE(r.protocol_tokens == r.tokens_collected - r.creator_tokens);
    }
}

TEST_CASE("Combined trade and harvest", "[token][harvest]") {
    World combined;
    World separate;
    const Address none = addresses::ZERO;

    SECTION("Buy") {
        TradeAndHarvest both = combined.token->buy_and_harvest(ALICE, ETHER, ALICE, none, 0);
        I128 out = separate.token->buy(ALICE, ETHER, ALICE, none, 0);
        HarvestResult rewards = separate.token->harvest(ALICE);

        REQUIRE(both.amount == out);
        REQUIRE(both.rewards.eth_collected == rewards.eth_collected);
        REQUIRE(both.rewards.creator_eth == rewards.creator_eth);
        REQUIRE(combined.eth(CREATOR) == separate.eth(CREATOR));
        REQUIRE(combined.eth(PROTOCOL) == separate.eth(PROTOCOL));
        REQUIRE(combined.recorder.trades.size() == 1);
        REQUIRE(combined.recorder.harvests.size() == 1);
    }

    SECTION("Sell") {
        I128 a = combined.token->buy(ALICE, ETHER, ALICE, none, 0);
        I128 b = separate.token->buy(ALICE, ETHER, ALICE, none, 0);
        REQUIRE(a == b);

        TradeAndHarvest both = combined.token->sell_and_harvest(ALICE, a / 2, ALICE, none, 0);
        I128 payout = separate.token->sell(ALICE, b / 2, ALICE, none, 0);
        HarvestResult rewards = separate.token->harvest(ALICE);

        REQUIRE(both.amount == payout);
        REQUIRE(both.rewards.eth_collected == rewards.eth_collected);
        REQUIRE(both.rewards.tokens_collected == rewards.tokens_collected);
    }

    SECTION("A failing trade harvests nothing") {
        combined.token->buy(ALICE, ETHER, ALICE, none, 0);
        const I128 creator_before = combined.eth(CREATOR);
        const I128 too_many = combined.token->quote_buy(ETHER).tokens_out + 1;
        REQUIRE_THROWS_AS(combined.token->buy_and_harvest(ALICE, ETHER, ALICE, none, too_many),
                          SlippageError);
        REQUIRE(combined.eth(CREATOR) == creator_before);
        REQUIRE(combined.token->harvest(ALICE).eth_collected > 0);
    }
}

TEST_CASE("Settlement callbacks", "[token][guard]") {
    World w;
    const auto data = payload::encode(
        SettlementContext{SettlementKind::Buy, ETHER, 0, ATTACKER, 0});

    REQUIRE(error_code([&] { w.token->unlock_callback(ATTACKER, data); }) ==
            errors::UNAUTHORIZED_CALLBACK);
    REQUIRE(error_code([&] { w.token->unlock_callback(w.manager.address(), data); }) ==
            errors::NO_ACTIVE_SETTLEMENT);

    // Trading still works afterwards
    REQUIRE(w.token->buy(ALICE, ETHER, ALICE, addresses::ZERO, 0) > 0);
}

TEST_CASE("Token burn", "[token]") {
    World w;
    w.token->burn(CREATOR, 1000 * ETHER);
    REQUIRE(w.token->total_supply() == 1000000000 * ETHER - 1000 * ETHER);
    REQUIRE(w.tokens(CREATOR) == 100000000 * ETHER - 1000 * ETHER);
    REQUIRE_THROWS_AS(w.token->burn(CREATOR, 0), ValidationError);
    REQUIRE_THROWS_AS(w.token->burn(ALICE, ETHER), TransferError);
}
