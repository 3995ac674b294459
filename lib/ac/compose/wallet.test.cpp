/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/common/test.hpp>
#include <ac/compose/mocks.hpp>
#include <ac/compose/wallet.hpp>

using namespace ada_composer;
using namespace ada_composer::compose;

namespace {
    cardano::signing_key make_key(const uint8_t fill)
    {
        uint8_vector seed(32);
        std::fill(seed.begin(), seed.end(), fill);
        return cardano::signing_key::from_seed(seed);
    }
}

suite compose_wallet_suite = [] {
    "compose::wallet"_test = [] {
        static const auto pay_key = make_key(11);
        static const auto stake_key = make_key(12);
        "base address"_test = [] {
            mocks::chain_context ctx {};
            const auto w = wallet::from_keys("base", ctx, pay_key, stake_key, cardano::network_id::testnet);
            expect(w.address().has_pay_id());
            expect(w.address().has_stake_id());
            expect(w.address().pay_id() == cardano::credential_t { pay_key.hash() });
            const auto sa = w.stake_address();
            expect(sa.has_value() >> fatal);
            expect(sa->is_reward());
            expect(*sa == cardano::address::reward(cardano::credential_t { stake_key.hash() }, cardano::network_id::testnet));
            test_same(std::string { "base" }, w.name());
        };
        "enterprise address"_test = [] {
            mocks::chain_context ctx {};
            const auto w = wallet::from_keys("ent", ctx, pay_key);
            expect(w.address().has_pay_id());
            expect(!w.address().has_stake_id());
            expect(!w.stake_address());
            expect(!w.stake_key());
        };
        "keys must match the address"_test = [] {
            mocks::chain_context ctx {};
            const auto addr = cardano::address::enterprise(cardano::credential_t { pay_key.hash() }, cardano::network_id::testnet);
            expect(nothrow([&] { wallet { "w", addr, ctx, pay_key }; }));
            expect(nothrow([&] { wallet { "watch-only", addr, ctx }; }));
            expect(throws<error>([&] { wallet { "w", addr, ctx, stake_key }; }));
            expect(throws<error>([&] { wallet { "w", addr, ctx, pay_key, stake_key }; }));
        };
        "sync and balance"_test = [] {
            mocks::chain_context ctx {};
            auto w = wallet::from_keys("w", ctx, pay_key);
            test_same(0, w.utxos().size());
            test_same(0, w.balance().lovelace_value());
            ctx.add_utxo(w.address(), 3'000'000);
            ctx.add_utxo(w.address(), 1'500'000);
            ctx.add_utxo(cardano::address::enterprise(cardano::credential_t { stake_key.hash() }, cardano::network_id::mainnet), 7'000'000);
            test_same(0, w.utxos().size());
            w.sync();
            test_same(2, w.utxos().size());
            test_same(4'500'000, w.balance().lovelace_value());
            expect(w.balance() == ada { 4.5 });
        };
        "tokens"_test = [] {
            mocks::chain_context ctx {};
            auto w = wallet::from_keys("w", ctx, pay_key);
            const auto policy_a = cardano::script_hash::from_hex("aa000000000000000000000000000000000000000000000000000001");
            const auto policy_b = cardano::script_hash::from_hex("bb000000000000000000000000000000000000000000000000000002");
            const uint8_vector coin { buffer { std::string_view { "coin" } } };
            const uint8_vector nft { buffer { std::string_view { "nft" } } };
            cardano::policy_map first {};
            first[policy_a][coin] = 3;
            cardano::policy_map second {};
            second[policy_a][coin] = 4;
            second[policy_b][nft] = 1;
            ctx.add_utxo(w.address(), 2'000'000, first);
            ctx.add_utxo(w.address(), 2'000'000, second);
            expect(w.tokens().empty());
            w.sync();
            test_same(2, w.tokens().size());
            test_same(7, w.tokens().at(policy_a).at(coin));
            test_same(1, w.tokens().at(policy_b).at(nft));
            ctx.utxo_sets.clear();
            w.sync();
            expect(w.tokens().empty());
        };
    };
};
