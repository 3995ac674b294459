/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <ac/common/test.hpp>
#include <ac/compose/composer.hpp>
#include <ac/compose/mocks.hpp>
#include <ac/logger.hpp>

using namespace ada_composer;
using namespace ada_composer::compose;

namespace {
    cardano::signing_key make_key(const uint8_t fill)
    {
        uint8_vector seed(32);
        std::fill(seed.begin(), seed.end(), fill);
        return cardano::signing_key::from_seed(seed);
    }

    const auto pay_key = make_key(1);
    const auto stake_key = make_key(2);
    const auto other_key = make_key(3);
    const auto recipient = cardano::address::enterprise(cardano::credential_t { other_key.hash() }, cardano::network_id::testnet);
    const std::string pool_hex = "fedcba9876543210fedcba9876543210fedcba9876543210fedcba98";

    struct env {
        mocks::reward_chain_context ctx {};
        mocks::tx_builder builder {};
        wallet owner = wallet::from_keys("alice", ctx, pay_key, stake_key, cardano::network_id::testnet);
        size_t sleeps = 0;
        composer comp { owner, builder, composer_config {}, [this](const auto) { ++sleeps; } };

        env()
        {
            ctx.add_utxo(owner.address(), 10'000'000);
            ctx.add_utxo(owner.address(), 5'000'000);
        }

        env(const env &) =delete;
    };

    token_policy make_policy(const std::string &name, const std::optional<uint64_t> exp={})
    {
        token_policy p { name };
        p.generate({ pay_key.hash() }, exp);
        return p;
    }

    vector<cardano::key_hash> key_hashes(const cardano::signing_key_list &keys)
    {
        vector<cardano::key_hash> res {};
        for (const auto &k: keys)
            res.emplace_back(k.hash());
        return res;
    }
}

suite compose_composer_suite = [] {
    "compose::composer"_test = [] {
        static const submit_options build_only { submit_mode::build_only };
        static const submit_options sign_only { submit_mode::sign };
        "send ada build only"_test = [] {
            env e {};
            const auto res = e.comp.send_ada(recipient, ada { 2 }, {}, build_only);
            expect(std::holds_alternative<unsigned_tx>(res));
            test_same(1, e.builder.requests.size());
            const auto &req = e.builder.requests.at(0);
            test_same(2, req.inputs.size());
            test_same(1, req.outputs.size());
            test_same(2'000'000, req.outputs.at(0).coin);
            expect(req.change_address == e.owner.address());
            expect(req.metadata.empty());
            expect(req.aux_cbor().empty());
            expect(e.ctx.submitted.empty());
            const auto &utx = std::get<unsigned_tx>(res);
            test_same(blake2b<cardano::tx_hash>(utx.body), utx.id);
        };
        "sign only"_test = [] {
            env e {};
            const auto res = e.comp.send_ada(recipient, lovelace { 1'500'000 }, {}, sign_only);
            expect(std::holds_alternative<signed_tx>(res) >> fatal);
            const auto &stx = std::get<signed_tx>(res);
            test_same(1, e.builder.signers.size());
            expect(e.builder.signers.at(0) == vector<cardano::key_hash> { pay_key.hash() });
            expect(!stx.cbor.empty());
            expect(e.ctx.submitted.empty());
            expect(ed25519::verify(pay_key.sign(stx.id), pay_key.vkey, stx.id));
        };
        "submit and await confirmation"_test = [] {
            env e {};
            e.ctx.failing_queries = 1;
            e.ctx.pending_queries = 1;
            expect(e.owner.utxos().empty());
            const auto res = e.comp.send_ada(recipient, ada { 1 }, {}, submit_options { submit_mode::submit, true });
            expect(std::holds_alternative<cardano::tx_hash>(res) >> fatal);
            test_same(1, e.ctx.submitted.size());
            test_same(3, e.ctx.queries);
            test_same(2, e.sleeps);
            test_same(2, e.owner.utxos().size());
        };
        "submit without waiting"_test = [] {
            env e {};
            const auto res = e.comp.send_ada(recipient, ada { 1 });
            expect(std::holds_alternative<cardano::tx_hash>(res));
            test_same(1, e.ctx.submitted.size());
            test_same(0, e.ctx.queries);
            expect(e.owner.utxos().empty());
        };
        "explicit inputs"_test = [] {
            env e {};
            const auto &u = e.ctx.utxo_sets.at(e.owner.address()).at(1);
            e.comp.send_ada(recipient, ada { 1 }, spend_source_list { u, u }, build_only);
            const auto &req = e.builder.requests.at(0);
            test_same(1, req.inputs.size());
            expect(req.inputs.at(0).ref == u.ref);
        };
        "send utxo and empty wallet"_test = [] {
            env e {};
            e.owner.sync();
            e.comp.empty_wallet(recipient, build_only);
            const auto &req = e.builder.requests.at(0);
            test_same(2, req.inputs.size());
            expect(req.outputs.empty());
            expect(req.change_address == recipient);
            test_same(1, e.builder.balanced.at(0).outputs.size());
            test_same(15'000'000 - e.builder.fee, e.builder.balanced.at(0).outputs.at(0).coin);
        };
        "delegation registers and adds the stake key once"_test = [] {
            env e {};
            e.comp.delegate(pool_ref { pool_hex }, true, {}, {}, sign_only);
            const auto &req = e.builder.requests.at(0);
            test_same(2, req.certs.size());
            expect(std::holds_alternative<cardano::stake_reg_cert>(req.certs.at(0).val));
            expect(std::holds_alternative<cardano::stake_deleg_cert>(req.certs.at(1).val));
            test_same(2'000'000, req.outputs.at(0).coin);
            expect(e.builder.signers.at(0) == vector<cardano::key_hash> { pay_key.hash(), stake_key.hash() });

            tx_intent intent {};
            intent.signers = { stake_key, pay_key, stake_key };
            intent.stake_registration = true;
            intent.delegations = pool_ref { pool_hex };
            const auto comp = e.comp.compose(intent);
            expect(key_hashes(comp.signers) == vector<cardano::key_hash> { pay_key.hash(), stake_key.hash() });
        };
        "delegation of an active stake address"_test = [] {
            env e {};
            e.ctx.active_stake.emplace(*e.owner.stake_address());
            e.comp.delegate(pool_ref { pool_hex }, true, {}, {}, build_only);
            test_same(1, e.builder.requests.at(0).certs.size());
            e.ctx.active_stake.clear();
            expect(throws<compose_error>([&] { e.comp.delegate(pool_ref { pool_hex }, false, {}, {}, build_only); }));
        };
        "delegation needs a staking component"_test = [] {
            mocks::chain_context ctx {};
            mocks::tx_builder builder {};
            auto w = wallet::from_keys("bob", ctx, pay_key, {}, cardano::network_id::testnet);
            ctx.add_utxo(w.address(), 10'000'000);
            composer c { w, builder };
            expect(throws<invalid_stake_target_error>([&] { c.delegate(pool_ref { pool_hex }); }));
            expect(builder.requests.empty());
        };
        "withdraw rewards"_test = [] {
            env e {};
            expect(throws<compose_error>([&] { e.comp.withdraw_rewards({}, {}, build_only); }));
            e.ctx.reward_balances.emplace(*e.owner.stake_address(), 0);
            expect(throws<compose_error>([&] { e.comp.withdraw_rewards({}, {}, build_only); }));
            e.ctx.reward_balances[*e.owner.stake_address()] = 3'000'000;
            e.comp.withdraw_rewards({}, {}, sign_only);
            const auto &req = e.builder.requests.at(0);
            test_same(3'000'000, req.withdrawals.at(uint8_vector { e.owner.stake_address()->bytes() }));
            test_same(1'000'000, req.outputs.at(0).coin);
            expect(e.builder.signers.at(0) == vector<cardano::key_hash> { pay_key.hash(), stake_key.hash() });
            e.comp.withdraw_rewards(ada { 1 }, ada { 2 }, build_only);
            test_same(1'000'000, e.builder.requests.at(1).withdrawals.begin()->second);
            test_same(2'000'000, e.builder.requests.at(1).outputs.at(0).coin);
        };
        "withdraw all needs the reward capability"_test = [] {
            mocks::chain_context ctx {};
            mocks::tx_builder builder {};
            auto w = wallet::from_keys("carol", ctx, pay_key, stake_key, cardano::network_id::testnet);
            ctx.add_utxo(w.address(), 10'000'000);
            composer c { w, builder };
            expect(throws<unsupported_withdraw_all_error>([&] { c.withdraw_rewards(); }));
            tx_intent intent {};
            intent.withdrawals = true;
            expect(throws<unsupported_withdraw_all_error>([&] { c.transact(intent); }));
            expect(builder.requests.empty());
        };
        "mint with the minimum value"_test = [] {
            env e {};
            const auto policy = make_policy("nft", 2'000'000);
            const token t { policy, 5, "abc", json::object { { "name", "ABC" } } };
            e.comp.mint_tokens(recipient, { t }, {}, {}, build_only);
            const auto &req = e.builder.requests.at(0);
            const auto abc = uint8_vector { buffer { std::string_view { "abc" } } };
            test_same(5, req.mint.at(policy.id()).at(abc));
            test_same(1, req.scripts.size());
            test_same(2'000'000, *req.ttl);
            test_same(e.ctx.min_coin + e.ctx.min_coin_per_asset, req.outputs.at(0).coin);
            test_same(5, req.outputs.at(0).assets.at(policy.id()).at(abc));
            expect(req.metadata.contains(nft_metadata_label));
            const auto &nft = req.metadata.at(nft_metadata_label).as_object();
            expect(nft.at(policy.id().to_hex()).as_object().contains("abc"));
        };
        "mint without metadata has no auxiliary data"_test = [] {
            env e {};
            const auto policy = make_policy("plain");
            e.comp.mint_tokens(recipient, { token { policy, 5, "abc" } }, ada { 3 }, {}, build_only);
            const auto &req = e.builder.requests.at(0);
            expect(req.metadata.empty());
            expect(!req.ttl);
            test_same(3'000'000, req.outputs.at(0).coin);
        };
        "burn"_test = [] {
            env e {};
            const auto policy = make_policy("burnable");
            const auto abc = uint8_vector { buffer { std::string_view { "abc" } } };
            cardano::policy_map held {};
            held[policy.id()][abc] = 3;
            e.ctx.add_utxo(e.owner.address(), 2'000'000, held);
            e.comp.burn_tokens({ token { policy, 1, "abc", json::object { { "name", "ABC" } } } }, e.owner.address(), {}, {}, build_only);
            const auto &req = e.builder.requests.at(0);
            test_same(-1, req.mint.at(policy.id()).at(abc));
            test_same(1'000'000, req.outputs.at(0).coin);
            expect(req.outputs.at(0).assets.empty());
            expect(req.metadata.empty());
            const auto &bal = e.builder.balanced.at(0);
            test_same(1, bal.outputs.size());
            test_same(2, bal.outputs.at(0).assets.at(policy.id()).at(abc));
        };
        "several policies in one transaction"_test = [] {
            env e {};
            const auto policy_a = make_policy("a", 3'000'000);
            const auto policy_b = make_policy("b", 2'500'000);
            tx_intent intent {};
            intent.mints = { token { policy_a, 2, "x" }, token { policy_b, 1, "y" }, token { policy_a, 3, "x" } };
            intent.outputs = { output { recipient, lovelace { 0 }, { token { policy_a, 5, "x" }, token { policy_b, 1, "y" } } } };
            intent.options = build_only;
            e.comp.transact(intent);
            const auto &req = e.builder.requests.at(0);
            test_same(2, req.mint.size());
            test_same(2, req.scripts.size());
            test_same(2'500'000, *req.ttl);
            test_same(e.ctx.min_coin + 2 * e.ctx.min_coin_per_asset, req.outputs.at(0).coin);
        };
        "expired policy"_test = [] {
            env e {};
            const auto policy = make_policy("expired", e.ctx.slot);
            expect(throws<compose_error>([&] { e.comp.mint_tokens(e.owner.address(), { token { policy, 1, "Late" } }); }));
            expect(e.builder.requests.empty());
        };
        "policy without a script"_test = [] {
            env e {};
            const auto raw = token_policy::from_id("raw", make_policy("x").id());
            expect(throws<policy_script_missing_error>([&] { e.comp.mint_tokens(recipient, { token { raw, 1, "abc" } }, {}, {}, build_only); }));
            expect(e.builder.requests.empty());
        };
        "metadata"_test = [] {
            env e {};
            tx_intent intent {};
            intent.outputs = { output { recipient, ada { 1 } } };
            intent.message = std::string(100, 'm');
            intent.other_metadata.emplace(1234, json::object { { "k", "v" } });
            intent.options = build_only;
            e.comp.transact(intent);
            const auto &req = e.builder.requests.at(0);
            test_same(2, req.metadata.size());
            test_same(2, req.metadata.at(message_label).as_object().at("msg").as_array().size());
            intent.other_metadata.emplace(42, json::value(std::string(65, 'x')));
            expect(throws<metadata_field_too_long_error>([&] { e.comp.transact(intent); }));
            intent.other_metadata.erase(42);
            intent.other_metadata.emplace(43, json::parse("[null]"));
            expect(throws<metadata_not_serializable_error>([&] { e.comp.transact(intent); }));
            test_same(1, e.builder.requests.size());
        };
        "no signing key"_test = [] {
            mocks::chain_context ctx {};
            mocks::tx_builder builder {};
            wallet watch { "watch", recipient, ctx };
            ctx.add_utxo(recipient, 10'000'000);
            composer c { watch, builder };
            expect(throws<no_signing_key_error>([&] { c.send_ada(recipient, ada { 1 }, {}, sign_only); }));
            expect(builder.requests.empty());
            expect(nothrow([&] { c.send_ada(recipient, ada { 1 }, {}, build_only); }));
            tx_intent intent {};
            intent.outputs = { output { recipient, ada { 1 } } };
            intent.signers = { other_key };
            intent.options = sign_only;
            expect(nothrow([&] { c.transact(intent); }));
            expect(builder.signers.at(0) == vector<cardano::key_hash> { other_key.hash() });
        };
        "policies from the configured directory"_test = [] {
            const auto dir = (std::filesystem::temp_directory_path() / "ac-test-composer-policies").string();
            std::filesystem::remove_all(dir);
            mocks::chain_context ctx {};
            mocks::tx_builder builder {};
            auto w = wallet::from_keys("minter", ctx, pay_key, {}, cardano::network_id::testnet);
            composer_config cfg {};
            cfg.policy_dir = dir;
            composer c { w, builder, cfg };
            auto p = c.policy("coins");
            expect(!p.script());
            p.generate({ pay_key.hash() }, 5000);
            const auto loaded = c.policy("coins");
            expect(loaded.script().has_value() >> fatal);
            test_same(p.id(), loaded.id());
            test_same(5000, *loaded.expiration_slot());
            std::filesystem::remove_all(dir);
        };
        "empty input set"_test = [] {
            mocks::chain_context ctx {};
            mocks::tx_builder builder {};
            auto w = wallet::from_keys("empty", ctx, pay_key, {}, cardano::network_id::testnet);
            composer c { w, builder };
            logger::reset_last_error();
            expect(throws<empty_input_set_error>([&] { c.send_ada(recipient, ada { 1 }); }));
            const auto logged = logger::last_error();
            expect(static_cast<bool>(logged) >> fatal);
            expect(logged->find("resolve to no UTxOs") != logged->npos);
            expect(throws<empty_input_set_error>([&] { c.empty_wallet(recipient); }));
            expect(builder.requests.empty());
            expect(ctx.submitted.empty());
        };
    };
};
