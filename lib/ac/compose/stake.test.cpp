/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/bech32.hpp>
#include <ac/common/test.hpp>
#include <ac/compose/mocks.hpp>
#include <ac/compose/stake.hpp>

using namespace ada_composer;
using namespace ada_composer::compose;

suite compose_stake_suite = [] {
    "compose::stake_resolver"_test = [] {
        static const auto pay = cardano::credential_t { cardano::key_hash::from_hex("9493315cd92eb5d8c4304e67b7e16ae36d61d34502694657811a2c8e") };
        static const auto stake = cardano::credential_t { cardano::key_hash::from_hex("337b62cfff6403a06a3acbc34f8c46003c69fe79a3628cefa9c47251") };
        static const auto other_stake = cardano::credential_t { cardano::key_hash::from_hex("0123456789abcdef0123456789abcdef0123456789abcdef01234567") };
        static const auto own_addr = cardano::address::base(pay, stake, cardano::network_id::testnet);
        static const auto own_stake = own_addr.stake_address();
        static const auto other_addr = cardano::address::base(pay, other_stake, cardano::network_id::testnet);
        static const auto enterprise = cardano::address::enterprise(pay, cardano::network_id::testnet);
        static const std::string pool_hex = "fedcba9876543210fedcba9876543210fedcba9876543210fedcba98";
        static const auto pool_id = cardano::pool_hash::from_hex(pool_hex);
        "pool ids"_test = [] {
            test_same(pool_id, parse_pool_id(pool_hex));
            test_same(pool_id, parse_pool_id(bech32::encode("pool", pool_id)));
            expect(throws<error>([] { parse_pool_id(bech32::encode("stake", pool_id)); }));
        };
        "register and delegate self"_test = [] {
            mocks::chain_context ctx {};
            const stake_resolver r { ctx, own_stake };
            const auto plan = r.resolve(true, pool_ref { pool_hex }, {});
            test_same(2, plan.certs.size());
            expect(plan.certs.at(0) == cardano::cert_t { cardano::stake_reg_cert { stake } });
            expect(plan.certs.at(1) == cardano::cert_t { cardano::stake_deleg_cert { stake, pool_id } });
            expect(plan.own_stake_key);
            expect(plan.withdrawals.empty());
        };
        "registration of an active address is skipped"_test = [] {
            mocks::reward_chain_context ctx {};
            ctx.active_stake.emplace(own_stake);
            const stake_resolver r { ctx, own_stake };
            const auto plan = r.resolve(true, pool_ref { pool_id }, {});
            test_same(1, plan.certs.size());
            expect(std::holds_alternative<cardano::stake_deleg_cert>(plan.certs.at(0).val));
        };
        "explicit targets"_test = [] {
            mocks::chain_context ctx {};
            const stake_resolver r { ctx, own_stake };
            const auto plan = r.resolve(stake_target_list { other_addr, other_addr.to_bech32() },
                delegation_list { { stake_target { other_addr }, pool_ref { pool_id } } }, {});
            test_same(3, plan.certs.size());
            for (const auto &c: plan.certs)
                test_same(other_stake, c.stake_id());
            expect(!plan.own_stake_key);
        };
        "wallet targets"_test = [] {
            mocks::chain_context ctx {};
            const wallet w { "w", other_addr, ctx };
            const stake_resolver r { ctx, own_stake };
            test_same(other_stake, r.resolve_target(std::cref(w)));
            test_same(stake, r.resolve_target(own_stake));
        };
        "targets without a staking component"_test = [] {
            mocks::chain_context ctx {};
            const stake_resolver r { ctx, own_stake };
            expect(throws<invalid_stake_target_error>([&] { r.resolve(stake_target { enterprise }, {}, {}); }));
            expect(throws<invalid_stake_target_error>([&] { r.resolve({}, {}, withdrawal_list { { stake_target { enterprise }, lovelace { 1 } } }); }));
            const stake_resolver no_stake { ctx, {} };
            expect(throws<invalid_stake_target_error>([&] { no_stake.resolve(true, {}, {}); }));
            expect(throws<invalid_stake_target_error>([&] { no_stake.resolve({}, pool_ref { pool_id }, {}); }));
        };
        "withdraw all"_test = [] {
            mocks::chain_context plain {};
            expect(throws<unsupported_withdraw_all_error>([&] { stake_resolver { plain, own_stake }.resolve({}, {}, true); }));
            mocks::reward_chain_context ctx {};
            ctx.reward_balances.emplace(own_stake, 7'000'000);
            const auto plan = stake_resolver { ctx, own_stake }.resolve({}, {}, true);
            test_same(1, plan.withdrawals.size());
            test_same(7'000'000, plan.withdrawals.at(uint8_vector { own_stake.bytes() }));
            expect(plan.own_stake_key);
        };
        "withdraw all from an unregistered address"_test = [] {
            mocks::reward_chain_context ctx {};
            const auto plan = stake_resolver { ctx, own_stake }.resolve({}, {}, true);
            test_same(0, plan.withdrawals.at(uint8_vector { own_stake.bytes() }));
        };
        "withdraw all per target"_test = [] {
            mocks::reward_chain_context ctx {};
            ctx.reward_balances.emplace(other_addr.stake_address(), 3'000'000);
            const auto plan = stake_resolver { ctx, own_stake }.resolve({}, {}, withdrawal_list {
                { stake_target { other_addr }, withdraw_all_t {} },
                { stake_target { own_addr }, lovelace { 5 } }
            });
            test_same(2, plan.withdrawals.size());
            test_same(3'000'000, plan.withdrawals.at(uint8_vector { other_addr.stake_address().bytes() }));
            test_same(5, plan.withdrawals.at(uint8_vector { own_stake.bytes() }));
            expect(plan.own_stake_key);
            const auto other_only = stake_resolver { ctx, own_stake }.resolve({}, {}, withdrawal_list {
                { stake_target { other_addr }, withdraw_all_t {} }
            });
            expect(!other_only.own_stake_key);
        };
        "withdraw all per target needs the reward capability"_test = [] {
            mocks::chain_context plain {};
            expect(throws<unsupported_withdraw_all_error>([&] {
                stake_resolver { plain, own_stake }.resolve({}, {}, withdrawal_list { { stake_target { other_addr }, withdraw_all_t {} } });
            }));
        };
        "withdraw all from an unregistered target"_test = [] {
            mocks::reward_chain_context ctx {};
            const auto plan = stake_resolver { ctx, own_stake }.resolve({}, {}, withdrawal_list {
                { stake_target { other_addr }, withdraw_all_t {} }
            });
            test_same(1, plan.withdrawals.size());
            test_same(0, plan.withdrawals.at(uint8_vector { other_addr.stake_address().bytes() }));
        };
        "explicit withdrawals sum per address"_test = [] {
            mocks::chain_context ctx {};
            const auto plan = stake_resolver { ctx, own_stake }.resolve({}, {}, withdrawal_list {
                { stake_target { other_addr }, lovelace { 100 } },
                { stake_target { other_addr.stake_address() }, ada { 1 } },
                { stake_target { own_addr }, lovelace { 5 } }
            });
            test_same(2, plan.withdrawals.size());
            test_same(1'000'100, plan.withdrawals.at(uint8_vector { other_addr.stake_address().bytes() }));
            expect(plan.own_stake_key);
            expect(throws<amount_error>([&] {
                stake_resolver { ctx, own_stake }.resolve({}, {}, withdrawal_list { { stake_target { own_addr }, lovelace { -5 } } });
            }));
        };
    };
};
