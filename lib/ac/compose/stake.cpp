/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/bech32.hpp>
#include <ac/compose/stake.hpp>
#include <ac/common/variant.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    cardano::pool_hash parse_pool_id(const std::string_view text)
    {
        if (text.size() == sizeof(cardano::pool_hash) * 2)
            return cardano::pool_hash::from_hex(text);
        const bech32 pool_bech32 { text };
        if (pool_bech32.prefix() != "pool")
            throw error(fmt::format("expected a pool id but got {}", text));
        return cardano::pool_hash { pool_bech32.data() };
    }

    static cardano::pool_hash resolve_pool(const pool_ref &ref)
    {
        return std::visit(variant::overloaded {
            [](const std::string &text) { return parse_pool_id(text); },
            [](const cardano::pool_hash &id) { return id; }
        }, ref);
    }

    stake_resolver::stake_resolver(const cardano::chain_context &ctx, std::optional<cardano::address> own_stake_addr):
        _ctx { ctx }, _own_stake_addr { std::move(own_stake_addr) }
    {
    }

    cardano::address stake_resolver::reward_address(const stake_target &target) const
    {
        const auto addr = std::visit(variant::overloaded {
            [](const cardano::address &a) { return a; },
            [](const std::reference_wrapper<const wallet> &w) { return w.get().address(); },
            [](const std::string &text) { return cardano::address::from_string(text); }
        }, target);
        if (!addr.has_stake_id())
            throw invalid_stake_target_error(fmt::format("address {} has no staking component", addr));
        return addr.stake_address();
    }

    cardano::credential_t stake_resolver::resolve_target(const stake_target &target) const
    {
        return reward_address(target).stake_id();
    }

    const cardano::address &stake_resolver::_own(const std::string_view purpose) const
    {
        if (!_own_stake_addr)
            throw invalid_stake_target_error(fmt::format("{} requires the caller's stake credential but its address has none", purpose));
        return *_own_stake_addr;
    }

    void stake_resolver::_add(stake_plan &plan, cardano::cert_t &&cert) const
    {
        if (_own_stake_addr && cert.stake_id() == _own_stake_addr->stake_id())
            plan.own_stake_key = true;
        logger::debug("stake resolver: {}", cert);
        plan.certs.emplace_back(std::move(cert));
    }

    void stake_resolver::_register(stake_plan &plan, const registration_input &reg) const
    {
        std::visit(variant::overloaded {
            [](const std::monostate &) {},
            [&](const bool flag) {
                if (!flag)
                    return;
                const auto &own = _own("stake registration");
                if (const auto *rewards = _ctx.rewards(); rewards && rewards->stake_active(own)) {
                    logger::info("stake address {} is already active, skipping its registration", own);
                    return;
                }
                _add(plan, cardano::cert_t { cardano::stake_reg_cert { own.stake_id() } });
            },
            [&](const stake_target &target) {
                _add(plan, cardano::cert_t { cardano::stake_reg_cert { resolve_target(target) } });
            },
            [&](const stake_target_list &targets) {
                for (const auto &target: targets)
                    _add(plan, cardano::cert_t { cardano::stake_reg_cert { resolve_target(target) } });
            }
        }, reg);
    }

    void stake_resolver::_delegate(stake_plan &plan, const delegation_input &deleg) const
    {
        std::visit(variant::overloaded {
            [](const std::monostate &) {},
            [&](const pool_ref &pool) {
                const auto &own = _own("stake delegation");
                _add(plan, cardano::cert_t { cardano::stake_deleg_cert { own.stake_id(), resolve_pool(pool) } });
            },
            [&](const delegation_list &items) {
                for (const auto &item: items)
                    _add(plan, cardano::cert_t { cardano::stake_deleg_cert { resolve_target(item.first), resolve_pool(item.second) } });
            }
        }, deleg);
    }

    uint64_t stake_resolver::_reward_balance(const cardano::address &stake_addr) const
    {
        const auto *rewards = _ctx.rewards();
        if (!rewards)
            throw unsupported_withdraw_all_error("the chain context cannot report reward balances");
        if (const auto res = rewards->reward_balance(stake_addr); res)
            return *res;
        logger::warn("stake address {} is not registered, withdrawing nothing", stake_addr);
        return 0;
    }

    void stake_resolver::_withdraw(stake_plan &plan, const withdrawal_input &withdraw) const
    {
        std::visit(variant::overloaded {
            [](const std::monostate &) {},
            [&](const bool flag) {
                if (!flag)
                    return;
                const auto &own = _own("withdrawal of all rewards");
                merge(plan.withdrawals, uint8_vector { own.bytes() }, _reward_balance(own));
                plan.own_stake_key = true;
            },
            [&](const withdrawal_list &items) {
                for (const auto &item: items) {
                    const auto addr = reward_address(item.first);
                    const auto qty = std::visit(variant::overloaded {
                        [&](const amount &a) {
                            if (a.lovelace_value() < 0)
                                throw amount_error(fmt::format("a withdrawal from {} cannot be negative: {}", addr, a));
                            return static_cast<uint64_t>(a.lovelace_value());
                        },
                        [&](const withdraw_all_t &) {
                            return _reward_balance(addr);
                        }
                    }, item.second);
                    merge(plan.withdrawals, uint8_vector { addr.bytes() }, qty);
                    if (_own_stake_addr && addr == *_own_stake_addr)
                        plan.own_stake_key = true;
                }
            }
        }, withdraw);
    }

    stake_plan stake_resolver::resolve(const registration_input &reg, const delegation_input &deleg, const withdrawal_input &withdraw) const
    {
        stake_plan plan {};
        _register(plan, reg);
        _delegate(plan, deleg);
        _withdraw(plan, withdraw);
        return plan;
    }
}
