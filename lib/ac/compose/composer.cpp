/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <ac/common/variant.hpp>
#include <ac/compose/composer.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    composer::composer(wallet &owner, const tx_builder &builder, composer_config cfg, sleep_func sleep):
        _owner { owner }, _builder { builder }, _cfg { std::move(cfg) }, _sleep { std::move(sleep) }
    {
    }

    cardano::utxo_list composer::_resolve_inputs(const std::optional<spend_source_list> &sources) const
    {
        const auto &ctx = _owner.context();
        cardano::utxo_list utxos {};
        set<cardano::tx_out_ref> seen {};
        const auto add = [&](const cardano::utxo &u) {
            if (seen.emplace(u.ref).second)
                utxos.emplace_back(u);
        };
        const auto add_address = [&](const cardano::address &addr) {
            for (const auto &u: ctx.utxos(addr))
                add(u);
        };
        if (!sources) {
            add_address(_owner.address());
        } else {
            for (const auto &src: *sources) {
                std::visit(variant::overloaded {
                    [&](const cardano::address &addr) { add_address(addr); },
                    [&](const cardano::utxo &u) { add(u); },
                    [&](const std::reference_wrapper<const wallet> &w) { add_address(w.get().address()); }
                }, src);
            }
        }
        if (utxos.empty())
            throw empty_input_set_error("the inputs of the transaction resolve to no UTxOs");
        logger::debug("composer: {} inputs", utxos.size());
        return utxos;
    }

    cardano::address composer::_own_stake_address() const
    {
        if (!_owner.address().has_stake_id())
            throw invalid_stake_target_error(fmt::format("wallet {} does not have a staking component", _owner.name()));
        return _owner.address().stake_address();
    }

    cardano::signing_key_list composer::_resolve_signers(const cardano::signing_key_list &explicit_signers, const bool own_stake_key, const submit_mode mode) const
    {
        cardano::signing_key_list keys {};
        const auto add = [&](const cardano::signing_key &k) {
            if (std::find(keys.begin(), keys.end(), k) == keys.end())
                keys.emplace_back(k);
        };
        if (_owner.pay_key())
            add(*_owner.pay_key());
        for (const auto &k: explicit_signers)
            add(k);
        if (own_stake_key) {
            if (_owner.stake_key())
                add(*_owner.stake_key());
            else if (mode != submit_mode::build_only)
                throw no_signing_key_error(fmt::format("wallet {} has no stake key to authorize its stake operations", _owner.name()));
        }
        if (keys.empty() && mode != submit_mode::build_only)
            throw no_signing_key_error(fmt::format("wallet {} has no signing key and no signers were given", _owner.name()));
        return keys;
    }

    composition composer::compose(const tx_intent &intent) const
    {
        const auto &ctx = _owner.context();
        composition res {};
        auto &req = res.request;
        req.inputs = _resolve_inputs(intent.inputs);
        req.change_address = intent.change_address ? *intent.change_address : _owner.address();
        req.merge_change = intent.merge_change;

        const asset_ledger ledger { intent.mints };
        req.mint = ledger.signed_assets();
        req.scripts = ledger.scripts();
        req.ttl = intent.ttl;
        if (const auto ttl = ledger.ttl(); ttl) {
            if (const auto slot = ctx.current_slot(); slot >= *ttl)
                throw compose_error(fmt::format("a minting policy has expired at slot {} and the current slot is {}", *ttl, slot));
            if (!req.ttl || *ttl < *req.ttl)
                req.ttl = ttl;
        }
        logger::debug("composer: mint of {} policies, {} of them with positive quantities", ledger.signed_assets().size(), ledger.mint_assets().size());

        metadata_assembler meta {};
        for (const auto &t: intent.mints)
            meta.add_token(t.policy_id(), t.name(), t.amount(), t.metadata());
        if (intent.message)
            meta.message(*intent.message);
        for (const auto &[label, val]: intent.other_metadata)
            meta.custom(label, val);
        req.metadata = meta.build();

        const stake_resolver stake { ctx, _owner.stake_address() };
        auto plan = stake.resolve(intent.stake_registration, intent.delegations, intent.withdrawals);
        req.certs = std::move(plan.certs);
        req.withdrawals = std::move(plan.withdrawals);

        req.outputs = format_outputs(ctx, intent.outputs);
        res.signers = _resolve_signers(intent.signers, plan.own_stake_key, intent.options.mode);
        req.validate();
        logger::debug("composer: {} outputs, {} certificates, {} withdrawals, {} metadata labels, {} signers",
            req.outputs.size(), req.certs.size(), req.withdrawals.size(), req.metadata.size(), res.signers.size());
        return res;
    }

    tx_result composer::transact(const tx_intent &intent)
    {
        std::optional<tx_result> res {};
        logger::run_log_errors_rethrow([&] { res.emplace(_transact(intent)); });
        return std::move(*res);
    }

    tx_result composer::_transact(const tx_intent &intent)
    {
        const auto comp = compose(intent);
        switch (intent.options.mode) {
            case submit_mode::build_only: {
                auto utx = _builder.build(comp.request);
                logger::info("built transaction {} with fee {}", utx.id, utx.fee);
                return utx;
            }
            case submit_mode::sign: {
                auto stx = _builder.build_and_sign(comp.request, comp.signers);
                logger::info("signed transaction {} of {} bytes", stx.id, stx.cbor.size());
                return stx;
            }
            case submit_mode::submit: {
                const auto stx = _builder.build_and_sign(comp.request, comp.signers);
                const auto &ctx = _owner.context();
                ctx.submit(stx.cbor);
                logger::info("submitted transaction {}", stx.id);
                if (intent.options.await_confirmation) {
                    wait_for_confirmation(ctx, stx.id, _cfg.confirm_interval, _cfg.confirm_max_attempts, _sleep);
                    _owner.sync();
                }
                return stx.id;
            }
            default:
                throw error(fmt::format("unsupported submit mode: {}", static_cast<int>(intent.options.mode)));
        }
    }

    token_policy composer::policy(const std::string &name) const
    {
        return token_policy::load(name, _cfg.policy_dir);
    }

    tx_result composer::send_ada(const cardano::address &to, const amount &value, std::optional<spend_source_list> utxos, const submit_options &opts)
    {
        tx_intent intent {};
        intent.inputs = std::move(utxos);
        intent.outputs.emplace_back(output { to, value });
        intent.options = opts;
        return transact(intent);
    }

    tx_result composer::send_utxo(const cardano::address &to, const spend_source_list &utxos, const submit_options &opts)
    {
        tx_intent intent {};
        intent.inputs = utxos;
        intent.change_address = to;
        intent.options = opts;
        return transact(intent);
    }

    tx_result composer::empty_wallet(const cardano::address &to, const submit_options &opts)
    {
        spend_source_list utxos {};
        for (const auto &u: _owner.utxos())
            utxos.emplace_back(u);
        return send_utxo(to, utxos, opts);
    }

    tx_result composer::delegate(const pool_ref &pool, bool reg, std::optional<amount> value,
        std::optional<spend_source_list> utxos, const submit_options &opts)
    {
        const auto stake_addr = _own_stake_address();
        if (!reg) {
            if (const auto *rewards = _owner.context().rewards(); rewards && !rewards->stake_active(stake_addr))
                throw compose_error(fmt::format("stake address {} is not registered yet: delegate with registration", stake_addr));
        }
        tx_intent intent {};
        intent.inputs = std::move(utxos);
        intent.outputs.emplace_back(output { _owner.address(), value ? *value : _cfg.delegate_deposit });
        intent.stake_registration = reg;
        intent.delegations = pool;
        intent.options = opts;
        return transact(intent);
    }

    tx_result composer::withdraw_rewards(std::optional<amount> value, std::optional<amount> output_value, const submit_options &opts)
    {
        const auto stake_addr = _own_stake_address();
        if (!value) {
            const auto *rewards = _owner.context().rewards();
            if (!rewards)
                throw unsupported_withdraw_all_error("the chain context cannot report reward balances");
            const auto balance = rewards->reward_balance(stake_addr);
            if (!balance)
                logger::warn("stake address {} is not registered", stake_addr);
            value = lovelace { static_cast<int64_t>(balance.value_or(0)) };
        }
        if (value->lovelace_value() <= 0)
            throw compose_error(fmt::format("stake address {} has no rewards to withdraw", stake_addr));
        tx_intent intent {};
        intent.outputs.emplace_back(output { _owner.address(), output_value ? *output_value : _cfg.withdraw_output });
        intent.withdrawals = withdrawal_list { { stake_target { stake_addr }, *value } };
        intent.options = opts;
        return transact(intent);
    }

    tx_result composer::mint_tokens(const cardano::address &to, const token_list &tokens, std::optional<amount> value,
        std::optional<spend_source_list> utxos, const submit_options &opts)
    {
        tx_intent intent {};
        intent.inputs = std::move(utxos);
        token_list minted {};
        for (const auto &t: tokens) {
            if (t.amount() > 0)
                minted.emplace_back(t);
        }
        intent.outputs.emplace_back(output { to, value ? *value : lovelace { 0 }, std::move(minted) });
        intent.mints = tokens;
        intent.options = opts;
        return transact(intent);
    }

    tx_result composer::burn_tokens(const token_list &tokens, const cardano::address &change_address, std::optional<amount> value,
        std::optional<spend_source_list> utxos, const submit_options &opts)
    {
        tx_intent intent {};
        intent.inputs = std::move(utxos);
        for (const auto &t: tokens)
            intent.mints.emplace_back(t.with_amount(t.amount() > 0 ? -t.amount() : t.amount()));
        intent.outputs.emplace_back(output { change_address, value ? *value : _cfg.burn_output });
        intent.change_address = change_address;
        intent.options = opts;
        return transact(intent);
    }
}
