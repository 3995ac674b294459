/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_MOCKS_HPP
#define ADA_COMPOSER_COMPOSE_MOCKS_HPP

#include <ac/blake2b.hpp>
#include <ac/cardano/chain-context.hpp>
#include <ac/compose/builder.hpp>

namespace ada_composer::compose::mocks {
    // An in-memory chain without the reward-balance capability
    struct chain_context: cardano::chain_context {
        map<cardano::address, cardano::utxo_list> utxo_sets {};
        uint64_t slot = 1'000'000;
        uint64_t min_coin = 1'000'000;
        uint64_t min_coin_per_asset = 150'000;
        // the first query_tx calls fail with an error and the next ones report no transaction
        size_t failing_queries = 0;
        size_t pending_queries = 0;
        mutable size_t queries = 0;
        mutable vector<uint8_vector> submitted {};
        mutable vector<cardano::tx_output> min_value_requests {};

        const cardano::utxo &add_utxo(const cardano::address &addr, const uint64_t coin, cardano::policy_map assets={})
        {
            const uint64_t seq = _next_seq++;
            auto &utxos = utxo_sets[addr];
            return utxos.emplace_back(cardano::utxo {
                cardano::tx_out_ref { blake2b<cardano::tx_hash>(buffer::from(seq)), 0 },
                cardano::tx_output { addr, coin, std::move(assets) }
            });
        }
    private:
        uint64_t _next_seq = 0;

        cardano::utxo_list _utxos_impl(const cardano::address &addr) const override
        {
            if (const auto it = utxo_sets.find(addr); it != utxo_sets.end())
                return it->second;
            return {};
        }

        uint64_t _min_value_impl(const cardano::tx_output &out) const override
        {
            min_value_requests.emplace_back(out);
            size_t num_assets = 0;
            for (const auto &[policy_id, names]: out.assets)
                num_assets += names.size();
            return min_coin + min_coin_per_asset * num_assets;
        }

        void _submit_impl(const buffer tx) const override
        {
            submitted.emplace_back(tx);
        }

        std::optional<cardano::tx_info> _query_tx_impl(const cardano::tx_hash &id) const override
        {
            ++queries;
            if (queries <= failing_queries)
                throw error(fmt::format("chain query #{} for {} has failed", queries, id));
            if (queries <= failing_queries + pending_queries)
                return {};
            return cardano::tx_info { id, slot };
        }

        uint64_t _current_slot_impl() const override
        {
            return slot;
        }
    };

    struct reward_chain_context: chain_context, cardano::reward_query {
        // registered stake addresses and their reward balances
        map<cardano::address, uint64_t> reward_balances {};
        set<cardano::address> active_stake {};
    private:
        const cardano::reward_query *_rewards_impl() const override
        {
            return this;
        }

        std::optional<uint64_t> _reward_balance_impl(const cardano::address &stake_addr) const override
        {
            if (const auto it = reward_balances.find(stake_addr); it != reward_balances.end())
                return it->second;
            return {};
        }

        bool _stake_active_impl(const cardano::address &stake_addr) const override
        {
            return active_stake.contains(stake_addr);
        }
    };

    // Balances requests with a flat fee and records everything it has been asked to do
    struct tx_builder: compose::tx_builder {
        uint64_t fee = 200'000;
        uint64_t stake_deposit = 2'000'000;
        mutable vector<tx_request> requests {};
        mutable vector<tx_request> balanced {};
        mutable vector<vector<cardano::key_hash>> signers {};
    private:
        tx_request _balance(const tx_request &req) const
        {
            req.validate();
            auto res = req;
            uint64_t deposits = 0;
            for (const auto &c: req.certs) {
                if (std::holds_alternative<cardano::stake_reg_cert>(c.val))
                    deposits += stake_deposit;
            }
            const auto spent = req.output_coin() + fee + deposits;
            if (req.input_coin() < spent)
                throw error(fmt::format("insufficient funds: inputs {} < outputs, fee and deposits {}", req.input_coin(), spent));
            cardano::tx_output change { *req.change_address, req.input_coin() - spent };
            for (const auto &u: req.inputs) {
                for (const auto &[policy_id, names]: u.output.assets) {
                    for (const auto &[name, qty]: names)
                        merge(change.assets[policy_id], name, qty);
                }
            }
            for (const auto &[policy_id, names]: req.mint) {
                for (const auto &[name, qty]: names)
                    merge(change.assets[policy_id], name, qty);
            }
            for (const auto &out: req.outputs) {
                for (const auto &[policy_id, names]: out.assets) {
                    for (const auto &[name, qty]: names)
                        merge(change.assets[policy_id], name, -qty);
                }
            }
            for (auto p_it = change.assets.begin(); p_it != change.assets.end(); ) {
                for (auto a_it = p_it->second.begin(); a_it != p_it->second.end(); ) {
                    if (a_it->second < 0)
                        throw error(fmt::format("insufficient quantity of asset {}.{}", p_it->first, a_it->first));
                    a_it = a_it->second == 0 ? p_it->second.erase(a_it) : std::next(a_it);
                }
                p_it = p_it->second.empty() ? change.assets.erase(p_it) : std::next(p_it);
            }
            if (change.coin == 0 && change.assets.empty())
                return res;
            if (req.merge_change) {
                for (auto &out: res.outputs) {
                    if (out.address == change.address) {
                        out.coin += change.coin;
                        for (const auto &[policy_id, names]: change.assets) {
                            for (const auto &[name, qty]: names)
                                merge(out.assets[policy_id], name, qty);
                        }
                        return res;
                    }
                }
            }
            res.outputs.emplace_back(std::move(change));
            return res;
        }

        unsigned_tx _build_impl(const tx_request &req) const override
        {
            requests.emplace_back(req);
            const auto &bal = balanced.emplace_back(_balance(req));
            auto body = bal.body_cbor(fee);
            return { blake2b<cardano::tx_hash>(body), fee, std::move(body) };
        }

        signed_tx _build_and_sign_impl(const tx_request &req, const cardano::signing_key_list &keys) const override
        {
            const auto utx = _build_impl(req);
            auto &tx_signers = signers.emplace_back();
            cbor::encoder enc {};
            enc.array(4);
            enc.raw_cbor(utx.body);
            const auto &scripts = balanced.back().scripts;
            enc.map(scripts.empty() ? 1 : 2);
            enc.uint(0);
            enc.array(keys.size());
            for (const auto &k: keys) {
                tx_signers.emplace_back(k.hash());
                enc.array(2);
                enc.bytes(k.vkey);
                enc.bytes(k.sign(utx.id));
            }
            if (!scripts.empty()) {
                enc.uint(1);
                enc.array(scripts.size());
                for (const auto &s: scripts)
                    s.to_cbor(enc);
            }
            enc.s_bool(true);
            if (const auto aux = balanced.back().aux_cbor(); !aux.empty())
                enc.raw_cbor(aux);
            else
                enc.s_null();
            return { utx.id, enc.cbor() };
        }
    };
}

#endif // !ADA_COMPOSER_COMPOSE_MOCKS_HPP
