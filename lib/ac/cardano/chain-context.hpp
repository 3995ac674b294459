/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_CARDANO_CHAIN_CONTEXT_HPP
#define ADA_COMPOSER_CARDANO_CHAIN_CONTEXT_HPP

#include <optional>
#include <ac/cardano/types.hpp>

namespace ada_composer::cardano {
    struct tx_info {
        tx_hash hash {};
        uint64_t slot = 0;
    };

    // Account queries that only some chain contexts support
    struct reward_query {
        virtual ~reward_query() =default;

        // std::nullopt when the stake address is not registered
        [[nodiscard]] std::optional<uint64_t> reward_balance(const address &stake_addr) const
        {
            return _reward_balance_impl(stake_addr);
        }

        [[nodiscard]] bool stake_active(const address &stake_addr) const
        {
            return _stake_active_impl(stake_addr);
        }
    private:
        virtual std::optional<uint64_t> _reward_balance_impl(const address &) const =0;
        virtual bool _stake_active_impl(const address &) const =0;
    };

    struct chain_context {
        virtual ~chain_context() =default;

        [[nodiscard]] utxo_list utxos(const address &addr) const
        {
            return _utxos_impl(addr);
        }

        // the smallest coin value the output may carry given its multi-asset bundle
        [[nodiscard]] uint64_t min_value(const tx_output &out) const
        {
            return _min_value_impl(out);
        }

        void submit(const buffer signed_tx) const
        {
            _submit_impl(signed_tx);
        }

        [[nodiscard]] std::optional<tx_info> query_tx(const tx_hash &id) const
        {
            return _query_tx_impl(id);
        }

        [[nodiscard]] uint64_t current_slot() const
        {
            return _current_slot_impl();
        }

        // nullptr when the context cannot report reward balances
        [[nodiscard]] const reward_query *rewards() const
        {
            return _rewards_impl();
        }
    private:
        virtual utxo_list _utxos_impl(const address &) const =0;
        virtual uint64_t _min_value_impl(const tx_output &) const =0;
        virtual void _submit_impl(buffer) const =0;
        virtual std::optional<tx_info> _query_tx_impl(const tx_hash &) const =0;
        virtual uint64_t _current_slot_impl() const =0;

        virtual const reward_query *_rewards_impl() const
        {
            return nullptr;
        }
    };
}

#endif // !ADA_COMPOSER_CARDANO_CHAIN_CONTEXT_HPP
