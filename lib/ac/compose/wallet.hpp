/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_WALLET_HPP
#define ADA_COMPOSER_COMPOSE_WALLET_HPP

#include <ac/cardano/chain-context.hpp>
#include <ac/cardano/keys.hpp>
#include <ac/compose/amount.hpp>

namespace ada_composer::compose {
    // The caller's identity: an address, optional signing capabilities and a cached UTxO snapshot
    struct wallet {
        // a base address when a stake key is given and an enterprise address otherwise
        static wallet from_keys(std::string name, const cardano::chain_context &ctx, cardano::signing_key pay_key,
            std::optional<cardano::signing_key> stake_key={}, cardano::network_id net=cardano::network_id::mainnet);

        wallet(std::string name, cardano::address addr, const cardano::chain_context &ctx,
            std::optional<cardano::signing_key> pay_key={}, std::optional<cardano::signing_key> stake_key={});

        const std::string &name() const noexcept
        {
            return _name;
        }

        const cardano::address &address() const noexcept
        {
            return _address;
        }

        const cardano::chain_context &context() const noexcept
        {
            return _ctx;
        }

        const std::optional<cardano::signing_key> &pay_key() const noexcept
        {
            return _pay_key;
        }

        const std::optional<cardano::signing_key> &stake_key() const noexcept
        {
            return _stake_key;
        }

        // the reward address of the wallet when its address has a staking component
        std::optional<cardano::address> stake_address() const;

        const cardano::utxo_list &utxos() const noexcept
        {
            return _utxos;
        }

        // native assets of the UTxO snapshot by policy and asset name
        const cardano::policy_map &tokens() const noexcept
        {
            return _tokens;
        }

        lovelace balance() const;
        // refreshes the UTxO snapshot from the chain context
        void sync();
    private:
        std::string _name;
        cardano::address _address;
        const cardano::chain_context &_ctx;
        std::optional<cardano::signing_key> _pay_key;
        std::optional<cardano::signing_key> _stake_key;
        cardano::utxo_list _utxos {};
        cardano::policy_map _tokens {};
    };
}

#endif // !ADA_COMPOSER_COMPOSE_WALLET_HPP
