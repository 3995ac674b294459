/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_STAKE_HPP
#define ADA_COMPOSER_COMPOSE_STAKE_HPP

#include <functional>
#include <variant>
#include <ac/cardano/cert.hpp>
#include <ac/compose/request.hpp>
#include <ac/compose/wallet.hpp>

namespace ada_composer::compose {
    // An address, a wallet or the text form of an address
    using stake_target = std::variant<cardano::address, std::reference_wrapper<const wallet>, std::string>;
    using stake_target_list = vector<stake_target>;

    // A pool id in the bech32 pool1 form or in hex
    using pool_ref = std::variant<std::string, cardano::pool_hash>;
    using delegation_list = vector<std::pair<stake_target, pool_ref>>;

    // the whole reward balance of a target as reported by the chain context
    struct withdraw_all_t {};
    using withdrawal_amount = std::variant<amount, withdraw_all_t>;
    using withdrawal_list = vector<std::pair<stake_target, withdrawal_amount>>;

    // monostate: nothing to register; true: the caller's own credential unless it is already active
    using registration_input = std::variant<std::monostate, bool, stake_target, stake_target_list>;
    // a bare pool reference delegates the caller's own credential
    using delegation_input = std::variant<std::monostate, pool_ref, delegation_list>;
    // true: the caller's whole reward balance
    using withdrawal_input = std::variant<std::monostate, bool, withdrawal_list>;

    extern cardano::pool_hash parse_pool_id(std::string_view text);

    struct stake_plan {
        cardano::cert_list certs {};
        withdrawal_map withdrawals {};
        // the caller's stake key must be among the signers
        bool own_stake_key = false;
    };

    struct stake_resolver {
        // own_stake_addr is the caller's reward address when it has one
        stake_resolver(const cardano::chain_context &ctx, std::optional<cardano::address> own_stake_addr);

        cardano::credential_t resolve_target(const stake_target &target) const;
        cardano::address reward_address(const stake_target &target) const;
        stake_plan resolve(const registration_input &reg, const delegation_input &deleg, const withdrawal_input &withdraw) const;
    private:
        const cardano::chain_context &_ctx;
        std::optional<cardano::address> _own_stake_addr;

        const cardano::address &_own(std::string_view purpose) const;
        uint64_t _reward_balance(const cardano::address &stake_addr) const;
        void _register(stake_plan &plan, const registration_input &reg) const;
        void _delegate(stake_plan &plan, const delegation_input &deleg) const;
        void _withdraw(stake_plan &plan, const withdrawal_input &withdraw) const;
        void _add(stake_plan &plan, cardano::cert_t &&cert) const;
    };
}

#endif // !ADA_COMPOSER_COMPOSE_STAKE_HPP
