/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_COMPOSER_HPP
#define ADA_COMPOSER_COMPOSE_COMPOSER_HPP

#include <ac/compose/asset-ledger.hpp>
#include <ac/compose/builder.hpp>
#include <ac/compose/config.hpp>
#include <ac/compose/confirm.hpp>
#include <ac/compose/output.hpp>
#include <ac/compose/stake.hpp>

namespace ada_composer::compose {
    // Where inputs come from: every UTxO of an address or of a wallet, or one specific UTxO
    using spend_source = std::variant<cardano::address, cardano::utxo, std::reference_wrapper<const wallet>>;
    using spend_source_list = vector<spend_source>;

    enum class submit_mode {
        build_only,
        sign,
        submit
    };

    struct submit_options {
        submit_mode mode = submit_mode::submit;
        // applies to submit_mode::submit only
        bool await_confirmation = false;
    };

    struct tx_intent {
        // unset: the UTxOs of the caller's wallet
        std::optional<spend_source_list> inputs {};
        output_list outputs {};
        token_list mints {};
        cardano::signing_key_list signers {};
        registration_input stake_registration {};
        delegation_input delegations {};
        withdrawal_input withdrawals {};
        // unset: the caller's own address
        std::optional<cardano::address> change_address {};
        bool merge_change = true;
        std::optional<message_t> message {};
        metadata_map other_metadata {};
        std::optional<uint64_t> ttl {};
        submit_options options {};
    };

    struct composition {
        tx_request request;
        cardano::signing_key_list signers {};
    };

    using tx_result = std::variant<unsigned_tx, signed_tx, cardano::tx_hash>;

    struct composer {
        composer(wallet &owner, const tx_builder &builder, composer_config cfg={}, sleep_func sleep=sleep_for);

        // resolves an intent into a consistent request without contacting the builder
        composition compose(const tx_intent &intent) const;
        tx_result transact(const tx_intent &intent);

        tx_result send_ada(const cardano::address &to, const amount &value,
            std::optional<spend_source_list> utxos={}, const submit_options &opts={});
        tx_result send_utxo(const cardano::address &to, const spend_source_list &utxos, const submit_options &opts={});
        // spends the wallet's cached UTxO snapshot
        tx_result empty_wallet(const cardano::address &to, const submit_options &opts={});
        tx_result delegate(const pool_ref &pool, bool reg=true, std::optional<amount> value={},
            std::optional<spend_source_list> utxos={}, const submit_options &opts={});
        // withdraws the whole reward balance when value is not set
        tx_result withdraw_rewards(std::optional<amount> value={}, std::optional<amount> output_value={}, const submit_options &opts={});
        // a missing value attaches the minimum coin for the minted tokens
        tx_result mint_tokens(const cardano::address &to, const token_list &tokens, std::optional<amount> value={},
            std::optional<spend_source_list> utxos={}, const submit_options &opts={});
        tx_result burn_tokens(const token_list &tokens, const cardano::address &change_address, std::optional<amount> value={},
            std::optional<spend_source_list> utxos={}, const submit_options &opts={});

        // a policy stored in the configured policy directory
        token_policy policy(const std::string &name) const;

        const composer_config &config() const noexcept
        {
            return _cfg;
        }
    private:
        wallet &_owner;
        const tx_builder &_builder;
        composer_config _cfg;
        sleep_func _sleep;

        tx_result _transact(const tx_intent &intent);
        cardano::utxo_list _resolve_inputs(const std::optional<spend_source_list> &sources) const;
        cardano::signing_key_list _resolve_signers(const cardano::signing_key_list &explicit_signers, bool own_stake_key, submit_mode mode) const;
        cardano::address _own_stake_address() const;
    };
}

#endif // !ADA_COMPOSER_COMPOSE_COMPOSER_HPP
