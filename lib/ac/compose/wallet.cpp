/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/compose/wallet.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    wallet wallet::from_keys(std::string name, const cardano::chain_context &ctx, cardano::signing_key pay_key,
        std::optional<cardano::signing_key> stake_key, const cardano::network_id net)
    {
        const cardano::credential_t pay_id { pay_key.hash() };
        auto addr = stake_key
            ? cardano::address::base(pay_id, cardano::credential_t { stake_key->hash() }, net)
            : cardano::address::enterprise(pay_id, net);
        return wallet { std::move(name), std::move(addr), ctx, std::move(pay_key), std::move(stake_key) };
    }

    wallet::wallet(std::string name, cardano::address addr, const cardano::chain_context &ctx,
            std::optional<cardano::signing_key> pay_key, std::optional<cardano::signing_key> stake_key):
        _name { std::move(name) }, _address { std::move(addr) }, _ctx { ctx },
        _pay_key { std::move(pay_key) }, _stake_key { std::move(stake_key) }
    {
        if (_pay_key && (!_address.has_pay_id() || _address.pay_id() != cardano::credential_t { _pay_key->hash() }))
            throw error(fmt::format("wallet {}: the payment key does not match the address {}", _name, _address));
        if (_stake_key && (!_address.has_stake_id() || _address.stake_id() != cardano::credential_t { _stake_key->hash() }))
            throw error(fmt::format("wallet {}: the stake key does not match the address {}", _name, _address));
    }

    std::optional<cardano::address> wallet::stake_address() const
    {
        if (!_address.has_stake_id())
            return {};
        return _address.stake_address();
    }

    lovelace wallet::balance() const
    {
        int64_t sum = 0;
        for (const auto &u: _utxos)
            sum += static_cast<int64_t>(u.output.coin);
        return lovelace { sum };
    }

    void wallet::sync()
    {
        _utxos = _ctx.utxos(_address);
        _tokens.clear();
        for (const auto &u: _utxos) {
            for (const auto &[policy_id, names]: u.output.assets) {
                for (const auto &[name, qty]: names)
                    merge(_tokens[policy_id], name, qty);
            }
        }
        logger::debug("wallet {}: {} UTxOs with {} and assets of {} policies", _name, _utxos.size(), balance().as_ada(), _tokens.size());
    }
}
