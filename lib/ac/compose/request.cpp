/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/blake2b.hpp>
#include <ac/compose/request.hpp>

namespace ada_composer::compose {
    static void assets_to_cbor(cbor::encoder &enc, const cardano::policy_map &assets)
    {
        enc.map(assets.size());
        for (const auto &[policy_id, names]: assets) {
            enc.bytes(policy_id);
            enc.map(names.size());
            for (const auto &[name, qty]: names) {
                enc.bytes(name);
                enc.sint(qty);
            }
        }
    }

    static void output_to_cbor(cbor::encoder &enc, const cardano::tx_output &out)
    {
        enc.array(2);
        enc.bytes(out.address.bytes());
        if (!out.assets.empty()) {
            enc.array(2);
            enc.uint(out.coin);
            assets_to_cbor(enc, out.assets);
        } else {
            enc.uint(out.coin);
        }
    }

    void tx_request::validate() const
    {
        if (inputs.empty())
            throw empty_input_set_error("a transaction request must have at least one input");
        if (!change_address)
            throw error("a transaction request must have a change address");
        set<cardano::script_hash> script_ids {};
        for (const auto &s: scripts) {
            if (!script_ids.emplace(s.hash()).second)
                throw error(fmt::format("policy script {} is attached more than once", s.hash()));
        }
        for (const auto &[policy_id, names]: mint) {
            if (!script_ids.contains(policy_id))
                throw policy_script_missing_error(fmt::format("no script is attached for the minting policy {}", policy_id));
        }
        if (script_ids.size() != mint.size())
            throw error("a policy script is attached for a policy that mints nothing");
        for (const auto &[stake_addr, coin]: withdrawals) {
            const cardano::address addr { stake_addr };
            if (!addr.is_reward())
                throw invalid_stake_target_error(fmt::format("withdrawals must use reward addresses but got {}", addr));
        }
        for (const auto &[label, val]: metadata)
            validate_metadata(val);
    }

    uint64_t tx_request::input_coin() const
    {
        uint64_t sum = 0;
        for (const auto &u: inputs)
            sum += u.output.coin;
        for (const auto &[stake_addr, coin]: withdrawals)
            sum += coin;
        return sum;
    }

    uint64_t tx_request::output_coin() const
    {
        uint64_t sum = 0;
        for (const auto &out: outputs)
            sum += out.coin;
        return sum;
    }

    uint8_vector tx_request::aux_cbor() const
    {
        if (metadata.empty())
            return {};
        cbor::encoder enc {};
        metadata_to_cbor(enc, metadata);
        return enc.cbor();
    }

    uint8_vector tx_request::body_cbor(const uint64_t fee) const
    {
        const auto aux = aux_cbor();
        cbor::encoder enc {};
        enc.map(3 + (ttl ? 1 : 0) + (certs.empty() ? 0 : 1) + (withdrawals.empty() ? 0 : 1) + (aux.empty() ? 0 : 1) + (mint.empty() ? 0 : 1));
        flat_set<cardano::tx_out_ref> refs {};
        for (const auto &u: inputs)
            refs.emplace(u.ref);
        enc.uint(0);
        enc.array(refs.size());
        for (const auto &ref: refs) {
            enc.array(2);
            enc.bytes(ref.hash);
            enc.uint(ref.idx);
        }
        enc.uint(1);
        enc.array(outputs.size());
        for (const auto &out: outputs)
            output_to_cbor(enc, out);
        enc.uint(2);
        enc.uint(fee);
        if (ttl) {
            enc.uint(3);
            enc.uint(*ttl);
        }
        if (!certs.empty()) {
            enc.uint(4);
            enc.array(certs.size());
            for (const auto &c: certs)
                c.to_cbor(enc);
        }
        if (!withdrawals.empty()) {
            enc.uint(5);
            enc.map(withdrawals.size());
            for (const auto &[stake_addr, coin]: withdrawals) {
                enc.bytes(stake_addr);
                enc.uint(coin);
            }
        }
        if (!aux.empty()) {
            enc.uint(7);
            enc.bytes(blake2b<blake2b_256_hash>(aux));
        }
        if (!mint.empty()) {
            enc.uint(9);
            assets_to_cbor(enc, mint);
        }
        return enc.cbor();
    }
}
