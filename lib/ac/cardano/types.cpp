/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cctype>
#include <ac/bech32.hpp>
#include <ac/cardano/types.hpp>

namespace ada_composer::cardano {
    void credential_t::to_cbor(cbor::encoder &enc) const
    {
        enc.array(2).uint(script ? 1 : 0).bytes(hash);
    }

    static bool is_hex(const std::string_view text)
    {
        if (text.empty() || text.size() % 2 != 0)
            return false;
        for (const auto k: text) {
            if (!std::isxdigit(static_cast<unsigned char>(k)))
                return false;
        }
        return true;
    }

    address address::from_string(const std::string_view text)
    {
        if (text.starts_with("0x"))
            return address { uint8_vector::from_hex(text.substr(2)) };
        if (is_hex(text))
            return address { uint8_vector::from_hex(text) };
        const bech32 addr_bech32 { text };
        return address { addr_bech32.data() };
    }

    static uint8_vector make_address(const uint8_t type, const network_id net, const std::initializer_list<const credential_t *> parts)
    {
        uint8_vector bytes {};
        bytes << static_cast<uint8_t>((type << 4) | static_cast<uint8_t>(net));
        for (const auto *cred: parts)
            bytes << cred->hash.span();
        return bytes;
    }

    address address::base(const credential_t &pay, const credential_t &stake, const network_id net)
    {
        const uint8_t type = (pay.script ? 0b0001 : 0) | (stake.script ? 0b0010 : 0);
        return address { make_address(type, net, { &pay, &stake }) };
    }

    address address::enterprise(const credential_t &pay, const network_id net)
    {
        return address { make_address(pay.script ? 0b0111 : 0b0110, net, { &pay }) };
    }

    address address::reward(const credential_t &stake, const network_id net)
    {
        return address { make_address(stake.script ? 0b1111 : 0b1110, net, { &stake }) };
    }

    address::address(const buffer bytes): _bytes { bytes }
    {
        if (_bytes.size() < 2)
            throw cardano_error("cardano address must have at least two bytes!");
        switch (type()) {
            case 0b1110: // reward key
            case 0b1111: // reward script
            case 0b0110: // enterprise key
            case 0b0111: // enterprise script
                if (_bytes.size() != 29) [[unlikely]]
                    throw cardano_error(fmt::format("address of type {} must have 29 bytes but has {}!", type(), _bytes.size()));
                break;
            case 0b0000: // base address: keyhash28,keyhash28
            case 0b0001: // base address: scripthash28,keyhash28
            case 0b0010: // base address: keyhash28,scripthash28
            case 0b0011: // base address: scripthash28,scripthash28
                if (_bytes.size() != 57) [[unlikely]]
                    throw cardano_error(fmt::format("shelley base address must have 57 bytes but has {}!", _bytes.size()));
                break;
            case 0b0100: // keyhash28, pointer
            case 0b0101: // scripthash28, pointer
                if (_bytes.size() < 29 + 3) [[unlikely]]
                    throw cardano_error(fmt::format("pointer address must have at least 32 bytes but has {}!", _bytes.size()));
                break;
            default:
                throw cardano_error(fmt::format("unsupported address type: {}!", type()));
        }
    }

    bool address::has_pay_id() const
    {
        return type() <= 0b0111;
    }

    bool address::has_stake_id() const
    {
        return type() <= 0b0011 || is_reward();
    }

    bool address::has_pointer() const
    {
        return type() == 0b0100 || type() == 0b0101;
    }

    bool address::is_reward() const
    {
        return type() == 0b1110 || type() == 0b1111;
    }

    credential_t address::pay_id() const
    {
        if (!has_pay_id()) [[unlikely]]
            throw cardano_error(fmt::format("address type {} has no payment component!", type()));
        return { key_hash { _bytes.span().subbuf(1, 28) }, (type() & 0x1) > 0 };
    }

    credential_t address::stake_id() const
    {
        if (is_reward())
            return { key_hash { _bytes.span().subbuf(1, 28) }, (type() & 0x1) > 0 };
        if (type() <= 0b0011)
            return { key_hash { _bytes.span().subbuf(29, 28) }, (type() & 0x2) > 0 };
        throw cardano_error(fmt::format("address type {} has no staking component!", type()));
    }

    address address::stake_address() const
    {
        return reward(stake_id(), network());
    }

    std::string address::to_bech32() const
    {
        const bool mainnet = network() == network_id::mainnet;
        if (is_reward())
            return bech32::encode(mainnet ? "stake" : "stake_test", _bytes);
        return bech32::encode(mainnet ? "addr" : "addr_test", _bytes);
    }
}
