/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_CARDANO_TYPES_HPP
#define ADA_COMPOSER_CARDANO_TYPES_HPP

#include <compare>
#include <ac/blake2b.hpp>
#include <ac/cbor/encoder.hpp>
#include <ac/container.hpp>
#include <ac/json.hpp>

namespace ada_composer::cardano {
    using cardano_error = error;
    using key_hash = blake2b_224_hash;
    using script_hash = blake2b_224_hash;
    using pool_hash = blake2b_224_hash;
    using tx_hash = blake2b_256_hash;
    using vkey = byte_array<32>;

    static constexpr uint64_t lovelace_per_ada = 1'000'000;

    enum class network_id: uint8_t {
        testnet = 0,
        mainnet = 1
    };

    struct credential_t {
        key_hash hash {};
        bool script { false };

        void to_cbor(cbor::encoder &) const;

        std::strong_ordering operator<=>(const credential_t &o) const
        {
            if (const auto cmp = hash <=> o.hash; cmp != 0)
                return cmp;
            return script <=> o.script;
        }

        bool operator==(const credential_t &o) const =default;
    };

    struct address {
        // accepts bech32 text as well as hex-encoded bytes with an optional 0x prefix
        static address from_string(std::string_view text);
        static address base(const credential_t &pay, const credential_t &stake, network_id net);
        static address enterprise(const credential_t &pay, network_id net);
        static address reward(const credential_t &stake, network_id net);

        explicit address(buffer bytes);

        uint8_t type() const
        {
            return (_bytes[0] >> 4) & 0xF;
        }

        network_id network() const
        {
            return static_cast<network_id>(_bytes[0] & 0xF);
        }

        buffer bytes() const
        {
            return _bytes;
        }

        bool has_pay_id() const;
        bool has_stake_id() const;
        bool has_pointer() const;
        bool is_reward() const;
        credential_t pay_id() const;
        credential_t stake_id() const;
        // the reward address of this address's staking component
        address stake_address() const;
        std::string to_bech32() const;

        bool operator==(const address &o) const
        {
            return _bytes == o._bytes;
        }

        std::strong_ordering operator<=>(const address &o) const
        {
            return _bytes <=> o._bytes;
        }
    private:
        uint8_vector _bytes;
    };

    using asset_map = map<uint8_vector, int64_t>;
    using policy_map = map<script_hash, asset_map>;

    struct tx_out_ref {
        tx_hash hash {};
        uint64_t idx = 0;

        std::strong_ordering operator<=>(const tx_out_ref &o) const =default;
        bool operator==(const tx_out_ref &o) const =default;
    };

    struct tx_output {
        cardano::address address;
        uint64_t coin = 0;
        policy_map assets {};
    };

    struct utxo {
        tx_out_ref ref;
        tx_output output;
    };
    using utxo_list = vector<utxo>;
}

namespace fmt {
    template<>
    struct formatter<ada_composer::cardano::credential_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}-{}", v.script ? "scriptHash" : "keyHash", v.hash);
        }
    };

    template<>
    struct formatter<ada_composer::cardano::address>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_bech32());
        }
    };

    template<>
    struct formatter<ada_composer::cardano::tx_out_ref>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}#{}", v.hash, v.idx);
        }
    };
}

#endif // !ADA_COMPOSER_CARDANO_TYPES_HPP
