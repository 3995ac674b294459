/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/common/test.hpp>
#include <ac/cardano/types.hpp>

using namespace ada_composer;
using namespace ada_composer::cardano;

suite cardano_types_suite = [] {
    "cardano::types"_test = [] {
        static const auto pay_hash = key_hash::from_hex("9493315cd92eb5d8c4304e67b7e16ae36d61d34502694657811a2c8e");
        static const auto stake_hash = key_hash::from_hex("337b62cfff6403a06a3acbc34f8c46003c69fe79a3628cefa9c47251");
        "base address"_test = [] {
            const auto addr = address::from_string("addr1qx2fxv2umyhttkxyxp8x0dlpdt3k6cwng5pxj3jhsydzer3n0d3vllmyqwsx5wktcd8cc3sq835lu7drv2xwl2wywfgse35a3x");
            test_same(0, addr.type());
            expect(addr.network() == network_id::mainnet);
            expect(addr.has_stake_id());
            expect(!addr.has_pointer());
            test_same(credential_t { pay_hash, false }, addr.pay_id());
            test_same(credential_t { stake_hash, false }, addr.stake_id());
            test_same(std::string { "stake1uyehkck0lajq8gr28t9uxnuvgcqrc6070x3k9r8048z8y5gh6ffgw" }, addr.stake_address().to_bech32());
        };
        "construct from credentials"_test = [] {
            const auto addr = address::base({ pay_hash, false }, { stake_hash, false }, network_id::mainnet);
            test_same(std::string { "addr1qx2fxv2umyhttkxyxp8x0dlpdt3k6cwng5pxj3jhsydzer3n0d3vllmyqwsx5wktcd8cc3sq835lu7drv2xwl2wywfgse35a3x" }, addr.to_bech32());
            const auto ent = address::enterprise({ pay_hash, false }, network_id::mainnet);
            test_same(std::string { "addr1vx2fxv2umyhttkxyxp8x0dlpdt3k6cwng5pxj3jhsydzers66hrl8" }, ent.to_bech32());
            expect(!ent.has_stake_id());
            expect(throws<error>([&] { ent.stake_id(); }));
        };
        "hex input"_test = [] {
            const auto hex = "e1337b62cfff6403a06a3acbc34f8c46003c69fe79a3628cefa9c47251";
            const auto a1 = address::from_string(hex);
            const auto a2 = address::from_string(fmt::format("0x{}", hex));
            test_same(a1, a2);
            expect(a1.is_reward());
            test_same(credential_t { stake_hash, false }, a1.stake_id());
        };
        "pointer address"_test = [] {
            const auto addr = address::from_string("addr1gx2fxv2umyhttkxyxp8x0dlpdt3k6cwng5pxj3jhsydzer5pnz75xxcrzqf96k");
            expect(addr.has_pointer());
            expect(!addr.has_stake_id());
            expect(throws<error>([&] { addr.stake_address(); }));
        };
        "invalid addresses"_test = [] {
            expect(throws<error>([] { address::from_string("e1337b62"); }));
            expect(throws<error>([] { address::from_string("82d818"); }));
            expect(throws<error>([] { address::from_string("not-an-address"); }));
        };
        "credential cbor"_test = [] {
            cbor::encoder enc {};
            credential_t { stake_hash, false }.to_cbor(enc);
            test_same(uint8_vector::from_hex("8200581c337b62cfff6403a06a3acbc34f8c46003c69fe79a3628cefa9c47251"), enc.cbor());
        };
    };
};
