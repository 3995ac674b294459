/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/common/test.hpp>
#include <ac/cbor/encoder.hpp>

using namespace ada_composer;

suite cbor_encoder_suite = [] {
    "cbor::encoder"_test = [] {
        "uint boundaries"_test = [] {
            cbor::encoder enc {};
            enc.uint(23).uint(24).uint(255).uint(256).uint(65536).uint(0x100000000ULL);
            test_same(uint8_vector::from_hex("171818" "18ff" "190100" "1a00010000" "1b0000000100000000"), enc.cbor());
        };
        "signed integers"_test = [] {
            cbor::encoder enc {};
            enc.sint(-1).sint(-100).sint(10);
            test_same(uint8_vector::from_hex("203863" "0a"), enc.cbor());
        };
        "text and bytes"_test = [] {
            cbor::encoder enc {};
            enc.array(2).text("msg").bytes(uint8_vector::from_hex("0102"));
            test_same(uint8_vector::from_hex("82636d7367420102"), enc.cbor());
        };
        "simple values"_test = [] {
            cbor::encoder enc {};
            enc.map(1).s_bool(true).s_null();
            test_same(uint8_vector::from_hex("a1f5f6"), enc.cbor());
        };
        "raw items"_test = [] {
            cbor::encoder item {};
            item.array(1).uint(1);
            cbor::encoder enc {};
            enc.array(2).raw_cbor(item.cbor()).s_null();
            test_same(uint8_vector::from_hex("828101f6"), enc.cbor());
        };
    };
};
