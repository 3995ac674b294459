/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/common/test.hpp>
#include <ac/blake2b.hpp>

using namespace ada_composer;

suite blake2b_suite = [] {
    "blake2b"_test = [] {
        "empty input"_test = [] {
            test_same(blake2b_256_hash::from_hex("0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8"),
                blake2b<blake2b_256_hash>(uint8_vector {}));
            test_same(blake2b_224_hash::from_hex("836cc68931c2e4e3e838602eca1902591d216837bafddfe6f0c8cb07"),
                blake2b<blake2b_224_hash>(uint8_vector {}));
        };
        "deterministic"_test = [] {
            const auto data = uint8_vector::from_hex("8200581c9493315cd92eb5d8c4304e67b7e16ae36d61d34502694657811a2c8e");
            test_same(blake2b<blake2b_224_hash>(data), blake2b<blake2b_224_hash>(data));
            expect(blake2b<blake2b_224_hash>(data) != blake2b<blake2b_224_hash>(data.span().subbuf(1)));
        };
        "invalid size"_test = [] {
            std::array<uint8_t, 8> out {};
            expect(throws<error>([&] { blake2b(std::span<uint8_t> { out.data(), 0 }, buffer {}); }));
        };
    };
};
