#pragma once
#ifndef ADA_COMPOSER_BLAKE2B_HPP
#define ADA_COMPOSER_BLAKE2B_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/array.hpp>
#include <ac/common/bytes.hpp>

namespace ada_composer {
    using blake2b_224_hash = byte_array<28>;
    using blake2b_256_hash = byte_array<32>;

    // initializes libsodium once per process, safe to call repeatedly
    extern void sodium_ensure_initialized();
    extern void blake2b(std::span<uint8_t> out, buffer in);

    template<typename T>
    T blake2b(const buffer in)
    {
        T out;
        blake2b(std::span<uint8_t> { out.data(), out.size() }, in);
        return out;
    }
}

namespace std {
    template<>
    struct hash<ada_composer::blake2b_224_hash> {
        size_t operator()(const ada_composer::blake2b_224_hash &o) const noexcept
        {
            return *reinterpret_cast<const size_t *>(o.data());
        }
    };
}

#endif // !ADA_COMPOSER_BLAKE2B_HPP
