/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <mutex>
extern "C" {
#   include <sodium.h>
}
#include <ac/blake2b.hpp>

namespace ada_composer {
    void sodium_ensure_initialized()
    {
        static std::once_flag init_flag {};
        std::call_once(init_flag, [] {
            if (sodium_init() < 0)
                throw error("libsodium initialization failed!");
        });
    }

    void blake2b(const std::span<uint8_t> out, const buffer in)
    {
        sodium_ensure_initialized();
        if (out.size() < crypto_generichash_BYTES_MIN || out.size() > crypto_generichash_BYTES_MAX) [[unlikely]]
            throw error(fmt::format("unsupported blake2b hash size: {}", out.size()));
        if (crypto_generichash(out.data(), out.size(), in.data(), in.size(), nullptr, 0) != 0)
            throw error("libsodium error: can't compute hash!");
    }
}
