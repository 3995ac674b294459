/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_ED25519_HPP
#define ADA_COMPOSER_ED25519_HPP

#include <ac/array.hpp>

namespace ada_composer::ed25519 {
    using vkey = byte_array<32>;
    using skey = secure_byte_array<64>;
    using signature = byte_array<64>;
    using seed = secure_byte_array<32>;

    extern std::pair<skey, vkey> create_from_seed(buffer seed);
    extern vkey extract_vk(buffer sk);
    extern signature sign(buffer msg, buffer sk);
    extern bool verify(buffer sig, buffer vk, buffer msg);
}

#endif // !ADA_COMPOSER_ED25519_HPP
