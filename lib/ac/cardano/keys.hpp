/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_CARDANO_KEYS_HPP
#define ADA_COMPOSER_CARDANO_KEYS_HPP

#include <ac/ed25519.hpp>
#include <ac/cardano/types.hpp>

namespace ada_composer::cardano {
    // A signing capability handed over by the key-material provider
    struct signing_key {
        static signing_key from_seed(const buffer seed)
        {
            auto [sk, vk] = ed25519::create_from_seed(seed);
            return { std::move(sk), vk };
        }

        ed25519::skey skey {};
        ed25519::vkey vkey {};

        key_hash hash() const
        {
            return blake2b<key_hash>(vkey);
        }

        ed25519::signature sign(const buffer msg) const
        {
            return ed25519::sign(msg, skey);
        }

        bool operator==(const signing_key &o) const
        {
            return vkey == o.vkey;
        }
    };
    using signing_key_list = vector<signing_key>;
}

namespace fmt {
    template<>
    struct formatter<ada_composer::cardano::signing_key>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "signing_key({})", v.hash());
        }
    };
}

#endif // !ADA_COMPOSER_CARDANO_KEYS_HPP
