/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_BECH32_HPP
#define ADA_COMPOSER_BECH32_HPP

#include <string>
#include <string_view>
#include <ac/common/bytes.hpp>

namespace ada_composer {
    struct bech32 {
        static constexpr char separator = '1';

        // encodes an 8-bit payload under the given human-readable prefix
        static std::string encode(std::string_view prefix, buffer data);

        explicit bech32(std::string_view text);

        [[nodiscard]] const std::string &prefix() const noexcept
        {
            return _prefix;
        }

        [[nodiscard]] buffer data() const noexcept
        {
            return _data;
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return _data.size();
        }
    private:
        std::string _prefix {};
        uint8_vector _data {};
    };
}

#endif // !ADA_COMPOSER_BECH32_HPP
