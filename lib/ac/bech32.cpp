/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <cctype>
#include <ac/bech32.hpp>

namespace ada_composer {
    static constexpr std::string_view charset { "qpzry9x8gf2tvdw0s3jn54khce6mua7l" };

    static uint8_t decode_char(const char k)
    {
        const auto pos = charset.find(static_cast<char>(std::tolower(k)));
        if (pos == charset.npos) [[unlikely]]
            throw error(fmt::format("unsupported bech32 data char: '{}'", k));
        return static_cast<uint8_t>(pos);
    }

    static uint32_t polymod(const uint8_vector &vals)
    {
        static constexpr std::array<uint32_t, 5> gen { 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
        uint32_t chk = 1;
        for (const auto v: vals) {
            const uint32_t b = chk >> 25;
            chk = ((chk & 0x1ffffff) << 5) ^ v;
            for (size_t i = 0; i < gen.size(); ++i)
                chk ^= (b >> i) & 1 ? gen[i] : 0;
        }
        return chk;
    }

    static uint8_vector expand_prefix(const std::string_view prefix)
    {
        uint8_vector x {};
        x.reserve(prefix.size() * 2 + 1);
        for (const auto k: prefix)
            x.emplace_back(std::tolower(k) >> 5);
        x.emplace_back(0);
        for (const auto k: prefix)
            x.emplace_back(std::tolower(k) & 31);
        return x;
    }

    std::string bech32::encode(const std::string_view prefix, const buffer data)
    {
        if (prefix.empty()) [[unlikely]]
            throw error("bech32 prefix must not be empty!");
        uint8_vector u5 {};
        uint32_t acc = 0;
        uint32_t bits = 0;
        for (const auto b: data) {
            acc = (acc << 8) | b;
            bits += 8;
            while (bits >= 5) {
                bits -= 5;
                u5.emplace_back((acc >> bits) & 31);
            }
        }
        if (bits > 0)
            u5.emplace_back((acc << (5 - bits)) & 31);
        auto chk_input = expand_prefix(prefix);
        chk_input << u5;
        chk_input.resize(chk_input.size() + 6, 0);
        const auto chk = polymod(chk_input) ^ 1;
        std::string res { prefix };
        res += separator;
        for (const auto v: u5)
            res += charset[v];
        for (size_t i = 0; i < 6; ++i)
            res += charset[(chk >> (5 * (5 - i))) & 31];
        return res;
    }

    bech32::bech32(const std::string_view text)
    {
        const auto sep_pos = text.rfind(separator);
        if (sep_pos == text.npos || sep_pos == 0) [[unlikely]]
            throw error(fmt::format("can't find bech32 separator '{}' in '{}'", separator, text));
        _prefix = text.substr(0, sep_pos);
        const auto data = text.substr(sep_pos + 1);
        if (data.size() < 6) [[unlikely]]
            throw error(fmt::format("bech32 data part must be at least 6 characters long: {}", data));
        uint8_vector u5 {};
        u5.reserve(data.size());
        for (const auto k: data)
            u5.emplace_back(decode_char(k));
        auto chk_input = expand_prefix(_prefix);
        chk_input << u5;
        if (polymod(chk_input) != 1) [[unlikely]]
            throw error(fmt::format("bech32 checksum verification failed: {}", text));
        uint32_t acc = 0;
        uint32_t bits = 0;
        for (size_t i = 0; i < u5.size() - 6; ++i) {
            acc = (acc << 5) | u5[i];
            bits += 5;
            while (bits >= 8) {
                bits -= 8;
                _data.emplace_back((acc >> bits) & 0xFF);
            }
        }
        if (bits >= 5) [[unlikely]]
            throw error(fmt::format("bech32 payload contains an incomplete group of {} bits: {}", bits, text));
        if ((acc & ((1U << bits) - 1)) != 0) [[unlikely]]
            throw error(fmt::format("bech32 padding bits must be zero: {}", text));
    }
}
