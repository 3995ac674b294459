/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_CARDANO_CERT_HPP
#define ADA_COMPOSER_CARDANO_CERT_HPP

#include <variant>
#include <ac/cardano/types.hpp>

namespace ada_composer::cardano {
    struct stake_reg_cert {
        credential_t stake_id {};

        bool operator==(const stake_reg_cert &) const =default;
    };

    struct stake_deleg_cert {
        credential_t stake_id {};
        pool_hash pool_id {};

        bool operator==(const stake_deleg_cert &) const =default;
    };

    struct cert_t {
        using value_type = std::variant<stake_reg_cert, stake_deleg_cert>;
        value_type val;

        const credential_t &stake_id() const
        {
            return std::visit([](const auto &c) -> const credential_t & { return c.stake_id; }, val);
        }

        void to_cbor(cbor::encoder &enc) const
        {
            if (const auto *reg = std::get_if<stake_reg_cert>(&val); reg) {
                enc.array(2).uint(0);
                reg->stake_id.to_cbor(enc);
            } else {
                const auto &deleg = std::get<stake_deleg_cert>(val);
                enc.array(3).uint(2);
                deleg.stake_id.to_cbor(enc);
                enc.bytes(deleg.pool_id);
            }
        }

        bool operator==(const cert_t &) const =default;
    };
    using cert_list = vector<cert_t>;
}

namespace fmt {
    template<>
    struct formatter<ada_composer::cardano::cert_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace ada_composer::cardano;
            if (const auto *reg = std::get_if<stake_reg_cert>(&v.val); reg)
                return fmt::format_to(ctx.out(), "stake_reg({})", reg->stake_id);
            const auto &deleg = std::get<stake_deleg_cert>(v.val);
            return fmt::format_to(ctx.out(), "stake_deleg({} -> {})", deleg.stake_id, deleg.pool_id);
        }
    };
}

#endif // !ADA_COMPOSER_CARDANO_CERT_HPP
