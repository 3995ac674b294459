/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_CARDANO_NATIVE_SCRIPT_HPP
#define ADA_COMPOSER_CARDANO_NATIVE_SCRIPT_HPP

#include <optional>
#include <variant>
#include <ac/cardano/types.hpp>

namespace ada_composer::cardano {
    using optional_error_string = std::optional<std::string>;

    struct native_script {
        using script_list = vector<native_script>;

        struct sig_t {
            key_hash hash {};
        };

        struct all_t {
            script_list scripts {};
        };

        struct any_t {
            script_list scripts {};
        };

        struct at_least_t {
            uint64_t required = 0;
            script_list scripts {};
        };

        // valid starting from the slot: InvalidBefore in the ledger's terms
        struct after_t {
            uint64_t slot = 0;
        };

        // valid strictly before the slot: InvalidHereafter in the ledger's terms
        struct before_t {
            uint64_t slot = 0;
        };

        using value_type = std::variant<sig_t, all_t, any_t, at_least_t, after_t, before_t>;
        value_type val;

        // parses the script format of cardano-cli
        static native_script from_json(const json::value &j);

        json::object to_json() const;
        void to_cbor(cbor::encoder &enc) const;
        uint8_vector cbor() const;
        // blake2b-224 of the native script tag followed by the script's CBOR
        script_hash hash() const;
        optional_error_string validate(uint64_t slot, const set<key_hash> &vkeys) const;
        // the immediate children of all, any and atLeast scripts; the script itself otherwise
        script_list top_level() const;

        bool operator==(const native_script &o) const
        {
            return cbor() == o.cbor();
        }
    };
}

#endif // !ADA_COMPOSER_CARDANO_NATIVE_SCRIPT_HPP
