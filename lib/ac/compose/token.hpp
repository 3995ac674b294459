/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_TOKEN_HPP
#define ADA_COMPOSER_COMPOSE_TOKEN_HPP

#include <optional>
#include <string>
#include <ac/json.hpp>
#include <ac/cardano/native-script.hpp>
#include <ac/compose/errors.hpp>

namespace ada_composer::compose {
    static constexpr size_t max_asset_name_size = 32;

    struct token_policy {
        static std::string default_dir();

        // loads <dir>/<name>.script when it exists and leaves the policy unresolved otherwise
        static token_policy load(std::string name, const std::string &dir=default_dir());

        static token_policy from_script(std::string name, cardano::native_script script);

        // a policy the caller does not control, known only by its id
        static token_policy from_id(std::string name, const cardano::script_hash &id);

        explicit token_policy(std::string name, std::optional<cardano::native_script> script={},
            std::optional<cardano::script_hash> id={}, std::optional<std::string> dir={});

        const std::string &name() const noexcept
        {
            return _name;
        }

        const std::optional<cardano::native_script> &script() const noexcept
        {
            return _script;
        }

        bool has_id() const noexcept
        {
            return _id.has_value();
        }

        const cardano::script_hash &id() const;
        std::string script_path() const;

        // creates a CIP-25 style all-of policy for the signers with an optional before-slot lock and saves it
        void generate(const vector<cardano::key_hash> &signers, std::optional<uint64_t> expiration_slot={});
        std::optional<uint64_t> expiration_slot() const;
        vector<cardano::key_hash> required_signatures() const;
        bool is_expired(uint64_t current_slot) const;
        int64_t slots_until_expiration(uint64_t current_slot) const;
    private:
        std::string _name;
        std::optional<cardano::native_script> _script;
        std::optional<cardano::script_hash> _id;
        std::optional<std::string> _dir;

        const cardano::native_script &_require_script() const;
    };

    struct token {
        // token quantities must be whole numbers
        static int64_t amount_from_json(const json::value &j);

        token(token_policy policy, int64_t amount, std::string name, json::object metadata={});
        static token from_hex_name(token_policy policy, int64_t amount, std::string_view hex_name, json::object metadata={});

        const token_policy &policy() const noexcept
        {
            return _policy;
        }

        const cardano::script_hash &policy_id() const
        {
            return _policy.id();
        }

        int64_t amount() const noexcept
        {
            return _amount;
        }

        const std::string &name() const noexcept
        {
            return _name;
        }

        const std::string &hex_name() const noexcept
        {
            return _hex_name;
        }

        uint8_vector bytes_name() const
        {
            return uint8_vector { buffer { _name } };
        }

        const json::object &metadata() const noexcept
        {
            return _metadata;
        }

        token with_amount(int64_t amount) const;
    private:
        token_policy _policy;
        int64_t _amount;
        std::string _name;
        std::string _hex_name;
        json::object _metadata;
    };
    using token_list = vector<token>;
}

namespace fmt {
    template<>
    struct formatter<ada_composer::compose::token>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{} {}.{}", v.amount(), v.policy().name(), v.name());
        }
    };
}

#endif // !ADA_COMPOSER_COMPOSE_TOKEN_HPP
