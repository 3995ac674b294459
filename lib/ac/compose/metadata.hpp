/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_METADATA_HPP
#define ADA_COMPOSER_COMPOSE_METADATA_HPP

#include <optional>
#include <string>
#include <variant>
#include <ac/container.hpp>
#include <ac/json.hpp>
#include <ac/cardano/types.hpp>
#include <ac/compose/errors.hpp>

namespace ada_composer::compose {
    static constexpr size_t max_metadata_field_size = 64;
    // CIP-25 token metadata
    static constexpr uint64_t nft_metadata_label = 721;
    // CIP-20 transaction messages
    static constexpr uint64_t message_label = 674;

    struct metadata_violation {
        enum class kind_type { too_long, not_serializable };

        kind_type kind;
        // a slash-separated location of the offending element within the checked tree
        std::string path;
        std::string description;
    };

    // Walks the tree depth-first and reports the first key or scalar leaf that breaks the metadata rules
    extern std::optional<metadata_violation> find_metadata_violation(const json::value &v);
    // Throws metadata_field_too_long_error or metadata_not_serializable_error for the first violation
    extern void validate_metadata(const json::value &v);

    // Splits text into segments of at most max_metadata_field_size bytes without breaking UTF-8 sequences
    extern json::array chunk_message(std::string_view text);

    using message_t = std::variant<std::string, vector<std::string>>;
    extern json::object format_message(const message_t &msg);

    // The auxiliary data document keyed by metadata labels
    using metadata_map = map<uint64_t, json::value>;

    extern void metadata_to_cbor(cbor::encoder &enc, const metadata_map &doc);

    struct metadata_assembler {
        // registers token metadata; only tokens minted in a positive quantity contribute
        void add_token(const cardano::script_hash &policy_id, std::string_view name, int64_t quantity, const json::object &meta);
        void message(const message_t &msg);
        void custom(uint64_t label, const json::value &v);
        [[nodiscard]] metadata_map build() const;
    private:
        json::object _tokens {};
        std::optional<json::object> _message {};
        metadata_map _custom {};
    };
}

#endif // !ADA_COMPOSER_COMPOSE_METADATA_HPP
