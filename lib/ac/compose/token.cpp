/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <limits>
#include <ac/compose/metadata.hpp>
#include <ac/compose/token.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    std::string token_policy::default_dir()
    {
        return "./priv/policies";
    }

    token_policy token_policy::load(std::string name, const std::string &dir)
    {
        return token_policy { std::move(name), {}, {}, dir };
    }

    token_policy token_policy::from_script(std::string name, cardano::native_script script)
    {
        return token_policy { std::move(name), std::move(script) };
    }

    token_policy token_policy::from_id(std::string name, const cardano::script_hash &id)
    {
        return token_policy { std::move(name), {}, id };
    }

    token_policy::token_policy(std::string name, std::optional<cardano::native_script> script,
            std::optional<cardano::script_hash> id, std::optional<std::string> dir):
        _name { std::move(name) }, _script { std::move(script) }, _id { std::move(id) }, _dir { std::move(dir) }
    {
        if (_name.empty())
            throw error("a token policy must have a name");
        if (!_script && _dir) {
            const auto path = script_path();
            if (std::filesystem::exists(path)) {
                _script = cardano::native_script::from_json(json::load(path));
                logger::debug("loaded policy {} from {}", _name, path);
            }
        }
        if (_script) {
            const auto script_id = _script->hash();
            if (_id && *_id != script_id)
                throw error(fmt::format("policy {}: the id {} does not match the script hash {}", _name, *_id, script_id));
            _id = script_id;
        }
    }

    const cardano::script_hash &token_policy::id() const
    {
        if (!_id)
            throw policy_script_missing_error(fmt::format("policy {} has neither a script nor an id", _name));
        return *_id;
    }

    std::string token_policy::script_path() const
    {
        if (!_dir)
            throw error(fmt::format("policy {} has no directory", _name));
        return (std::filesystem::path { *_dir } / fmt::format("{}.script", _name)).string();
    }

    void token_policy::generate(const vector<cardano::key_hash> &signers, const std::optional<uint64_t> expiration_slot)
    {
        if (_script || (_dir && std::filesystem::exists(script_path())))
            throw error(fmt::format("policy {} already exists", _name));
        if (signers.empty())
            throw error(fmt::format("policy {}: at least one signer is required", _name));
        cardano::native_script::script_list scripts {};
        for (const auto &hash: signers)
            scripts.emplace_back(cardano::native_script::sig_t { hash });
        if (expiration_slot)
            scripts.emplace_back(cardano::native_script::before_t { *expiration_slot });
        cardano::native_script script { cardano::native_script::all_t { std::move(scripts) } };
        if (_dir) {
            const auto path = script_path();
            json::save_pretty(path, script.to_json());
            logger::info("saved policy {} to {}", _name, path);
        }
        _id = script.hash();
        _script = std::move(script);
    }

    const cardano::native_script &token_policy::_require_script() const
    {
        if (!_script)
            throw policy_script_missing_error(fmt::format("the script of policy {} is not set", _name));
        return *_script;
    }

    std::optional<uint64_t> token_policy::expiration_slot() const
    {
        std::optional<uint64_t> exp {};
        for (const auto &s: _require_script().top_level()) {
            if (const auto *before = std::get_if<cardano::native_script::before_t>(&s.val); before) {
                if (!exp || before->slot < *exp)
                    exp = before->slot;
            }
        }
        return exp;
    }

    vector<cardano::key_hash> token_policy::required_signatures() const
    {
        vector<cardano::key_hash> res {};
        for (const auto &s: _require_script().top_level()) {
            if (const auto *sig = std::get_if<cardano::native_script::sig_t>(&s.val); sig)
                res.emplace_back(sig->hash);
        }
        return res;
    }

    bool token_policy::is_expired(const uint64_t current_slot) const
    {
        const auto exp = expiration_slot();
        return exp && current_slot >= *exp;
    }

    int64_t token_policy::slots_until_expiration(const uint64_t current_slot) const
    {
        const auto exp = expiration_slot();
        if (!exp)
            throw error(fmt::format("policy {} does not expire", _name));
        return static_cast<int64_t>(*exp) - static_cast<int64_t>(current_slot);
    }

    int64_t token::amount_from_json(const json::value &j)
    {
        switch (j.kind()) {
            case json::kind::int64:
                return j.get_int64();
            case json::kind::uint64:
                if (j.get_uint64() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                    throw type_mismatch_error(fmt::format("token amount {} is out of range", j.get_uint64()));
                return static_cast<int64_t>(j.get_uint64());
            default:
                throw type_mismatch_error(fmt::format("token amounts must be integers but got: {}", json::serialize(j)));
        }
    }

    token::token(token_policy policy, const int64_t amount, std::string name, json::object metadata):
        _policy { std::move(policy) }, _amount { amount }, _name { std::move(name) },
        _hex_name { to_hex(buffer { _name }) }, _metadata { std::move(metadata) }
    {
        if (_name.size() > max_asset_name_size)
            throw error(fmt::format("asset name {} is longer than {} bytes", _name, max_asset_name_size));
        validate_metadata(_metadata);
    }

    token token::from_hex_name(token_policy policy, const int64_t amount, const std::string_view hex_name, json::object metadata)
    {
        const auto bytes = uint8_vector::from_hex(hex_name);
        return token { std::move(policy), amount, std::string { bytes.str() }, std::move(metadata) };
    }

    token token::with_amount(const int64_t amount) const
    {
        auto copy = *this;
        copy._amount = amount;
        return copy;
    }
}
