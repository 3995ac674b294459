/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <utfcpp/utf8.h>
#include <ac/common/variant.hpp>
#include <ac/compose/metadata.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    using kind_type = metadata_violation::kind_type;

    static std::string scalar_text(const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::string: return std::string { v.get_string() };
            case json::kind::int64: return fmt::format("{}", v.get_int64());
            case json::kind::uint64: return fmt::format("{}", v.get_uint64());
            case json::kind::double_: return fmt::format("{}", v.get_double());
            default: return json::serialize(v);
        }
    }

    static std::optional<metadata_violation> find_too_long(const json::value &v, const std::string &path)
    {
        switch (v.kind()) {
            case json::kind::object:
                for (const auto &kv: v.get_object()) {
                    const auto sub_path = fmt::format("{}/{}", path, std::string_view { kv.key() });
                    if (kv.key().size() > max_metadata_field_size)
                        return metadata_violation { kind_type::too_long, sub_path,
                            fmt::format("metadata key is too long ({} > {} bytes)", kv.key().size(), max_metadata_field_size) };
                    if (auto res = find_too_long(kv.value(), sub_path); res)
                        return res;
                }
                return {};
            case json::kind::array: {
                size_t idx = 0;
                for (const auto &sub_v: v.get_array()) {
                    if (auto res = find_too_long(sub_v, fmt::format("{}/{}", path, idx++)); res)
                        return res;
                }
                return {};
            }
            default:
                if (const auto text = scalar_text(v); text.size() > max_metadata_field_size)
                    return metadata_violation { kind_type::too_long, path,
                        fmt::format("metadata field is too long ({} > {} bytes), consider splitting it into an array of shorter strings", text.size(), max_metadata_field_size) };
                return {};
        }
    }

    static std::optional<metadata_violation> find_not_serializable(const json::value &v, const std::string &path)
    {
        switch (v.kind()) {
            case json::kind::object:
                for (const auto &kv: v.get_object()) {
                    if (auto res = find_not_serializable(kv.value(), fmt::format("{}/{}", path, std::string_view { kv.key() })); res)
                        return res;
                }
                return {};
            case json::kind::array: {
                size_t idx = 0;
                for (const auto &sub_v: v.get_array()) {
                    if (auto res = find_not_serializable(sub_v, fmt::format("{}/{}", path, idx++)); res)
                        return res;
                }
                return {};
            }
            case json::kind::string:
            case json::kind::int64:
            case json::kind::uint64:
                return {};
            case json::kind::double_:
                if (const auto d = v.get_double(); !std::isfinite(d) || std::trunc(d) != d)
                    return metadata_violation { kind_type::not_serializable, path, fmt::format("fractional numbers are not supported: {}", d) };
                return {};
            case json::kind::bool_:
                return metadata_violation { kind_type::not_serializable, path, "boolean values are not supported" };
            case json::kind::null:
                return metadata_violation { kind_type::not_serializable, path, "null values are not supported" };
            default:
                return metadata_violation { kind_type::not_serializable, path, "unsupported value kind" };
        }
    }

    std::optional<metadata_violation> find_metadata_violation(const json::value &v)
    {
        if (auto res = find_too_long(v, ""); res)
            return res;
        return find_not_serializable(v, "");
    }

    void validate_metadata(const json::value &v)
    {
        const auto violation = find_metadata_violation(v);
        if (!violation)
            return;
        const auto path = violation->path.empty() ? std::string { "/" } : violation->path;
        if (violation->kind == kind_type::too_long)
            throw metadata_field_too_long_error(fmt::format("{}: {}", path, violation->description));
        throw metadata_not_serializable_error(fmt::format("{}: {}", path, violation->description));
    }

    json::array chunk_message(const std::string_view text)
    {
        if (const auto it = utf8::find_invalid(text.begin(), text.end()); it != text.end())
            throw metadata_not_serializable_error(fmt::format("a message has an invalid UTF-8 sequence at byte {}", it - text.begin()));
        json::array chunks {};
        auto start = text.begin();
        while (start != text.end()) {
            auto end = start;
            for (auto next = end; next != text.end(); end = next) {
                utf8::next(next, text.end());
                if (static_cast<size_t>(next - start) > max_metadata_field_size)
                    break;
            }
            chunks.emplace_back(std::string_view { start, end });
            start = end;
        }
        return chunks;
    }

    json::object format_message(const message_t &msg)
    {
        const auto lines = std::visit<json::array>(variant::overloaded {
            [](const std::string &text) {
                return chunk_message(text);
            },
            [](const vector<std::string> &src) {
                json::array res {};
                for (const auto &line: src) {
                    if (line.size() > max_metadata_field_size)
                        throw metadata_field_too_long_error(fmt::format("message line is too long ({} > {} bytes): {}", line.size(), max_metadata_field_size, line));
                    res.emplace_back(line);
                }
                return res;
            }
        }, msg);
        return json::object { { "msg", lines } };
    }

    static void value_to_cbor(cbor::encoder &enc, const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::object: {
                const auto &obj = v.get_object();
                enc.map(obj.size());
                for (const auto &kv: obj) {
                    enc.text(kv.key());
                    value_to_cbor(enc, kv.value());
                }
                break;
            }
            case json::kind::array: {
                const auto &arr = v.get_array();
                enc.array(arr.size());
                for (const auto &sub_v: arr)
                    value_to_cbor(enc, sub_v);
                break;
            }
            case json::kind::string:
                enc.text(v.get_string());
                break;
            case json::kind::int64:
                enc.sint(v.get_int64());
                break;
            case json::kind::uint64:
                enc.uint(v.get_uint64());
                break;
            case json::kind::double_:
                enc.sint(static_cast<int64_t>(v.get_double()));
                break;
            default:
                throw metadata_not_serializable_error(fmt::format("unsupported metadata value: {}", json::serialize(v)));
        }
    }

    void metadata_to_cbor(cbor::encoder &enc, const metadata_map &doc)
    {
        enc.map(doc.size());
        for (const auto &[label, v]: doc) {
            validate_metadata(v);
            enc.uint(label);
            value_to_cbor(enc, v);
        }
    }

    void metadata_assembler::add_token(const cardano::script_hash &policy_id, const std::string_view name, const int64_t quantity, const json::object &meta)
    {
        if (quantity <= 0 || meta.empty())
            return;
        auto &policy_meta = _tokens[policy_id.to_hex()];
        if (!policy_meta.is_object())
            policy_meta = json::object {};
        policy_meta.as_object()[name] = meta;
    }

    void metadata_assembler::message(const message_t &msg)
    {
        if (const auto *text = std::get_if<std::string>(&msg); text && text->empty())
            return;
        if (const auto *lines = std::get_if<vector<std::string>>(&msg); lines && lines->empty())
            return;
        _message = format_message(msg);
    }

    void metadata_assembler::custom(const uint64_t label, const json::value &v)
    {
        validate_metadata(v);
        _custom.insert_or_assign(label, v);
    }

    metadata_map metadata_assembler::build() const
    {
        metadata_map doc {};
        if (!_tokens.empty())
            doc.emplace(nft_metadata_label, _tokens);
        if (_message)
            doc.emplace(message_label, *_message);
        for (const auto &[label, v]: _custom) {
            if (doc.contains(label))
                logger::debug("custom metadata replaces the generated entry under label {}", label);
            doc.insert_or_assign(label, v);
        }
        for (const auto &[label, v]: doc)
            validate_metadata(v);
        return doc;
    }
}
