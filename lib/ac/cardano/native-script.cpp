/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/common/variant.hpp>
#include <ac/cardano/native-script.hpp>

namespace ada_composer::cardano {
    static native_script::script_list scripts_from_json(const json::value &j)
    {
        native_script::script_list scripts {};
        for (const auto &sj: j.as_object().at("scripts").as_array())
            scripts.emplace_back(native_script::from_json(sj));
        return scripts;
    }

    static json::array scripts_to_json(const native_script::script_list &scripts)
    {
        json::array res {};
        for (const auto &s: scripts)
            res.emplace_back(s.to_json());
        return res;
    }

    static void scripts_to_cbor(cbor::encoder &enc, const native_script::script_list &scripts)
    {
        enc.array(scripts.size());
        for (const auto &s: scripts)
            s.to_cbor(enc);
    }

    native_script native_script::from_json(const json::value &j)
    {
        const std::string_view typ = j.as_object().at("type").as_string();
        if (typ == "sig")
            return { sig_t { key_hash::from_hex(j.as_object().at("keyHash").as_string()) } };
        if (typ == "all")
            return { all_t { scripts_from_json(j) } };
        if (typ == "any")
            return { any_t { scripts_from_json(j) } };
        if (typ == "atLeast")
            return { at_least_t { json::value_to<uint64_t>(j.as_object().at("required")), scripts_from_json(j) } };
        if (typ == "after")
            return { after_t { json::value_to<uint64_t>(j.as_object().at("slot")) } };
        if (typ == "before")
            return { before_t { json::value_to<uint64_t>(j.as_object().at("slot")) } };
        throw cardano_error(fmt::format("unsupported native script type: {}", typ));
    }

    json::object native_script::to_json() const
    {
        return std::visit<json::object>(variant::overloaded {
            [](const sig_t &s) {
                return json::object { { "type", "sig" }, { "keyHash", s.hash.to_hex() } };
            },
            [](const all_t &s) {
                return json::object { { "type", "all" }, { "scripts", scripts_to_json(s.scripts) } };
            },
            [](const any_t &s) {
                return json::object { { "type", "any" }, { "scripts", scripts_to_json(s.scripts) } };
            },
            [](const at_least_t &s) {
                return json::object { { "type", "atLeast" }, { "required", s.required }, { "scripts", scripts_to_json(s.scripts) } };
            },
            [](const after_t &s) {
                return json::object { { "type", "after" }, { "slot", s.slot } };
            },
            [](const before_t &s) {
                return json::object { { "type", "before" }, { "slot", s.slot } };
            }
        }, val);
    }

    void native_script::to_cbor(cbor::encoder &enc) const
    {
        std::visit(variant::overloaded {
            [&](const sig_t &s) { enc.array(2).uint(0).bytes(s.hash); },
            [&](const all_t &s) { enc.array(2).uint(1); scripts_to_cbor(enc, s.scripts); },
            [&](const any_t &s) { enc.array(2).uint(2); scripts_to_cbor(enc, s.scripts); },
            [&](const at_least_t &s) { enc.array(3).uint(3).uint(s.required); scripts_to_cbor(enc, s.scripts); },
            [&](const after_t &s) { enc.array(2).uint(4).uint(s.slot); },
            [&](const before_t &s) { enc.array(2).uint(5).uint(s.slot); }
        }, val);
    }

    uint8_vector native_script::cbor() const
    {
        cbor::encoder enc {};
        to_cbor(enc);
        return enc.cbor();
    }

    script_hash native_script::hash() const
    {
        uint8_vector tagged {};
        tagged << static_cast<uint8_t>(0) << cbor();
        return blake2b<script_hash>(tagged);
    }

    optional_error_string native_script::validate(const uint64_t slot, const set<key_hash> &vkeys) const
    {
        return std::visit<optional_error_string>(variant::overloaded {
            [&](const sig_t &s) -> optional_error_string {
                if (!vkeys.contains(s.hash)) [[unlikely]]
                    return fmt::format("required key {} didn't sign the transaction", s.hash);
                return {};
            },
            [&](const all_t &s) -> optional_error_string {
                for (const auto &sub: s.scripts) {
                    if (auto err = sub.validate(slot, vkeys); err)
                        return err;
                }
                return {};
            },
            [&](const any_t &s) -> optional_error_string {
                for (const auto &sub: s.scripts) {
                    if (!sub.validate(slot, vkeys))
                        return {};
                }
                return fmt::format("no child script has been successful!");
            },
            [&](const at_least_t &s) -> optional_error_string {
                uint64_t num_ok = 0;
                for (const auto &sub: s.scripts) {
                    if (!sub.validate(slot, vkeys))
                        ++num_ok;
                }
                if (num_ok < s.required) [[unlikely]]
                    return fmt::format("only {} child scripts succeed while {} are required!", num_ok, s.required);
                return {};
            },
            [&](const after_t &s) -> optional_error_string {
                if (slot < s.slot)
                    return fmt::format("invalid before {} while the current slot is {}!", s.slot, slot);
                return {};
            },
            [&](const before_t &s) -> optional_error_string {
                if (slot >= s.slot)
                    return fmt::format("invalid after {} while the current slot is {}!", s.slot, slot);
                return {};
            }
        }, val);
    }

    native_script::script_list native_script::top_level() const
    {
        return std::visit<script_list>(variant::overloaded {
            [](const all_t &s) { return s.scripts; },
            [](const any_t &s) { return s.scripts; },
            [](const at_least_t &s) { return s.scripts; },
            [&](const auto &) { return script_list { *this }; }
        }, val);
    }
}
