/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <ac/common/test.hpp>
#include <ac/compose/token.hpp>

using namespace ada_composer;
using namespace ada_composer::compose;

suite compose_token_suite = [] {
    "compose::token"_test = [] {
        static const auto signer = cardano::key_hash::from_hex("9493315cd92eb5d8c4304e67b7e16ae36d61d34502694657811a2c8e");
        static const auto other = cardano::key_hash::from_hex("337b62cfff6403a06a3acbc34f8c46003c69fe79a3628cefa9c47251");
        static const std::string policy_dir = (std::filesystem::temp_directory_path() / "ac-test-policies").string();
        "generate and load"_test = [] {
            std::filesystem::remove_all(policy_dir);
            auto policy = token_policy::load("nft", policy_dir);
            expect(!policy.script());
            expect(!policy.has_id());
            expect(throws<policy_script_missing_error>([&] { policy.id(); }));
            policy.generate({ signer, other }, 1000);
            expect(policy.script().has_value() >> fatal);
            expect(std::filesystem::exists(policy.script_path()));
            test_same(policy.script()->hash(), policy.id());
            const auto loaded = token_policy::load("nft", policy_dir);
            expect(loaded.script().has_value() >> fatal);
            test_same(policy.id(), loaded.id());
            expect(throws<error>([&] { policy.generate({ signer }); }));
            auto dup = token_policy::load("nft", policy_dir);
            expect(throws<error>([&] { dup.generate({ signer }); }));
            std::filesystem::remove_all(policy_dir);
        };
        "expiration"_test = [] {
            auto policy = token_policy { "limited" };
            policy.generate({ signer }, 1000);
            test_same(1000, *policy.expiration_slot());
            test_same(1, policy.required_signatures().size());
            test_same(signer, policy.required_signatures().at(0));
            expect(!policy.is_expired(999));
            expect(policy.is_expired(1000));
            test_same(100, policy.slots_until_expiration(900));
            test_same(-10, policy.slots_until_expiration(1010));
            auto forever = token_policy { "forever" };
            forever.generate({ signer });
            expect(!forever.expiration_slot());
            expect(!forever.is_expired(1'000'000'000));
            expect(throws<error>([&] { forever.slots_until_expiration(0); }));
            expect(throws<policy_script_missing_error>([] { token_policy::from_id("raw", signer).expiration_slot(); }));
        };
        "id must match the script"_test = [] {
            const cardano::native_script script { cardano::native_script::sig_t { signer } };
            expect(nothrow([&] { token_policy { "p", script, script.hash() }; }));
            expect(throws<error>([&] { token_policy { "p", script, signer }; }));
        };
        "names"_test = [] {
            const auto policy = token_policy::from_script("p", cardano::native_script { cardano::native_script::sig_t { signer } });
            const token t { policy, 1, "Token" };
            test_same(std::string { "546f6b656e" }, t.hex_name());
            const auto h = token::from_hex_name(policy, 1, "546f6b656e");
            test_same(std::string { "Token" }, h.name());
            test_same(uint8_vector::from_hex("546f6b656e"), h.bytes_name());
            test_same(policy.id(), h.policy_id());
            expect(throws<error>([&] { token { policy, 1, std::string(33, 'a') }; }));
            test_same(-5, t.with_amount(-5).amount());
        };
        "metadata is validated"_test = [] {
            const auto policy = token_policy::from_id("p", signer);
            expect(nothrow([&] { token { policy, 1, "a", json::object { { "name", "short" } } }; }));
            expect(throws<metadata_field_too_long_error>([&] { token { policy, 1, "a", json::object { { "name", std::string(65, 'x') } } }; }));
            expect(throws<metadata_not_serializable_error>([&] { token { policy, 1, "a", json::object { { "flag", true } } }; }));
        };
        "amount from json"_test = [] {
            test_same(7, token::amount_from_json(json::value(7)));
            test_same(-3, token::amount_from_json(json::value(-3)));
            expect(throws<type_mismatch_error>([] { token::amount_from_json(json::value(1.5)); }));
            expect(throws<type_mismatch_error>([] { token::amount_from_json(json::value("7")); }));
        };
    };
};
