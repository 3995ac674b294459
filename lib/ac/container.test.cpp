/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/common/test.hpp>
#include <algorithm>
#include <ac/container.hpp>

using namespace ada_composer;

namespace {
    using std::string_literals::operator""s;
}

suite container_suite = [] {
    "container"_test = [] {
        "flat_set"_test = [] {
            flat_set<std::string> s {};
            s.emplace("b"s);
            s.emplace("a"s);
            s.emplace("c"s);
            s.emplace("a"s);
            test_same(3, s.size());
            test_same("a"s, *s.begin());
            test_same("c"s, *std::prev(s.end()));
        };
        "merge"_test = [] {
            map<std::string, int64_t> m {};
            test_same(5, merge(m, "a"s, 5));
            test_same(2, merge(m, "a"s, -3));
            test_same(7, merge(m, "b"s, 7));
            test_same(2, m.size());
            test_same(7, merge(m, "b"s, 3, [](const auto a, const auto b) { return std::max<int64_t>(a, b); }));
            test_same(8, merge(m, "b"s, 8, [](const auto a, const auto b) { return std::max<int64_t>(a, b); }));
        };
        "nested merge"_test = [] {
            map<std::string, map<std::string, int64_t>> m {};
            merge(m["p"], "x"s, 1);
            merge(m["p"], "x"s, 2);
            merge(m["q"], "y"s, -1);
            test_same(3, m.at("p").at("x"));
            test_same(-1, m.at("q").at("y"));
        };
    };
};
