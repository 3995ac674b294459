#pragma once
#ifndef ADA_COMPOSER_CONTAINER_HPP
#define ADA_COMPOSER_CONTAINER_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <functional>
#include <map>
#include <set>
#include <vector>
#include <boost/container/flat_set.hpp>

namespace ada_composer {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename T, typename C=std::less<T>>
    using set = std::set<T, C>;

    template<typename K>
    struct flat_set: boost::container::flat_set<K> {
        using base_type = boost::container::flat_set<K>;
        using base_type::base_type;
    };

    // upsert-with-combine: inserts delta under key or combines it with the existing value
    template<typename M, typename K, typename V, typename C=std::plus<>>
    typename M::mapped_type &merge(M &m, const K &key, V &&delta, const C &combine=C {})
    {
        auto [it, created] = m.try_emplace(key, std::forward<V>(delta));
        if (!created)
            it->second = combine(it->second, std::forward<V>(delta));
        return it->second;
    }
}

#endif //!ADA_COMPOSER_CONTAINER_HPP
