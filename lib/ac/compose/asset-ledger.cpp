/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/compose/asset-ledger.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    asset_ledger::asset_ledger(const token_list &tokens)
    {
        for (const auto &t: tokens)
            add(t);
    }

    void asset_ledger::_add_policy(const token_policy &policy)
    {
        if (!policy.script())
            throw policy_script_missing_error(fmt::format("cannot mint or burn under policy {}: its script is not available", policy.name()));
        const auto &script = *policy.script();
        const auto &id = policy.id();
        const auto [it, created] = _script_idx.try_emplace(id, _scripts.size());
        if (!created) {
            if (_scripts.at(it->second) != script)
                throw error(fmt::format("policy {} has conflicting script definitions", id));
            return;
        }
        _scripts.emplace_back(script);
        if (const auto exp = policy.expiration_slot(); exp && (!_ttl || *exp < *_ttl))
            _ttl = *exp;
        logger::debug("asset ledger: policy {} ({}) attached", policy.name(), id);
    }

    void asset_ledger::add(const token &t)
    {
        _add_policy(t.policy());
        const auto name = t.bytes_name();
        merge(_signed[t.policy_id()], name, t.amount());
        if (t.amount() > 0)
            merge(_mint[t.policy_id()], name, t.amount());
    }
}
