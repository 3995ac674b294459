/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_ASSET_LEDGER_HPP
#define ADA_COMPOSER_COMPOSE_ASSET_LEDGER_HPP

#include <ac/compose/token.hpp>

namespace ada_composer::compose {
    // Transaction-wide aggregation of minted and burned tokens
    struct asset_ledger {
        asset_ledger() =default;
        explicit asset_ledger(const token_list &tokens);

        void add(const token &t);

        bool empty() const noexcept
        {
            return _signed.empty();
        }

        // net signed quantities: the mint field of the transaction
        const cardano::policy_map &signed_assets() const noexcept
        {
            return _signed;
        }

        // only the strictly positive requests; informational, outputs size their minimum coin from their own bundle
        const cardano::policy_map &mint_assets() const noexcept
        {
            return _mint;
        }

        // one script per policy in the order of first appearance
        const cardano::native_script::script_list &scripts() const noexcept
        {
            return _scripts;
        }

        // the earliest before-slot of the participating policies
        std::optional<uint64_t> ttl() const noexcept
        {
            return _ttl;
        }
    private:
        cardano::policy_map _signed {};
        cardano::policy_map _mint {};
        cardano::native_script::script_list _scripts {};
        map<cardano::script_hash, size_t> _script_idx {};
        std::optional<uint64_t> _ttl {};

        void _add_policy(const token_policy &policy);
    };
}

#endif // !ADA_COMPOSER_COMPOSE_ASSET_LEDGER_HPP
