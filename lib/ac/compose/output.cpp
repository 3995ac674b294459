/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/compose/output.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    cardano::policy_map output_assets(const token_list &tokens)
    {
        cardano::policy_map assets {};
        for (const auto &t: tokens)
            merge(assets[t.policy_id()], t.bytes_name(), t.amount());
        for (const auto &[policy_id, names]: assets) {
            for (const auto &[name, qty]: names) {
                if (qty <= 0)
                    throw error(fmt::format("an output cannot carry a non-positive quantity {} of {}.{}", qty, policy_id, name));
            }
        }
        return assets;
    }

    cardano::tx_output format_output(const cardano::chain_context &ctx, const output &out)
    {
        if (out.value.lovelace_value() < 0)
            throw amount_error(fmt::format("output to {} has a negative amount: {}", out.address, out.value));
        cardano::tx_output res { out.address, static_cast<uint64_t>(out.value.lovelace_value()), output_assets(out.tokens) };
        if (res.coin == 0) {
            res.coin = ctx.min_value(res);
            logger::debug("output to {}: using the minimum value {} for {} policies", out.address, res.coin, res.assets.size());
        }
        return res;
    }

    vector<cardano::tx_output> format_outputs(const cardano::chain_context &ctx, const output_list &outputs)
    {
        vector<cardano::tx_output> res {};
        res.reserve(outputs.size());
        for (const auto &out: outputs)
            res.emplace_back(format_output(ctx, out));
        return res;
    }
}
