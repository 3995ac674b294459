/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_OUTPUT_HPP
#define ADA_COMPOSER_COMPOSE_OUTPUT_HPP

#include <ac/cardano/chain-context.hpp>
#include <ac/compose/amount.hpp>
#include <ac/compose/token.hpp>

namespace ada_composer::compose {
    // A destination as declared by the caller; a zero amount stands for the minimum viable value
    struct output {
        cardano::address address;
        amount value {};
        token_list tokens {};
    };
    using output_list = vector<output>;

    // merges the tokens of a single output by policy and name
    extern cardano::policy_map output_assets(const token_list &tokens);
    extern cardano::tx_output format_output(const cardano::chain_context &ctx, const output &out);
    extern vector<cardano::tx_output> format_outputs(const cardano::chain_context &ctx, const output_list &outputs);
}

#endif // !ADA_COMPOSER_COMPOSE_OUTPUT_HPP
