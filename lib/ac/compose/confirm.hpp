/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_CONFIRM_HPP
#define ADA_COMPOSER_COMPOSE_CONFIRM_HPP

#include <chrono>
#include <functional>
#include <ac/cardano/chain-context.hpp>

namespace ada_composer::compose {
    using sleep_func = std::function<void(std::chrono::milliseconds)>;

    extern void sleep_for(std::chrono::milliseconds delay);

    // false when the transaction is unknown or the query fails
    extern bool confirm_tx(const cardano::chain_context &ctx, const cardano::tx_hash &tx_id);

    // polls at the given interval until the transaction is observed; without max_attempts it never gives up
    extern void wait_for_confirmation(const cardano::chain_context &ctx, const cardano::tx_hash &tx_id,
        std::chrono::milliseconds interval, std::optional<size_t> max_attempts={}, const sleep_func &sleep=sleep_for);
}

#endif // !ADA_COMPOSER_COMPOSE_CONFIRM_HPP
