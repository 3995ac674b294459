/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <thread>
#include <ac/compose/confirm.hpp>
#include <ac/compose/errors.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    void sleep_for(const std::chrono::milliseconds delay)
    {
        std::this_thread::sleep_for(delay);
    }

    bool confirm_tx(const cardano::chain_context &ctx, const cardano::tx_hash &tx_id)
    {
        try {
            return ctx.query_tx(tx_id).has_value();
        } catch (const error &ex) {
            logger::warn("query for transaction {} failed: {}", tx_id, ex.what());
            return false;
        }
    }

    void wait_for_confirmation(const cardano::chain_context &ctx, const cardano::tx_hash &tx_id,
        const std::chrono::milliseconds interval, const std::optional<size_t> max_attempts, const sleep_func &sleep)
    {
        for (size_t attempt = 1; !confirm_tx(ctx, tx_id); ++attempt) {
            if (max_attempts && attempt >= *max_attempts)
                throw compose_error(fmt::format("transaction {} has not been confirmed after {} attempts", tx_id, attempt));
            logger::debug("transaction {} is not confirmed yet, attempt {}", tx_id, attempt);
            sleep(interval);
        }
        logger::info("transaction {} has been confirmed", tx_id);
    }
}
