/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ac/compose/config.hpp>
#include <ac/logger.hpp>

namespace ada_composer::compose {
    composer_config composer_config::from_config(const config &cfg)
    {
        composer_config res {};
        if (const auto *v = cfg.find("confirmInterval"); v)
            res.confirm_interval = std::chrono::milliseconds { static_cast<int64_t>(v->to_number<double>() * 1000) };
        if (const auto *v = cfg.find("confirmMaxAttempts"); v && !v->is_null())
            res.confirm_max_attempts = json::value_to<size_t>(*v);
        if (const auto *v = cfg.find("delegateDeposit"); v)
            res.delegate_deposit = amount::from_json(*v);
        if (const auto *v = cfg.find("withdrawOutput"); v)
            res.withdraw_output = amount::from_json(*v);
        if (const auto *v = cfg.find("burnOutput"); v)
            res.burn_output = amount::from_json(*v);
        if (const auto *v = cfg.find("policyDir"); v)
            res.policy_dir = json::value_to<std::string>(*v);
        if (res.confirm_interval.count() <= 0)
            throw error(fmt::format("confirmInterval must be positive but got {} ms", res.confirm_interval.count()));
        if (res.confirm_max_attempts && *res.confirm_max_attempts == 0)
            throw error("confirmMaxAttempts must be positive when set");
        return res;
    }

    composer_config composer_config::from_configs(const configs &cfgs)
    {
        if (const auto *cfg = cfgs.find(config_name); cfg)
            return from_config(*cfg);
        logger::debug("no {} config, using the defaults", config_name);
        return {};
    }
}
