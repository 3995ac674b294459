/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_CONFIG_HPP
#define ADA_COMPOSER_COMPOSE_CONFIG_HPP

#include <chrono>
#include <ac/config.hpp>
#include <ac/compose/amount.hpp>

namespace ada_composer::compose {
    struct composer_config {
        // the name of the JSON file in the configuration directory
        static constexpr const char *config_name = "composer";

        std::chrono::milliseconds confirm_interval { std::chrono::seconds { 10 } };
        // unset: poll until the transaction is observed
        std::optional<size_t> confirm_max_attempts {};
        amount delegate_deposit = ada { 2 };
        amount withdraw_output = ada { 1 };
        amount burn_output = ada { 1 };
        std::string policy_dir { "./priv/policies" };

        static composer_config from_config(const config &cfg);
        // the composer config of the configuration directory or the defaults when it has none
        static composer_config from_configs(const configs &cfgs=configs_dir::get());
    };
}

#endif // !ADA_COMPOSER_COMPOSE_CONFIG_HPP
