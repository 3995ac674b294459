/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_ERRORS_HPP
#define ADA_COMPOSER_COMPOSE_ERRORS_HPP

#include <ac/common/error.hpp>

namespace ada_composer::compose {
    // All failures of a composition call derive from this type
    struct compose_error: error {
        using error::error;
    };

    // invalid arithmetic on amounts such as a division by zero
    struct amount_error: compose_error {
        using compose_error::compose_error;
    };

    struct type_mismatch_error: compose_error {
        using compose_error::compose_error;
    };

    struct policy_script_missing_error: compose_error {
        using compose_error::compose_error;
    };

    struct invalid_stake_target_error: compose_error {
        using compose_error::compose_error;
    };

    struct unsupported_withdraw_all_error: compose_error {
        using compose_error::compose_error;
    };

    struct metadata_field_too_long_error: compose_error {
        using compose_error::compose_error;
    };

    struct metadata_not_serializable_error: compose_error {
        using compose_error::compose_error;
    };

    struct no_signing_key_error: compose_error {
        using compose_error::compose_error;
    };

    struct empty_input_set_error: compose_error {
        using compose_error::compose_error;
    };
}

#endif // !ADA_COMPOSER_COMPOSE_ERRORS_HPP
