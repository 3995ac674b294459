/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMMON_VARIANT_HPP
#define ADA_COMPOSER_COMMON_VARIANT_HPP

#include <variant>

namespace ada_composer::variant {
    // a visitor assembled from a set of lambdas
    template<typename... Ts>
    struct overloaded: Ts... {
        using Ts::operator()...;
    };
}

#endif // !ADA_COMPOSER_COMMON_VARIANT_HPP
