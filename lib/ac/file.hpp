/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_FILE_HPP
#define ADA_COMPOSER_FILE_HPP

#include <string>
#include <ac/common/bytes.hpp>

namespace ada_composer::file {
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);
}

#endif // !ADA_COMPOSER_FILE_HPP
