/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMMON_ERROR_HPP
#define ADA_COMPOSER_COMMON_ERROR_HPP

#include <array>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ada_composer {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg, const std::source_location &loc);
        const char *what() const noexcept override;

        // the message without the source location suffix
        std::string_view message() const noexcept
        {
            return std::string_view { _msg }.substr(0, _msg_size);
        }

        const std::source_location &where() const noexcept
        {
            return _loc;
        }
    private:
        std::string _msg;
        size_t _msg_size;
        std::source_location _loc;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg, const std::source_location &loc=std::source_location::current());
        explicit error(std::string_view msg, const std::exception &ex, const std::source_location &loc=std::source_location::current());
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg, const std::source_location &loc=std::source_location::current());
    };
}

#endif // !ADA_COMPOSER_COMMON_ERROR_HPP
