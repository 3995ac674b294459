/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_CONFIG_HPP
#define ADA_COMPOSER_CONFIG_HPP

#include <map>
#include <optional>
#include <ac/json.hpp>

namespace ada_composer {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            const auto &obj = _json_impl();
            if (const auto it = obj.find(name); it != obj.end())
                return &it->value();
            return nullptr;
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const;
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json={})
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        std::string _path;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;
        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };

    struct configs {
        virtual ~configs() =default;

        [[nodiscard]] const config &at(const std::string &name) const
        {
            if (const auto *cfg = find(name); cfg)
                return *cfg;
            throw error(fmt::format("there is no config named {}!", name));
        }

        [[nodiscard]] const config *find(const std::string &name) const
        {
            return _find_impl(name);
        }
    private:
        virtual const config *_find_impl(const std::string &) const =0;
    };

    struct configs_mock: configs {
        using map_type = std::map<std::string, config_json>;

        explicit configs_mock() =default;

        explicit configs_mock(map_type &&map): _map { std::move(map) }
        {
        }
    private:
        const map_type _map;

        const config *_find_impl(const std::string &name) const override
        {
            if (const auto it = _map.find(name); it != _map.end())
                return &it->second;
            return nullptr;
        }
    };

    struct configs_dir: configs {
        static void set_default_path(const std::optional<std::string> &);
        static std::string default_path();
        static const configs &get();
        explicit configs_dir(const std::string &dir);
    private:
        std::map<std::string, config_file> _configs {};

        const config *_find_impl(const std::string &) const override;
    };
}

#endif // !ADA_COMPOSER_CONFIG_HPP
