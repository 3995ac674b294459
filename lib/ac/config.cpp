/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <ac/config.hpp>
#include <ac/logger.hpp>

namespace ada_composer {
    const json::value &config::_at_impl(const std::string_view &name) const
    {
        if (const auto *v = find(name); v)
            return *v;
        throw error(fmt::format("config does not have the requested {} element!", name));
    }

    config_file::config_file(const std::string &path)
        : _path { path }, _parsed { json::load(path).as_object() }
    {
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }

    static std::optional<std::string> &_configs_default_path()
    {
        static std::optional<std::string> p {};
        return p;
    }

    void configs_dir::set_default_path(const std::optional<std::string> &p)
    {
        _configs_default_path() = p;
    }

    std::string configs_dir::default_path()
    {
        std::optional<std::string> path = _configs_default_path();
        if (const char *env_path = std::getenv("AC_ETC"); !path && env_path)
            path.emplace(env_path);
        if (!path)
            path.emplace("./etc");
        logger::debug("configuration directory: {}", *path);
        return *path;
    }

    const configs &configs_dir::get()
    {
        static configs_dir cfg { default_path() };
        return cfg;
    }

    configs_dir::configs_dir(const std::string &dir)
    {
        if (!std::filesystem::is_directory(dir)) {
            logger::warn("configuration directory {} does not exist, using built-in defaults", dir);
            return;
        }
        for (const auto &e: std::filesystem::directory_iterator(dir)) {
            if (!e.is_regular_file() || e.path().extension() != ".json")
                continue;
            _configs.emplace(e.path().stem().string(), e.path().string());
        }
    }

    const config *configs_dir::_find_impl(const std::string &name) const
    {
        if (const auto it = _configs.find(name); it != _configs.end())
            return &it->second;
        return nullptr;
    }
}
