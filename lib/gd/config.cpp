/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <filesystem>
#include <gd/config.hpp>
#include <gd/logger.hpp>

namespace gumdrop {
    static std::optional<std::string> &_config_default_path()
    {
        static std::optional<std::string> p {};
        return p;
    }

    void config::set_default_path(const std::optional<std::string> &p)
    {
        _config_default_path() = p;
    }

    std::string config::default_path()
    {
        std::optional<std::string> path = _config_default_path();
        if (const char *env_path = std::getenv("GD_CONFIG"); !path && env_path)
            path.emplace(env_path);
        if (!path)
            path.emplace("./etc/gumdrop.json");
        return *path;
    }

    const json::value &config_json::_at_impl(const std::string_view &name) const
    {
        const auto it = _json.find(name);
        if (it == _json.end())
            throw error(fmt::format("config does not have the requested {} element!", name));
        return it->value();
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

    std::unique_ptr<config> load_config(const std::optional<std::string> &path)
    {
        if (path)
            return std::make_unique<config_file>(*path);
        const auto def_path = config::default_path();
        if (!std::filesystem::exists(def_path)) {
            logger::debug("configuration file {} is not present, using the built-in defaults", def_path);
            return std::make_unique<config_json>(json::object {});
        }
        logger::debug("configuration file: {}", def_path);
        return std::make_unique<config_file>(def_path);
    }
}
