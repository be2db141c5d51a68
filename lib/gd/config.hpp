/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_CONFIG_HPP
#define GUMDROP_CONFIG_HPP

#include <memory>
#include <optional>
#include <string>
#include <gd/json.hpp>

namespace gumdrop {
    struct config {
        static void set_default_path(const std::optional<std::string> &);
        static std::string default_path();

        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] std::string get(const std::string_view &name, const std::string_view &default_value) const
        {
            if (!json().contains(name))
                return std::string { default_value };
            return std::string { at(name).as_string() };
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::value &_at_impl(const std::string_view &name) const override;

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

    // An absent file at the default location yields an empty configuration so that built-in defaults apply
    extern std::unique_ptr<config> load_config(const std::optional<std::string> &path={});
}

#endif // !GUMDROP_CONFIG_HPP
