/* This file is part of Shape Codec project.
 * Derived from Daedalus Turbo: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_CONFIG_HPP
#define SHAPE_CODEC_CONFIG_HPP

#include <optional>
#include <string>
#include <sc/json.hpp>

namespace shape_codec {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            const auto &obj = json();
            const auto it = obj.find(name);
            return it != obj.end() ? &it->value() : nullptr;
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

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error(fmt::format("Config does not have the requested {} element!", name));
            return it->value();
        }

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

    // the directory with configuration files: explicit override, then SC_ETC, then ./etc
    extern void set_config_dir(const std::optional<std::string> &dir);
    extern std::string config_dir();
    extern std::string config_path(std::string_view name);
}

#endif // !SHAPE_CODEC_CONFIG_HPP
