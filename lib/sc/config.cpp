/* This file is part of Shape Codec project.
 * Derived from Daedalus Turbo: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <filesystem>
#include <sc/config.hpp>
#include <sc/logger.hpp>

namespace shape_codec {
    static json::object load_object(const std::string &path)
    {
        auto val = json::load(path);
        if (!val.is_object())
            throw error(fmt::format("configuration file {} must contain a JSON object!", path));
        return std::move(val.as_object());
    }

    config_file::config_file(const std::string &path)
            : _path { path }, _parsed { load_object(path) }
    {
        logger::debug("loaded configuration file {}", path);
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }

    static std::optional<std::string> &_config_dir_override()
    {
        static std::optional<std::string> p {};
        return p;
    }

    void set_config_dir(const std::optional<std::string> &dir)
    {
        _config_dir_override() = dir;
    }

    std::string config_dir()
    {
        std::optional<std::string> path = _config_dir_override();
        if (const char *env_path = std::getenv("SC_ETC"); !path && env_path)
            path.emplace(env_path);
        if (!path)
            path.emplace("./etc");
        return *path;
    }

    std::string config_path(const std::string_view name)
    {
        return (std::filesystem::path { config_dir() } / fmt::format("{}.json", name)).string();
    }
}
