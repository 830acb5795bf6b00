/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <sc/cbor/options.hpp>
#include <sc/logger.hpp>

namespace shape_codec::cbor {
    static uint64_t _positive_uint(const json::value &v, const std::string_view name, const uint64_t max)
    {
        uint64_t res = 0;
        if (v.is_uint64()) {
            res = v.get_uint64();
        } else if (v.is_int64() && v.get_int64() > 0) {
            res = static_cast<uint64_t>(v.get_int64());
        } else {
            throw error(fmt::format("configuration element {} must be a positive integer but got: {}", name, json::serialize(v)));
        }
        if (res == 0 || res > max)
            throw error(fmt::format("configuration element {} must be within [1, {}] but got: {}", name, max, res));
        return res;
    }

    parser_options parser_options::from_config(const config &cfg)
    {
        parser_options opts {};
        if (const auto *v = cfg.find("maxDepth"); v)
            opts.max_depth = _positive_uint(*v, "maxDepth", std::numeric_limits<uint32_t>::max());
        if (const auto *v = cfg.find("maxLength"); v)
            opts.max_length = _positive_uint(*v, "maxLength", default_max_length);
        if (const auto *v = cfg.find("errorStacktraces"); v) {
            if (!v->is_bool())
                throw error(fmt::format("configuration element errorStacktraces must be a boolean but got: {}", json::serialize(*v)));
            opts.error_stacktraces = v->get_bool();
        }
        logger::debug("parser options: max_depth: {} max_length: {} error_stacktraces: {}",
            opts.max_depth, opts.max_length, opts.error_stacktraces);
        return opts;
    }

    parser_options parser_options::load()
    {
        const auto path = config_path("parser");
        if (!std::filesystem::exists(path)) {
            logger::debug("no parser configuration at {}, using the defaults", path);
            return {};
        }
        return from_config(config_file { path });
    }
}
