/* This file is part of Shape Codec project.
 * Derived from Daedalus Turbo: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cerrno>
#include <cstring>
#include <sstream>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <sc/logger.hpp>

namespace shape_codec {
    base_error::base_error(const std::string_view msg, const bool trace):
        _msg { msg }
    {
        // skips top 3 frames: safe_dump, base_error, and error
        if (trace)
            _trace_frames = boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    std::string base_error::trace() const
    {
        if (!_trace_frames)
            return {};
        std::ostringstream os {};
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
        return os.str();
    }

    const char *base_error::what() const noexcept
    {
        if (_trace_frames) {
            try {
                logger::debug("stacktrace for a user visible exception: {}\n{}", _msg, trace());
            } catch (const std::exception &) {
                // what() must not throw: the message is still returned below
            }
        }
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg, true }
    {
    }

    error::error(const std::string_view msg, const bool trace)
        : base_error { msg, trace }
    {
    }

    error::error(const std::string_view msg, const std::exception &ex)
        : error { fmt::format("{} caused by {}: {}", msg, typeid(ex).name(), ex.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}
