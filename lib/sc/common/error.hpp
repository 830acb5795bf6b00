/* This file is part of Shape Codec project.
 * Derived from Daedalus Turbo: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_COMMON_ERROR_HPP
#define SHAPE_CODEC_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shape_codec {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        // the stack trace is captured only when trace is true
        explicit base_error(std::string_view msg, bool trace=true);
        const char *what() const noexcept override;

        bool has_trace() const noexcept
        {
            return _trace_frames > 0;
        }

        std::string trace() const;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
        size_t _trace_frames = 0;
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    protected:
        explicit error(std::string_view msg, bool trace);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !SHAPE_CODEC_COMMON_ERROR_HPP
