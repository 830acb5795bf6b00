/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_CBOR_OPTIONS_HPP
#define SHAPE_CODEC_CBOR_OPTIONS_HPP

#include <cstdint>
#include <limits>
#include <sc/config.hpp>

namespace shape_codec::cbor {
    struct parser_options {
        static constexpr size_t default_max_depth = 1024;
        static constexpr uint64_t default_max_length = std::numeric_limits<int32_t>::max();

        // the maximum number of simultaneously open collections
        size_t max_depth = default_max_depth;
        // the maximum length operand of a string or a collection
        uint64_t max_length = default_max_length;
        // capture stack traces in malformed_error raised by the parser
        bool error_stacktraces = false;

        // keys absent from the config keep their default values
        static parser_options from_config(const config &cfg);
        // ${config_dir}/parser.json when it exists, the defaults otherwise
        static parser_options load();
    };
}

#endif // !SHAPE_CODEC_CBOR_OPTIONS_HPP
