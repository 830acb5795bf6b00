/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_CBOR_ERROR_HPP
#define SHAPE_CODEC_CBOR_ERROR_HPP

#include <sc/common/error.hpp>

namespace shape_codec::cbor {
    /*
     * The single error kind for all malformed CBOR input.
     * Parse failures are frequent on hostile input, so by default no stack trace is captured.
     * Pass trace=true for internal-consistency violations where the trace helps debugging.
     */
    struct malformed_error: error {
        explicit malformed_error(std::string_view msg, bool trace=false);
    };
}

#endif // !SHAPE_CODEC_CBOR_ERROR_HPP
