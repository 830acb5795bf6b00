/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sc/cbor/error.hpp>

namespace shape_codec::cbor {
    malformed_error::malformed_error(const std::string_view msg, const bool trace):
        error { msg, trace }
    {
    }
}
