/* This file is part of Shape Codec project.
 * Derived from Daedalus Turbo: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_FILE_HPP
#define SHAPE_CODEC_FILE_HPP

#include <string>
#include <sc/common/bytes.hpp>

namespace shape_codec::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, const buffer &buf);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }
}

#endif // !SHAPE_CODEC_FILE_HPP
