/* This file is part of Shape Codec project.
 * Derived from Daedalus Turbo: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <fstream>
#include <sc/file.hpp>

namespace shape_codec::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::error_code ec {};
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
            throw error(fmt::format("can't determine the size of {}: {}", path, ec.message()));
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("can't open {} for reading", path));
        buf.resize(size);
        if (size > 0 && !is.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(size)))
            throw error_sys(fmt::format("can't read {} bytes from {}", size, path));
    }

    void write(const std::string &path, const buffer &buf)
    {
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("can't open {} for writing", path));
        if (!os.write(reinterpret_cast<const char *>(buf.data()), static_cast<std::streamsize>(buf.size())))
            throw error_sys(fmt::format("can't write {} bytes to {}", buf.size(), path));
    }
}
