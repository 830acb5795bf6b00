/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <sc/cbor/dump.hpp>
#include <sc/config.hpp>
#include <sc/file.hpp>
#include <sc/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace shape_codec;
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: sc-dump <file.cbor> [config.json]\n";
        return 1;
    }
    const std::string path { argv[1] };
    const auto ex = logger::run_log_errors([&] {
        const auto opts = argc == 3
            ? cbor::parser_options::from_config(config_file { argv[2] })
            : cbor::parser_options::load();
        const auto data = file::read(path);
        logger::debug("dumping {} of {} bytes", path, data.size());
        cbor::dump(std::cout, data, opts);
    });
    std::cout.flush();
    return ex ? 1 : 0;
}
