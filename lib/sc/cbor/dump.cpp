/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sc/cbor/dump.hpp>

namespace shape_codec::cbor {
    template std::ostreambuf_iterator<char> format_to(std::ostreambuf_iterator<char> out_it, parser &p);
    template std::back_insert_iterator<std::string> format_to(std::back_insert_iterator<std::string> out_it, parser &p);

    std::string dump(const buffer data, const parser_options &opts)
    {
        std::string res {};
        parser p { data, opts };
        format_to(std::back_inserter(res), p);
        return res;
    }

    void dump(std::ostream &os, const buffer data, const parser_options &opts)
    {
        parser p { data, opts };
        format_to(std::ostreambuf_iterator<char>(os), p);
    }
}
