/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_CBOR_DUMP_HPP
#define SHAPE_CODEC_CBOR_DUMP_HPP

#include <iterator>
#include <ostream>
#include <sc/cbor/parser.hpp>
#include <sc/cbor/read.hpp>

namespace shape_codec::cbor {
    inline bool is_ascii(const buffer b)
    {
        for (const auto c: b) {
            if (c < 32 || c > 126) [[unlikely]]
                return false;
        }
        return true;
    }

    // writes the current token of p as a single line without the line break
    template<typename OUT_IT>
    OUT_IT format_token_to(OUT_IT out_it, const parser &p)
    {
        const auto t = p.current_token();
        const auto buf = p.data();
        const auto pos = p.position();
        const auto len = p.item_length();
        auto depth = p.depth();
        if (t == token::map_start || t == token::array_start)
            --depth;
        out_it = fmt::format_to(out_it, "{} {:{}}{}", pos, "", depth * 4, t);
        switch (t) {
            case token::uint:
            case token::nint:
                return fmt::format_to(out_it, " {}", read_bigint(buf, t, pos, len));
            case token::pos_bigint:
            case token::neg_bigint:
                return fmt::format_to(out_it, " {}{}", is_indefinite(len) ? "chunked " : "", read_bigint(buf, t, pos, len));
            case token::bytes: {
                const auto bytes = read_bytes(buf, pos, len);
                if (!bytes.empty() && is_ascii(bytes))
                    return fmt::format_to(out_it, " {}#{} ('{}')", is_indefinite(len) ? "chunked " : "", bytes, bytes.str());
                return fmt::format_to(out_it, " {}#{}", is_indefinite(len) ? "chunked " : "", bytes);
            }
            case token::text:
            case token::key:
                return fmt::format_to(out_it, " {}'{}'", is_indefinite(len) ? "chunked " : "", read_text(buf, pos, len));
            case token::fp:
                return fmt::format_to(out_it, " F{} {}", len * 8, read_double(buf, pos, len));
            case token::big_decimal:
                return fmt::format_to(out_it, " {}", read_big_decimal(buf, pos));
            case token::epoch_uint:
            case token::epoch_nint:
            case token::epoch_fp:
                return fmt::format_to(out_it, " {} ms", read_epoch_millis(buf, t, pos, len));
            case token::map_start:
            case token::array_start:
                if (p.collection_size() < 0)
                    return fmt::format_to(out_it, " (unbounded)");
                return fmt::format_to(out_it, " (size: {})", p.collection_size());
            default:
                return out_it;
        }
    }

    // advances p until the end of its window, one line per token including the final FINISHED
    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, parser &p)
    {
        for (;;) {
            const auto t = p.advance();
            out_it = format_token_to(out_it, p);
            out_it = fmt::format_to(out_it, "\n");
            if (t == token::finished)
                return out_it;
        }
    }

    extern template std::ostreambuf_iterator<char> format_to(std::ostreambuf_iterator<char> out_it, parser &p);
    extern template std::back_insert_iterator<std::string> format_to(std::back_insert_iterator<std::string> out_it, parser &p);

    extern std::string dump(buffer data, const parser_options &opts={});
    extern void dump(std::ostream &os, buffer data, const parser_options &opts={});
}

#endif // !SHAPE_CODEC_CBOR_DUMP_HPP
