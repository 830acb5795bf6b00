/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sc/common/test.hpp>
#include "parser.hpp"
#include "read.hpp"

using namespace shape_codec;
using namespace shape_codec::cbor;

namespace {
    void expect_token(parser &p, const token exp, const size_t pos, const uint64_t len,
        const std::source_location &loc=std::source_location::current())
    {
        test_same(exp, p.advance(), loc);
        test_same(pos, p.position(), loc);
        test_same(len, p.item_length(), loc);
    }

    // a token trace with the materialized values
    std::vector<std::string> materialize(const buffer data, const parser_options &opts={})
    {
        std::vector<std::string> res {};
        parser p { data, opts };
        for (;;) {
            const auto t = p.advance();
            switch (t) {
                case token::uint:
                case token::nint:
                    res.emplace_back(fmt::format("{}:{}", t, read_int(data, t, p.position(), p.item_length())));
                    break;
                case token::text:
                case token::key:
                    res.emplace_back(fmt::format("{}:{}", t, read_text(data, p.position(), p.item_length())));
                    break;
                case token::bytes:
                    res.emplace_back(fmt::format("{}:{}", t, read_bytes(data, p.position(), p.item_length())));
                    break;
                default:
                    res.emplace_back(fmt::format("{}", t));
                    break;
            }
            if (t == token::finished)
                break;
        }
        return res;
    }

    // the full (token, position, item_length) trace
    std::vector<std::string> trace(const buffer data)
    {
        std::vector<std::string> res {};
        parser p { data };
        for (;;) {
            const auto t = p.advance();
            res.emplace_back(fmt::format("{} {} {}", t, p.position(), p.item_length()));
            if (t == token::finished)
                break;
        }
        return res;
    }

    void expect_malformed(const std::string_view hex, const std::string_view match, const parser_options &opts={},
        const std::source_location &loc=std::source_location::current())
    {
        const auto data = uint8_vector::from_hex(hex);
        expect_throws_msg<malformed_error>([&] {
            parser p { data, opts };
            while (p.advance() != token::finished) {
                // consume the whole stream
            }
        }, match, loc);
    }
}

suite cbor_parser_suite = [] {
    "cbor::parser"_test = [] {
        "integers"_test = [] {
            const auto data = uint8_vector::from_hex("011A0010000020");
            parser p { data };
            test_same(token::finished, p.current_token());
            expect_token(p, token::uint, 0, 0);
            test_same(uint64_t { 1 }, read_uint(data, p.position(), p.item_length()));
            expect_token(p, token::uint, 2, 4);
            test_same(uint64_t { 1048576 }, read_uint(data, p.position(), p.item_length()));
            expect_token(p, token::nint, 6, 0);
            test_same(int64_t { -1 }, read_int(data, p.current_token(), p.position(), p.item_length()));
            expect_token(p, token::finished, 7, 0);
        };
        "zero"_test = [] {
            const auto data = uint8_vector::from_hex("00");
            parser p { data };
            expect_token(p, token::uint, 0, 0);
            test_same(uint64_t { 0 }, read_uint(data, p.position(), p.item_length()));
            expect_token(p, token::finished, 1, 0);
        };
        "strings"_test = [] {
            const auto data = uint8_vector::from_hex("4568656C6C6F4A414141414141414141417077656C6C20686F776479207468657265");
            parser p { data };
            expect_token(p, token::bytes, 1, 5);
            test_same(std::string { "hello" }, read_text(data, p.position(), p.item_length()));
            expect_token(p, token::bytes, 7, 10);
            test_same(std::string(10, 'A'), read_text(data, p.position(), p.item_length()));
            expect_token(p, token::text, 18, 16);
            test_same(std::string { "well howdy there" }, read_text(data, p.position(), p.item_length()));
            expect_token(p, token::finished, 34, 0);
        };
        "chunked text"_test = [] {
            const auto data = uint8_vector::from_hex("7F61616162FF");
            parser p { data };
            test_same(token::text, p.advance());
            test_same(size_t { 1 }, p.position());
            expect(is_indefinite(p.item_length()));
            test_same(std::string { "ab" }, read_text(data, p.position(), p.item_length()));
            expect_token(p, token::finished, 6, 0);
        };
        "empty chunked bytes"_test = [] {
            const auto data = uint8_vector::from_hex("5FFF01");
            parser p { data };
            test_same(token::bytes, p.advance());
            test_same(uint8_vector {}, read_bytes(data, p.position(), p.item_length()));
            expect_token(p, token::uint, 2, 0);
        };
        "nested indefinite arrays"_test = [] {
            const auto data = uint8_vector::from_hex("9F019F023B7FFFFFFFFFFFFFFF9F6568656C6C6FFFFFFF");
            parser p { data };
            expect_token(p, token::array_start, 0, 0);
            test_same(int64_t { -1 }, p.collection_size());
            expect_token(p, token::uint, 1, 0);
            expect_token(p, token::array_start, 2, 0);
            expect_token(p, token::uint, 3, 0);
            expect_token(p, token::nint, 5, 8);
            test_same(std::numeric_limits<int64_t>::min(), read_int(data, p.current_token(), p.position(), p.item_length()));
            expect_token(p, token::array_start, 13, 0);
            test_same(size_t { 3 }, p.depth());
            expect_token(p, token::text, 15, 5);
            expect_token(p, token::array_end, 20, 0);
            expect_token(p, token::array_end, 21, 0);
            expect_token(p, token::array_end, 22, 0);
            test_same(size_t { 0 }, p.depth());
            expect_token(p, token::finished, 23, 0);
        };
        "map"_test = [] {
            const auto data = uint8_vector::from_hex("A1636B657920696E6F742061206B6579");
            parser p { data };
            test_same(token::map_start, p.advance());
            test_same(int64_t { 1 }, p.collection_size());
            expect_token(p, token::key, 2, 3);
            expect(compare_external(data, p.position(), p.item_length(), std::string_view { "key" }));
            expect_token(p, token::nint, 5, 0);
            test_same(token::map_end, p.advance());
            expect_token(p, token::text, 7, 9);
            test_same(std::string { "not a key" }, read_text(data, p.position(), p.item_length()));
            expect_token(p, token::finished, 16, 0);
        };
        "empty map"_test = [] {
            const auto data = uint8_vector::from_hex("A0");
            parser p { data };
            test_same(token::map_start, p.advance());
            test_same(int64_t { 0 }, p.collection_size());
            test_same(size_t { 1 }, p.depth());
            test_same(token::map_end, p.advance());
            test_same(size_t { 0 }, p.depth());
            expect_token(p, token::finished, 1, 0);
        };
        "nested collections"_test = [] {
            const auto data = uint8_vector::from_hex("A2634141410163424242A163434343654444444444");
            parser p { data };
            test_same(token::map_start, p.advance());
            test_same(int64_t { 2 }, p.collection_size());
            expect_token(p, token::key, 2, 3);
            expect_token(p, token::uint, 5, 0);
            expect_token(p, token::key, 7, 3);
            test_same(token::map_start, p.advance());
            test_same(int64_t { 1 }, p.collection_size());
            expect_token(p, token::key, 12, 3);
            expect_token(p, token::text, 16, 5);
            test_same(token::map_end, p.advance());
            test_same(int64_t { 2 }, p.collection_size());
            test_same(token::map_end, p.advance());
            expect_token(p, token::finished, 21, 0);
        };
        "definite array"_test = [] {
            const auto data = uint8_vector::from_hex("84010203181F");
            parser p { data };
            expect_token(p, token::array_start, 1, 0);
            test_same(int64_t { 4 }, p.collection_size());
            for (const uint64_t exp: { 1, 2, 3 }) {
                test_same(token::uint, p.advance());
                test_same(exp, read_uint(data, p.position(), p.item_length()));
            }
            expect_token(p, token::uint, 5, 1);
            test_same(uint64_t { 31 }, read_uint(data, p.position(), p.item_length()));
            test_same(token::array_end, p.advance());
            expect_token(p, token::finished, 6, 0);
        };
        "simple values"_test = [] {
            const auto data = uint8_vector::from_hex("F4F5F6F7");
            parser p { data };
            expect_token(p, token::s_false, 0, 1);
            expect_token(p, token::s_true, 1, 1);
            expect_token(p, token::null, 2, 1);
            expect_token(p, token::null, 3, 1);
            expect_token(p, token::finished, 4, 0);
        };
        "floats"_test = [] {
            const auto data = uint8_vector::from_hex("FB3FF0000000000000FA3FC00000F93E00");
            parser p { data };
            expect_token(p, token::fp, 1, 8);
            test_same(1.0, read_double(data, p.position(), p.item_length()));
            expect_token(p, token::fp, 10, 4);
            test_same(1.5, read_double(data, p.position(), p.item_length()));
            expect_token(p, token::fp, 15, 2);
            test_same(1.5, read_double(data, p.position(), p.item_length()));
            expect_token(p, token::finished, 17, 0);
        };
        "epoch timestamps"_test = [] {
            {
                const auto data = uint8_vector::from_hex("C1FB3FF8000000000000");
                parser p { data };
                expect_token(p, token::epoch_fp, 2, 8);
                test_same(int64_t { 1500 }, read_epoch_millis(data, p.current_token(), p.position(), p.item_length()));
                expect_token(p, token::finished, 10, 0);
            }
            {
                const auto data = uint8_vector::from_hex("C1F93E00");
                parser p { data };
                test_same(token::epoch_fp, p.advance());
                test_same(int64_t { 1500 }, read_epoch_millis(data, p.current_token(), p.position(), p.item_length()));
            }
            {
                const auto data = uint8_vector::from_hex("82C11A5A0F3B80C120");
                parser p { data };
                test_same(token::array_start, p.advance());
                test_same(token::epoch_uint, p.advance());
                test_same(int64_t { 1510947712000 }, read_epoch_millis(data, p.current_token(), p.position(), p.item_length()));
                test_same(token::epoch_nint, p.advance());
                test_same(int64_t { -1000 }, read_epoch_millis(data, p.current_token(), p.position(), p.item_length()));
                test_same(token::array_end, p.advance());
                test_same(token::finished, p.advance());
            }
        };
        "bignums"_test = [] {
            const auto data = uint8_vector::from_hex("C348FFFFFFFFFFFFFFFFC249010000000000000000");
            parser p { data };
            expect_token(p, token::neg_bigint, 2, 8);
            test_same(cpp_int { "-18446744073709551616" }, read_bigint(data, p.current_token(), p.position(), p.item_length()));
            expect_token(p, token::pos_bigint, 12, 9);
            test_same(cpp_int { "18446744073709551616" }, read_bigint(data, p.current_token(), p.position(), p.item_length()));
            expect_token(p, token::finished, 21, 0);
        };
        "big decimals"_test = [] {
            {
                const auto data = uint8_vector::from_hex("C48221196AB3");
                parser p { data };
                expect_token(p, token::big_decimal, 2, 4);
                test_same(std::string { "273.15" }, read_big_decimal(data, p.position()).to_string());
                test_same(size_t { 0 }, p.depth());
                expect_token(p, token::finished, 6, 0);
            }
            {
                const auto data = uint8_vector::from_hex("C49F21196AB3FF");
                parser p { data };
                expect_token(p, token::big_decimal, 2, 5);
                test_same(std::string { "273.15" }, read_big_decimal(data, p.position()).to_string());
                expect_token(p, token::finished, 7, 0);
            }
            {
                const auto data = uint8_vector::from_hex("82C48221196AB301");
                parser p { data };
                test_same(token::array_start, p.advance());
                expect_token(p, token::big_decimal, 3, 4);
                test_same(size_t { 1 }, p.depth());
                expect_token(p, token::uint, 7, 0);
                test_same(token::array_end, p.advance());
                expect_token(p, token::finished, 8, 0);
            }
            {
                // a bignum mantissa
                const auto data = uint8_vector::from_hex("C48220C249010000000000000000");
                parser p { data };
                test_same(token::big_decimal, p.advance());
                test_same(std::string { "1844674407370955161.6" }, read_big_decimal(data, p.position()).to_string());
                test_same(token::finished, p.advance());
            }
        };
        "big decimals with unrepresentable exponents"_test = [] {
            for (const auto *hex: { "C4821B00000007FFFFFFFF01", "C4823B00000007FFFFFFFF01", "C4823A7FFFFFFF01", "C4823A8000000001" }) {
                const auto data = uint8_vector::from_hex(hex);
                parser p { data };
                test_same(token::big_decimal, p.advance());
                expect(throws<malformed_error>([&] { read_big_decimal(data, p.position()); })) << hex;
                test_same(token::finished, p.advance());
            }
        };
        "deep nesting"_test = [] {
            uint8_vector data {};
            for (size_t i = 0; i < 100; ++i)
                data << uint8_vector::from_hex("A1616B");
            data << uint8_vector::from_hex("9F");
            for (size_t i = 0; i < 100; ++i)
                data << uint8_vector::from_hex("81");
            data << uint8_vector::from_hex("00FF");
            parser p { data };
            for (size_t i = 0; i < 100; ++i) {
                test_same(token::map_start, p.advance());
                test_same(token::key, p.advance());
            }
            test_same(token::array_start, p.advance());
            for (size_t i = 0; i < 100; ++i)
                test_same(token::array_start, p.advance());
            test_same(size_t { 201 }, p.depth());
            test_same(token::uint, p.advance());
            for (size_t i = 0; i < 101; ++i)
                test_same(token::array_end, p.advance());
            for (size_t i = 0; i < 100; ++i)
                test_same(token::map_end, p.advance());
            test_same(token::finished, p.advance());
            test_same(data.size(), p.position());
        };
        "the trace is deterministic"_test = [] {
            const auto data = uint8_vector::from_hex("A2616182019F02C1FB3FF8000000000000FF6162BF6163C348FFFFFFFFFFFFFFFFFF");
            const auto first = trace(data);
            test_same(size_t { 16 }, first.size());
            test_same(first, trace(data));
        };
        "definite and indefinite encodings yield the same values"_test = [] {
            const auto definite = materialize(uint8_vector::from_hex("8263616263A1616B420102"));
            const auto indefinite = materialize(uint8_vector::from_hex("9F7F6161626263FFBF616B5F41014102FFFFFF"));
            test_same(size_t { 8 }, definite.size());
            test_same(definite, indefinite);
            test_same(std::string { "TEXT_STRING:abc" }, definite.at(1));
            test_same(std::string { "KEY:k" }, definite.at(3));
        };
        "skip"_test = [] {
            const auto data = uint8_vector::from_hex("A2616182019F02FF6162F5");
            {
                parser p { data };
                test_same(token::map_start, p.advance());
                test_same(token::key, p.advance());
                // nothing to skip on a key
                p.skip();
                test_same(token::key, p.current_token());
                test_same(size_t { 2 }, p.position());
                test_same(token::array_start, p.advance());
                p.skip();
                test_same(token::array_end, p.current_token());
                test_same(size_t { 1 }, p.depth());
                expect_token(p, token::key, 9, 1);
                expect_token(p, token::s_true, 10, 1);
                test_same(token::map_end, p.advance());
                expect_token(p, token::finished, 11, 0);
            }
            {
                parser p { data };
                test_same(token::map_start, p.advance());
                p.skip();
                test_same(token::map_end, p.current_token());
                test_same(size_t { 0 }, p.depth());
                test_same(token::finished, p.advance());
            }
        };
        "windows report absolute positions"_test = [] {
            const auto data = uint8_vector::from_hex("FFFF820102FF");
            parser p { data, 2, 3 };
            expect_token(p, token::array_start, 3, 0);
            expect_token(p, token::uint, 3, 0);
            expect_token(p, token::uint, 4, 0);
            test_same(token::array_end, p.advance());
            expect_token(p, token::finished, 5, 0);
        };
        "windows bound the reads"_test = [] {
            const auto data = uint8_vector::from_hex("63616263");
            expect_throws_msg<malformed_error>([&] { parser p { data, 0, 3 }; p.advance(); }, "unexpected end of payload");
            expect(throws<error>([&] { parser p { data, 3, 2 }; }));
            expect(throws<error>([&] { parser p { data, 5, 0 }; }));
            parser empty { data, 4, 0 };
            expect_token(empty, token::finished, 4, 0);
        };
        "an empty buffer"_test = [] {
            parser p { buffer {} };
            expect_token(p, token::finished, 0, 0);
            expect_token(p, token::finished, 0, 0);
        };
        "incomplete collections"_test = [] {
            expect_malformed("9A7FFFFFFF", "incomplete array: expecting 2147483647 more elements");
            expect_malformed("82626869", "incomplete array: expecting 1 more elements");
            expect_malformed("A2626869626869", "incomplete map: expecting 2 more elements");
            expect_malformed("A1626869", "incomplete map: expecting 1 more elements");
            expect_malformed("9F01", "incomplete array: expecting stream break");
            expect_malformed("BF616101", "incomplete map: expecting stream break");
            {
                const auto data = uint8_vector::from_hex("A2626869626869");
                parser p { data };
                test_same(token::map_start, p.advance());
                test_same(token::key, p.advance());
                test_same(token::text, p.advance());
                expect(throws<malformed_error>([&] { p.advance(); }));
            }
        };
        "truncated items"_test = [] {
            expect_malformed("19", "unexpected end of payload");
            expect_malformed("1A0001", "unexpected end of payload");
            expect_malformed("4301", "unexpected end of payload");
            expect_malformed("7A00000010", "unexpected end of payload");
            expect_malformed("C1", "unexpected end of payload");
            expect_malformed("7F6161", "non-terminating string");
        };
        "structural errors"_test = [] {
            expect_malformed("A10102", "map keys must be strings");
            expect_malformed("A14101F5", "map keys must be strings");
            expect_malformed("C1C101", "nested tags not permitted");
            expect_malformed("1F", "numeric type has indefinite length");
            expect_malformed("3F", "numeric type has indefinite length");
            expect_malformed("FF", "unexpected indefinite terminator");
            expect_malformed("8101FF", "unexpected indefinite terminator");
            expect_malformed("BF6161FF", "a map value is missing");
            expect_malformed("7F01FF", "major type misalign");
            expect_malformed("5F7F6161FFFF", "major type misalign");
        };
        "reserved minor values"_test = [] {
            for (const auto *hex: { "1C", "3D", "5E", "7C", "9D", "BE" })
                expect_malformed(hex, "illegal arg length type");
            expect_malformed("FC", "illegal simple minor type 28");
            expect_malformed("FE", "illegal simple minor type 30");
            expect_malformed("E0", "bad simple minor type 0");
            expect_malformed("F818", "bad simple minor type 24");
        };
        "tag errors"_test = [] {
            expect_malformed("C060", "unsupported tag minor 0");
            expect_malformed("C501", "unsupported tag minor 5");
            expect_malformed("D82001", "unsupported tag minor 24");
            expect_malformed("C160", "malformed instant: got TEXT_STRING");
            expect_malformed("C201", "malformed +bignum: got POS_INT");
            expect_malformed("C360", "malformed -bignum: got TEXT_STRING");
            expect_malformed("C401", "malformed BIG_DECIMAL: got POS_INT");
            expect_malformed("C4826001", "malformed BIG_DECIMAL: expected int 1, got TEXT_STRING");
            expect_malformed("C4820160", "malformed BIG_DECIMAL: expected int 2, got TEXT_STRING");
            expect_malformed("C48101", "malformed BIG_DECIMAL: expected int 2, got END_ARRAY");
            expect_malformed("C483010101", "malformed BIG_DECIMAL: expected END_ARRAY, got POS_INT");
            expect_malformed("C49F0101", "incomplete array: expecting stream break");
        };
        "depth limit"_test = [] {
            parser_options opts {};
            opts.max_depth = 10;
            uint8_vector data {};
            for (size_t i = 0; i < 10; ++i)
                data << uint8_vector::from_hex("81");
            data << uint8_vector::from_hex("00");
            test_same(size_t { 22 }, materialize(data, opts).size());
            expect_malformed(fmt::format("81{}", data), "nesting depth exceeds 10", opts);
        };
        "length limit"_test = [] {
            parser_options opts {};
            opts.max_length = 4;
            test_same(size_t { 2 }, materialize(uint8_vector::from_hex("4401020304"), opts).size());
            expect_malformed("450102030405", "length 5 exceeds the configured maximum of 4", opts);
            expect_malformed("5F43010203420405FF", "length 5 exceeds the configured maximum of 4", opts);
            expect_malformed("850102030405", "length 5 exceeds the configured maximum of 4", opts);
            expect_malformed("7A80000000", "exceeds the configured maximum");
        };
        "collection sizes beyond int64"_test = [] {
            parser_options opts {};
            opts.max_length = std::numeric_limits<uint64_t>::max();
            expect_malformed("9BFFFFFFFFFFFFFFFF", "collection size 18446744073709551615 is too large", opts);
            expect_malformed("BB8000000000000000", "collection size 9223372036854775808 is too large", opts);
            // the largest representable count is a definite collection, not an indefinite one
            const auto data = uint8_vector::from_hex("9B7FFFFFFFFFFFFFFF01");
            parser p { data, opts };
            test_same(token::array_start, p.advance());
            test_same(std::numeric_limits<int64_t>::max(), p.collection_size());
            test_same(token::uint, p.advance());
            expect_throws_msg<malformed_error>([&] { p.advance(); }, "incomplete array: expecting 9223372036854775806 more elements");
        };
        "error stack traces"_test = [] {
            const auto data = uint8_vector::from_hex("FF");
            const auto capture = [&](const parser_options &opts) {
                try {
                    parser p { data, opts };
                    p.advance();
                } catch (const malformed_error &ex) {
                    return ex.has_trace();
                }
                throw error("the parser must have failed");
            };
            expect(!capture(parser_options {}));
            parser_options opts {};
            opts.error_stacktraces = true;
            expect(capture(opts));
        };
    };
};
