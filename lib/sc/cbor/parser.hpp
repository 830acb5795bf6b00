/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_CBOR_PARSER_HPP
#define SHAPE_CODEC_CBOR_PARSER_HPP

/*
 * A zero-copy pull parser producing a stream of semantic tokens from a CBOR buffer.
 * No values are materialized: after each advance() the consumer reads the current token's
 * data with the functions from read.hpp using the buffer, position() and item_length().
 *
 * Data layout per token:
 * - integers, floats and epoch timestamps: position() points to the argument bytes and item_length() is
 *   their count: 0 (the value is in the low bits of the byte at position()), 1, 2, 4, or 8;
 * - strings, keys and bignums: position() points to the payload, or to the first chunk header for chunked strings,
 *   and item_length() is the payload length with indefinite_flag set for chunked strings;
 * - big decimals: position() points to the exponent and item_length() spans the exponent and the mantissa;
 * - for other tokens item_length() is not meaningful.
 *
 * The buffer is borrowed and must outlive the parser. A parser instance must not be shared between threads.
 */

#include <sc/common/bytes.hpp>
#include <sc/cbor/error.hpp>
#include <sc/cbor/nesting.hpp>
#include <sc/cbor/options.hpp>
#include <sc/cbor/types.hpp>

namespace shape_codec::cbor {
    struct parser {
        explicit parser(buffer buf, const parser_options &opts={});
        parser(buffer buf, size_t offset, size_t length, const parser_options &opts={});

        token advance();

        // on a start token, moves to the matching end token; does nothing on other tokens
        void skip();

        token current_token() const noexcept
        {
            return _token;
        }

        size_t position() const noexcept
        {
            return _idx;
        }

        uint64_t item_length() const noexcept
        {
            return _item_len;
        }

        // the declared size of the innermost open collection or -1 if it is indefinite
        int64_t collection_size() const noexcept
        {
            return _stack.empty() ? 0 : _stack.top().size;
        }

        size_t depth() const noexcept
        {
            return _stack.size();
        }

        buffer data() const noexcept
        {
            return _buf;
        }
    private:
        buffer _buf;
        size_t _end;
        size_t _idx;
        uint64_t _item_len = 0;
        uint64_t _overhead = 0;
        token _token = token::finished;
        bool _reading_tag = false;
        nesting_stack _stack {};
        parser_options _opts;

        [[noreturn]] void _fail(std::string_view msg) const;
        [[noreturn]] void _fail_incomplete() const;
        void _check_length(uint64_t len) const;
        void _consume();
        uint64_t _read_imm(uint8_t minor);

        token _next();
        token _dispatch(uint8_t b);
        token _dispatch_key(uint8_t b);
        token _end_of_buffer();
        token _end_collection();
        token _end_stream();
        void _integer(uint8_t minor);
        token _string(major_type type, uint8_t minor);
        token _collection(major_type type, uint8_t minor);
        token _tag(uint8_t minor);
        void _decimal(token next);
        token _simple(uint8_t minor);
    };
}

#endif // !SHAPE_CODEC_CBOR_PARSER_HPP
