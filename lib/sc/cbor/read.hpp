/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_CBOR_READ_HPP
#define SHAPE_CODEC_CBOR_READ_HPP

/*
 * Stateless readers that materialize values from (buffer, position, item_length) triples
 * as reported by cbor::parser. Nothing here keeps state between calls, and every
 * inconsistency in the input is reported with cbor::malformed_error.
 */

#include <string>
#include <sc/big-int.hpp>
#include <sc/common/bytes.hpp>
#include <sc/cbor/error.hpp>
#include <sc/cbor/types.hpp>

namespace shape_codec::cbor {
    struct chunked_size {
        uint64_t payload = 0;
        // chunk headers, their length operands and the closing break byte
        uint64_t overhead = 0;
    };

    // Walks the payload bytes of a definite or a chunked string without copying them.
    struct string_cursor {
        string_cursor(buffer buf, size_t off, uint64_t item_len);

        // the next non-empty run of payload bytes or an empty buffer once all have been returned
        buffer next();

        uint64_t size() const noexcept
        {
            return _size;
        }
    private:
        buffer _buf;
        size_t _off;
        uint64_t _size;
        uint64_t _consumed = 0;
        bool _chunked;
    };

    extern size_t arg_length(uint8_t minor);
    extern uint64_t read_uint(buffer buf, size_t off, size_t len);
    extern int64_t read_int(buffer buf, token t, size_t off, size_t len);
    extern int64_t read_int64_checked(buffer buf, token t, size_t off, size_t len);
    extern int32_t read_int32(buffer buf, token t, size_t off, size_t len);
    extern int32_t read_pos_int(buffer buf, size_t off, size_t len);
    extern int32_t read_str_len(buffer buf, size_t off, uint8_t minor, size_t arg_len);
    // off points to the first chunk header right after the indefinite-length string header
    extern chunked_size scan_chunked(buffer buf, size_t off, size_t end, major_type type);

    extern void read_bytes(buffer buf, size_t off, uint64_t item_len, uint8_vector &dst);
    extern uint8_vector read_bytes(buffer buf, size_t off, uint64_t item_len);
    extern std::string read_text(buffer buf, size_t off, uint64_t item_len);

    extern cpp_int read_bigint(buffer buf, token t, size_t off, uint64_t item_len);
    // off points to the exponent, which is where the parser positions a big_decimal token
    extern big_decimal read_big_decimal(buffer buf, size_t off);

    extern float half_to_float(uint16_t half_bits) noexcept;
    extern double read_double(buffer buf, size_t off, size_t len);
    extern int64_t read_epoch_millis(buffer buf, token t, size_t off, uint64_t item_len);

    extern bool compare_external(buffer buf, size_t off, uint64_t item_len, buffer str);
    extern bool compare_in_payload(buffer buf, size_t off1, uint64_t item_len1, size_t off2, uint64_t item_len2);
}

#endif // !SHAPE_CODEC_CBOR_READ_HPP
