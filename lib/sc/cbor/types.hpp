/* This file is part of Shape Codec project.
 * Derived from Daedalus Turbo: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_CBOR_TYPES_HPP
#define SHAPE_CODEC_CBOR_TYPES_HPP

#include <cstdint>
#include <string_view>
#include <sc/common/format.hpp>

namespace shape_codec::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    enum class tag_id: uint8_t {
        time_rfc3339 = 0,
        time_epoch = 1,
        pos_bignum = 2,
        neg_bignum = 3,
        decimal = 4
    };

    // semantic tokens produced by the parser
    enum class token: uint8_t {
        uint,
        nint,
        bytes,
        text,
        null,
        key,
        map_start,
        array_start,
        map_end,
        array_end,
        pos_bigint,
        neg_bigint,
        fp,
        big_decimal,
        s_true,
        s_false,
        epoch_uint,
        epoch_nint,
        epoch_fp,
        finished
    };

    static constexpr uint8_t major_shift = 5;
    static constexpr uint8_t minor_mask = 0x1F;
    static constexpr uint8_t max_immediate = 23;
    static constexpr uint8_t indefinite_minor = 31;
    static constexpr uint8_t break_byte = 0xFF;

    // item_length() values with this bit set describe chunked strings
    static constexpr uint64_t indefinite_flag = uint64_t { 1 } << 63;

    constexpr bool is_indefinite(const uint64_t item_len) noexcept
    {
        return (item_len & indefinite_flag) != 0;
    }

    constexpr uint64_t item_size(const uint64_t item_len) noexcept
    {
        return item_len & ~indefinite_flag;
    }

    constexpr major_type major_of(const uint8_t b) noexcept
    {
        return static_cast<major_type>(b >> major_shift);
    }

    constexpr uint8_t minor_of(const uint8_t b) noexcept
    {
        return b & minor_mask;
    }

    constexpr bool is_integer(const token t) noexcept
    {
        return t == token::uint || t == token::nint;
    }

    constexpr bool is_epoch(const token t) noexcept
    {
        return t == token::epoch_uint || t == token::epoch_nint || t == token::epoch_fp;
    }

    constexpr std::string_view token_name(const token t) noexcept
    {
        switch (t) {
            case token::uint: return "POS_INT";
            case token::nint: return "NEG_INT";
            case token::bytes: return "BYTE_STRING";
            case token::text: return "TEXT_STRING";
            case token::null: return "NULL";
            case token::key: return "KEY";
            case token::map_start: return "START_OBJECT";
            case token::array_start: return "START_ARRAY";
            case token::map_end: return "END_OBJECT";
            case token::array_end: return "END_ARRAY";
            case token::pos_bigint: return "POS_BIGINT";
            case token::neg_bigint: return "NEG_BIGINT";
            case token::fp: return "FLOAT";
            case token::big_decimal: return "BIG_DECIMAL";
            case token::s_true: return "TRUE";
            case token::s_false: return "FALSE";
            case token::epoch_uint: return "EPOCH_IPOS";
            case token::epoch_nint: return "EPOCH_INEG";
            case token::epoch_fp: return "EPOCH_F";
            case token::finished: return "FINISHED";
            default: return "UNKNOWN";
        }
    }
}

namespace fmt {
    template<>
    struct formatter<shape_codec::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using shape_codec::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<shape_codec::cbor::token>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", shape_codec::cbor::token_name(v));
        }
    };
}

#endif // !SHAPE_CODEC_CBOR_TYPES_HPP
