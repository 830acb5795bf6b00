/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <sc/cbor/parser.hpp>
#include <sc/cbor/read.hpp>

namespace shape_codec::cbor {
    parser::parser(const buffer buf, const parser_options &opts):
        parser { buf, 0, buf.size(), opts }
    {
    }

    parser::parser(const buffer buf, const size_t offset, const size_t length, const parser_options &opts):
        _buf { buf }, _end { offset + length }, _idx { offset }, _opts { opts }
    {
        if (offset > buf.size() || length > buf.size() - offset) [[unlikely]]
            throw error(fmt::format("the parser window offset: {} length: {} ends beyond the buffer size: {}", offset, length, buf.size()));
    }

    token parser::advance()
    {
        _token = _next();
        return _token;
    }

    void parser::skip()
    {
        if (_token != token::map_start && _token != token::array_start)
            return;
        const auto target_depth = _stack.size() - 1;
        while (_stack.size() > target_depth) {
            // running out of data inside a collection raises an error, so this never loops forever
            advance();
        }
    }

    void parser::_fail(const std::string_view msg) const
    {
        throw malformed_error(msg, _opts.error_stacktraces);
    }

    void parser::_fail_incomplete() const
    {
        const auto &top = _stack.top();
        const std::string_view kind { top.kind == collection::map ? "map" : "array" };
        if (top.indefinite())
            _fail(fmt::format("incomplete {}: expecting stream break", kind));
        _fail(fmt::format("incomplete {}: expecting {} more elements", kind, top.items_left()));
    }

    void parser::_check_length(const uint64_t len) const
    {
        if (len > _opts.max_length) [[unlikely]]
            _fail(fmt::format("length {} exceeds the configured maximum of {}", len, _opts.max_length));
    }

    void parser::_consume()
    {
        if (!_stack.empty())
            _stack.top().consume();
    }

    // leaves _idx at the first byte after the length operand
    uint64_t parser::_read_imm(const uint8_t minor)
    {
        const auto arg_len = arg_length(minor);
        if (arg_len == 0) {
            ++_idx;
            _check_length(minor);
            return minor;
        }
        if (arg_len >= _end - _idx) [[unlikely]]
            _fail("unexpected end of payload");
        const auto val = read_uint(_buf, ++_idx, arg_len);
        _idx += arg_len;
        _check_length(val);
        return val;
    }

    token parser::_next()
    {
        if (!_stack.empty()) {
            const auto &top = _stack.top();
            if (top.done())
                return _end_collection();
            if (top.kind == collection::map && top.ph == phase::key) {
                _idx += item_size(_item_len) + _overhead;
                if (_idx >= _end) [[unlikely]]
                    _fail_incomplete();
                return _dispatch_key(_buf[_idx]);
            }
        }
        _idx += item_size(_item_len) + _overhead;
        if (_idx >= _end)
            return _end_of_buffer();
        return _dispatch(_buf[_idx]);
    }

    token parser::_dispatch(const uint8_t b)
    {
        const auto type = major_of(b);
        const auto minor = minor_of(b);
        switch (type) {
            case major_type::uint:
                _integer(minor);
                return token::uint;
            case major_type::nint:
                _integer(minor);
                return token::nint;
            case major_type::bytes:
            case major_type::text:
                return _string(type, minor);
            case major_type::array:
            case major_type::map:
                return _collection(type, minor);
            case major_type::tag:
                return _tag(minor);
            case major_type::simple:
                return _simple(minor);
            default:
                _fail(fmt::format("unknown major type: {}", static_cast<int>(type)));
        }
    }

    token parser::_dispatch_key(const uint8_t b)
    {
        if (const auto type = major_of(b); type == major_type::text) [[likely]] {
            _string(type, minor_of(b));
            return token::key;
        }
        if (b == break_byte)
            return _end_stream();
        _fail("map keys must be strings");
    }

    token parser::_end_of_buffer()
    {
        _item_len = 0;
        _overhead = 0;
        if (_idx > _end) [[unlikely]]
            _fail("unexpected end of payload");
        if (!_stack.empty()) [[unlikely]]
            _fail_incomplete();
        return token::finished;
    }

    // a definite collection has no bytes of its own after the last item, so the position stays
    token parser::_end_collection()
    {
        const auto res = _stack.top().kind == collection::map ? token::map_end : token::array_end;
        _stack.pop();
        return res;
    }

    token parser::_end_stream()
    {
        _item_len = 0;
        _overhead = 1;
        if (_stack.empty() || !_stack.top().indefinite()) [[unlikely]]
            _fail("unexpected indefinite terminator");
        const auto &top = _stack.top();
        if (top.kind == collection::map && top.ph == phase::value) [[unlikely]]
            _fail("unexpected indefinite terminator: a map value is missing");
        const auto res = top.kind == collection::map ? token::map_end : token::array_end;
        _stack.pop();
        return res;
    }

    void parser::_integer(const uint8_t minor)
    {
        if (minor == indefinite_minor) [[unlikely]]
            _fail("numeric type has indefinite length");
        const auto arg_len = arg_length(minor);
        if (arg_len > 0) {
            if (arg_len >= _end - _idx) [[unlikely]]
                _fail("unexpected end of payload");
            _overhead = 0;
            ++_idx;
        } else {
            _overhead = 1;
        }
        _item_len = arg_len;
        _consume();
    }

    token parser::_string(const major_type type, const uint8_t minor)
    {
        _overhead = 0;
        if (minor == indefinite_minor) {
            // _idx points to the first chunk header, the headers and the break are the overhead
            const auto sz = scan_chunked(_buf, ++_idx, _end, type);
            _check_length(sz.payload);
            _item_len = sz.payload | indefinite_flag;
            _overhead = sz.overhead;
        } else {
            _item_len = _read_imm(minor);
            if (_item_len > _end - _idx) [[unlikely]]
                _fail("unexpected end of payload");
        }
        _consume();
        return type == major_type::bytes ? token::bytes : token::text;
    }

    token parser::_collection(const major_type type, const uint8_t minor)
    {
        _item_len = 0;
        int64_t size = -1;
        if (minor == indefinite_minor) {
            _overhead = 1;
        } else {
            _overhead = 0;
            const auto count = _read_imm(minor);
            if (count > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
                _fail(fmt::format("collection size {} is too large", count));
            size = static_cast<int64_t>(count);
        }
        if (_stack.size() >= _opts.max_depth) [[unlikely]]
            _fail(fmt::format("nesting depth exceeds {}", _opts.max_depth));
        // the new collection is one item of its parent
        _consume();
        const auto kind = type == major_type::array ? collection::array : collection::map;
        _stack.push(frame { size, size, kind, phase::key });
        return kind == collection::array ? token::array_start : token::map_start;
    }

    token parser::_tag(const uint8_t minor)
    {
        if (_reading_tag) [[unlikely]]
            _fail("nested tags not permitted");
        switch (static_cast<tag_id>(minor)) {
            case tag_id::time_epoch:
            case tag_id::pos_bignum:
            case tag_id::neg_bignum:
            case tag_id::decimal:
                break;
            default:
                _fail(fmt::format("unsupported tag minor {}", minor));
        }
        // the tag byte is the only overhead before the tagged item
        _overhead = 1;
        _item_len = 0;
        _reading_tag = true;
        const auto next = advance();
        _reading_tag = false;
        if (next == token::finished) [[unlikely]]
            _fail("unexpected end of payload");
        switch (static_cast<tag_id>(minor)) {
            case tag_id::time_epoch:
                switch (next) {
                    case token::uint: return token::epoch_uint;
                    case token::nint: return token::epoch_nint;
                    case token::fp: return token::epoch_fp;
                    default: _fail(fmt::format("malformed instant: got {}", next));
                }
            case tag_id::pos_bignum:
                if (next != token::bytes) [[unlikely]]
                    _fail(fmt::format("malformed +bignum: got {}", next));
                return token::pos_bigint;
            case tag_id::neg_bignum:
                if (next != token::bytes) [[unlikely]]
                    _fail(fmt::format("malformed -bignum: got {}", next));
                return token::neg_bigint;
            case tag_id::decimal:
                _decimal(next);
                return token::big_decimal;
            default:
                throw malformed_error(fmt::format("unexpected tag minor {} after validation", minor), true);
        }
    }

    /*
     * A decimal fraction must be an array of exactly an integer exponent and an integer or bignum mantissa.
     * The shape is validated on a copy of the parser so that only the final bookkeeping is committed:
     * the token spans the array items and its position is the exponent.
     */
    void parser::_decimal(const token next)
    {
        if (next != token::array_start) [[unlikely]]
            _fail(fmt::format("malformed BIG_DECIMAL: got {}", next));
        // for definite arrays the header has already been stepped over, for indefinite ones it is the overhead
        const auto start = _idx + _overhead;
        parser peek { *this };
        if (const auto t = peek.advance(); !is_integer(t)) [[unlikely]]
            _fail(fmt::format("malformed BIG_DECIMAL: expected int 1, got {}", t));
        if (const auto t = peek.advance(); !is_integer(t) && t != token::pos_bigint && t != token::neg_bigint) [[unlikely]]
            _fail(fmt::format("malformed BIG_DECIMAL: expected int 2, got {}", t));
        if (const auto t = peek.advance(); t != token::array_end) [[unlikely]]
            _fail(fmt::format("malformed BIG_DECIMAL: expected END_ARRAY, got {}", t));
        // the array is fully consumed, including its closing break if any
        _stack.pop();
        _item_len = peek._idx + item_size(peek._item_len) + peek._overhead - start;
        _overhead = 0;
        _idx = start;
    }

    token parser::_simple(const uint8_t minor)
    {
        if (minor <= static_cast<uint8_t>(special_val::one_byte)) {
            _consume();
            _item_len = 1;
            _overhead = 0;
            switch (static_cast<special_val>(minor)) {
                case special_val::s_false: return token::s_false;
                case special_val::s_true: return token::s_true;
                case special_val::s_null:
                case special_val::s_undefined:
                    return token::null;
                default:
                    _fail(fmt::format("bad simple minor type {}", minor));
            }
        }
        if (minor <= static_cast<uint8_t>(special_val::eight_bytes)) {
            _integer(minor);
            return token::fp;
        }
        if (minor == indefinite_minor)
            return _end_stream();
        _fail(fmt::format("illegal simple minor type {}", minor));
    }
}
