/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <bit>
#include <cmath>
#include <cstring>
#include <limits>
#include <sc/cbor/read.hpp>

namespace shape_codec::cbor {
    static void _ensure_range(const buffer buf, const size_t off, const uint64_t len)
    {
        if (off > buf.size() || len > buf.size() - off) [[unlikely]]
            throw malformed_error(fmt::format("out-of-bounds read: offset {} length {} buffer size {}", off, len, buf.size()), true);
    }

    static bool _is_negative(const token t)
    {
        switch (t) {
            case token::uint:
            case token::epoch_uint:
                return false;
            case token::nint:
            case token::epoch_nint:
                return true;
            default:
                throw malformed_error(fmt::format("cannot read an integer from a {} token", t), true);
        }
    }

    string_cursor::string_cursor(const buffer buf, const size_t off, const uint64_t item_len):
        _buf { buf }, _off { off }, _size { item_size(item_len) }, _chunked { is_indefinite(item_len) }
    {
    }

    buffer string_cursor::next()
    {
        while (_consumed < _size) {
            uint64_t chunk_len = _size;
            if (_chunked) {
                _ensure_range(_buf, _off, 1);
                const auto b = _buf[_off];
                if (b == break_byte) [[unlikely]]
                    throw malformed_error("cannot read unclosed indefinite length string");
                const auto minor = minor_of(b);
                const auto arg_len = arg_length(minor);
                chunk_len = read_str_len(_buf, _off, minor, arg_len);
                _off += 1 + arg_len;
            }
            _ensure_range(_buf, _off, chunk_len);
            if (chunk_len > _size - _consumed) [[unlikely]]
                throw malformed_error(fmt::format("a string chunk of {} bytes overruns the string length {}", chunk_len, _size));
            const buffer res { _buf.data() + _off, static_cast<size_t>(chunk_len) };
            _off += chunk_len;
            _consumed += chunk_len;
            if (!res.empty())
                return res;
        }
        return {};
    }

    size_t arg_length(const uint8_t minor)
    {
        if (minor <= max_immediate)
            return 0;
        if (minor > static_cast<uint8_t>(special_val::eight_bytes)) [[unlikely]]
            throw malformed_error(fmt::format("illegal arg length type: {}", minor));
        return size_t { 1 } << (minor - static_cast<uint8_t>(special_val::one_byte));
    }

    uint64_t read_uint(const buffer buf, const size_t off, const size_t len)
    {
        switch (len) {
            case 0:
                _ensure_range(buf, off, 1);
                return minor_of(buf[off]);
            case 1:
            case 2:
            case 4:
            case 8: {
                _ensure_range(buf, off, len);
                uint64_t acc = 0;
                for (size_t i = 0; i < len; ++i)
                    acc = (acc << 8) | buf[off + i];
                return acc;
            }
            default:
                throw malformed_error(fmt::format("invalid length: {}", len), true);
        }
    }

    int64_t read_int(const buffer buf, const token t, const size_t off, const size_t len)
    {
        const auto neg = _is_negative(t);
        const auto val = read_uint(buf, off, len);
        // -val - 1 wraps the same way as the bitwise complement
        return static_cast<int64_t>(neg ? ~val : val);
    }

    int64_t read_int64_checked(const buffer buf, const token t, const size_t off, const size_t len)
    {
        const auto neg = _is_negative(t);
        const auto val = read_uint(buf, off, len);
        if (val > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
            throw malformed_error("value cannot fit into a long");
        return neg ? -static_cast<int64_t>(val) - 1 : static_cast<int64_t>(val);
    }

    int32_t read_int32(const buffer buf, const token t, const size_t off, const size_t len)
    {
        const auto neg = _is_negative(t);
        const auto val = read_uint(buf, off, len);
        if (val > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) [[unlikely]]
            throw malformed_error("value cannot fit into an int");
        return neg ? -static_cast<int32_t>(val) - 1 : static_cast<int32_t>(val);
    }

    int32_t read_pos_int(const buffer buf, const size_t off, const size_t len)
    {
        const auto val = read_uint(buf, off, len);
        if (val > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) [[unlikely]]
            throw malformed_error("value cannot fit into an int");
        return static_cast<int32_t>(val);
    }

    int32_t read_str_len(const buffer buf, const size_t off, const uint8_t minor, const size_t arg_len)
    {
        if (arg_len == 0)
            return minor;
        return read_pos_int(buf, off + 1, arg_len);
    }

    chunked_size scan_chunked(const buffer buf, size_t off, const size_t end, const major_type type)
    {
        if (end > buf.size()) [[unlikely]]
            throw malformed_error(fmt::format("scan end {} is beyond the buffer size {}", end, buf.size()), true);
        chunked_size res {};
        for (;;) {
            if (off >= end) [[unlikely]]
                throw malformed_error("non-terminating string");
            const auto b = buf[off];
            if (b == break_byte) {
                ++res.overhead;
                break;
            }
            if (const auto chunk_type = major_of(b); chunk_type != type) [[unlikely]]
                throw malformed_error(fmt::format("major type misalign: {} {}", static_cast<int>(type), static_cast<int>(chunk_type)));
            const auto minor = minor_of(b);
            if (minor == indefinite_minor) [[unlikely]]
                throw malformed_error("expected finite length");
            const auto arg_len = arg_length(minor);
            if (arg_len >= end - off) [[unlikely]]
                throw malformed_error("non-terminating string");
            const auto str_len = static_cast<uint64_t>(read_str_len(buf, off, minor, arg_len));
            res.overhead += arg_len + 1;
            res.payload += str_len;
            off += arg_len + 1;
            if (str_len > end - off) [[unlikely]]
                throw malformed_error("non-terminating string");
            off += str_len;
        }
        return res;
    }

    void read_bytes(const buffer buf, const size_t off, const uint64_t item_len, uint8_vector &dst)
    {
        const auto sz = item_size(item_len);
        if (!is_indefinite(item_len)) [[likely]] {
            _ensure_range(buf, off, sz);
            dst.assign(buf.data() + off, buf.data() + off + sz);
            return;
        }
        if (sz > buf.size()) [[unlikely]]
            throw malformed_error(fmt::format("a chunked string of {} bytes cannot fit a buffer of {} bytes", sz, buf.size()));
        dst.resize(sz);
        string_cursor cur { buf, off, item_len };
        size_t pos = 0;
        for (auto chunk = cur.next(); !chunk.empty(); chunk = cur.next()) {
            memcpy(dst.data() + pos, chunk.data(), chunk.size());
            pos += chunk.size();
        }
        if (pos != sz) [[unlikely]]
            throw malformed_error("cannot read unclosed indefinite length string");
    }

    uint8_vector read_bytes(const buffer buf, const size_t off, const uint64_t item_len)
    {
        uint8_vector res {};
        read_bytes(buf, off, item_len, res);
        return res;
    }

    std::string read_text(const buffer buf, const size_t off, const uint64_t item_len)
    {
        if (!is_indefinite(item_len)) [[likely]] {
            _ensure_range(buf, off, item_len);
            return std::string { reinterpret_cast<const char *>(buf.data() + off), static_cast<size_t>(item_len) };
        }
        thread_local uint8_vector bytes {};
        read_bytes(buf, off, item_len, bytes);
        return std::string { bytes.str() };
    }

    cpp_int read_bigint(const buffer buf, const token t, const size_t off, const uint64_t item_len)
    {
        switch (t) {
            case token::uint:
                return { read_uint(buf, off, item_len) };
            case token::nint:
                return cpp_int { read_uint(buf, off, item_len) } * -1 - 1;
            case token::pos_bigint:
            case token::neg_bigint: {
                if (item_size(item_len) > big_int_max_size) [[unlikely]]
                    throw malformed_error(fmt::format("big ints larger than {} bytes are not supported but got: {}!", big_int_max_size, item_size(item_len)));
                buffer data {};
                thread_local uint8_vector bytes {};
                if (!is_indefinite(item_len)) [[likely]] {
                    _ensure_range(buf, off, item_len);
                    data = buffer { buf.data() + off, static_cast<size_t>(item_len) };
                } else {
                    read_bytes(buf, off, item_len, bytes);
                    data = bytes;
                }
                return t == token::pos_bigint ? big_uint_from_bytes(data) : big_nint_from_bytes(data);
            }
            default:
                throw malformed_error(fmt::format("cannot read a big integer from a {} token", t), true);
        }
    }

    big_decimal read_big_decimal(const buffer buf, const size_t off)
    {
        _ensure_range(buf, off, 1);
        const auto exp_type = major_of(buf[off]);
        if (exp_type != major_type::uint && exp_type != major_type::nint) [[unlikely]]
            throw malformed_error(fmt::format("malformed BIG_DECIMAL: unexpected exponent type {}", exp_type), true);
        const auto exp_len = arg_length(minor_of(buf[off]));
        const auto exp_raw = read_uint(buf, exp_len > 0 ? off + 1 : off, exp_len);
        // the exponent is negated into the scale so its lowest value is excluded as well
        if (exp_raw > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) [[unlikely]]
            throw malformed_error("exponent cannot fit into an int");
        const auto exponent = exp_type == major_type::nint ? -static_cast<int64_t>(exp_raw) - 1 : static_cast<int64_t>(exp_raw);
        if (exponent == std::numeric_limits<int32_t>::min()) [[unlikely]]
            throw malformed_error("exponent cannot be represented as a scale");

        size_t cur = off + 1 + exp_len;
        _ensure_range(buf, cur, 1);
        const auto mant_minor = minor_of(buf[cur]);
        token mant_token;
        size_t mant_off;
        uint64_t mant_len;
        switch (major_of(buf[cur])) {
            case major_type::tag: {
                if (mant_minor == static_cast<uint8_t>(tag_id::pos_bignum)) {
                    mant_token = token::pos_bigint;
                } else if (mant_minor == static_cast<uint8_t>(tag_id::neg_bignum)) {
                    mant_token = token::neg_bigint;
                } else [[unlikely]] {
                    throw malformed_error(fmt::format("malformed BIG_DECIMAL: unexpected mantissa tag {}", mant_minor), true);
                }
                ++cur;
                _ensure_range(buf, cur, 1);
                if (major_of(buf[cur]) != major_type::bytes) [[unlikely]]
                    throw malformed_error(fmt::format("malformed BIG_DECIMAL: unexpected mantissa type {}", major_of(buf[cur])), true);
                const auto str_minor = minor_of(buf[cur]);
                if (str_minor == indefinite_minor) {
                    mant_off = cur + 1;
                    mant_len = scan_chunked(buf, mant_off, buf.size(), major_type::bytes).payload | indefinite_flag;
                } else {
                    const auto arg_len = arg_length(str_minor);
                    mant_len = static_cast<uint64_t>(read_str_len(buf, cur, str_minor, arg_len));
                    mant_off = cur + 1 + arg_len;
                }
                break;
            }
            case major_type::uint:
            case major_type::nint:
                mant_token = major_of(buf[cur]) == major_type::uint ? token::uint : token::nint;
                mant_len = arg_length(mant_minor);
                mant_off = mant_len > 0 ? cur + 1 : cur;
                break;
            default:
                throw malformed_error(fmt::format("malformed BIG_DECIMAL: unexpected mantissa type {}", major_of(buf[cur])), true);
        }
        return big_decimal { read_bigint(buf, mant_token, mant_off, mant_len), static_cast<int32_t>(-exponent) };
    }

    float half_to_float(const uint16_t half_bits) noexcept
    {
        const uint32_t sign = static_cast<uint32_t>(half_bits & 0x8000U) << 16U;
        uint32_t exp = static_cast<uint32_t>((half_bits >> 10U) & 0x1FU);
        uint32_t frac = static_cast<uint32_t>(half_bits & 0x03FFU);
        if (exp == 0U) {
            if (frac == 0U)
                return std::bit_cast<float>(sign);
            // subnormal: normalize the fraction
            int32_t shift = 0;
            while ((frac & 0x0400U) == 0U) {
                frac <<= 1U;
                ++shift;
            }
            frac &= 0x03FFU;
            exp = static_cast<uint32_t>(127 - 15 - shift + 1);
            return std::bit_cast<float>(sign | (exp << 23U) | (frac << 13U));
        }
        if (exp == 31U)
            return std::bit_cast<float>(sign | 0x7F800000U | (frac << 13U));
        exp += 127 - 15;
        return std::bit_cast<float>(sign | (exp << 23U) | (frac << 13U));
    }

    double read_double(const buffer buf, const size_t off, const size_t len)
    {
        switch (len) {
            case 8:
                return std::bit_cast<double>(read_uint(buf, off, len));
            case 4:
                return std::bit_cast<float>(static_cast<uint32_t>(read_uint(buf, off, len)));
            case 2:
                return half_to_float(static_cast<uint16_t>(read_uint(buf, off, len)));
            default:
                throw malformed_error(fmt::format("invalid floating point length: {}", len), true);
        }
    }

    int64_t read_epoch_millis(const buffer buf, const token t, const size_t off, const uint64_t item_len)
    {
        switch (t) {
            case token::epoch_uint:
            case token::epoch_nint: {
                const auto secs = read_int64_checked(buf, t, off, item_len);
                if (secs > std::numeric_limits<int64_t>::max() / 1000 || secs < std::numeric_limits<int64_t>::min() / 1000) [[unlikely]]
                    throw malformed_error(fmt::format("timestamp {} seconds cannot be represented in milliseconds", secs));
                return secs * 1000;
            }
            case token::epoch_fp: {
                const auto secs = read_double(buf, off, item_len);
                // round half up to the nearest millisecond without an inexact intermediate sum
                const auto scaled = secs * 1000.0;
                const auto whole = std::floor(scaled);
                const auto millis = scaled - whole >= 0.5 ? whole + 1.0 : whole;
                if (!std::isfinite(millis) || millis < -9223372036854775808.0 || millis >= 9223372036854775808.0) [[unlikely]]
                    throw malformed_error(fmt::format("timestamp {} seconds cannot be represented in milliseconds", secs));
                return static_cast<int64_t>(millis);
            }
            default:
                throw malformed_error(fmt::format("cannot read a timestamp from a {} token", t), true);
        }
    }

    static bool _equal(string_cursor a, string_cursor b)
    {
        if (a.size() != b.size())
            return false;
        buffer x {}, y {};
        for (;;) {
            if (x.empty())
                x = a.next();
            if (y.empty())
                y = b.next();
            if (x.empty() || y.empty())
                return x.empty() && y.empty();
            const auto n = std::min(x.size(), y.size());
            if (memcmp(x.data(), y.data(), n) != 0)
                return false;
            x = x.subbuf(n);
            y = y.subbuf(n);
        }
    }

    bool compare_external(const buffer buf, const size_t off, const uint64_t item_len, const buffer str)
    {
        return _equal(string_cursor { buf, off, item_len }, string_cursor { str, 0, str.size() });
    }

    bool compare_in_payload(const buffer buf, const size_t off1, const uint64_t item_len1, const size_t off2, const uint64_t item_len2)
    {
        if (!is_indefinite(item_len1) && !is_indefinite(item_len2)) [[likely]] {
            if (item_len1 != item_len2)
                return false;
            _ensure_range(buf, off1, item_len1);
            _ensure_range(buf, off2, item_len2);
            return memcmp(buf.data() + off1, buf.data() + off2, item_len1) == 0;
        }
        return _equal(string_cursor { buf, off1, item_len1 }, string_cursor { buf, off2, item_len2 });
    }
}
