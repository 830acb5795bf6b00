/* This file is part of Shape Codec project.
 * Derived from Daedalus Turbo: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_BIG_INT_HPP
#define SHAPE_CODEC_BIG_INT_HPP

#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <sstream>
#include <boost/multiprecision/cpp_int.hpp>
#include <sc/common/bytes.hpp>
#include <sc/common/format.hpp>

namespace shape_codec {
    using boost::multiprecision::cpp_int;

    static constexpr size_t big_int_max_size = 8192;

    inline cpp_int big_uint_from_bytes(const buffer data)
    {
        if (data.size() > big_int_max_size)
            throw error(fmt::format("big ints larger than {} bytes are not supported but got: {}!", big_int_max_size, data.size()));
        cpp_int val = 0;
        for (const uint8_t &b: data) {
            val *= 256;
            val += b;
        }
        return val;
    }

    // negative bignums are stored as the complement of their magnitude: -(n + 1)
    inline cpp_int big_nint_from_bytes(const buffer data)
    {
        auto val = big_uint_from_bytes(data);
        ++val;
        val *= -1;
        return val;
    }

    /*
     * An arbitrary-precision decimal: value = unscaled * 10^(-scale).
     * A CBOR decimal fraction [e, m] maps to unscaled = m and scale = -e.
     */
    struct big_decimal {
        cpp_int unscaled {};
        int32_t scale = 0;

        int64_t exponent() const noexcept
        {
            return -static_cast<int64_t>(scale);
        }

        bool operator==(const big_decimal &o) const
        {
            return scale == o.scale && unscaled == o.unscaled;
        }

        std::string to_string() const
        {
            std::ostringstream ss {};
            ss << boost::multiprecision::abs(unscaled);
            std::string digits = ss.str();
            const std::string_view sign { unscaled < 0 ? "-" : "" };
            if (scale == 0)
                return fmt::format("{}{}", sign, digits);
            if (scale < 0 && scale >= -max_plain_digits)
                return fmt::format("{}{}{}", sign, digits, std::string(static_cast<size_t>(-scale), '0'));
            if (scale > 0 && scale <= max_plain_digits) {
                const auto frac_sz = static_cast<size_t>(scale);
                if (digits.size() <= frac_sz)
                    digits.insert(0, frac_sz - digits.size() + 1, '0');
                digits.insert(digits.size() - frac_sz, 1, '.');
                return fmt::format("{}{}", sign, digits);
            }
            return fmt::format("{}{}E{}", sign, digits, exponent());
        }
    private:
        static constexpr int32_t max_plain_digits = 64;
    };
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };

    template<>
    struct formatter<shape_codec::big_decimal>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !SHAPE_CODEC_BIG_INT_HPP
