/* This file is part of Shape Codec project.
 * Copyright (c) 2026 Shape Codec contributors
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SHAPE_CODEC_CBOR_NESTING_HPP
#define SHAPE_CODEC_CBOR_NESTING_HPP

#include <array>
#include <cstdint>
#include <vector>
#include <sc/cbor/error.hpp>

namespace shape_codec::cbor {
    enum class collection: uint8_t {
        map,
        array
    };

    enum class phase: uint8_t {
        key,
        value
    };

    // One open collection. For maps the counts are in entries, for arrays in elements.
    struct frame {
        int64_t remaining = 0; // negative when indefinite
        int64_t size = 0; // as declared, negative when indefinite
        collection kind = collection::array;
        phase ph = phase::key;

        bool indefinite() const noexcept
        {
            return remaining < 0;
        }

        bool done() const noexcept
        {
            return remaining == 0 && ph == phase::key;
        }

        // keys and values still expected, meaningful for definite collections only
        int64_t items_left() const noexcept
        {
            if (kind == collection::array)
                return remaining;
            return remaining * 2 - (ph == phase::value ? 1 : 0);
        }

        void consume() noexcept
        {
            if (kind == collection::map) {
                if (ph == phase::key) {
                    ph = phase::value;
                    return;
                }
                ph = phase::key;
            }
            if (remaining > 0)
                --remaining;
        }
    };

    /*
     * A stack of open collections. The first inline_capacity frames live inside the object,
     * so shallow documents never allocate. Deeper frames spill into a heap array whose capacity doubles.
     */
    struct nesting_stack {
        static constexpr size_t inline_capacity = 4;

        void push(const frame &f)
        {
            if (_size < inline_capacity) [[likely]] {
                _inline[_size++] = f;
                return;
            }
            if (_spill.size() == _spill.capacity())
                _spill.reserve(_spill.empty() ? inline_capacity * 2 : _spill.capacity() * 2);
            _spill.emplace_back(f);
            ++_size;
        }

        void pop()
        {
            if (_size == 0) [[unlikely]]
                throw malformed_error("invalid nesting of cbor structures detected!", true);
            if (_size > inline_capacity)
                _spill.pop_back();
            --_size;
        }

        frame &top()
        {
            return const_cast<frame &>(const_cast<const nesting_stack *>(this)->top());
        }

        const frame &top() const
        {
            if (_size == 0) [[unlikely]]
                throw malformed_error("the nesting stack is empty!", true);
            if (_size > inline_capacity)
                return _spill.back();
            return _inline[_size - 1];
        }

        size_t size() const noexcept
        {
            return _size;
        }

        bool empty() const noexcept
        {
            return _size == 0;
        }

        size_t capacity() const noexcept
        {
            return inline_capacity + _spill.capacity();
        }
    private:
        std::array<frame, inline_capacity> _inline {};
        std::vector<frame> _spill {};
        size_t _size = 0;
    };
}

#endif // !SHAPE_CODEC_CBOR_NESTING_HPP
