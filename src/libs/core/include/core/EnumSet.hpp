/*
 * Copyright (C) 2025 The Fooder Authors
 *
 * This file is part of Fooder.
 *
 * Fooder is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Fooder is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Fooder.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <type_traits>

namespace fooder::core
{
    template<typename T, typename underlying_type = std::uint32_t>
    class EnumSet
    {
        static_assert(std::is_enum_v<T>);
        static_assert(std::is_same_v<underlying_type, std::uint64_t> || std::is_same_v<underlying_type, std::uint32_t>);

        using IndexType = std::uint_fast8_t;

    public:
        using ValueType = underlying_type;

        constexpr EnumSet() = default;
        constexpr EnumSet(std::initializer_list<T> values)
        {
            for (T value : values)
                insert(value);
        }

        constexpr void insert(T value)
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            _bitfield |= (underlying_type{ 1 } << static_cast<underlying_type>(value));
        }

        constexpr void erase(T value)
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            _bitfield &= ~(underlying_type{ 1 } << static_cast<underlying_type>(value));
        }

        constexpr bool empty() const
        {
            return _bitfield == 0;
        }

        constexpr bool contains(T value) const
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            return _bitfield & (underlying_type{ 1 } << static_cast<underlying_type>(value));
        }

        constexpr void clear()
        {
            _bitfield = 0;
        }

        constexpr underlying_type getBitfield() const
        {
            return _bitfield;
        }

        constexpr bool operator==(const EnumSet& other) const = default;

    private:
        static_assert(std::numeric_limits<IndexType>::max() >= sizeof(underlying_type) * 8);

        underlying_type _bitfield{};
    };
} // namespace fooder::core
