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

#include <functional>
#include <ostream>

namespace fooder::core
{
    template<typename Tag, typename T>
    class TaggedType
    {
    public:
        using underlying_type = T;

        explicit constexpr TaggedType() = default;
        explicit constexpr TaggedType(T value)
            : _value{ value } {}

        constexpr T value() const { return _value; }

        auto operator<=>(const TaggedType&) const = default;

    private:
        T _value{};
    };

    template<typename Tag, typename T>
    std::ostream& operator<<(std::ostream& os, TaggedType<Tag, T> taggedValue)
    {
        return os << taggedValue.value();
    }
} // namespace fooder::core

namespace std
{
    template<typename Tag, typename T>
    struct hash<fooder::core::TaggedType<Tag, T>>
    {
        size_t operator()(fooder::core::TaggedType<Tag, T> taggedValue) const
        {
            return std::hash<T>()(taggedValue.value());
        }
    };
} // namespace std
