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
#include <iterator>
#include <random>

namespace fooder::core::random
{
    using RandGenerator = std::mt19937;

    // Per-thread generator seeded from std::random_device
    RandGenerator& getRandGenerator();

    RandGenerator createSeededGenerator(std::uint_fast32_t seed);

    template<typename T>
    T getRandom(RandGenerator& generator, T min, T max)
    {
        assert(min <= max);
        std::uniform_int_distribution<T> dist{ min, max };
        return dist(generator);
    }

    template<typename Container>
    typename Container::const_iterator pickRandom(RandGenerator& generator, const Container& container)
    {
        if (container.empty())
            return std::cend(container);

        return std::next(std::cbegin(container), getRandom<std::size_t>(generator, 0, container.size() - 1));
    }
} // namespace fooder::core::random
