#pragma once
/*
 *  Copyright (C) 2025  Brett Terpstra
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef BLT_GE_RANDOM_H
#define BLT_GE_RANDOM_H

#include <blt/std/types.h>
#include <blt/std/random.h>
#include <blt/ge/fwdecl.h>

namespace blt::ge
{
#define BLT_GE_RANDOM_FUNCTION blt::random::murmur_random64
#define BLT_GE_RANDOM_DOUBLE blt::random::murmur_double64

    /**
     * Seedable generator handed to every operator that needs randomness. Two generators constructed with the same seed
     * produce the same sequence, which is what makes whole runs reproducible.
     */
    class random_t
    {
    public:
        explicit random_t(const u64 seed): seed(seed)
        {
        }

        // [0, 1)
        double get_double()
        {
            return BLT_GE_RANDOM_DOUBLE(seed);
        }

        // [min, max)
        double get_double(const double min, const double max)
        {
            return BLT_GE_RANDOM_FUNCTION(seed, min, max);
        }

        // [min, max)
        u64 get_u64(const u64 min, const u64 max)
        {
            return BLT_GE_RANDOM_FUNCTION(seed, min, max);
        }

        // [min, max)
        size_t get_size_t(const size_t min, const size_t max)
        {
            return BLT_GE_RANDOM_FUNCTION(seed, min, max);
        }

        codon_t get_codon(const codon_range_t& range)
        {
            return get_u64(range.min, range.max);
        }

        // true with the given probability. 0 never succeeds, 1 always does
        bool choice(const double probability)
        {
            return get_double() < probability;
        }

    private:
        u64 seed;
    };
}

#endif //BLT_GE_RANDOM_H
