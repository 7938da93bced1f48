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

#ifndef BLT_GE_TRANSFORMERS_H
#define BLT_GE_TRANSFORMERS_H

#include <blt/ge/fwdecl.h>
#include <blt/ge/random.h>

namespace blt::ge
{
    class crossover_t
    {
    public:
        /**
         * Apply crossover to a pair of parents. Note: c1 and c2 are already filled with their respective parent's codons.
         * @return true if the crossover succeeded, otherwise the children are treated as clones of the parents.
         */
        virtual bool apply(random_t& random, const genome_t& p1, const genome_t& p2, genome_t& c1, genome_t& c2) = 0;

        virtual ~crossover_t() = default;
    };

    /**
     * Cuts both parents at the same index, drawn uniformly from [0, min(|p1|, |p2|)), and swaps the tails.
     * |c1| + |c2| == |p1| + |p2| always holds.
     */
    class one_point_crossover_t : public crossover_t
    {
    public:
        bool apply(random_t& random, const genome_t& p1, const genome_t& p2, genome_t& c1, genome_t& c2) override;

        // the children of cutting at point
        static void cross_at(size_t point, const genome_t& p1, const genome_t& p2, genome_t& c1, genome_t& c2);
    };

    enum class mutation_mode_t : u8
    {
        // with the mutation chance, one point mutation for the whole genome
        PER_INDIVIDUAL,
        // every codon is redrawn independently with the mutation chance
        PER_CODON
    };

    class mutation_t
    {
    public:
        /**
         * Applies the configured mutation policy to c in place, using the mutation chance, granularity and codon range
         * of the config.
         * @return true if any codon was redrawn
         */
        virtual bool apply(random_t& random, const prog_config_t& config, genome_t& c);

        // redraws one uniformly chosen codon from range, returns its index
        static size_t mutate_point(random_t& random, const codon_range_t& range, genome_t& c);

        virtual ~mutation_t() = default;
    };
}

#endif //BLT_GE_TRANSFORMERS_H
