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

#ifndef BLT_GE_FWDECL_H
#define BLT_GE_FWDECL_H

#include <string>
#include <vector>
#include <blt/std/types.h>

namespace blt::ge
{
    class random_t;

    class grammar_t;

    class grammar_builder_t;

    struct phenotype_t;

    struct fitness_t;

    class fitness_function_t;

    struct individual_t;

    class population_t;

    struct population_stats;

    class selection_t;

    class crossover_t;

    class mutation_t;

    struct prog_config_t;

    class ge_program;

    // codons are unbounded, they are reduced modulo the production count where they are consumed
    using codon_t = u64;
    using genome_t = std::vector<codon_t>;

    using symbol_t = std::string;
    using production_t = std::vector<symbol_t>;

    /**
     * Range of values a freshly drawn codon can take, [min, max)
     */
    struct codon_range_t
    {
        codon_t min = 0;
        codon_t max = 256;

        [[nodiscard]] bool empty() const
        {
            return max <= min;
        }

        [[nodiscard]] bool contains(const codon_t codon) const
        {
            return codon >= min && codon < max;
        }
    };
}

#endif //BLT_GE_FWDECL_H
