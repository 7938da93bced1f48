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

#ifndef BLT_GE_GENOME_H
#define BLT_GE_GENOME_H

#include <ostream>
#include <blt/ge/fwdecl.h>
#include <blt/ge/random.h>

namespace blt::ge
{
    /**
     * Creates a genome with a length drawn uniformly from [min_length, max_length] and codons drawn from the range.
     * min_length == max_length gives fixed length genomes.
     */
    genome_t random_genome(random_t& random, size_t min_length, size_t max_length, const codon_range_t& range);

    // appends count random codons
    void extend_genome(random_t& random, genome_t& genome, size_t count, const codon_range_t& range);

    // removes up to count codons from the end, a genome always keeps at least one codon
    void truncate_genome(genome_t& genome, size_t count);

    std::ostream& print_genome(std::ostream& out, const genome_t& genome);
}

#endif //BLT_GE_GENOME_H
