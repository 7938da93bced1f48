/*
 *  <Short Description>
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
#include <blt/ge/genome.h>
#include <blt/std/assert.h>
#include <algorithm>
#include <string>

namespace blt::ge
{
    genome_t random_genome(random_t& random, const size_t min_length, const size_t max_length, const codon_range_t& range)
    {
        BLT_ASSERT_MSG(min_length > 0, "Genomes must contain at least one codon!");
        BLT_ASSERT_MSG(min_length <= max_length, ("Minimum genome length (" + std::to_string(min_length) +
                           ") is larger than the maximum genome length (" + std::to_string(max_length) + ")").c_str());
        BLT_ASSERT_MSG(!range.empty(), "Codon range is empty!");

        const auto length = min_length == max_length ? min_length : random.get_size_t(min_length, max_length + 1);
        genome_t genome;
        genome.reserve(length);
        for (size_t i = 0; i < length; i++)
            genome.push_back(random.get_codon(range));
        return genome;
    }

    void extend_genome(random_t& random, genome_t& genome, const size_t count, const codon_range_t& range)
    {
        BLT_ASSERT_MSG(!range.empty(), "Codon range is empty!");
        genome.reserve(genome.size() + count);
        for (size_t i = 0; i < count; i++)
            genome.push_back(random.get_codon(range));
    }

    void truncate_genome(genome_t& genome, const size_t count)
    {
        if (genome.empty())
            return;
        const auto removable = std::min(count, genome.size() - 1);
        genome.resize(genome.size() - removable);
    }

    std::ostream& print_genome(std::ostream& out, const genome_t& genome)
    {
        out << '[';
        for (size_t i = 0; i < genome.size(); i++)
        {
            if (i != 0)
                out << ", ";
            out << genome[i];
        }
        return out << ']';
    }
}
