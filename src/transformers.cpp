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
#include <blt/ge/transformers.h>
#include <blt/ge/config.h>
#include <blt/std/assert.h>
#include <blt/std/utility.h>
#include <algorithm>

namespace blt::ge
{
    bool one_point_crossover_t::apply(random_t& random, const genome_t& p1, const genome_t& p2, genome_t& c1, genome_t& c2)
    {
        if (p1.empty() || p2.empty())
            BLT_ABORT("Cannot cross over an empty genome!");

        const auto point = random.get_size_t(0, std::min(p1.size(), p2.size()));
        cross_at(point, p1, p2, c1, c2);
        return true;
    }

    void one_point_crossover_t::cross_at(const size_t point, const genome_t& p1, const genome_t& p2, genome_t& c1, genome_t& c2)
    {
        BLT_ASSERT_MSG(point <= p1.size() && point <= p2.size(), "Crossover point must lie within both parents!");

        c1.clear();
        c1.insert(c1.end(), p1.begin(), p1.begin() + static_cast<std::ptrdiff_t>(point));
        c1.insert(c1.end(), p2.begin() + static_cast<std::ptrdiff_t>(point), p2.end());

        c2.clear();
        c2.insert(c2.end(), p2.begin(), p2.begin() + static_cast<std::ptrdiff_t>(point));
        c2.insert(c2.end(), p1.begin() + static_cast<std::ptrdiff_t>(point), p1.end());
    }

    bool mutation_t::apply(random_t& random, const prog_config_t& config, genome_t& c)
    {
        switch (config.mutation_mode)
        {
        case mutation_mode_t::PER_INDIVIDUAL:
            if (!random.choice(config.mutation_chance))
                return false;
            mutate_point(random, config.codon_range, c);
            return true;
        case mutation_mode_t::PER_CODON:
        {
            bool mutated = false;
            for (auto& codon : c)
            {
                if (random.choice(config.mutation_chance))
                {
                    codon = random.get_codon(config.codon_range);
                    mutated = true;
                }
            }
            return mutated;
        }
        }
        BLT_UNREACHABLE;
    }

    size_t mutation_t::mutate_point(random_t& random, const codon_range_t& range, genome_t& c)
    {
        if (c.empty())
            BLT_ABORT("Cannot mutate an empty genome!");
        BLT_ASSERT_MSG(!range.empty(), "Codon range for mutation is empty!");

        const auto point = random.get_size_t(0, c.size());
        c[point] = random.get_codon(range);
        return point;
    }
}
