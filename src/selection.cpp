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
#include <blt/ge/selection.h>

namespace blt::ge
{
    const individual_t& select_tournament_t::select(random_t& random, const population_t& pop, const fitness_direction_t direction)
    {
        if (pop.empty())
            BLT_ABORT("Cannot select from an empty population!");

        const auto& i_ref = pop.get_individuals();
        u64 best = random.get_u64(0, i_ref.size());
        for (size_t i = 1; i < selection_size; i++)
        {
            const u64 sel_point = random.get_u64(0, i_ref.size());
            if (is_better(i_ref[sel_point].fitness.adjusted_fitness, i_ref[best].fitness.adjusted_fitness, direction))
                best = sel_point;
        }
        return i_ref[best];
    }
}
