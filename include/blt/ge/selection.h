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

#ifndef BLT_GE_SELECTION_H
#define BLT_GE_SELECTION_H

#include <algorithm>
#include <string>
#include <vector>
#include <blt/ge/fwdecl.h>
#include <blt/ge/fitness.h>
#include <blt/ge/population.h>
#include <blt/ge/random.h>
#include <blt/std/assert.h>

namespace blt::ge
{
    namespace detail
    {
        /**
         * Copies the elites best individuals of current_pop, genome phenotype and fitness alike, to the end of next_pop.
         * Equal fitness keeps population order.
         * @return number of individuals copied
         */
        constexpr inline auto perform_elitism = [](const population_t& current_pop, population_t& next_pop, const size_t elites,
                                                   const fitness_direction_t direction)
        {
            BLT_ASSERT_MSG(elites <= current_pop.size(), ("Not enough individuals in population (" + std::to_string(current_pop.size()) +
                               ") for requested amount of elites (" + std::to_string(elites) + ")").c_str());

            if (elites == 0)
                return static_cast<size_t>(0);

            thread_local std::vector<size_t> order;
            order.clear();
            for (size_t i = 0; i < current_pop.size(); i++)
                order.push_back(i);

            std::stable_sort(order.begin(), order.end(), [&current_pop, direction](const size_t a, const size_t b)
            {
                return is_better(current_pop[a].fitness.adjusted_fitness, current_pop[b].fitness.adjusted_fitness, direction);
            });

            for (size_t i = 0; i < elites; i++)
                next_pop.get_individuals().push_back(current_pop[order[i]]);
            return elites;
        };
    }

    class selection_t
    {
    public:
        /**
         * @param random source of randomness for the selection
         * @param pop evaluated population to select from
         * @param direction which fitness values are better
         * @return the selected individual, which stays owned by pop
         */
        virtual const individual_t& select(random_t& random, const population_t& pop, fitness_direction_t direction) = 0;

        virtual ~selection_t() = default;
    };

    /**
     * Samples selection_size individuals uniformly with replacement and returns the best of them. The first candidate
     * drawn wins ties.
     */
    class select_tournament_t final : public selection_t
    {
    public:
        explicit select_tournament_t(const size_t selection_size = 3): selection_size(selection_size)
        {
            if (selection_size == 0)
                BLT_ABORT("Unable to select with this size. Must select at least 1 individual_t!");
        }

        const individual_t& select(random_t& random, const population_t& pop, fitness_direction_t direction) override;

        [[nodiscard]] size_t get_selection_size() const
        {
            return selection_size;
        }

    private:
        size_t selection_size;
    };
}

#endif //BLT_GE_SELECTION_H
