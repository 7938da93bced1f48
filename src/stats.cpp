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
#include <blt/ge/stats.h>
#include <blt/ge/population.h>
#include <blt/std/assert.h>
#include <blt/std/ranges.h>

namespace blt::ge
{
    population_stats compute_population_stats(const population_t& population, const size_t generation, const fitness_direction_t direction)
    {
        if (population.empty())
            BLT_ABORT("Cannot compute statistics of an empty population!");

        population_stats stats;
        stats.generation = generation;
        stats.best_fitness = population[0].fitness.adjusted_fitness;
        stats.worst_fitness = population[0].fitness.adjusted_fitness;

        for (const auto& [index, individual] : blt::enumerate(population.get_individuals()))
        {
            const auto fitness = individual.fitness.adjusted_fitness;
            if (individual.fitness.valid)
            {
                stats.overall_fitness += fitness;
                ++stats.valid_individuals;
            }
            if (is_better(fitness, stats.best_fitness, direction))
            {
                stats.best_fitness = fitness;
                stats.best_index = index;
            }
            if (is_better(stats.worst_fitness, fitness, direction))
                stats.worst_fitness = fitness;
        }

        if (stats.valid_individuals > 0)
            stats.average_fitness = stats.overall_fitness / static_cast<double>(stats.valid_individuals);
        stats.best_phenotype = population[stats.best_index].phenotype.text;
        return stats;
    }
}
