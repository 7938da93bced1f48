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

#ifndef BLT_GE_STATS_H
#define BLT_GE_STATS_H

#include <string>
#include <blt/std/types.h>
#include <blt/ge/fwdecl.h>
#include <blt/ge/fitness.h>

namespace blt::ge
{
    /**
     * Summary of one evaluated generation. Sum and average only count individuals that were actually scored, best and
     * worst range over everyone.
     */
    struct population_stats
    {
        size_t generation = 0;
        double overall_fitness = 0;
        double average_fitness = 0;
        double best_fitness = 0;
        double worst_fitness = 0;
        size_t valid_individuals = 0;
        size_t best_index = 0;
        std::string best_phenotype;

        friend bool operator==(const population_stats& a, const population_stats& b)
        {
            return a.generation == b.generation && a.overall_fitness == b.overall_fitness && a.average_fitness == b.average_fitness &&
                a.best_fitness == b.best_fitness && a.worst_fitness == b.worst_fitness && a.valid_individuals == b.valid_individuals &&
                a.best_index == b.best_index && a.best_phenotype == b.best_phenotype;
        }

        friend bool operator!=(const population_stats& a, const population_stats& b)
        {
            return !(a == b);
        }
    };

    /**
     * The population must be evaluated and non-empty. Ties for best or worst go to the lowest index.
     */
    population_stats compute_population_stats(const population_t& population, size_t generation, fitness_direction_t direction);
}

#endif //BLT_GE_STATS_H
