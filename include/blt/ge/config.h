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

#ifndef BLT_GE_CONFIG_H
#define BLT_GE_CONFIG_H

#include <functional>
#include <tuple>
#include <blt/std/types.h>
#include <blt/ge/fwdecl.h>
#include <blt/ge/fitness.h>
#include <blt/ge/mapper.h>
#include <blt/ge/transformers.h>

namespace blt::ge
{
    struct prog_config_t
    {
        size_t population_size = 500;
        size_t max_generations = 50;
        // bounds on the length of the initial genomes, both inclusive
        size_t min_genome_length = 1;
        size_t max_genome_length = 100;
        codon_range_t codon_range{};
        size_t tournament_size = 3;

        // percent chance that a pair of parents is crossed over, otherwise both are cloned
        double crossover_chance = 0.9;
        // percent chance of mutation, per individual or per codon depending on mutation_mode
        double mutation_chance = 0.01;
        mutation_mode_t mutation_mode = mutation_mode_t::PER_INDIVIDUAL;

        size_t elites = 0;

        fitness_direction_t direction = fitness_direction_t::MAXIMIZE;
        size_t max_derivation_steps = default_max_derivation_steps;

        std::reference_wrapper<mutation_t> mutator;
        std::reference_wrapper<crossover_t> crossover;

        // default config (one point crossover, point mutation) or for buildering
        prog_config_t();

        explicit prog_config_t(size_t populationSize);

        prog_config_t& set_pop_size(const size_t pop)
        {
            population_size = pop;
            return *this;
        }

        prog_config_t& set_genome_length(const size_t min_length, const size_t max_length)
        {
            min_genome_length = min_length;
            max_genome_length = max_length;
            return *this;
        }

        prog_config_t& set_codon_range(const codon_t min, const codon_t max)
        {
            codon_range = {min, max};
            return *this;
        }

        prog_config_t& set_tournament_size(const size_t size)
        {
            tournament_size = size;
            return *this;
        }

        prog_config_t& set_crossover(crossover_t& ref)
        {
            crossover = {ref};
            return *this;
        }

        prog_config_t& set_mutation(mutation_t& ref)
        {
            mutator = {ref};
            return *this;
        }

        prog_config_t& set_elite_count(const size_t new_elites)
        {
            elites = new_elites;
            return *this;
        }

        prog_config_t& set_crossover_chance(const double new_crossover_chance)
        {
            crossover_chance = new_crossover_chance;
            return *this;
        }

        prog_config_t& set_mutation_chance(const double new_mutation_chance)
        {
            mutation_chance = new_mutation_chance;
            return *this;
        }

        prog_config_t& set_mutation_mode(const mutation_mode_t mode)
        {
            mutation_mode = mode;
            return *this;
        }

        prog_config_t& set_max_generations(const size_t new_max_generations)
        {
            max_generations = new_max_generations;
            return *this;
        }

        prog_config_t& set_direction(const fitness_direction_t new_direction)
        {
            direction = new_direction;
            return *this;
        }

        prog_config_t& set_max_derivation_steps(const size_t steps)
        {
            max_derivation_steps = steps;
            return *this;
        }
    };

    /**
     * Builds a config from command line flags, every flag defaults to the prog_config_t default. Also returns the seed,
     * which defaults to 0.
     */
    std::tuple<prog_config_t, u64> create_config_from_args(int argc, const char** argv);
}

#endif //BLT_GE_CONFIG_H
