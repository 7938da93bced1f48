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

#ifndef BLT_GE_PROGRAM_H
#define BLT_GE_PROGRAM_H

#include <vector>
#include <blt/std/types.h>
#include <blt/ge/fwdecl.h>
#include <blt/ge/config.h>
#include <blt/ge/fitness.h>
#include <blt/ge/grammar.h>
#include <blt/ge/mapper.h>
#include <blt/ge/population.h>
#include <blt/ge/random.h>
#include <blt/ge/selection.h>
#include <blt/ge/stats.h>

namespace blt::ge
{
    enum class program_state_t : u8
    {
        INIT,
        EVALUATE,
        SELECT_AND_BREED,
        MUTATE,
        REPLACE,
        TERMINAL
    };

    const char* to_string(program_state_t state);

    struct best_individual_t
    {
        genome_t genome;
        phenotype_t phenotype;
        fitness_t fitness;
        // generation the individual was first seen in
        size_t generation = 0;
        bool found = false;
    };

    struct run_result_t
    {
        genome_t best_genome;
        phenotype_t best_phenotype;
        fitness_t best_fitness;
        size_t best_generation = 0;
        std::vector<population_stats> history;
    };

    /**
     * Generational loop over genomes. One generation is
     *
     *  create_next_generation() -> next_generation() -> evaluate_fitness()
     *
     * after setup_generational_evaluation() and generate_initial_population(). The population is evaluated
     * max_generations times in total, counting the initial population, after which should_terminate() is true.
     */
    class ge_program
    {
    public:
        explicit ge_program(u64 seed);

        explicit ge_program(u64 seed, const prog_config_t& config);

        /**
         * The grammar, fitness function and selection operator are borrowed and must outlive the program. Aborts if the
         * fitness function optimizes in a different direction than the config.
         */
        void setup_generational_evaluation(const grammar_t& grammar, const fitness_function_t& fitness_function, selection_t& selection);

        // creates population_size random genomes and evaluates them as generation 0
        void generate_initial_population();

        /**
         * Copies the elites, then breeds the rest of the next population from selected parents and mutates the bred
         * individuals.
         */
        void create_next_generation();

        void next_generation();

        void evaluate_fitness();

        [[nodiscard]] bool should_terminate() const
        {
            return current_generation + 1 >= config.max_generations;
        }

        [[nodiscard]] random_t& get_random()
        {
            return random;
        }

        [[nodiscard]] const prog_config_t& get_config() const
        {
            return config;
        }

        [[nodiscard]] const population_t& get_current_pop() const
        {
            return current_pop;
        }

        [[nodiscard]] size_t get_current_generation() const
        {
            return current_generation;
        }

        [[nodiscard]] program_state_t get_state() const
        {
            return state;
        }

        [[nodiscard]] const population_stats& get_population_stats() const
        {
            return current_stats;
        }

        [[nodiscard]] const std::vector<population_stats>& get_stats_history() const
        {
            return statistic_history;
        }

        // best individual of every generation so far, only replaced by a strictly better one
        [[nodiscard]] const best_individual_t& get_best_individual() const
        {
            return best_individual;
        }

        [[nodiscard]] run_result_t get_result() const;

    private:
        void validate_config() const;

        void expect_state(program_state_t expected, const char* operation) const;

        random_t random;
        prog_config_t config{};
        program_state_t state = program_state_t::INIT;

        const grammar_t* grammar = nullptr;
        const fitness_function_t* fitness_function = nullptr;
        selection_t* selection = nullptr;

        population_t current_pop;
        population_t next_pop;

        size_t current_generation = 0;

        population_stats current_stats{};
        std::vector<population_stats> statistic_history;
        best_individual_t best_individual;
    };

    /**
     * Runs a complete search with tournament selection of config.tournament_size.
     */
    run_result_t run(const grammar_t& grammar, const fitness_function_t& fitness_function, const prog_config_t& config, u64 seed);
}

#endif //BLT_GE_PROGRAM_H
