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

#ifndef BLT_GE_EXAMPLES_EXAMPLES_BASE_H
#define BLT_GE_EXAMPLES_EXAMPLES_BASE_H

#include <iostream>
#include <blt/ge/program.h>
#include <blt/ge/genome.h>
#include <blt/logging/logging.h>

namespace blt::ge::example
{
    class example_base_t
    {
    public:
        example_base_t(const u64 seed, const prog_config_t& config): program{seed, config}, selection{config.tournament_size}
        {
        }

        void run_generation_loop(const grammar_t& grammar, const fitness_function_t& fitness_function)
        {
            BLT_DEBUG("Generate Initial Population");
            program.setup_generational_evaluation(grammar, fitness_function, selection);
            program.generate_initial_population();

            BLT_DEBUG("Begin Generation Loop");
            while (!program.should_terminate())
            {
                BLT_TRACE("------------\\{Begin Generation {}}------------", program.get_current_generation() + 1);
                program.create_next_generation();
                program.next_generation();
                program.evaluate_fitness();
                const auto& stats = program.get_population_stats();
                BLT_TRACE("Avg Fit: {:0.6f}, Best Fit: {:0.6f}, Worst Fit: {:0.6f}, Valid: {}", stats.average_fitness, stats.best_fitness,
                          stats.worst_fitness, stats.valid_individuals);
            }
        }

        void print_best() const
        {
            const auto& best = program.get_best_individual();
            BLT_INFO("Best individual (generation {}): fitness {:0.6f}, raw {:0.6f}, hits {}", best.generation, best.fitness.adjusted_fitness,
                     best.fitness.raw_fitness, best.fitness.hits);
            std::cout << "Phenotype: " << best.phenotype << "\nGenome: ";
            print_genome(std::cout, best.genome) << std::endl;
        }

        [[nodiscard]] ge_program& get_program() { return program; }
        [[nodiscard]] const ge_program& get_program() const { return program; }

    protected:
        ge_program program;
        select_tournament_t selection;
    };
}

#endif //BLT_GE_EXAMPLES_EXAMPLES_BASE_H
