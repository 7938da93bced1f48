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

#ifndef BLT_GE_EXAMPLES_PARITY_H
#define BLT_GE_EXAMPLES_PARITY_H

#include "examples_base.h"

namespace blt::ge::example
{
    /**
     * Evolves the 3 input odd parity (XOR) function over AND, OR and NOT.
     */
    class parity_t : public example_base_t
    {
    public:
        static grammar_t make_grammar()
        {
            return grammar_builder_t{}
                   .add_rule("S", {"E"})
                   .add_rule("E", {"E OR T", "T"})
                   .add_rule("T", {"T AND F", "F"})
                   .add_rule("F", {"NOT F", "A", "B", "C"})
                   .build("S");
        }

        static bool target(const std::vector<bool>& inputs)
        {
            return inputs[0] ^ inputs[1] ^ inputs[2];
        }

        parity_t(const u64 seed, const prog_config_t& config): example_base_t{seed, config}, grammar(make_grammar()),
                                                                fitness{{"A", "B", "C"}, target}
        {
            BLT_INFO("Starting BLT-GE Parity Example");
        }

        void execute()
        {
            run_generation_loop(grammar, fitness);
            print_best();
            const auto& best = program.get_best_individual();
            BLT_INFO("Matched {} of {} rows", best.fitness.hits, fitness.get_row_count());
        }

    private:
        grammar_t grammar;
        truth_table_fitness_t fitness;
    };
}

#endif //BLT_GE_EXAMPLES_PARITY_H
