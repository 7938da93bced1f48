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

#ifndef BLT_GE_EXAMPLES_REGRESSION_H
#define BLT_GE_EXAMPLES_REGRESSION_H

#include "examples_base.h"
#include <blt/ge/expression/arithmetic.h>

namespace blt::ge::example
{
    /**
     * Fits an expression over x and y to a couple of samples, scored with 1 / (1 + mse).
     */
    class regression_t : public example_base_t
    {
    public:
        static grammar_t make_grammar()
        {
            return grammar_builder_t{}
                   .add_rule("E", {"E + T", "E - T", "T"})
                   .add_rule("T", {"T * F", "T / F", "F"})
                   .add_rule("F", {"x", "y", "( E )", "1.0", "2.0", "3.0"})
                   .build("E");
        }

        static dataset_t make_dataset()
        {
            return {
                {{0.1, 0.3}, 0.31},
                {{0.2, 0.6}, 0.59}
            };
        }

        regression_t(const u64 seed, const prog_config_t& config): example_base_t{seed, config}, grammar(make_grammar()),
                                                                    fitness{{"x", "y"}, make_dataset(), regression_score_t::INVERTED}
        {
            BLT_INFO("Starting BLT-GE Regression Example");
        }

        void execute()
        {
            run_generation_loop(grammar, fitness);
            print_best();

            const auto& best = program.get_best_individual();
            if (!best.phenotype.valid)
            {
                BLT_WARN("No complete expression was found");
                return;
            }
            const arithmetic_bindings_t unseen{{"x", 0.3}, {"y", 0.9}};
            BLT_INFO("Prediction at x = 0.3, y = 0.9: {}", evaluate_arithmetic(best.phenotype.text, unseen));
        }

    private:
        grammar_t grammar;
        named_regression_fitness_t fitness;
    };
}

#endif //BLT_GE_EXAMPLES_REGRESSION_H
