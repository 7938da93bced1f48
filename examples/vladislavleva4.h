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

#ifndef BLT_GE_EXAMPLES_VLADISLAVLEVA4_H
#define BLT_GE_EXAMPLES_VLADISLAVLEVA4_H

#include <string>
#include <string_view>
#include <vector>
#include "examples_base.h"

namespace blt::ge::example
{
    /**
     * Vladislavleva-4 benchmark, f(x) = 10 / (5 + sum((x_i - 3)^2)) over five inputs. Several independent runs minimize
     * training MSE, the best expression of each run is then scored on a wider test range.
     */
    class vladislavleva4_t
    {
    public:
        static constexpr size_t input_count = 5;

        struct run_report_t
        {
            double best_fitness;
            // final generation, over scored individuals
            double average_fitness;
            double test_mse;
            std::string best_expression;
        };

        static double target(const std::vector<double>& inputs);

        static dataset_t generate_dataset(random_t& random, size_t samples, double min, double max);

        vladislavleva4_t(u64 seed, const prog_config_t& config, std::string_view grammar_path);

        // writes both data sets to disk and reads them back, so every run sees exactly what is stored
        void prepare_datasets(const std::string& train_path, const std::string& test_path);

        run_report_t run_once(u64 run_seed);

        void execute(size_t runs);

    private:
        u64 seed;
        prog_config_t config;
        grammar_t grammar;
        dataset_t training_data;
        dataset_t test_data;
    };
}

#endif //BLT_GE_EXAMPLES_VLADISLAVLEVA4_H
