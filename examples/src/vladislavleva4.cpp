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
#include "../vladislavleva4.h"
#include "../loader.h"
#include <blt/profiling/profiler_v2.h>
#include <blt/std/ranges.h>
#include <algorithm>
#include <limits>

namespace blt::ge::example
{
    double vladislavleva4_t::target(const std::vector<double>& inputs)
    {
        double sum = 0;
        for (const auto x : inputs)
            sum += (x - 3) * (x - 3);
        return 10.0 / (5.0 + sum);
    }

    dataset_t vladislavleva4_t::generate_dataset(random_t& random, const size_t samples, const double min, const double max)
    {
        dataset_t dataset;
        dataset.reserve(samples);
        for (size_t i = 0; i < samples; i++)
        {
            sample_t sample;
            for (size_t j = 0; j < input_count; j++)
                sample.inputs.push_back(random.get_double(min, max));
            sample.output = target(sample.inputs);
            dataset.push_back(std::move(sample));
        }
        return dataset;
    }

    vladislavleva4_t::vladislavleva4_t(const u64 seed, const prog_config_t& config, const std::string_view grammar_path): seed(seed),
        config(config), grammar(load_grammar(grammar_path, "Expr"))
    {
        BLT_INFO("Starting BLT-GE Vladislavleva-4 Example");
        std::cout << grammar << std::endl;
    }

    void vladislavleva4_t::prepare_datasets(const std::string& train_path, const std::string& test_path)
    {
        BLT_DEBUG("Generate training and test data");
        random_t random{seed};
        save_dataset(train_path, generate_dataset(random, 1024, 0.05, 6.05));
        save_dataset(test_path, generate_dataset(random, 5000, -0.25, 6.35));
        training_data = load_dataset(train_path);
        test_data = load_dataset(test_path);
    }

    vladislavleva4_t::run_report_t vladislavleva4_t::run_once(const u64 run_seed)
    {
        const indexed_regression_fitness_t fitness{training_data, regression_score_t::MSE};
        const indexed_regression_fitness_t test_fitness{test_data, regression_score_t::MSE};

        example_base_t run{run_seed, config};
        BLT_START_INTERVAL("Vladislavleva-4", "Run");
        run.run_generation_loop(grammar, fitness);
        BLT_END_INTERVAL("Vladislavleva-4", "Run");
        run.print_best();

        const auto& best = run.get_program().get_best_individual();
        return {
            best.fitness.adjusted_fitness, run.get_program().get_population_stats().average_fitness, test_fitness(best.phenotype).raw_fitness,
            best.phenotype.text
        };
    }

    void vladislavleva4_t::execute(const size_t runs)
    {
        std::vector<run_report_t> reports;
        for (size_t i = 0; i < runs; i++)
            reports.push_back(run_once(seed + i + 1));

        double overall_best = std::numeric_limits<double>::infinity();
        double overall_average = 0;
        for (const auto& report : reports)
        {
            overall_best = std::min(overall_best, report.best_fitness);
            overall_average += report.average_fitness;
        }
        overall_average /= static_cast<double>(reports.size());

        BLT_INFO("Overall Best Fitness: {}", overall_best);
        BLT_INFO("Overall Average Fitness: {}", overall_average);
        for (const auto& [index, report] : blt::enumerate(reports))
        {
            BLT_INFO("Run {}: Best Expression: {}", index + 1, report.best_expression);
            BLT_INFO("Run {}: test fitness: {}", index + 1, report.test_mse);
        }
        BLT_PRINT_PROFILE("Vladislavleva-4", blt::PRINT_CYCLES | blt::PRINT_THREAD | blt::PRINT_WALL);
    }
}
