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
#include <blt/ge/fitness.h>
#include <blt/ge/expression/arithmetic.h>
#include <blt/ge/expression/ast.h>
#include <blt/std/assert.h>
#include <blt/logging/logging.h>
#include <utility>

namespace blt::ge
{
    truth_table_fitness_t::truth_table_fitness_t(std::vector<std::string> variables, const target_t& target): variables(std::move(variables))
    {
        const auto count = this->variables.size();
        BLT_ASSERT_MSG(count > 0 && count < 32, ("Truth table needs between 1 and 31 inputs, got " + std::to_string(count)).c_str());

        const size_t row_count = static_cast<size_t>(1) << count;
        rows.reserve(row_count);
        std::vector<bool> inputs(count);
        for (size_t row = 0; row < row_count; ++row)
        {
            boolean_bindings_t bindings;
            for (size_t i = 0; i < count; ++i)
            {
                inputs[i] = ((row >> (count - 1 - i)) & 1) != 0;
                bindings.bind(this->variables[i], inputs[i]);
            }
            rows.push_back({std::move(bindings), target(inputs)});
        }
        BLT_DEBUG("Truth table over {} inputs with {} rows", count, row_count);
    }

    fitness_t truth_table_fitness_t::evaluate(const phenotype_t& phenotype) const
    {
        const auto postfix = infix_to_postfix(tokenize(phenotype.text));

        fitness_t fitness;
        for (const auto& row : rows)
        {
            // malformed expressions read as false for every row
            if (evaluate_postfix(postfix, row.bindings).value_or(false) == row.expected)
                ++fitness.hits;
        }
        fitness.raw_fitness = static_cast<double>(fitness.hits);
        fitness.adjusted_fitness = fitness.raw_fitness;
        fitness.valid = true;
        return fitness;
    }

    regression_fitness_t::regression_fitness_t(dataset_t dataset, const regression_score_t mode): dataset(std::move(dataset)), mode(mode)
    {
        if (this->dataset.empty())
            BLT_ABORT("Regression fitness requires at least one sample!");
    }

    fitness_t regression_fitness_t::score_error(const double mse, const i64 hits) const
    {
        if (!std::isfinite(mse))
            return fitness_t::penalized(penalty());
        fitness_t fitness;
        fitness.raw_fitness = mse;
        fitness.adjusted_fitness = mode == regression_score_t::MSE ? mse : 1.0 / (1.0 + mse);
        fitness.hits = hits;
        fitness.valid = true;
        return fitness;
    }

    named_regression_fitness_t::named_regression_fitness_t(std::vector<std::string> variables, dataset_t dataset, const regression_score_t mode):
        regression_fitness_t(std::move(dataset), mode), variables(std::move(variables))
    {
        for (const auto& sample : get_dataset())
        {
            BLT_ASSERT_MSG(sample.inputs.size() == this->variables.size(),
                           ("Sample has " + std::to_string(sample.inputs.size()) + " inputs but " + std::to_string(this->variables.size()) +
                               " variables are named").c_str());
        }
    }

    fitness_t named_regression_fitness_t::evaluate(const phenotype_t& phenotype) const
    {
        const auto tokens = tokenize(phenotype.text);
        arithmetic_bindings_t bindings;
        return score([&](const sample_t& sample)
        {
            for (size_t i = 0; i < variables.size(); ++i)
                bindings.bind(variables[i], sample.inputs[i]);
            return evaluate_arithmetic(tokens, bindings);
        });
    }

    indexed_regression_fitness_t::indexed_regression_fitness_t(dataset_t dataset, const regression_score_t mode):
        regression_fitness_t(std::move(dataset), mode)
    {
    }

    fitness_t indexed_regression_fitness_t::evaluate(const phenotype_t& phenotype) const
    {
        const auto expr = parse_expression(phenotype.text);
        if (!expr.has_value())
            return fitness_t::penalized(penalty());
        return score([&](const sample_t& sample)
        {
            return expr.value().evaluate(sample.inputs);
        });
    }
}
