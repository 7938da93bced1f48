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

#ifndef BLT_GE_FITNESS_H
#define BLT_GE_FITNESS_H

#include <cmath>
#include <functional>
#include <limits>
#include <string>
#include <vector>
#include <blt/std/types.h>
#include <blt/ge/fwdecl.h>
#include <blt/ge/mapper.h>
#include <blt/ge/expression/boolean.h>

namespace blt::ge
{
    enum class fitness_direction_t : u8
    {
        MAXIMIZE,
        MINIMIZE
    };

    // strict, equal scores are never better
    inline bool is_better(const double a, const double b, const fitness_direction_t direction)
    {
        return direction == fitness_direction_t::MAXIMIZE ? a > b : a < b;
    }

    inline const char* to_string(const fitness_direction_t direction)
    {
        return direction == fitness_direction_t::MAXIMIZE ? "maximize" : "minimize";
    }

    struct fitness_t
    {
        // problem measure, match count or mean squared error
        double raw_fitness = 0;
        // value selection compares, in the direction of the fitness function that produced it
        double adjusted_fitness = 0;
        i64 hits = 0;
        // false if the individual was penalized instead of scored
        bool valid = false;

        static fitness_t penalized(const double penalty)
        {
            fitness_t fitness;
            fitness.raw_fitness = penalty;
            fitness.adjusted_fitness = penalty;
            return fitness;
        }
    };

    /**
     * Problem specific scoring. Phenotypes whose derivation did not finish are never handed to evaluate(), they receive
     * penalty() directly. Implementations must also return the penalty for anything they cannot score, the penalty has
     * to be the worst score possible in direction().
     */
    class fitness_function_t
    {
    public:
        fitness_t operator()(const phenotype_t& phenotype) const
        {
            if (!phenotype.valid)
                return fitness_t::penalized(penalty());
            return evaluate(phenotype);
        }

        [[nodiscard]] virtual fitness_direction_t direction() const = 0;

        [[nodiscard]] virtual double penalty() const = 0;

        virtual ~fitness_function_t() = default;

    protected:
        [[nodiscard]] virtual fitness_t evaluate(const phenotype_t& phenotype) const = 0;
    };

    /**
     * Compares a boolean phenotype against a target over every assignment of the named inputs. Rows are enumerated in
     * binary counting order with the first variable as the most significant bit. Score is the number of matching rows.
     */
    class truth_table_fitness_t final : public fitness_function_t
    {
    public:
        using target_t = std::function<bool(const std::vector<bool>&)>;

        truth_table_fitness_t(std::vector<std::string> variables, const target_t& target);

        [[nodiscard]] fitness_direction_t direction() const override
        {
            return fitness_direction_t::MAXIMIZE;
        }

        [[nodiscard]] double penalty() const override
        {
            return 0;
        }

        [[nodiscard]] size_t get_row_count() const
        {
            return rows.size();
        }

    protected:
        [[nodiscard]] fitness_t evaluate(const phenotype_t& phenotype) const override;

    private:
        struct row_t
        {
            boolean_bindings_t bindings;
            bool expected;
        };

        std::vector<std::string> variables;
        std::vector<row_t> rows;
    };

    struct sample_t
    {
        std::vector<double> inputs;
        double output;
    };

    using dataset_t = std::vector<sample_t>;

    enum class regression_score_t : u8
    {
        // mean squared error, minimized
        MSE,
        // 1 / (1 + mse), maximized
        INVERTED
    };

    class regression_fitness_t : public fitness_function_t
    {
    public:
        static constexpr double hit_tolerance = 0.01;

        [[nodiscard]] fitness_direction_t direction() const override
        {
            return mode == regression_score_t::MSE ? fitness_direction_t::MINIMIZE : fitness_direction_t::MAXIMIZE;
        }

        [[nodiscard]] double penalty() const override
        {
            return mode == regression_score_t::MSE ? std::numeric_limits<double>::infinity() : 0.0;
        }

        [[nodiscard]] const dataset_t& get_dataset() const
        {
            return dataset;
        }

        [[nodiscard]] regression_score_t get_mode() const
        {
            return mode;
        }

    protected:
        regression_fitness_t(dataset_t dataset, regression_score_t mode);

        /**
         * Scores predict(sample) over the data set. A NaN or infinite mean squared error is penalized.
         */
        template <typename Predictor>
        [[nodiscard]] fitness_t score(Predictor&& predict) const
        {
            double error_sum = 0;
            i64 hits = 0;
            for (const auto& sample : dataset)
            {
                const double error = predict(sample) - sample.output;
                error_sum += error * error;
                if (std::abs(error) <= hit_tolerance)
                    ++hits;
            }
            return score_error(error_sum / static_cast<double>(dataset.size()), hits);
        }

    private:
        [[nodiscard]] fitness_t score_error(double mse, i64 hits) const;

        dataset_t dataset;
        regression_score_t mode;
    };

    /**
     * Arithmetic over named variables, evaluated directly from the phenotype tokens. Sample inputs are bound to the
     * variable names in order.
     */
    class named_regression_fitness_t final : public regression_fitness_t
    {
    public:
        named_regression_fitness_t(std::vector<std::string> variables, dataset_t dataset, regression_score_t mode = regression_score_t::INVERTED);

    protected:
        [[nodiscard]] fitness_t evaluate(const phenotype_t& phenotype) const override;

    private:
        std::vector<std::string> variables;
    };

    /**
     * Phenotypes using x[i], pow( , ) and sqrt( ). The phenotype is parsed once and the tree evaluated for every sample,
     * unparseable phenotypes are penalized.
     */
    class indexed_regression_fitness_t final : public regression_fitness_t
    {
    public:
        explicit indexed_regression_fitness_t(dataset_t dataset, regression_score_t mode = regression_score_t::MSE);

    protected:
        [[nodiscard]] fitness_t evaluate(const phenotype_t& phenotype) const override;
    };
}

#endif //BLT_GE_FITNESS_H
