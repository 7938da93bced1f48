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
#include <blt/logging/logging.h>
#include <blt/std/assert.h>
#include <cmath>

using namespace blt::ge;

namespace
{
    phenotype_t make_phenotype(std::string text, const bool valid = true)
    {
        phenotype_t phenotype;
        phenotype.text = std::move(text);
        phenotype.valid = valid;
        return phenotype;
    }

    bool close_to(const double a, const double b)
    {
        return std::abs(a - b) < 1e-9;
    }

    truth_table_fitness_t make_xor()
    {
        return truth_table_fitness_t{{"A", "B"}, [](const std::vector<bool>& in)
        {
            return in[0] != in[1];
        }};
    }
}

void direction_test()
{
    BLT_INFO("Testing fitness direction comparisons");
    BLT_ASSERT(is_better(2, 1, fitness_direction_t::MAXIMIZE));
    BLT_ASSERT(!is_better(1, 2, fitness_direction_t::MAXIMIZE));
    BLT_ASSERT(is_better(1, 2, fitness_direction_t::MINIMIZE));
    BLT_ASSERT(!is_better(1, 1, fitness_direction_t::MAXIMIZE));
    BLT_ASSERT(!is_better(1, 1, fitness_direction_t::MINIMIZE));
}

void truth_table_rows_test()
{
    BLT_INFO("Testing truth table row order");
    std::vector<std::vector<bool>> seen;
    const truth_table_fitness_t fitness{{"A", "B", "C"}, [&seen](const std::vector<bool>& in)
    {
        seen.push_back(in);
        return false;
    }};
    BLT_ASSERT(fitness.get_row_count() == 8);
    BLT_ASSERT(seen.size() == 8);
    BLT_ASSERT((seen[0] == std::vector<bool>{false, false, false}));
    BLT_ASSERT((seen[1] == std::vector<bool>{false, false, true}));
    BLT_ASSERT((seen[4] == std::vector<bool>{true, false, false}));
    BLT_ASSERT((seen[7] == std::vector<bool>{true, true, true}));
}

void truth_table_score_test()
{
    BLT_INFO("Testing truth table scoring");
    const auto fitness = make_xor();
    BLT_ASSERT(fitness.direction() == fitness_direction_t::MAXIMIZE);

    const auto perfect = fitness(make_phenotype("( A AND NOT B ) OR ( NOT A AND B )"));
    BLT_ASSERT(perfect.valid);
    BLT_ASSERT(perfect.hits == 4);
    BLT_ASSERT(close_to(perfect.adjusted_fitness, 4));

    const auto partial = fitness(make_phenotype("A"));
    BLT_ASSERT(partial.hits == 2);

    // reads as false everywhere, matching the two rows where xor is false
    const auto malformed = fitness(make_phenotype("A AND"));
    BLT_ASSERT(malformed.valid);
    BLT_ASSERT(malformed.hits == 2);

    const auto incomplete = fitness(make_phenotype("( A AND NOT B ) OR ( NOT A AND B )", false));
    BLT_ASSERT(!incomplete.valid);
    BLT_ASSERT(incomplete.hits == 0);
    BLT_ASSERT(close_to(incomplete.adjusted_fitness, fitness.penalty()));
}

void parity_test()
{
    BLT_INFO("Testing three input parity");
    const truth_table_fitness_t fitness{{"A", "B", "C"}, [](const std::vector<bool>& in)
    {
        return in[0] != in[1] != in[2];
    }};
    const auto result = fitness(make_phenotype(
        "( ( A AND NOT B ) OR ( NOT A AND B ) ) AND NOT C OR ( NOT ( ( A AND NOT B ) OR ( NOT A AND B ) ) AND C )"));
    BLT_ASSERT(result.hits == 8);
}

void named_regression_test()
{
    BLT_INFO("Testing named variable regression");
    const dataset_t data{{{0.1, 0.3}, 0.31}, {{0.2, 0.6}, 0.59}};

    const named_regression_fitness_t inverted{{"x", "y"}, data};
    BLT_ASSERT(inverted.direction() == fitness_direction_t::MAXIMIZE);
    const auto sum = inverted(make_phenotype("x + y"));
    BLT_ASSERT(sum.valid);
    BLT_ASSERT(close_to(sum.raw_fitness, 0.0261));
    BLT_ASSERT(close_to(sum.adjusted_fitness, 1.0 / 1.0261));

    const named_regression_fitness_t mse{{"x", "y"}, data, regression_score_t::MSE};
    BLT_ASSERT(mse.direction() == fitness_direction_t::MINIMIZE);
    BLT_ASSERT(close_to(mse(make_phenotype("x + y")).adjusted_fitness, 0.0261));

    const auto broken = inverted(make_phenotype("x +"));
    BLT_ASSERT(!broken.valid);
    BLT_ASSERT(close_to(broken.adjusted_fitness, 0));
}

void indexed_regression_test()
{
    BLT_INFO("Testing indexed variable regression");
    const dataset_t data{{{1}, 2}, {{2}, 4}, {{3}, 6}};
    const indexed_regression_fitness_t fitness{data};
    BLT_ASSERT(fitness.direction() == fitness_direction_t::MINIMIZE);
    BLT_ASSERT(std::isinf(fitness.penalty()));

    const auto exact = fitness(make_phenotype("x[0] * 2.0"));
    BLT_ASSERT(exact.valid);
    BLT_ASSERT(close_to(exact.adjusted_fitness, 0));
    BLT_ASSERT(exact.hits == 3);

    const auto off_by_one = fitness(make_phenotype("x[0] * 2.0 + 1.0"));
    BLT_ASSERT(close_to(off_by_one.adjusted_fitness, 1));
    BLT_ASSERT(off_by_one.hits == 0);
    BLT_ASSERT(is_better(exact.adjusted_fitness, off_by_one.adjusted_fitness, fitness.direction()));

    const auto unparseable = fitness(make_phenotype("x[0] *"));
    BLT_ASSERT(!unparseable.valid);
    BLT_ASSERT(std::isinf(unparseable.adjusted_fitness));
}

void non_finite_test()
{
    BLT_INFO("Testing non finite errors are penalized");
    const dataset_t data{{{0}, 1}, {{1}, 1}};
    const indexed_regression_fitness_t mse{data};
    const auto divided = mse(make_phenotype("1.0 / x[0]"));
    BLT_ASSERT(!divided.valid);
    BLT_ASSERT(std::isinf(divided.adjusted_fitness));

    const indexed_regression_fitness_t inverted{data, regression_score_t::INVERTED};
    const auto rooted = inverted(make_phenotype("sqrt( x[0] - 1.0 )"));
    BLT_ASSERT(!rooted.valid);
    BLT_ASSERT(close_to(rooted.adjusted_fitness, 0));
}

int main()
{
    direction_test();
    truth_table_rows_test();
    truth_table_score_test();
    parity_test();
    named_regression_test();
    indexed_regression_test();
    non_finite_test();
    BLT_INFO("Fitness tests passed");
}
