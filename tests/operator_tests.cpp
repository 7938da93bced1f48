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
#include <blt/ge/config.h>
#include <blt/ge/genome.h>
#include <blt/ge/selection.h>
#include <blt/ge/transformers.h>
#include <blt/logging/logging.h>
#include <blt/std/assert.h>
#include <algorithm>

using namespace blt::ge;

namespace
{
    population_t make_population(const std::vector<double>& scores)
    {
        population_t pop;
        for (const auto score : scores)
        {
            individual_t ind{genome_t{static_cast<codon_t>(score)}};
            ind.fitness.adjusted_fitness = score;
            ind.fitness.raw_fitness = score;
            ind.fitness.valid = true;
            pop.get_individuals().push_back(std::move(ind));
        }
        return pop;
    }
}

void crossover_test()
{
    BLT_INFO("Testing one point crossover");
    const genome_t p1{1, 2, 3, 4};
    const genome_t p2{5, 6, 7};
    genome_t c1 = p1;
    genome_t c2 = p2;

    one_point_crossover_t::cross_at(2, p1, p2, c1, c2);
    BLT_ASSERT((c1 == genome_t{1, 2, 7}));
    BLT_ASSERT((c2 == genome_t{5, 6, 3, 4}));

    one_point_crossover_t::cross_at(0, p1, p2, c1, c2);
    BLT_ASSERT(c1 == p2);
    BLT_ASSERT(c2 == p1);

    random_t random{42};
    one_point_crossover_t crossover;
    for (int i = 0; i < 500; i++)
    {
        const auto a = random_genome(random, 1, 30, codon_range_t{});
        const auto b = random_genome(random, 1, 30, codon_range_t{});
        genome_t ca = a;
        genome_t cb = b;
        BLT_ASSERT(crossover.apply(random, a, b, ca, cb));
        BLT_ASSERT(ca.size() + cb.size() == a.size() + b.size());
        BLT_ASSERT(ca.size() == b.size());
        BLT_ASSERT(cb.size() == a.size());
        // the cut lies before the end of the shorter parent so every child ends with the other parent's tail
        BLT_ASSERT(ca.back() == b.back());
        BLT_ASSERT(cb.back() == a.back());
    }
}

void point_mutation_test()
{
    BLT_INFO("Testing point mutation changes exactly one codon");
    random_t random{7};
    prog_config_t config;
    config.set_codon_range(1, 256).set_mutation_chance(1.0).set_mutation_mode(mutation_mode_t::PER_INDIVIDUAL);

    for (int i = 0; i < 200; i++)
    {
        genome_t genome(20, 0);
        BLT_ASSERT(config.mutator.get().apply(random, config, genome));
        const auto changed = std::count_if(genome.begin(), genome.end(), [](const codon_t c)
        {
            return c != 0;
        });
        BLT_ASSERT(changed == 1);
    }

    genome_t genome(10, 0);
    const auto locus = mutation_t::mutate_point(random, codon_range_t{1, 2}, genome);
    BLT_ASSERT(locus < genome.size());
    BLT_ASSERT(genome[locus] == 1);

    config.set_mutation_chance(0);
    genome_t untouched(10, 0);
    BLT_ASSERT(!config.mutator.get().apply(random, config, untouched));
    BLT_ASSERT((untouched == genome_t(10, 0)));
}

void codon_mutation_test()
{
    BLT_INFO("Testing per codon mutation");
    random_t random{9};
    prog_config_t config;
    config.set_codon_range(1, 256).set_mutation_chance(1.0).set_mutation_mode(mutation_mode_t::PER_CODON);

    genome_t genome(50, 0);
    BLT_ASSERT(config.mutator.get().apply(random, config, genome));
    BLT_ASSERT(std::all_of(genome.begin(), genome.end(), [](const codon_t c)
    {
        return c >= 1 && c < 256;
    }));

    config.set_mutation_chance(0.5);
    genome_t half(1000, 0);
    config.mutator.get().apply(random, config, half);
    const auto changed = std::count_if(half.begin(), half.end(), [](const codon_t c)
    {
        return c != 0;
    });
    BLT_ASSERT(changed > 350 && changed < 650);
}

void tournament_test()
{
    BLT_INFO("Testing tournament selection");
    const auto pop = make_population({4, 9, 1, 7, 3, 8, 2, 6});

    for (const size_t size : {1ul, 2ul, 3ul, 5ul})
    {
        select_tournament_t selection{size};
        random_t random{size * 31};
        random_t replay{size * 31};
        for (int i = 0; i < 100; i++)
        {
            blt::u64 best = replay.get_u64(0, pop.size());
            for (size_t j = 1; j < size; j++)
            {
                const auto candidate = replay.get_u64(0, pop.size());
                if (pop[candidate].fitness.adjusted_fitness > pop[best].fitness.adjusted_fitness)
                    best = candidate;
            }
            const auto& selected = selection.select(random, pop, fitness_direction_t::MAXIMIZE);
            BLT_ASSERT(&selected == &pop[best]);
        }
    }

    // a tournament over the whole population almost always finds the minimum
    select_tournament_t large{64};
    random_t random{3};
    size_t found = 0;
    for (int i = 0; i < 100; i++)
    {
        if (large.select(random, pop, fitness_direction_t::MINIMIZE).fitness.adjusted_fitness == 1)
            ++found;
    }
    BLT_ASSERT(found > 95);
}

void tournament_tie_test()
{
    BLT_INFO("Testing tournament ties go to the first candidate drawn");
    const auto pop = make_population({5, 5, 5, 1});

    for (const size_t size : {2ul, 3ul, 4ul})
    {
        select_tournament_t selection{size};
        random_t random{size * 17};
        random_t replay{size * 17};
        for (int i = 0; i < 200; i++)
        {
            std::vector<blt::u64> drawn;
            for (size_t j = 0; j < size; j++)
                drawn.push_back(replay.get_u64(0, pop.size()));

            double best_score = pop[drawn.front()].fitness.adjusted_fitness;
            for (const auto index : drawn)
                best_score = std::max(best_score, pop[index].fitness.adjusted_fitness);
            const auto first_best = *std::find_if(drawn.begin(), drawn.end(), [&pop, best_score](const blt::u64 index)
            {
                return pop[index].fitness.adjusted_fitness == best_score;
            });

            const auto& selected = selection.select(random, pop, fitness_direction_t::MAXIMIZE);
            BLT_ASSERT(&selected == &pop[first_best]);
        }
    }
}

void elitism_test()
{
    BLT_INFO("Testing elitism");
    const auto pop = make_population({1, 5, 3, 5, 2});

    population_t next;
    BLT_ASSERT(detail::perform_elitism(pop, next, 2, fitness_direction_t::MAXIMIZE) == 2);
    BLT_ASSERT(next.size() == 2);
    // ties keep population order, both 5s are kept
    BLT_ASSERT(next[0].genome == pop[1].genome);
    BLT_ASSERT(next[1].genome == pop[3].genome);
    BLT_ASSERT(next[0].fitness.adjusted_fitness == 5);

    population_t lowest;
    BLT_ASSERT(detail::perform_elitism(pop, lowest, 3, fitness_direction_t::MINIMIZE) == 3);
    BLT_ASSERT(lowest[0].fitness.adjusted_fitness == 1);
    BLT_ASSERT(lowest[1].fitness.adjusted_fitness == 2);
    BLT_ASSERT(lowest[2].fitness.adjusted_fitness == 3);

    population_t none;
    BLT_ASSERT(detail::perform_elitism(pop, none, 0, fitness_direction_t::MAXIMIZE) == 0);
    BLT_ASSERT(none.empty());
}

int main()
{
    crossover_test();
    point_mutation_test();
    codon_mutation_test();
    tournament_test();
    tournament_tie_test();
    elitism_test();
    BLT_INFO("Operator tests passed");
}
