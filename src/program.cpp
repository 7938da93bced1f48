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
#include <blt/ge/program.h>
#include <blt/ge/genome.h>
#include <blt/std/assert.h>
#include <blt/logging/logging.h>
#include <string>
#include <utility>

namespace blt::ge
{
    // default static references for mutation and crossover
    // allows for quick setup of a program if you don't care how crossover or mutation is handled
    static mutation_t s_mutator;
    static one_point_crossover_t s_crossover;

    prog_config_t::prog_config_t(): mutator(s_mutator), crossover(s_crossover)
    {
    }

    prog_config_t::prog_config_t(const size_t populationSize): population_size(populationSize), mutator(s_mutator), crossover(s_crossover)
    {
    }

    const char* to_string(const program_state_t state)
    {
        switch (state)
        {
        case program_state_t::INIT:
            return "init";
        case program_state_t::EVALUATE:
            return "evaluate";
        case program_state_t::SELECT_AND_BREED:
            return "select and breed";
        case program_state_t::MUTATE:
            return "mutate";
        case program_state_t::REPLACE:
            return "replace";
        case program_state_t::TERMINAL:
            return "terminal";
        }
        return "unknown";
    }

    ge_program::ge_program(const u64 seed): random(seed)
    {
        validate_config();
    }

    ge_program::ge_program(const u64 seed, const prog_config_t& config): random(seed), config(config)
    {
        validate_config();
    }

    void ge_program::validate_config() const
    {
        if (config.population_size == 0)
            BLT_ABORT("Population size must be at least 1!");
        if (config.max_generations == 0)
            BLT_ABORT("Generation count must be at least 1!");
        if (config.tournament_size == 0)
            BLT_ABORT("Unable to select with this size. Must select at least 1 individual_t!");
        if (config.max_derivation_steps == 0)
            BLT_ABORT("Derivation step cap must be at least 1!");
        BLT_ASSERT_MSG(config.elites <= config.population_size, ("Not enough individuals in population (" +
                           std::to_string(config.population_size) + ") for requested amount of elites (" + std::to_string(config.elites) +
                           ")").c_str());
        BLT_ASSERT_MSG(!config.codon_range.empty(), ("Codon range [" + std::to_string(config.codon_range.min) + ", " +
                           std::to_string(config.codon_range.max) + ") is empty").c_str());
        BLT_ASSERT_MSG(config.min_genome_length > 0 && config.min_genome_length <= config.max_genome_length,
                       ("Invalid genome length bounds [" + std::to_string(config.min_genome_length) + ", " +
                           std::to_string(config.max_genome_length) + "]").c_str());
    }

    void ge_program::expect_state(const program_state_t expected, const char* operation) const
    {
        BLT_ASSERT_MSG(state == expected, (std::string("Cannot ") + operation + " while the program is in state '" + to_string(state) +
                           "', expected '" + to_string(expected) + "'").c_str());
    }

    void ge_program::setup_generational_evaluation(const grammar_t& grammar, const fitness_function_t& fitness_function, selection_t& selection)
    {
        expect_state(program_state_t::INIT, "setup the program");
        if (fitness_function.direction() != config.direction)
        {
            BLT_ERROR("Fitness function wants to {} but the program is configured to {}", to_string(fitness_function.direction()),
                      to_string(config.direction));
            BLT_ABORT("Fitness function direction does not match the configured direction!");
        }
        this->grammar = &grammar;
        this->fitness_function = &fitness_function;
        this->selection = &selection;
    }

    void ge_program::generate_initial_population()
    {
        expect_state(program_state_t::INIT, "generate the initial population");
        if (grammar == nullptr || fitness_function == nullptr || selection == nullptr)
            BLT_ABORT("setup_generational_evaluation() must be called before generating a population!");

        current_generation = 0;
        current_pop.clear();
        for (size_t i = 0; i < config.population_size; i++)
            current_pop.get_individuals().emplace_back(random_genome(random, config.min_genome_length, config.max_genome_length,
                                                                     config.codon_range));
        BLT_DEBUG("Generated initial population of {} genomes with lengths in [{}, {}]", config.population_size, config.min_genome_length,
                  config.max_genome_length);
        evaluate_fitness();
    }

    void ge_program::create_next_generation()
    {
        expect_state(program_state_t::EVALUATE, "create the next generation");

        state = program_state_t::SELECT_AND_BREED;
        next_pop.clear();
        const auto elites = detail::perform_elitism(current_pop, next_pop, config.elites, config.direction);

        auto& individuals = next_pop.get_individuals();
        while (individuals.size() < config.population_size)
        {
            const auto& p1 = selection->select(random, current_pop, config.direction);
            const auto& p2 = selection->select(random, current_pop, config.direction);

            genome_t c1 = p1.genome;
            genome_t c2 = p2.genome;
            if (random.choice(config.crossover_chance))
            {
                if (!config.crossover.get().apply(random, p1.genome, p2.genome, c1, c2))
                {
                    c1 = p1.genome;
                    c2 = p2.genome;
                }
            }

            individuals.emplace_back(std::move(c1));
            // an odd population size drops the second child of the last pair
            if (individuals.size() < config.population_size)
                individuals.emplace_back(std::move(c2));
        }

        state = program_state_t::MUTATE;
        for (size_t i = elites; i < individuals.size(); i++)
            config.mutator.get().apply(random, config, individuals[i].genome);
    }

    void ge_program::next_generation()
    {
        expect_state(program_state_t::MUTATE, "replace the population");
        BLT_ASSERT_MSG(next_pop.size() == config.population_size, ("next pop size: " + std::to_string(next_pop.size())).c_str());
        std::swap(current_pop, next_pop);
        ++current_generation;
        state = program_state_t::REPLACE;
    }

    void ge_program::evaluate_fitness()
    {
        if (state != program_state_t::INIT)
            expect_state(program_state_t::REPLACE, "evaluate the population");
        state = program_state_t::EVALUATE;

        for (auto& individual : current_pop)
        {
            individual.phenotype = map_genome(individual.genome, *grammar, config.max_derivation_steps);
            individual.fitness = (*fitness_function)(individual.phenotype);
        }

        current_stats = compute_population_stats(current_pop, current_generation, config.direction);
        statistic_history.push_back(current_stats);
        if (current_stats.valid_individuals == 0)
            BLT_WARN("Generation {} has no individual with a complete derivation", current_generation);

        const auto& best = current_pop[current_stats.best_index];
        if (!best_individual.found || is_better(best.fitness.adjusted_fitness, best_individual.fitness.adjusted_fitness, config.direction))
        {
            best_individual.genome = best.genome;
            best_individual.phenotype = best.phenotype;
            best_individual.fitness = best.fitness;
            best_individual.generation = current_generation;
            best_individual.found = true;
        }

        BLT_TRACE("Generation {}: best {} average {} worst {} ({} / {} valid)", current_generation, current_stats.best_fitness,
                  current_stats.average_fitness, current_stats.worst_fitness, current_stats.valid_individuals, current_pop.size());

        if (should_terminate())
            state = program_state_t::TERMINAL;
    }

    run_result_t ge_program::get_result() const
    {
        run_result_t result;
        result.best_genome = best_individual.genome;
        result.best_phenotype = best_individual.phenotype;
        result.best_fitness = best_individual.fitness;
        result.best_generation = best_individual.generation;
        result.history = statistic_history;
        return result;
    }

    run_result_t run(const grammar_t& grammar, const fitness_function_t& fitness_function, const prog_config_t& config, const u64 seed)
    {
        ge_program program{seed, config};
        select_tournament_t selection{config.tournament_size};
        program.setup_generational_evaluation(grammar, fitness_function, selection);
        program.generate_initial_population();
        while (!program.should_terminate())
        {
            program.create_next_generation();
            program.next_generation();
            program.evaluate_fitness();
        }
        return program.get_result();
    }
}
