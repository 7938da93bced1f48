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
#include <blt/parse/argparse_v2.h>

namespace blt::ge
{
    std::tuple<prog_config_t, u64> create_config_from_args(const int argc, const char** argv)
    {
        const prog_config_t defaults;

        argparse::argument_parser_t parser;
        parser.with_help();
        parser.add_flag("--population_size", "-p").set_dest("population_size").set_default(static_cast<u32>(defaults.population_size)).as_type<u32>().
               set_help("The size of the population");
        parser.add_flag("--max_generations", "-g").set_dest("max_generations").set_default(static_cast<u32>(defaults.max_generations)).as_type<u32>().
               set_help("The number of generations to evaluate, including the initial population");
        parser.add_flag("--min_genome_length").set_dest("min_genome_length").set_default(static_cast<u32>(defaults.min_genome_length)).as_type<u32>().
               set_help("The minimum number of codons in the initial genomes");
        parser.add_flag("--max_genome_length").set_dest("max_genome_length").set_default(static_cast<u32>(defaults.max_genome_length)).as_type<u32>().
               set_help("The maximum number of codons in the initial genomes");
        parser.add_flag("--max_codon").set_dest("max_codon").set_default(static_cast<u32>(defaults.codon_range.max)).as_type<u32>().
               set_help("Codons are drawn from [0, max_codon)");
        parser.add_flag("--tournament_size", "-s").set_dest("tournament_size").set_default(static_cast<u32>(defaults.tournament_size)).as_type<u32>().
               set_help("The size of the tournament");
        parser.add_flag("--crossover_rate", "-c").set_dest("crossover_rate").set_default(defaults.crossover_chance).as_type<double>().
               set_help("The chance a pair of parents is crossed over instead of cloned");
        parser.add_flag("--mutation_rate", "-m").set_dest("mutation_rate").set_default(defaults.mutation_chance).as_type<double>().
               set_help("The rate of mutation");
        parser.add_flag("--per_codon").set_dest("per_codon").make_flag().set_help(
            "Apply the mutation rate to every codon instead of once per individual");
        parser.add_flag("--elites", "-e").set_dest("elites").set_default(static_cast<u32>(defaults.elites)).as_type<u32>().
               set_help("Number of best fitness individuals to keep each generation");
        parser.add_flag("--max_steps").set_dest("max_steps").set_default(static_cast<u32>(defaults.max_derivation_steps)).as_type<u32>().
               set_help("Maximum number of derivation steps before a phenotype is considered incomplete");
        parser.add_flag("--seed").set_dest("seed").set_default(0u).as_type<u32>().set_help("Seed of the random generator");

        const auto args = parser.parse(argc, argv);
        auto config = prog_config_t()
                      .set_pop_size(args.get<u32>("population_size"))
                      .set_max_generations(args.get<u32>("max_generations"))
                      .set_genome_length(args.get<u32>("min_genome_length"), args.get<u32>("max_genome_length"))
                      .set_codon_range(0, args.get<u32>("max_codon"))
                      .set_tournament_size(args.get<u32>("tournament_size"))
                      .set_crossover_chance(args.get<double>("crossover_rate"))
                      .set_mutation_chance(args.get<double>("mutation_rate"))
                      .set_mutation_mode(args.get<bool>("per_codon") ? mutation_mode_t::PER_CODON : mutation_mode_t::PER_INDIVIDUAL)
                      .set_elite_count(args.get<u32>("elites"))
                      .set_max_derivation_steps(args.get<u32>("max_steps"));

        return {config, static_cast<u64>(args.get<u32>("seed"))};
    }
}
