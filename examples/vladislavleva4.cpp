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
#include "vladislavleva4.h"

#ifndef BLT_GE_EXAMPLES_GRAMMAR_DIR
#define BLT_GE_EXAMPLES_GRAMMAR_DIR "grammars"
#endif

int main(const int argc, const char** argv)
{
    auto [config, seed] = blt::ge::create_config_from_args(argc, argv);
    // the classic setup of this benchmark, command line flags only change the seed
    config.set_pop_size(100)
          .set_genome_length(1, 100)
          .set_codon_range(0, 255)
          .set_mutation_chance(0.01)
          .set_crossover_chance(0.9)
          .set_max_generations(20)
          .set_tournament_size(3)
          .set_direction(blt::ge::fitness_direction_t::MINIMIZE);

    blt::ge::example::vladislavleva4_t vlad{seed, config, BLT_GE_EXAMPLES_GRAMMAR_DIR "/vladislavleva4.bnf"};
    vlad.prepare_datasets("vlad_train.txt", "vlad_test.txt");
    vlad.execute(5);
    return 0;
}
