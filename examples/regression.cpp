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
#include "regression.h"
#include <blt/profiling/profiler_v2.h>

int main(const int argc, const char** argv)
{
    auto [config, seed] = blt::ge::create_config_from_args(argc, argv);
    // fixed length genomes of 10 codons
    config.set_genome_length(10, 10).set_direction(blt::ge::fitness_direction_t::MAXIMIZE);

    BLT_START_INTERVAL("Regression", "Main");
    blt::ge::example::regression_t regression{seed, config};
    regression.execute();
    BLT_END_INTERVAL("Regression", "Main");

    BLT_PRINT_PROFILE("Regression", blt::PRINT_CYCLES | blt::PRINT_THREAD | blt::PRINT_WALL);
    return 0;
}
