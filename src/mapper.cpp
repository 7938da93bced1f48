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
#include <blt/ge/mapper.h>
#include <blt/std/assert.h>

namespace blt::ge
{
    phenotype_t map_genome(const genome_t& genome, const grammar_t& grammar, const size_t max_steps)
    {
        if (genome.empty())
            BLT_ABORT("Cannot map an empty genome!");
        BLT_ASSERT_MSG(max_steps > 0, "Derivation step cap must be at least 1!");

        // symbols live inside the grammar, which outlives this call
        thread_local std::vector<const symbol_t*> symbols;
        symbols.clear();
        symbols.push_back(&grammar.get_start_symbol());

        phenotype_t phenotype;
        size_t cursor = 0;
        while (!symbols.empty())
        {
            if (phenotype.steps >= max_steps)
            {
                phenotype.valid = false;
                break;
            }
            const auto& symbol = *symbols.back();
            symbols.pop_back();
            ++phenotype.steps;

            if (const auto productions = grammar.lookup(symbol))
            {
                const auto codon = genome[cursor % genome.size()];
                ++cursor;
                const auto& production = (*productions)[codon % productions->size()];
                for (auto it = production.rbegin(); it != production.rend(); ++it)
                    symbols.push_back(&*it);
            }
            else
            {
                if (!phenotype.text.empty())
                    phenotype.text += ' ';
                phenotype.text += symbol;
            }
        }
        phenotype.codons_consumed = cursor;
        return phenotype;
    }
}
