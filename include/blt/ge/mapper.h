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

#ifndef BLT_GE_MAPPER_H
#define BLT_GE_MAPPER_H

#include <string>
#include <ostream>
#include <blt/ge/fwdecl.h>
#include <blt/ge/grammar.h>

namespace blt::ge
{
    inline constexpr size_t default_max_derivation_steps = 1000;

    struct phenotype_t
    {
        // terminals in derivation order, separated by single spaces
        std::string text;
        // false when the derivation hit the step cap, text then only holds the terminals emitted so far
        bool valid = true;
        // codons read, wrapping over the genome counts every read
        size_t codons_consumed = 0;
        size_t steps = 0;

        [[nodiscard]] bool empty() const
        {
            return text.empty();
        }
    };

    /**
     * Derives a phenotype from the grammar's start symbol. Each expansion of a non-terminal reads the next codon
     * (cyclically, so short genomes are reused) and picks production codon % production_count. Every popped symbol is
     * one step; once max_steps steps have been taken with symbols still pending, derivation stops and the partial
     * phenotype is returned marked invalid.
     *
     * The genome must not be empty.
     */
    phenotype_t map_genome(const genome_t& genome, const grammar_t& grammar, size_t max_steps = default_max_derivation_steps);

    inline std::ostream& operator<<(std::ostream& out, const phenotype_t& phenotype)
    {
        out << phenotype.text;
        if (!phenotype.valid)
            out << " <incomplete>";
        return out;
    }
}

#endif //BLT_GE_MAPPER_H
