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

#ifndef BLT_GE_EXAMPLES_LOADER_H
#define BLT_GE_EXAMPLES_LOADER_H

#include <string>
#include <string_view>
#include <blt/ge/grammar.h>
#include <blt/ge/fitness.h>

namespace blt::ge::example
{
    /**
     * Reads one rule per line,
     *
     *  Expr ::= Expr Op Expr | Var
     *
     * Productions are separated by '|' and symbols by whitespace. Blank lines and lines starting with '#' are skipped.
     */
    grammar_t load_grammar(std::string_view path, const symbol_t& start_symbol);

    // one row per sample, inputs followed by the output, comma separated
    void save_dataset(const std::string& path, const dataset_t& dataset);

    dataset_t load_dataset(std::string_view path);
}

#endif //BLT_GE_EXAMPLES_LOADER_H
