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
#include <blt/ge/grammar.h>
#include <blt/ge/genome.h>
#include <blt/logging/logging.h>
#include <blt/std/assert.h>
#include <sstream>

blt::ge::grammar_t make_boolean_grammar()
{
    return blt::ge::grammar_builder_t{}
           .add_rule("S", {"E"})
           .add_rule("E", {"E OR T", "T"})
           .add_rule("T", {"T AND F", "F"})
           .add_rule("F", {"NOT F", "A", "B", "C"})
           .build("S");
}

void lookup_test()
{
    BLT_INFO("Testing grammar lookup");
    const auto grammar = make_boolean_grammar();

    BLT_ASSERT(grammar.size() == 4);
    BLT_ASSERT(grammar.get_start_symbol() == "S");

    const auto* e = grammar.lookup("E");
    BLT_ASSERT(e != nullptr);
    BLT_ASSERT(e->size() == 2);
    BLT_ASSERT(((*e)[0] == blt::ge::production_t{"E", "OR", "T"}));
    BLT_ASSERT(((*e)[1] == blt::ge::production_t{"T"}));

    // absent symbols are terminals, not errors
    BLT_ASSERT(grammar.lookup("AND") == nullptr);
    BLT_ASSERT(grammar.lookup("A") == nullptr);
    BLT_ASSERT(!grammar.is_non_terminal("OR"));
    BLT_ASSERT(grammar.is_non_terminal("F"));

    const auto& order = grammar.get_non_terminals();
    BLT_ASSERT(order.size() == 4);
    BLT_ASSERT(order[0] == "S" && order[3] == "F");
}

void analysis_test()
{
    BLT_INFO("Testing arity and recursion analysis");
    const auto grammar = make_boolean_grammar();

    BLT_ASSERT(grammar.arity({"E", "OR", "T"}) == 2);
    BLT_ASSERT(grammar.arity({"NOT", "F"}) == 1);
    BLT_ASSERT(grammar.arity({"A"}) == 0);

    BLT_ASSERT(grammar.is_recursive("E"));
    BLT_ASSERT(grammar.is_recursive("T"));
    BLT_ASSERT(grammar.is_recursive("F"));
    BLT_ASSERT(!grammar.is_recursive("S"));
    BLT_ASSERT(!grammar.is_recursive("A"));

    // indirect recursion through another rule
    const auto indirect = blt::ge::grammar_builder_t{}
                          .add_rule("X", {"( Y )", "a"})
                          .add_rule("Y", {"X + X"})
                          .build("X");
    BLT_ASSERT(indirect.is_recursive("X"));
    BLT_ASSERT(indirect.is_recursive("Y"));
}

void builder_test()
{
    BLT_INFO("Testing grammar builder appends and prints");
    const auto grammar = blt::ge::grammar_builder_t{}
                         .add_rule("Expr", {"Expr Op Expr"})
                         .add_rule("Op", std::vector<std::string>{" + ", "-"})
                         .add_rule("Expr", {"x[0]"})
                         .add_production("Op", {"*"})
                         .build("Expr");

    BLT_ASSERT(grammar.lookup("Expr")->size() == 2);
    BLT_ASSERT(grammar.lookup("Op")->size() == 3);
    BLT_ASSERT(((*grammar.lookup("Op"))[0] == blt::ge::production_t{"+"}));

    std::stringstream out;
    out << grammar;
    BLT_ASSERT(out.str() == "Expr ::= Expr Op Expr | x[0]\nOp ::= + | - | *\n");
}

void genome_test()
{
    BLT_INFO("Testing genome utilities");
    blt::ge::random_t random{691};
    const blt::ge::codon_range_t range{10, 20};

    for (int i = 0; i < 100; i++)
    {
        const auto genome = blt::ge::random_genome(random, 3, 8, range);
        BLT_ASSERT(genome.size() >= 3 && genome.size() <= 8);
        for (const auto codon : genome)
            BLT_ASSERT(range.contains(codon));
    }

    auto fixed = blt::ge::random_genome(random, 5, 5, range);
    BLT_ASSERT(fixed.size() == 5);

    blt::ge::extend_genome(random, fixed, 3, range);
    BLT_ASSERT(fixed.size() == 8);

    blt::ge::truncate_genome(fixed, 2);
    BLT_ASSERT(fixed.size() == 6);
    blt::ge::truncate_genome(fixed, 100);
    BLT_ASSERT(fixed.size() == 1);

    std::stringstream out;
    blt::ge::print_genome(out, {1, 2, 3});
    BLT_ASSERT(out.str() == "[1, 2, 3]");
}

int main()
{
    lookup_test();
    analysis_test();
    builder_test();
    genome_test();
    BLT_INFO("Grammar tests passed");
}
