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
#include <blt/ge/expression/boolean.h>
#include <blt/logging/logging.h>
#include <blt/std/assert.h>

using blt::ge::token_list_t;

void postfix_test()
{
    BLT_INFO("Testing infix to postfix conversion");
    const token_list_t tokens{"A", "AND", "B", "OR", "C"};
    const auto postfix = blt::ge::infix_to_postfix(tokens);
    BLT_ASSERT((postfix == token_list_t{"A", "B", "AND", "C", "OR"}));

    // equal precedence, so OR does not bind looser than AND
    const auto left_assoc = blt::ge::infix_to_postfix({"A", "OR", "B", "AND", "C"});
    BLT_ASSERT((left_assoc == token_list_t{"A", "B", "OR", "C", "AND"}));

    const auto parens = blt::ge::infix_to_postfix({"A", "AND", "(", "B", "OR", "C", ")"});
    BLT_ASSERT((parens == token_list_t{"A", "B", "C", "OR", "AND"}));

    const auto negated = blt::ge::infix_to_postfix({"NOT", "NOT", "A", "AND", "B"});
    BLT_ASSERT((negated == token_list_t{"A", "NOT", "NOT", "B", "AND"}));
}

void evaluation_test()
{
    BLT_INFO("Testing postfix evaluation");
    const blt::ge::boolean_bindings_t bindings{{"A", true}, {"B", false}, {"C", true}};

    const auto result = blt::ge::evaluate_postfix({"A", "B", "AND", "C", "OR"}, bindings);
    BLT_ASSERT(result.has_value());
    BLT_ASSERT(*result);

    BLT_ASSERT(blt::ge::evaluate_boolean("A AND B OR C", bindings));
    BLT_ASSERT(!blt::ge::evaluate_boolean("A AND ( B OR NOT C )", bindings));
    BLT_ASSERT(blt::ge::evaluate_boolean("NOT NOT A", bindings));
    BLT_ASSERT(blt::ge::evaluate_boolean("NOT B AND A", bindings));
}

void truth_table_test()
{
    BLT_INFO("Testing xor expression over its whole truth table");
    for (int row = 0; row < 4; row++)
    {
        const bool a = (row & 2) != 0;
        const bool b = (row & 1) != 0;
        const blt::ge::boolean_bindings_t bindings{{"A", a}, {"B", b}};
        BLT_ASSERT(blt::ge::evaluate_boolean("( A AND NOT B ) OR ( NOT A AND B )", bindings) == (a != b));
    }
}

void malformed_test()
{
    BLT_INFO("Testing malformed expressions evaluate to false");
    const blt::ge::boolean_bindings_t bindings{{"A", true}, {"B", true}};

    BLT_ASSERT(!blt::ge::evaluate_postfix({"A", "AND"}, bindings).has_value());
    BLT_ASSERT(!blt::ge::evaluate_postfix({"NOT"}, bindings).has_value());
    BLT_ASSERT(!blt::ge::evaluate_postfix({"A", "B"}, bindings).has_value());
    BLT_ASSERT(!blt::ge::evaluate_postfix({}, bindings).has_value());
    BLT_ASSERT(!blt::ge::evaluate_postfix({"A", "Z", "OR"}, bindings).has_value());

    BLT_ASSERT(!blt::ge::evaluate_boolean("A AND", bindings));
    BLT_ASSERT(!blt::ge::evaluate_boolean("OR", bindings));
    BLT_ASSERT(!blt::ge::evaluate_boolean("A B", bindings));
    BLT_ASSERT(!blt::ge::evaluate_boolean("", bindings));
    BLT_ASSERT(!blt::ge::evaluate_boolean("( A", bindings));
}

int main()
{
    postfix_test();
    evaluation_test();
    truth_table_test();
    malformed_test();
    BLT_INFO("Boolean tests passed");
}
