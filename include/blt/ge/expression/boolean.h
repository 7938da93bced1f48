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

#ifndef BLT_GE_EXPRESSION_BOOLEAN_H
#define BLT_GE_EXPRESSION_BOOLEAN_H

#include <optional>
#include <string_view>
#include <blt/ge/tokenizer.h>
#include <blt/ge/expression/bindings.h>

namespace blt::ge
{
    namespace boolean_tokens
    {
        inline constexpr std::string_view AND = "AND";
        inline constexpr std::string_view OR = "OR";
        inline constexpr std::string_view NOT = "NOT";
        inline constexpr std::string_view OPEN = "(";
        inline constexpr std::string_view CLOSE = ")";
    }

    using boolean_bindings_t = bindings_t<bool>;

    /**
     * Shunting-yard conversion. AND, OR and NOT all share one precedence level and AND / OR associate to the left, so
     * "A AND B OR C" becomes "A B AND C OR". A ')' without a matching '(' drains the operator stack.
     */
    token_list_t infix_to_postfix(const token_list_t& tokens);

    /**
     * @return std::nullopt if an operator is missing operands, a variable is unbound, or the expression does not
     * reduce to exactly one value
     */
    std::optional<bool> evaluate_postfix(const token_list_t& postfix, const boolean_bindings_t& bindings);

    /**
     * Tokenizes, converts and evaluates an infix boolean expression. Malformed expressions evaluate to false.
     */
    bool evaluate_boolean(std::string_view expression, const boolean_bindings_t& bindings);
}

#endif //BLT_GE_EXPRESSION_BOOLEAN_H
