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

#ifndef BLT_GE_EXPRESSION_ARITHMETIC_H
#define BLT_GE_EXPRESSION_ARITHMETIC_H

#include <string_view>
#include <blt/ge/tokenizer.h>
#include <blt/ge/expression/bindings.h>

namespace blt::ge
{
    using arithmetic_bindings_t = bindings_t<double>;

    /**
     * Evaluates while parsing, no tree is built.
     *
     *  E -> T (('+' | '-') T)*
     *  T -> F (('*' | '/') F)*
     *  F -> variable | number | '(' E ')'
     *
     * Division by zero yields NaN. Malformed input (unknown token, missing operand or ')', tokens left over) yields NaN
     * as well.
     */
    double evaluate_arithmetic(const token_list_t& tokens, const arithmetic_bindings_t& bindings);

    inline double evaluate_arithmetic(const std::string_view expression, const arithmetic_bindings_t& bindings)
    {
        return evaluate_arithmetic(tokenize(expression), bindings);
    }
}

#endif //BLT_GE_EXPRESSION_ARITHMETIC_H
