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
#include <blt/ge/expression/arithmetic.h>
#include <blt/ge/expression/cursor.h>
#include <limits>

namespace blt::ge
{
    namespace
    {
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();

        struct partial_t
        {
            double value;
            token_cursor_t cursor;
        };

        partial_t parse_sum(token_cursor_t cursor, const arithmetic_bindings_t& bindings);

        partial_t parse_factor(const token_cursor_t cursor, const arithmetic_bindings_t& bindings)
        {
            if (cursor.at_end())
                return {nan, cursor};

            if (cursor.is("("))
            {
                const auto inner = parse_sum(cursor.advance(), bindings);
                if (!inner.cursor.is(")"))
                    return {nan, inner.cursor};
                return {inner.value, inner.cursor.advance()};
            }

            const auto token = cursor.peek();
            if (const auto variable = bindings.find(token))
                return {*variable, cursor.advance()};
            if (const auto number = parse_number(token))
                return {*number, cursor.advance()};
            return {nan, cursor.advance()};
        }

        partial_t parse_product(const token_cursor_t cursor, const arithmetic_bindings_t& bindings)
        {
            auto result = parse_factor(cursor, bindings);
            while (result.cursor.is("*") || result.cursor.is("/"))
            {
                const bool divide = result.cursor.is("/");
                const auto rhs = parse_factor(result.cursor.advance(), bindings);
                if (divide)
                    result.value = rhs.value == 0.0 ? nan : result.value / rhs.value;
                else
                    result.value *= rhs.value;
                result.cursor = rhs.cursor;
            }
            return result;
        }

        partial_t parse_sum(const token_cursor_t cursor, const arithmetic_bindings_t& bindings)
        {
            auto result = parse_product(cursor, bindings);
            while (result.cursor.is("+") || result.cursor.is("-"))
            {
                const bool subtract = result.cursor.is("-");
                const auto rhs = parse_product(result.cursor.advance(), bindings);
                result.value = subtract ? result.value - rhs.value : result.value + rhs.value;
                result.cursor = rhs.cursor;
            }
            return result;
        }
    }

    double evaluate_arithmetic(const token_list_t& tokens, const arithmetic_bindings_t& bindings)
    {
        const auto result = parse_sum(token_cursor_t{tokens}, bindings);
        if (!result.cursor.at_end())
            return nan;
        return result.value;
    }
}
