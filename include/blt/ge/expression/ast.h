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

#ifndef BLT_GE_EXPRESSION_AST_H
#define BLT_GE_EXPRESSION_AST_H

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <blt/std/types.h>
#include <blt/std/expected.h>
#include <blt/ge/tokenizer.h>

namespace blt::ge
{
    enum class expr_kind_t : u8
    {
        ADD,
        SUB,
        MUL,
        DIV,
        POW,
        SQRT,
        VARIABLE,
        CONSTANT
    };

    /**
     * Expression tree node. Every node owns its children, trees are move-only and acyclic by construction.
     */
    class expr_t
    {
    public:
        static expr_t make_constant(double value);

        static expr_t make_variable(size_t index);

        static expr_t make_unary(expr_kind_t kind, expr_t operand);

        static expr_t make_binary(expr_kind_t kind, expr_t lhs, expr_t rhs);

        expr_t(expr_t&&) noexcept = default;

        expr_t& operator=(expr_t&&) noexcept = default;

        expr_t(const expr_t&) = delete;

        expr_t& operator=(const expr_t&) = delete;

        [[nodiscard]] expr_kind_t get_kind() const
        {
            return kind;
        }

        [[nodiscard]] double get_value() const
        {
            return value;
        }

        [[nodiscard]] size_t get_index() const
        {
            return index;
        }

        // first operand of unary and binary nodes
        [[nodiscard]] const expr_t& lhs() const
        {
            return *left;
        }

        [[nodiscard]] const expr_t& rhs() const
        {
            return *right;
        }

        // number of nodes in the tree
        [[nodiscard]] size_t size() const;

        /**
         * Division by zero, negative square roots, bad powers and variable indexes past the end of the inputs all produce
         * NaN, which then propagates up the tree.
         */
        [[nodiscard]] double evaluate(const std::vector<double>& inputs) const;

        // prints space separated tokens the parser accepts
        void print(std::ostream& out) const;

    private:
        explicit expr_t(const expr_kind_t kind): kind(kind)
        {
        }

        expr_kind_t kind;
        double value = 0;
        size_t index = 0;
        std::unique_ptr<expr_t> left;
        std::unique_ptr<expr_t> right;
    };

    struct parse_error_t
    {
        enum class code_t : u8
        {
            UNEXPECTED_TOKEN,
            UNEXPECTED_END,
            MISSING_COMMA,
            MISSING_CLOSE_PAREN,
            TRAILING_INPUT
        };

        code_t code;
        // index of the offending token
        size_t position;
        // empty at the end of input
        std::string token;

        [[nodiscard]] std::string to_string() const;
    };

    using parse_result_t = blt::expected<expr_t, parse_error_t>;

    /**
     * Recursive descent over
     *
     *  E -> P (('+' | '-' | '*' | '/') P)*
     *  P -> 'pow(' E ',' E ')' | 'sqrt(' E ')' | '(' E ')' | 'x[' index ']' | number
     *
     * All binary operators share one precedence level and associate to the left.
     */
    parse_result_t parse_expression(const token_list_t& tokens);

    inline parse_result_t parse_expression(const std::string_view expression)
    {
        return parse_expression(tokenize(expression));
    }

    // index of an "x[<digits>]" token
    std::optional<size_t> parse_variable_index(std::string_view token);

    inline std::ostream& operator<<(std::ostream& out, const expr_t& expr)
    {
        expr.print(out);
        return out;
    }
}

#endif //BLT_GE_EXPRESSION_AST_H
