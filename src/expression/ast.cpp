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
#include <blt/ge/expression/ast.h>
#include <blt/ge/expression/cursor.h>
#include <blt/std/assert.h>
#include <blt/std/utility.h>
#include <cmath>
#include <limits>
#include <utility>

namespace blt::ge
{
    namespace
    {
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();

        using partial_t = std::pair<expr_t, token_cursor_t>;
        using step_t = blt::expected<partial_t, parse_error_t>;

        step_t fail(const parse_error_t::code_t code, const token_cursor_t& cursor)
        {
            return step_t{blt::unexpected<parse_error_t>(parse_error_t{code, cursor.get_position(), std::string(cursor.peek())})};
        }

        step_t success(expr_t expr, const token_cursor_t& cursor)
        {
            return step_t{partial_t{std::move(expr), cursor}};
        }

        std::optional<expr_kind_t> binary_operator(const token_cursor_t& cursor)
        {
            if (cursor.is("+"))
                return expr_kind_t::ADD;
            if (cursor.is("-"))
                return expr_kind_t::SUB;
            if (cursor.is("*"))
                return expr_kind_t::MUL;
            if (cursor.is("/"))
                return expr_kind_t::DIV;
            return {};
        }

        step_t parse_chain(const token_cursor_t& cursor);

        // expects the cursor on the token after the closing delimiter's operand
        step_t expect_close(step_t inner)
        {
            if (!inner.has_value())
                return inner;
            auto& [expr, cursor] = inner.value();
            if (cursor.at_end())
                return fail(parse_error_t::code_t::UNEXPECTED_END, cursor);
            if (!cursor.is(")"))
                return fail(parse_error_t::code_t::MISSING_CLOSE_PAREN, cursor);
            return success(std::move(expr), cursor.advance());
        }

        step_t parse_primary(const token_cursor_t& cursor)
        {
            if (cursor.at_end())
                return fail(parse_error_t::code_t::UNEXPECTED_END, cursor);

            const auto token = cursor.peek();
            if (token == "pow(")
            {
                auto base = parse_chain(cursor.advance());
                if (!base.has_value())
                    return base;
                auto& [base_expr, after_base] = base.value();
                if (after_base.at_end())
                    return fail(parse_error_t::code_t::UNEXPECTED_END, after_base);
                if (!after_base.is(","))
                    return fail(parse_error_t::code_t::MISSING_COMMA, after_base);
                auto exponent = expect_close(parse_chain(after_base.advance()));
                if (!exponent.has_value())
                    return exponent;
                auto& [exponent_expr, after_exponent] = exponent.value();
                return success(expr_t::make_binary(expr_kind_t::POW, std::move(base_expr), std::move(exponent_expr)), after_exponent);
            }
            if (token == "sqrt(")
            {
                auto operand = expect_close(parse_chain(cursor.advance()));
                if (!operand.has_value())
                    return operand;
                auto& [operand_expr, after] = operand.value();
                return success(expr_t::make_unary(expr_kind_t::SQRT, std::move(operand_expr)), after);
            }
            if (token == "(")
                return expect_close(parse_chain(cursor.advance()));
            if (const auto index = parse_variable_index(token))
                return success(expr_t::make_variable(*index), cursor.advance());
            if (const auto number = parse_number(token))
                return success(expr_t::make_constant(*number), cursor.advance());
            return fail(parse_error_t::code_t::UNEXPECTED_TOKEN, cursor);
        }

        step_t parse_chain(const token_cursor_t& cursor)
        {
            auto lhs = parse_primary(cursor);
            if (!lhs.has_value())
                return lhs;
            auto& [expr, next] = lhs.value();
            while (const auto kind = binary_operator(next))
            {
                auto rhs = parse_primary(next.advance());
                if (!rhs.has_value())
                    return rhs;
                auto& [rhs_expr, after] = rhs.value();
                expr = expr_t::make_binary(*kind, std::move(expr), std::move(rhs_expr));
                next = after;
            }
            return lhs;
        }
    }

    expr_t expr_t::make_constant(const double value)
    {
        expr_t expr{expr_kind_t::CONSTANT};
        expr.value = value;
        return expr;
    }

    expr_t expr_t::make_variable(const size_t index)
    {
        expr_t expr{expr_kind_t::VARIABLE};
        expr.index = index;
        return expr;
    }

    expr_t expr_t::make_unary(const expr_kind_t kind, expr_t operand)
    {
        BLT_ASSERT_MSG(kind == expr_kind_t::SQRT, "Only sqrt is a unary expression!");
        expr_t expr{kind};
        expr.left = std::make_unique<expr_t>(std::move(operand));
        return expr;
    }

    expr_t expr_t::make_binary(const expr_kind_t kind, expr_t lhs, expr_t rhs)
    {
        BLT_ASSERT_MSG(kind != expr_kind_t::SQRT && kind != expr_kind_t::VARIABLE && kind != expr_kind_t::CONSTANT,
                       "Not a binary expression kind!");
        expr_t expr{kind};
        expr.left = std::make_unique<expr_t>(std::move(lhs));
        expr.right = std::make_unique<expr_t>(std::move(rhs));
        return expr;
    }

    size_t expr_t::size() const
    {
        size_t count = 1;
        if (left)
            count += left->size();
        if (right)
            count += right->size();
        return count;
    }

    double expr_t::evaluate(const std::vector<double>& inputs) const
    {
        switch (kind)
        {
        case expr_kind_t::ADD:
            return left->evaluate(inputs) + right->evaluate(inputs);
        case expr_kind_t::SUB:
            return left->evaluate(inputs) - right->evaluate(inputs);
        case expr_kind_t::MUL:
            return left->evaluate(inputs) * right->evaluate(inputs);
        case expr_kind_t::DIV:
        {
            const auto divisor = right->evaluate(inputs);
            if (divisor == 0.0)
                return nan;
            return left->evaluate(inputs) / divisor;
        }
        case expr_kind_t::POW:
            return std::pow(left->evaluate(inputs), right->evaluate(inputs));
        case expr_kind_t::SQRT:
        {
            const auto operand = left->evaluate(inputs);
            if (operand < 0.0)
                return nan;
            return std::sqrt(operand);
        }
        case expr_kind_t::VARIABLE:
            if (index >= inputs.size())
                return nan;
            return inputs[index];
        case expr_kind_t::CONSTANT:
            return value;
        }
        BLT_UNREACHABLE;
    }

    void expr_t::print(std::ostream& out) const
    {
        switch (kind)
        {
        case expr_kind_t::ADD:
        case expr_kind_t::SUB:
        case expr_kind_t::MUL:
        case expr_kind_t::DIV:
        {
            static constexpr const char* symbols[] = {"+", "-", "*", "/"};
            // operands are bracketed so the flat precedence of the parser reads the same tree back
            out << "( ";
            left->print(out);
            out << ' ' << symbols[static_cast<u8>(kind)] << ' ';
            right->print(out);
            out << " )";
            break;
        }
        case expr_kind_t::POW:
            out << "pow( ";
            left->print(out);
            out << " , ";
            right->print(out);
            out << " )";
            break;
        case expr_kind_t::SQRT:
            out << "sqrt( ";
            left->print(out);
            out << " )";
            break;
        case expr_kind_t::VARIABLE:
            out << "x[" << index << ']';
            break;
        case expr_kind_t::CONSTANT:
        {
            // enough digits for the parsed constant to be the same double
            const auto precision = out.precision(std::numeric_limits<double>::max_digits10);
            out << value;
            out.precision(precision);
            break;
        }
        }
    }

    std::string parse_error_t::to_string() const
    {
        std::string where = " at token " + std::to_string(position);
        if (!token.empty())
            where += " ('" + token + "')";
        switch (code)
        {
        case code_t::UNEXPECTED_TOKEN:
            return "Unexpected token" + where;
        case code_t::UNEXPECTED_END:
            return "Unexpected end of expression" + where;
        case code_t::MISSING_COMMA:
            return "Expected ',' in pow function" + where;
        case code_t::MISSING_CLOSE_PAREN:
            return "Expected ')'" + where;
        case code_t::TRAILING_INPUT:
            return "Unexpected input after expression" + where;
        }
        return "Unknown parse error" + where;
    }

    std::optional<size_t> parse_variable_index(const std::string_view token)
    {
        if (token.size() < 4 || token.substr(0, 2) != "x[" || token.back() != ']')
            return {};
        const auto digits = token.substr(2, token.size() - 3);
        size_t index = 0;
        for (const char c : digits)
        {
            if (c < '0' || c > '9')
                return {};
            index = index * 10 + static_cast<size_t>(c - '0');
        }
        return index;
    }

    parse_result_t parse_expression(const token_list_t& tokens)
    {
        auto result = parse_chain(token_cursor_t{tokens});
        if (!result.has_value())
            return parse_result_t{blt::unexpected<parse_error_t>(std::move(result.error()))};
        auto& [expr, cursor] = result.value();
        if (!cursor.at_end())
            return parse_result_t{blt::unexpected<parse_error_t>(parse_error_t{parse_error_t::code_t::TRAILING_INPUT, cursor.get_position(),
                                                                               std::string(cursor.peek())})};
        return parse_result_t{std::move(expr)};
    }
}
