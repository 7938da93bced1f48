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

namespace blt::ge
{
    namespace
    {
        bool is_binary_operator(const std::string_view token)
        {
            return token == boolean_tokens::AND || token == boolean_tokens::OR;
        }

        bool is_operator(const std::string_view token)
        {
            return is_binary_operator(token) || token == boolean_tokens::NOT;
        }
    }

    token_list_t infix_to_postfix(const token_list_t& tokens)
    {
        token_list_t output;
        token_list_t operators;
        output.reserve(tokens.size());

        for (const auto token : tokens)
        {
            if (is_binary_operator(token))
            {
                while (!operators.empty() && is_operator(operators.back()))
                {
                    output.push_back(operators.back());
                    operators.pop_back();
                }
                operators.push_back(token);
            }
            else if (token == boolean_tokens::NOT || token == boolean_tokens::OPEN)
                operators.push_back(token);
            else if (token == boolean_tokens::CLOSE)
            {
                while (!operators.empty())
                {
                    const auto top = operators.back();
                    operators.pop_back();
                    if (top == boolean_tokens::OPEN)
                        break;
                    output.push_back(top);
                }
            }
            else
                output.push_back(token);
        }

        while (!operators.empty())
        {
            output.push_back(operators.back());
            operators.pop_back();
        }

        return output;
    }

    std::optional<bool> evaluate_postfix(const token_list_t& postfix, const boolean_bindings_t& bindings)
    {
        std::vector<bool> stack;
        stack.reserve(postfix.size());

        for (const auto token : postfix)
        {
            if (is_binary_operator(token))
            {
                if (stack.size() < 2)
                    return {};
                const bool right = stack.back();
                stack.pop_back();
                const bool left = stack.back();
                stack.pop_back();
                stack.push_back(token == boolean_tokens::AND ? left && right : left || right);
            }
            else if (token == boolean_tokens::NOT)
            {
                if (stack.empty())
                    return {};
                stack.back() = !stack.back();
            }
            else
            {
                // an unmatched '(' left on the operator stack ends up here too
                const auto value = bindings.find(token);
                if (value == nullptr)
                    return {};
                stack.push_back(*value);
            }
        }

        if (stack.size() != 1)
            return {};
        return static_cast<bool>(stack.back());
    }

    bool evaluate_boolean(const std::string_view expression, const boolean_bindings_t& bindings)
    {
        return evaluate_postfix(infix_to_postfix(tokenize(expression)), bindings).value_or(false);
    }
}
