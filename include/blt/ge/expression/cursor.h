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

#ifndef BLT_GE_EXPRESSION_CURSOR_H
#define BLT_GE_EXPRESSION_CURSOR_H

#include <optional>
#include <string>
#include <cstdlib>
#include <blt/ge/tokenizer.h>

namespace blt::ge
{
    /**
     * Position in a token list. Parsers take a cursor by value and hand back the cursor past whatever they consumed,
     * nothing is shared between sub-parses.
     */
    class token_cursor_t
    {
    public:
        explicit token_cursor_t(const token_list_t& tokens, const size_t position = 0): tokens(&tokens), position(position)
        {
        }

        [[nodiscard]] bool at_end() const
        {
            return position >= tokens->size();
        }

        // empty view once the input is exhausted
        [[nodiscard]] std::string_view peek() const
        {
            if (at_end())
                return {};
            return (*tokens)[position];
        }

        [[nodiscard]] bool is(const std::string_view token) const
        {
            return !at_end() && (*tokens)[position] == token;
        }

        [[nodiscard]] token_cursor_t advance() const
        {
            return token_cursor_t{*tokens, position + 1};
        }

        [[nodiscard]] size_t get_position() const
        {
            return position;
        }

    private:
        const token_list_t* tokens;
        size_t position;
    };

    /**
     * @return the value if the whole token is a decimal floating point literal
     */
    inline std::optional<double> parse_number(const std::string_view token)
    {
        if (token.empty())
            return {};
        const std::string str(token);
        char* end = nullptr;
        const double value = std::strtod(str.c_str(), &end);
        if (end != str.c_str() + str.size())
            return {};
        return value;
    }
}

#endif //BLT_GE_EXPRESSION_CURSOR_H
