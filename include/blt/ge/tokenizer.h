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

#ifndef BLT_GE_TOKENIZER_H
#define BLT_GE_TOKENIZER_H

#include <string_view>
#include <vector>
#include <cctype>

namespace blt::ge
{
    using token_list_t = std::vector<std::string_view>;

    /**
     * Splits on runs of whitespace. The mapper joins terminals with single spaces and every evaluator reads them back
     * through this function, so it is the format contract between the two. Views point into the input.
     */
    inline token_list_t tokenize(const std::string_view str)
    {
        token_list_t tokens;
        size_t pos = 0;
        while (pos < str.size())
        {
            while (pos < str.size() && std::isspace(static_cast<unsigned char>(str[pos])))
                ++pos;
            const auto begin = pos;
            while (pos < str.size() && !std::isspace(static_cast<unsigned char>(str[pos])))
                ++pos;
            if (pos > begin)
                tokens.push_back(str.substr(begin, pos - begin));
        }
        return tokens;
    }
}

#endif //BLT_GE_TOKENIZER_H
