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

#ifndef BLT_GE_EXPRESSION_BINDINGS_H
#define BLT_GE_EXPRESSION_BINDINGS_H

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blt::ge
{
    /**
     * Assignment of values to named variables. Expressions only ever use a handful of variables so lookup is a
     * linear scan.
     */
    template <typename T>
    class bindings_t
    {
    public:
        bindings_t() = default;

        bindings_t(std::initializer_list<std::pair<std::string, T>> init)
        {
            for (const auto& [name, value] : init)
                bind(name, value);
        }

        bindings_t& bind(const std::string_view name, T value)
        {
            for (auto& [bound_name, bound_value] : values)
            {
                if (bound_name == name)
                {
                    bound_value = std::move(value);
                    return *this;
                }
            }
            values.emplace_back(std::string(name), std::move(value));
            return *this;
        }

        // nullptr if the variable is not bound
        [[nodiscard]] const T* find(const std::string_view name) const
        {
            for (const auto& [bound_name, bound_value] : values)
            {
                if (bound_name == name)
                    return &bound_value;
            }
            return nullptr;
        }

        [[nodiscard]] size_t size() const
        {
            return values.size();
        }

        [[nodiscard]] auto begin() const
        {
            return values.begin();
        }

        [[nodiscard]] auto end() const
        {
            return values.end();
        }

    private:
        std::vector<std::pair<std::string, T>> values;
    };
}

#endif //BLT_GE_EXPRESSION_BINDINGS_H
