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

#ifndef BLT_GE_GRAMMAR_H
#define BLT_GE_GRAMMAR_H

#include <initializer_list>
#include <ostream>
#include <string_view>
#include <blt/std/hashmap.h>
#include <blt/ge/fwdecl.h>

namespace blt::ge
{
    using production_list_t = std::vector<production_t>;

    /**
     * Immutable rule table. A symbol with an entry is a non-terminal, every other symbol is a terminal.
     * Built through grammar_builder_t, which guarantees the start symbol resolves and no rule is empty.
     */
    class grammar_t
    {
        friend class grammar_builder_t;

    public:
        /**
         * @return the ordered productions of the symbol, or nullptr if the symbol is a terminal
         */
        [[nodiscard]] const production_list_t* lookup(const symbol_t& symbol) const
        {
            const auto it = rules.find(symbol);
            if (it == rules.end())
                return nullptr;
            return &it->second;
        }

        [[nodiscard]] bool is_non_terminal(const symbol_t& symbol) const
        {
            return rules.find(symbol) != rules.end();
        }

        [[nodiscard]] const symbol_t& get_start_symbol() const
        {
            return start_symbol;
        }

        [[nodiscard]] const std::vector<symbol_t>& get_non_terminals() const
        {
            return rule_order;
        }

        [[nodiscard]] size_t size() const
        {
            return rule_order.size();
        }

        // number of non-terminal symbols in the production
        [[nodiscard]] size_t arity(const production_t& production) const;

        /**
         * @return true if the non-terminal can derive a sentential form which contains itself again
         */
        [[nodiscard]] bool is_recursive(const symbol_t& non_terminal) const;

        void print(std::ostream& out) const;

    private:
        grammar_t() = default;

        symbol_t start_symbol;
        std::vector<symbol_t> rule_order;
        hashmap_t<symbol_t, production_list_t> rules;
    };

    class grammar_builder_t
    {
    public:
        grammar_builder_t() = default;

        /**
         * Adds productions written as whitespace separated symbol lists, "E OR T" for example. Calling this again for the
         * same non-terminal appends to its productions.
         */
        grammar_builder_t& add_rule(const symbol_t& non_terminal, std::initializer_list<std::string_view> productions);

        grammar_builder_t& add_rule(const symbol_t& non_terminal, const std::vector<std::string>& productions);

        grammar_builder_t& add_production(const symbol_t& non_terminal, production_t production);

        [[nodiscard]] bool has_rule(const symbol_t& non_terminal) const
        {
            return grammar.rules.find(non_terminal) != grammar.rules.end();
        }

        // aborts if the start symbol has no rule or any rule has no productions
        grammar_t build(const symbol_t& start_symbol);

    private:
        production_list_t& get_rule(const symbol_t& non_terminal);

        grammar_t grammar;
    };

    production_t split_production(std::string_view production);

    inline std::ostream& operator<<(std::ostream& out, const grammar_t& grammar)
    {
        grammar.print(out);
        return out;
    }
}

#endif //BLT_GE_GRAMMAR_H
