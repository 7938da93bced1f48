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
#include <blt/ge/grammar.h>
#include <blt/ge/tokenizer.h>
#include <blt/std/assert.h>
#include <blt/logging/logging.h>

namespace blt::ge
{
    production_t split_production(const std::string_view production)
    {
        production_t symbols;
        for (const auto token : tokenize(production))
            symbols.emplace_back(token);
        return symbols;
    }

    size_t grammar_t::arity(const production_t& production) const
    {
        size_t count = 0;
        for (const auto& symbol : production)
        {
            if (is_non_terminal(symbol))
                ++count;
        }
        return count;
    }

    bool grammar_t::is_recursive(const symbol_t& non_terminal) const
    {
        if (!is_non_terminal(non_terminal))
            return false;
        hashset_t<symbol_t> visited;
        std::vector<const symbol_t*> pending;
        pending.push_back(&non_terminal);
        while (!pending.empty())
        {
            const auto& current = *pending.back();
            pending.pop_back();
            for (const auto& production : *lookup(current))
            {
                for (const auto& symbol : production)
                {
                    if (!is_non_terminal(symbol))
                        continue;
                    if (symbol == non_terminal)
                        return true;
                    if (visited.insert(symbol).second)
                        pending.push_back(&symbol);
                }
            }
        }
        return false;
    }

    void grammar_t::print(std::ostream& out) const
    {
        for (const auto& non_terminal : rule_order)
        {
            out << non_terminal << " ::=";
            bool first = true;
            for (const auto& production : rules.find(non_terminal)->second)
            {
                if (!first)
                    out << " |";
                first = false;
                for (const auto& symbol : production)
                    out << ' ' << symbol;
            }
            out << '\n';
        }
    }

    grammar_builder_t& grammar_builder_t::add_rule(const symbol_t& non_terminal, const std::initializer_list<std::string_view> productions)
    {
        auto& rule = get_rule(non_terminal);
        for (const auto production : productions)
            rule.push_back(split_production(production));
        return *this;
    }

    grammar_builder_t& grammar_builder_t::add_rule(const symbol_t& non_terminal, const std::vector<std::string>& productions)
    {
        auto& rule = get_rule(non_terminal);
        for (const auto& production : productions)
            rule.push_back(split_production(production));
        return *this;
    }

    grammar_builder_t& grammar_builder_t::add_production(const symbol_t& non_terminal, production_t production)
    {
        get_rule(non_terminal).push_back(std::move(production));
        return *this;
    }

    grammar_t grammar_builder_t::build(const symbol_t& start_symbol)
    {
        if (!has_rule(start_symbol))
            BLT_ABORT(("Start symbol '" + start_symbol + "' has no rule in the grammar!").c_str());
        for (const auto& non_terminal : grammar.rule_order)
        {
            if (grammar.rules[non_terminal].empty())
                BLT_ABORT(("Non-terminal '" + non_terminal + "' has no productions!").c_str());
        }
        grammar.start_symbol = start_symbol;
        BLT_DEBUG("Built grammar with {} rules, start symbol '{}'", grammar.rule_order.size(), start_symbol);
        return std::move(grammar);
    }

    production_list_t& grammar_builder_t::get_rule(const symbol_t& non_terminal)
    {
        const auto it = grammar.rules.find(non_terminal);
        if (it != grammar.rules.end())
            return it->second;
        grammar.rule_order.push_back(non_terminal);
        return grammar.rules[non_terminal];
    }
}
