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
#include "../loader.h"
#include <blt/fs/loader.h>
#include <blt/std/string.h>
#include <blt/std/ranges.h>
#include <blt/std/assert.h>
#include <blt/logging/logging.h>
#include <fstream>
#include <iomanip>
#include <limits>

namespace blt::ge::example
{
    grammar_t load_grammar(const std::string_view path, const symbol_t& start_symbol)
    {
        const auto lines = fs::getLinesFromFile(path);
        grammar_builder_t builder;
        for (const auto& [line_number, raw_line] : blt::enumerate(lines))
        {
            const auto line = string::trim(raw_line);
            if (line.empty() || line[0] == '#')
                continue;
            const auto separator = line.find("::=");
            if (separator == std::string::npos)
            {
                BLT_ERROR("{}:{} is not a rule: '{}'", path, line_number + 1, line);
                BLT_ABORT("Malformed grammar file!");
            }
            const auto non_terminal = string::trim(line.substr(0, separator));
            builder.add_rule(non_terminal, string::split(line.substr(separator + 3), '|'));
        }
        BLT_DEBUG("Loaded grammar from '{}'", path);
        return builder.build(start_symbol);
    }

    void save_dataset(const std::string& path, const dataset_t& dataset)
    {
        std::ofstream out{path};
        if (!out)
        {
            BLT_ERROR("Unable to open '{}' for writing", path);
            BLT_ABORT("Unable to save dataset!");
        }
        out << std::setprecision(std::numeric_limits<double>::max_digits10);
        for (const auto& sample : dataset)
        {
            for (const auto input : sample.inputs)
                out << input << ',';
            out << sample.output << '\n';
        }
        BLT_DEBUG("Saved {} samples to '{}'", dataset.size(), path);
    }

    dataset_t load_dataset(const std::string_view path)
    {
        dataset_t dataset;
        for (const auto& line : fs::getLinesFromFile(path))
        {
            if (string::trim(line).empty())
                continue;
            const auto values = string::split(line, ',');
            BLT_ASSERT_MSG(values.size() >= 2, ("Dataset row needs at least one input and an output: '" + line + "'").c_str());
            sample_t sample;
            for (size_t i = 0; i + 1 < values.size(); i++)
                sample.inputs.push_back(std::stod(values[i]));
            sample.output = std::stod(values.back());
            dataset.push_back(std::move(sample));
        }
        BLT_DEBUG("Loaded {} samples from '{}'", dataset.size(), path);
        return dataset;
    }
}
