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

#ifndef BLT_GE_POPULATION_H
#define BLT_GE_POPULATION_H

#include <utility>
#include <vector>
#include <blt/ge/fwdecl.h>
#include <blt/ge/mapper.h>
#include <blt/ge/fitness.h>

namespace blt::ge
{
    struct individual_t
    {
        genome_t genome;
        phenotype_t phenotype;
        fitness_t fitness;

        individual_t() = delete;

        explicit individual_t(genome_t&& genome): genome(std::move(genome))
        {
        }

        explicit individual_t(const genome_t& genome): genome(genome)
        {
        }

        individual_t(const individual_t&) = default;

        individual_t(individual_t&&) = default;

        individual_t& operator=(const individual_t&) = default;

        individual_t& operator=(individual_t&&) = default;
    };

    class population_t
    {
    public:
        std::vector<individual_t>& get_individuals()
        {
            return individuals;
        }

        [[nodiscard]] const std::vector<individual_t>& get_individuals() const
        {
            return individuals;
        }

        [[nodiscard]] size_t size() const
        {
            return individuals.size();
        }

        [[nodiscard]] bool empty() const
        {
            return individuals.empty();
        }

        individual_t& operator[](const size_t index)
        {
            return individuals[index];
        }

        const individual_t& operator[](const size_t index) const
        {
            return individuals[index];
        }

        auto begin()
        {
            return individuals.begin();
        }

        auto end()
        {
            return individuals.end();
        }

        [[nodiscard]] auto begin() const
        {
            return individuals.begin();
        }

        [[nodiscard]] auto end() const
        {
            return individuals.end();
        }

        void clear()
        {
            individuals.clear();
        }

        population_t() = default;

        population_t(const population_t&) = default;

        population_t(population_t&&) = default;

        population_t& operator=(const population_t&) = delete;

        population_t& operator=(population_t&&) = default;

    private:
        std::vector<individual_t> individuals;
    };
}

#endif //BLT_GE_POPULATION_H
