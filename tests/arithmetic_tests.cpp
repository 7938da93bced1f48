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
#include <blt/ge/expression/arithmetic.h>
#include <blt/logging/logging.h>
#include <blt/std/assert.h>
#include <cmath>

namespace
{
    bool close_to(const double a, const double b)
    {
        return std::abs(a - b) < 1e-9;
    }
}

void precedence_test()
{
    BLT_INFO("Testing arithmetic precedence");
    const blt::ge::arithmetic_bindings_t none;
    BLT_ASSERT(close_to(blt::ge::evaluate_arithmetic("1 + 2 * 3", none), 7));
    BLT_ASSERT(close_to(blt::ge::evaluate_arithmetic("( 1 + 2 ) * 3", none), 9));
    BLT_ASSERT(close_to(blt::ge::evaluate_arithmetic("8 - 2 - 1", none), 5));
    BLT_ASSERT(close_to(blt::ge::evaluate_arithmetic("8 / 2 / 2", none), 2));
    BLT_ASSERT(close_to(blt::ge::evaluate_arithmetic("2 * ( 3 - ( 1 + 1 ) ) / 4", none), 0.5));
}

void variable_test()
{
    BLT_INFO("Testing arithmetic over bound variables");
    const blt::ge::arithmetic_bindings_t bindings{{"x", 0.1}, {"y", 0.3}};
    BLT_ASSERT(close_to(blt::ge::evaluate_arithmetic("x + y", bindings), 0.4));
    BLT_ASSERT(close_to(blt::ge::evaluate_arithmetic("x * y + 1.0", bindings), 1.03));
    BLT_ASSERT(close_to(blt::ge::evaluate_arithmetic("( x + 3.0 ) * y", bindings), 0.93));
}

void division_by_zero_test()
{
    BLT_INFO("Testing division by zero yields NaN");
    const blt::ge::arithmetic_bindings_t bindings{{"x", 0.0}};
    BLT_ASSERT(std::isnan(blt::ge::evaluate_arithmetic("1.0 / x", bindings)));
    BLT_ASSERT(std::isnan(blt::ge::evaluate_arithmetic("2 + 1 / ( 1 - 1 )", bindings)));
}

void malformed_test()
{
    BLT_INFO("Testing malformed arithmetic yields NaN");
    const blt::ge::arithmetic_bindings_t bindings{{"x", 1.0}};
    BLT_ASSERT(std::isnan(blt::ge::evaluate_arithmetic("", bindings)));
    BLT_ASSERT(std::isnan(blt::ge::evaluate_arithmetic("1 +", bindings)));
    BLT_ASSERT(std::isnan(blt::ge::evaluate_arithmetic("( 1 + 2", bindings)));
    BLT_ASSERT(std::isnan(blt::ge::evaluate_arithmetic("1 2", bindings)));
    BLT_ASSERT(std::isnan(blt::ge::evaluate_arithmetic("x + z", bindings)));
    BLT_ASSERT(std::isnan(blt::ge::evaluate_arithmetic("1 + 2 )", bindings)));
}

int main()
{
    precedence_test();
    variable_test();
    division_by_zero_test();
    malformed_test();
    BLT_INFO("Arithmetic tests passed");
}
