// Copyright 2026 The Autoware Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TEXT_LUT__PLANE_FILL_HPP_
#define TEXT_LUT__PLANE_FILL_HPP_

#include "text_lut/error.hpp"
#include "text_lut/lookup_table.hpp"

namespace text_lut
{

/**
 * @brief Plane z = a * y + b * x + c
 */
struct PlaneCoefficients
{
  double a{};  //!< Slope along the y coordinates
  double b{};  //!< Slope along the x coordinates
  double c{};  //!< Offset
};

/**
 * @brief Overwrite every cell with the plane evaluated at its coordinates
 *
 * Results are truncated toward zero to `round_digits` decimal places.
 *
 * @param table Table to fill
 * @param plane Plane coefficients
 * @param round_digits Digits kept after the decimal point (>= 0)
 * @return InvalidArgument for a negative digit count
 */
Result<void> fill_plane(LookupTable & table, const PlaneCoefficients & plane, int round_digits);

/**
 * @brief Truncate a value toward zero to a number of decimal places
 */
double truncate_digits(double value, int digits);

}  // namespace text_lut

#endif  // TEXT_LUT__PLANE_FILL_HPP_
