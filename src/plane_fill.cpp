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

#include "text_lut/plane_fill.hpp"

#include <fmt/format.h>

#include <cmath>
#include <vector>

namespace text_lut
{

double truncate_digits(const double value, const int digits)
{
  const double scale = std::pow(10.0, digits);
  return std::trunc(value * scale) / scale;
}

Result<void> fill_plane(
  LookupTable & table, const PlaneCoefficients & plane, const int round_digits)
{
  if (round_digits < 0) {
    return make_error(
      ErrorKind::InvalidArgument,
      fmt::format("round digits must not be negative, got {}", round_digits));
  }

  if (!std::isfinite(std::pow(10.0, round_digits))) {
    return make_error(
      ErrorKind::InvalidArgument, fmt::format("round digits {} is too large", round_digits));
  }

  // no cell is written until every value is finite
  const std::vector<double> & x_coords = table.get_x_coords();
  const std::vector<double> & y_coords = table.get_y_coords();
  Map values(table.y_size(), Row(table.x_size(), 0.0));
  for (std::size_t x = 0; x < table.x_size(); ++x) {
    for (std::size_t y = 0; y < table.y_size(); ++y) {
      const double value =
        truncate_digits(plane.a * y_coords[y] + plane.b * x_coords[x] + plane.c, round_digits);
      if (!std::isfinite(value)) {
        return make_error(
          ErrorKind::InvalidArgument,
          fmt::format(
            "plane value at x {} y {} is not finite with {} digits", x_coords[x], y_coords[y],
            round_digits));
      }
      values[y][x] = value;
    }
  }

  for (std::size_t x = 0; x < table.x_size(); ++x) {
    for (std::size_t y = 0; y < table.y_size(); ++y) {
      const auto result = table.set(x, y, values[y][x]);
      if (!result) {
        return result;
      }
    }
  }
  return {};
}

}  // namespace text_lut
