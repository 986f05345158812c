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

#include "text_lut/lookup_table.hpp"

#include "text_lut/parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace text_lut
{

namespace
{
Result<std::vector<std::size_t>> diff_coords(
  const std::vector<double> & lhs, const std::vector<double> & rhs, const char * axis)
{
  if (lhs.size() != rhs.size()) {
    return make_error(
      ErrorKind::DimensionMismatch,
      fmt::format("{} coordinate count differs: {} != {}", axis, lhs.size(), rhs.size()));
  }

  std::vector<std::size_t> offsets;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (lhs[i] != rhs[i]) {
      offsets.push_back(i);
    }
  }
  return offsets;
}
}  // namespace

LookupTable::LookupTable(
  std::string x_title, std::string y_title, std::vector<double> x_coords,
  std::vector<double> y_coords, Map values)
: x_title_(std::move(x_title)),
  y_title_(std::move(y_title)),
  x_coords_(std::move(x_coords)),
  y_coords_(std::move(y_coords)),
  values_(std::move(values))
{
}

Result<LookupTable> LookupTable::create(
  std::string x_title, std::string y_title, std::vector<double> x_coords,
  std::vector<double> y_coords, Map values)
{
  if (x_coords.empty() || y_coords.empty()) {
    return make_error(
      ErrorKind::InvalidArgument,
      fmt::format("table size must be positive, got {} x {}", x_coords.size(), y_coords.size()));
  }
  if (!x_title.empty() && !is_valid_title(x_title)) {
    return make_error(ErrorKind::InvalidArgument, fmt::format("invalid x title '{}'", x_title));
  }
  if (!y_title.empty() && !is_valid_title(y_title)) {
    return make_error(ErrorKind::InvalidArgument, fmt::format("invalid y title '{}'", y_title));
  }
  if (values.size() != y_coords.size()) {
    return make_error(
      ErrorKind::DimensionMismatch,
      fmt::format("{} rows of values for {} y coordinates", values.size(), y_coords.size()));
  }
  for (std::size_t y = 0; y < values.size(); ++y) {
    if (values[y].size() != x_coords.size()) {
      return make_error(
        ErrorKind::DimensionMismatch,
        fmt::format(
          "row {} has {} values for {} x coordinates", y, values[y].size(), x_coords.size()));
    }
  }

  return LookupTable(
    std::move(x_title), std::move(y_title), std::move(x_coords), std::move(y_coords),
    std::move(values));
}

Result<LookupTable> LookupTable::build(
  const int x_size, const int y_size, const std::string & x_title, const std::string & y_title)
{
  if (x_size < 1 || y_size < 1) {
    return make_error(
      ErrorKind::InvalidArgument,
      fmt::format("table size must be positive, got {} x {}", x_size, y_size));
  }
  if (!is_valid_title(x_title)) {
    return make_error(
      ErrorKind::InvalidArgument, fmt::format("invalid x title '{}'", x_title));
  }
  if (!is_valid_title(y_title)) {
    return make_error(
      ErrorKind::InvalidArgument, fmt::format("invalid y title '{}'", y_title));
  }

  const auto num_x = static_cast<std::size_t>(x_size);
  const auto num_y = static_cast<std::size_t>(y_size);
  return LookupTable(
    x_title, y_title, std::vector<double>(num_x, 0.0), std::vector<double>(num_y, 0.0),
    Map(num_y, Row(num_x, 0.0)));
}

Result<double> LookupTable::get(const std::size_t x, const std::size_t y) const
{
  if (x >= x_size()) {
    return make_error(
      ErrorKind::OutOfRange,
      fmt::format("x offset {} is beyond the boundary {}", x, x_size() - 1));
  }
  if (y >= y_size()) {
    return make_error(
      ErrorKind::OutOfRange,
      fmt::format("y offset {} is beyond the boundary {}", y, y_size() - 1));
  }
  return values_[y][x];
}

Result<void> LookupTable::set(const std::size_t x, const std::size_t y, const double value)
{
  if (x >= x_size()) {
    return make_error(
      ErrorKind::OutOfRange,
      fmt::format("x offset {} is beyond the boundary {}", x, x_size() - 1));
  }
  if (y >= y_size()) {
    return make_error(
      ErrorKind::OutOfRange,
      fmt::format("y offset {} is beyond the boundary {}", y, y_size() - 1));
  }
  values_[y][x] = value;
  return {};
}

Result<void> LookupTable::set_x_coords(const std::vector<double> & coords)
{
  if (coords.size() != x_size()) {
    return make_error(
      ErrorKind::DimensionMismatch,
      fmt::format("expected {} x coordinates, got {}", x_size(), coords.size()));
  }
  x_coords_ = coords;
  return {};
}

Result<void> LookupTable::set_y_coords(const std::vector<double> & coords)
{
  if (coords.size() != y_size()) {
    return make_error(
      ErrorKind::DimensionMismatch,
      fmt::format("expected {} y coordinates, got {}", y_size(), coords.size()));
  }
  y_coords_ = coords;
  return {};
}

Result<std::vector<double>> LookupTable::get_x_vals(const std::size_t y) const
{
  if (y >= y_size()) {
    return make_error(
      ErrorKind::OutOfRange, fmt::format("y offset {} is out of bounds", y));
  }
  return values_[y];
}

Result<std::vector<double>> LookupTable::get_y_vals(const std::size_t x) const
{
  if (x >= x_size()) {
    return make_error(
      ErrorKind::OutOfRange, fmt::format("there is no y value at x offset {}", x));
  }

  std::vector<double> column;
  column.reserve(y_size());
  for (const auto & row : values_) {
    column.push_back(row[x]);
  }
  return column;
}

Result<std::vector<CellOffset>> LookupTable::diff(
  const LookupTable & other, const bool stop_early) const
{
  if (x_size() != other.x_size() || y_size() != other.y_size()) {
    return make_error(
      ErrorKind::DimensionMismatch,
      fmt::format(
        "cannot compare a {} x {} table with a {} x {} table", x_size(), y_size(),
        other.x_size(), other.y_size()));
  }

  std::vector<CellOffset> diff_points;
  for (std::size_t x = 0; x < x_size(); ++x) {
    for (std::size_t y = 0; y < y_size(); ++y) {
      if (values_[y][x] != other.values_[y][x]) {
        diff_points.push_back(CellOffset{x, y});
        if (stop_early) {
          return diff_points;
        }
      }
    }
  }
  return diff_points;
}

Result<bool> LookupTable::differs(const LookupTable & other) const
{
  return diff(other, true).map(
    [](const std::vector<CellOffset> & points) { return !points.empty(); });
}

Result<std::vector<std::size_t>> LookupTable::diff_x_coords(const LookupTable & other) const
{
  return diff_coords(x_coords_, other.x_coords_, "x");
}

Result<std::vector<std::size_t>> LookupTable::diff_y_coords(const LookupTable & other) const
{
  return diff_coords(y_coords_, other.y_coords_, "y");
}

Result<std::vector<CellOffset>> LookupTable::lookup_points(
  const double x_value, const double y_value, const int range) const
{
  if (range < 0) {
    return make_error(
      ErrorKind::InvalidArgument, fmt::format("range must not be negative, got {}", range));
  }

  const auto clamp_range = [range](const std::size_t center, const std::size_t size) {
    const auto r = static_cast<std::size_t>(range);
    const std::size_t first = center > r ? center - r : 0;
    const std::size_t last = std::min(center + r, size - 1);
    return std::make_pair(first, last);
  };

  const auto [x_first, x_last] = clamp_range(nearest_offset(x_coords_, x_value), x_size());
  const auto [y_first, y_last] = clamp_range(nearest_offset(y_coords_, y_value), y_size());

  std::vector<CellOffset> points;
  points.reserve((x_last - x_first + 1) * (y_last - y_first + 1));
  for (std::size_t x = x_first; x <= x_last; ++x) {
    for (std::size_t y = y_first; y <= y_last; ++y) {
      points.push_back(CellOffset{x, y});
    }
  }
  return points;
}

bool is_valid_title(const std::string & title)
{
  if (title.empty()) {
    return false;
  }
  const auto is_space = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  const auto is_word = [](const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  };
  if (std::any_of(title.begin(), title.end(), is_space)) {
    return false;
  }
  if (std::none_of(title.begin(), title.end(), is_word)) {
    return false;
  }
  // would be read back as a coordinate or a value
  if (title.front() == '[' || title.back() == ']') {
    return false;
  }
  return !parse_number(title).has_value();
}

std::size_t nearest_offset(const std::vector<double> & coords, const double value)
{
  if (coords.empty()) {
    return 0;
  }
  const std::size_t last = coords.size() - 1;
  if (value <= coords.front()) {
    return 0;
  }
  if (value >= coords.back()) {
    return last;
  }

  for (std::size_t i = 0; i < last; ++i) {
    const double lower = coords[i];
    const double upper = coords[i + 1];
    if (lower <= value && value <= upper) {
      // switch to the upper neighbor only when strictly closer
      return (std::fabs(value - lower) > std::fabs(upper - value)) ? i + 1 : i;
    }
  }

  // unordered coordinates, fall back to a plain nearest search
  std::size_t nearest = 0;
  double min_dist = std::fabs(value - coords.front());
  for (std::size_t i = 1; i < coords.size(); ++i) {
    const double dist = std::fabs(value - coords[i]);
    if (dist < min_dist) {
      min_dist = dist;
      nearest = i;
    }
  }
  return nearest;
}

}  // namespace text_lut
