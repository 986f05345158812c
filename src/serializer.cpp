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

#include "text_lut/serializer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace text_lut
{

namespace
{
constexpr const char * k_separator = "  ";
}  // namespace

std::string format_number(const double value)
{
  return fmt::format("{}", value);
}

std::vector<std::string> align_left(std::vector<std::string> cells)
{
  std::size_t width = 0;
  for (const auto & cell : cells) {
    width = std::max(width, cell.size());
  }
  for (auto & cell : cells) {
    cell.append(width - cell.size(), ' ');
  }
  return cells;
}

Result<std::string> render(const LookupTable & table)
{
  const std::size_t num_x = table.x_size();
  const std::size_t num_y = table.y_size();
  const std::size_t num_rows = num_y + 1;  // add 1 for the x coordinates

  // body line to place the y title on, line 0 holds the x coordinates
  const std::size_t title_row = num_y / 2;

  std::vector<std::string> yt_column(num_rows, " ");
  yt_column[title_row] = " " + table.y_title();
  yt_column = align_left(std::move(yt_column));

  // body line i shows the row at y offset (num_y - i)
  std::vector<std::string> y_column(num_rows, " ");
  for (std::size_t i = 1; i < num_rows; ++i) {
    y_column[i] = " [" + format_number(table.get_y_coords()[num_y - i]) + "] ";
  }
  y_column = align_left(std::move(y_column));

  std::vector<std::vector<std::string>> val_columns;
  val_columns.reserve(num_x);
  for (std::size_t x = 0; x < num_x; ++x) {
    const auto y_vals = table.get_y_vals(x);
    if (!y_vals) {
      return tl::make_unexpected(y_vals.error());
    }
    std::vector<std::string> column;
    column.reserve(num_rows);
    column.push_back("[" + format_number(table.get_x_coords()[x]) + "]");
    for (auto it = y_vals->rbegin(); it != y_vals->rend(); ++it) {
      column.push_back(format_number(*it));
    }
    val_columns.push_back(align_left(std::move(column)));
  }

  std::vector<std::string> lines;
  lines.reserve(num_rows);
  for (std::size_t i = 0; i < num_rows; ++i) {
    std::string line = yt_column[i] + k_separator + y_column[i];
    for (const auto & column : val_columns) {
      line += k_separator + column[i];
    }
    lines.push_back(std::move(line));
  }

  // the x title is centered over the body, leftover space goes to the right
  const std::string & x_title = table.x_title();
  const std::size_t width = lines.front().size();
  if (x_title.size() > width) {
    return make_error(
      ErrorKind::LayoutError,
      fmt::format(
        "x title '{}' is wider than the table ({} > {})", x_title, x_title.size(), width));
  }
  const std::size_t gap = (width - x_title.size()) / 2;

  std::string text = "\n" + std::string(gap, ' ') + x_title + "\n\n";
  for (const auto & line : lines) {
    text += line;
    text += '\n';
  }
  return text;
}

}  // namespace text_lut
