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

#include "text_lut/parser.hpp"

#include <fmt/format.h>
#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace text_lut
{

namespace
{
rclcpp::Logger logger()
{
  return rclcpp::get_logger("text_lut").get_child("parser");
}

bool is_word_char(const char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_bracketed(const std::string & token)
{
  return token.size() >= 2 && token.front() == '[' && token.back() == ']';
}

Result<LookupTable> parse_lines(const std::string & text)
{
  std::string x_title;
  std::string y_title;
  bool has_x_title = false;
  bool has_y_title = false;
  std::vector<double> x_coords;
  std::vector<double> y_coords;
  Map rows;
  std::size_t num_x = 0;  // 0 until the x coordinate line is seen

  std::istringstream iss(text);
  std::string line;
  std::size_t line_num = 0;
  while (std::getline(iss, line)) {
    ++line_num;
    const std::vector<std::string> parts = tokenize(line);

    // skip blank lines
    if (parts.empty()) {
      continue;
    }

    if (num_x == 0) {
      // x title, a lone token above the coordinates
      if (parts.size() == 1 && !parse_coordinate(parts.front())) {
        if (has_x_title) {
          return make_format_error(line_num, "multiple x-title lines");
        }
        if (!is_valid_title(parts.front())) {
          return make_format_error(
            line_num, fmt::format("invalid x title '{}'", parts.front()));
        }
        x_title = parts.front();
        has_x_title = true;
        RCLCPP_DEBUG(logger(), "line %zu: x title '%s'", line_num, x_title.c_str());
        continue;
      }

      // x coordinates across the top, possibly led by the y title on one-row tables
      auto first = parts.begin();
      if (parts.size() > 1 && !is_bracketed(parts.front()) && !parse_number(parts.front())) {
        if (has_y_title) {
          return make_format_error(line_num, "multiple y-title lines");
        }
        if (!is_valid_title(parts.front())) {
          return make_format_error(
            line_num, fmt::format("invalid y title '{}'", parts.front()));
        }
        y_title = parts.front();
        has_y_title = true;
        ++first;
      }
      for (auto it = first; it != parts.end(); ++it) {
        const auto coord = parse_coordinate(*it);
        if (!coord) {
          return make_format_error(line_num, fmt::format("malformed x coordinate '{}'", *it));
        }
        x_coords.push_back(*coord);
      }
      num_x = x_coords.size();
      RCLCPP_DEBUG(logger(), "line %zu: %zu x coordinates", line_num, num_x);
      continue;
    }

    std::size_t num_parts = parts.size();
    std::size_t first = 0;

    // y title, 1 y coordinate, and data
    if (num_parts == num_x + 2) {
      if (has_y_title) {
        return make_format_error(line_num, "multiple y-title lines");
      }
      if (!is_valid_title(parts.front())) {
        return make_format_error(line_num, fmt::format("invalid y title '{}'", parts.front()));
      }
      y_title = parts.front();
      has_y_title = true;
      first = 1;
      --num_parts;
      RCLCPP_DEBUG(logger(), "line %zu: y title '%s'", line_num, y_title.c_str());
    }

    if (num_parts != num_x + 1) {
      return make_format_error(line_num, "irregular data on this line or before");
    }

    const auto y_coord = parse_coordinate(parts[first]);
    if (!y_coord) {
      return make_format_error(
        line_num, fmt::format("malformed y coordinate '{}'", parts[first]));
    }

    Row row;
    row.reserve(num_x);
    for (std::size_t i = first + 1; i < parts.size(); ++i) {
      const auto value = parse_number(parts[i]);
      if (!value) {
        return make_format_error(line_num, fmt::format("value '{}' is not a number", parts[i]));
      }
      row.push_back(*value);
    }

    y_coords.push_back(*y_coord);
    rows.push_back(std::move(row));
  }

  if (num_x == 0) {
    return make_error(ErrorKind::FormatError, "no x coordinate line found");
  }
  if (rows.empty()) {
    return make_error(ErrorKind::FormatError, "no data rows found");
  }

  // rows were read top to bottom, offset 0 is the bottom row
  std::reverse(rows.begin(), rows.end());
  std::reverse(y_coords.begin(), y_coords.end());

  return LookupTable::create(
    std::move(x_title), std::move(y_title), std::move(x_coords), std::move(y_coords),
    std::move(rows));
}
}  // namespace

Result<LookupTable> parse(const std::string & text)
{
  auto table = parse_lines(text);
  if (!table) {
    RCLCPP_ERROR(logger(), "Cannot parse look up table: %s", table.error().what().c_str());
    return table;
  }

  RCLCPP_DEBUG(
    logger(), "Parsed %zu x %zu look up table ('%s' / '%s')", table->x_size(), table->y_size(),
    table->x_title().c_str(), table->y_title().c_str());
  return table;
}

std::vector<std::string> tokenize(const std::string & line)
{
  std::vector<std::string> parts;
  std::istringstream iss(line);
  std::string part;
  while (iss >> part) {
    if (std::any_of(part.begin(), part.end(), is_word_char)) {
      parts.push_back(part);
    }
  }
  return parts;
}

std::optional<double> parse_number(const std::string & token)
{
  if (token.empty() || std::isspace(static_cast<unsigned char>(token.front())) != 0) {
    return std::nullopt;
  }

  try {
    std::size_t pos = 0;
    const double value = std::stod(token, &pos);
    if (pos != token.size() || !std::isfinite(value)) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<double> parse_coordinate(const std::string & token)
{
  if (!is_bracketed(token)) {
    return std::nullopt;
  }
  return parse_number(token.substr(1, token.size() - 2));
}

}  // namespace text_lut
