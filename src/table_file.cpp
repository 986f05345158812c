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

#include "text_lut/table_file.hpp"

#include "text_lut/parser.hpp"
#include "text_lut/serializer.hpp"

#include <fmt/format.h>
#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace text_lut
{

namespace
{
rclcpp::Logger logger()
{
  return rclcpp::get_logger("text_lut").get_child("table_file");
}

bool is_blank(const std::string & path)
{
  return std::all_of(path.begin(), path.end(), [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}
}  // namespace

Result<LookupTable> load_file(const std::string & path)
{
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    RCLCPP_ERROR(logger(), "Table file '%s' does not exist", path.c_str());
    return make_error(ErrorKind::NotFound, fmt::format("file '{}' does not exist", path));
  }

  if (!std::filesystem::is_regular_file(path, ec)) {
    RCLCPP_ERROR(logger(), "Table file '%s' is not a regular file", path.c_str());
    return make_error(ErrorKind::IoError, fmt::format("'{}' is not a regular file", path));
  }

  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    RCLCPP_ERROR(logger(), "Cannot open %s", path.c_str());
    return make_error(ErrorKind::IoError, fmt::format("unable to open file '{}'", path));
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  if (ifs.bad()) {
    RCLCPP_ERROR(logger(), "Cannot read %s", path.c_str());
    return make_error(ErrorKind::IoError, fmt::format("unable to read file '{}'", path));
  }

  auto table = parse(oss.str());
  if (!table) {
    RCLCPP_ERROR(logger(), "Invalid table in %s", path.c_str());
    return table;
  }

  table->set_last_path(path);
  RCLCPP_INFO(
    logger(), "Loaded %zu x %zu table from %s", table->x_size(), table->y_size(), path.c_str());
  return table;
}

Result<void> save_file(LookupTable & table, const std::optional<std::string> & path)
{
  std::string target;
  if (path && !is_blank(*path)) {
    target = *path;
  } else if (table.last_path()) {
    target = *table.last_path();
  } else {
    return make_error(
      ErrorKind::NoFileSpecified, "trying to save but no file specified and no file stored");
  }

  const auto text = render(table);
  if (!text) {
    RCLCPP_ERROR(logger(), "Cannot render table for %s", target.c_str());
    return tl::make_unexpected(text.error());
  }

  std::ofstream ofs(target);
  if (!ofs.is_open()) {
    RCLCPP_ERROR(logger(), "Cannot open %s for writing", target.c_str());
    return make_error(ErrorKind::IoError, fmt::format("unable to open file '{}'", target));
  }
  ofs << *text;
  ofs.close();
  if (ofs.fail()) {
    RCLCPP_ERROR(logger(), "Cannot write %s", target.c_str());
    return make_error(ErrorKind::IoError, fmt::format("unable to write file '{}'", target));
  }

  table.set_last_path(target);
  RCLCPP_INFO_STREAM(logger(), "output table to " << target);
  return {};
}

}  // namespace text_lut
