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

#ifndef TEXT_LUT__LOOKUP_TABLE_HPP_
#define TEXT_LUT__LOOKUP_TABLE_HPP_

#include "text_lut/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Text based look up table namespace
 */
namespace text_lut
{

/**
 * @brief Position of a cell as (x offset, y offset)
 */
struct CellOffset
{
  std::size_t x{};  //!< Column offset, 0 = leftmost column
  std::size_t y{};  //!< Row offset, 0 = bottom row

  bool operator==(const CellOffset & other) const { return x == other.x && y == other.y; }
  bool operator!=(const CellOffset & other) const { return !(*this == other); }
};

using Row = std::vector<double>;
using Map = std::vector<Row>;

/**
 * @brief Two dimensional look up table with axis coordinates and titles
 *
 * Cells are addressed by offsets. The x offset starts at 0 on the left of the
 * displayed table and increases rightward, the y offset starts at 0 at the bottom
 * and increases upward. Coordinates are expected in ascending order per offset
 * but this is not enforced.
 *
 * The class has value semantics: a copy shares no state with the original.
 */
class LookupTable
{
public:
  /**
   * @brief Create a table from its parts
   *
   * Checks that both axes have at least one coordinate and that `values` holds
   * one row of x_coords.size() values per y coordinate. Titles may be empty,
   * otherwise they must be valid titles (see is_valid_title()).
   *
   * @param x_title Title of the x axis
   * @param y_title Title of the y axis
   * @param x_coords Column coordinates, left to right
   * @param y_coords Row coordinates, bottom to top
   * @param values Rows of values, row 0 is the bottom row
   * @return New table, InvalidArgument or DimensionMismatch
   */
  static Result<LookupTable> create(
    std::string x_title, std::string y_title, std::vector<double> x_coords,
    std::vector<double> y_coords, Map values);

  /**
   * @brief Create a zero filled table
   * @param x_size Number of columns (must be >= 1)
   * @param y_size Number of rows (must be >= 1)
   * @param x_title Title of the x axis, must satisfy is_valid_title()
   * @param y_title Title of the y axis, must satisfy is_valid_title()
   * @return New table or InvalidArgument
   */
  static Result<LookupTable> build(
    int x_size, int y_size, const std::string & x_title, const std::string & y_title);

  /**
   * @brief Deep copy of this table
   */
  LookupTable copy() const { return *this; }

  std::size_t x_size() const { return x_coords_.size(); }
  std::size_t y_size() const { return y_coords_.size(); }
  const std::string & x_title() const { return x_title_; }
  const std::string & y_title() const { return y_title_; }

  Result<double> get(std::size_t x, std::size_t y) const;
  Result<void> set(std::size_t x, std::size_t y, double value);

  const std::vector<double> & get_x_coords() const { return x_coords_; }
  const std::vector<double> & get_y_coords() const { return y_coords_; }

  /**
   * @brief Replace the column coordinates
   * @param coords New coordinates, offset 0 = left, ascending
   * @return DimensionMismatch if the size differs from the number of columns
   */
  Result<void> set_x_coords(const std::vector<double> & coords);

  /**
   * @brief Replace the row coordinates
   * @param coords New coordinates, offset 0 = bottom, ascending
   * @return DimensionMismatch if the size differs from the number of rows
   */
  Result<void> set_y_coords(const std::vector<double> & coords);

  /**
   * @brief All values of the row at a y offset, left to right
   */
  Result<std::vector<double>> get_x_vals(std::size_t y) const;

  /**
   * @brief All values of the column at an x offset, bottom to top
   */
  Result<std::vector<double>> get_y_vals(std::size_t x) const;

  /**
   * @brief Offsets of the cells whose values differ from another table
   *
   * Only values are compared, coordinates and titles are ignored. Cells are
   * scanned column by column (x outer, y inner).
   *
   * @param other Table of the same dimensions
   * @param stop_early Return after the first difference
   * @return Differing cells (empty when equal) or DimensionMismatch
   */
  Result<std::vector<CellOffset>> diff(const LookupTable & other, bool stop_early = false) const;

  /**
   * @brief Whether any value differs from another table
   */
  Result<bool> differs(const LookupTable & other) const;

  Result<std::vector<std::size_t>> diff_x_coords(const LookupTable & other) const;
  Result<std::vector<std::size_t>> diff_y_coords(const LookupTable & other) const;

  /**
   * @brief Cells around the point nearest to (x_value, y_value)
   *
   * The nearest x and y offsets are searched independently, then every offset
   * within `range` of them (clamped to the table) is returned, x outer and
   * y inner, both ascending.
   *
   * @param x_value Value on the x axis, e.g. engine speed
   * @param y_value Value on the y axis, e.g. manifold pressure
   * @param range Offset distance around the nearest point (>= 0)
   * @return Cell offsets or InvalidArgument for a negative range
   */
  Result<std::vector<CellOffset>> lookup_points(double x_value, double y_value, int range) const;

  const std::optional<std::string> & last_path() const { return last_path_; }
  void set_last_path(const std::string & path) { last_path_ = path; }

private:
  LookupTable(
    std::string x_title, std::string y_title, std::vector<double> x_coords,
    std::vector<double> y_coords, Map values);

  std::string x_title_;
  std::string y_title_;
  std::vector<double> x_coords_;
  std::vector<double> y_coords_;
  Map values_;
  std::optional<std::string> last_path_;
};

/**
 * @brief Whether a string can be written as an axis title and read back
 *
 * A title is a single non-empty token with at least one word character
 * ([A-Za-z0-9_]) that is neither bracketed nor a number.
 */
bool is_valid_title(const std::string & title);

/**
 * @brief Offset of the coordinate nearest to a value
 *
 * Values outside the coordinate range clamp to the first or last offset. Between
 * two coordinates the closer one wins, a tie goes to the lower offset.
 *
 * @param coords Ascending coordinates, offset 0 is returned when empty
 * @param value Value to search for
 */
std::size_t nearest_offset(const std::vector<double> & coords, double value);

}  // namespace text_lut

#endif  // TEXT_LUT__LOOKUP_TABLE_HPP_
