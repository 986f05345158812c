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

#ifndef TEXT_LUT__SERIALIZER_HPP_
#define TEXT_LUT__SERIALIZER_HPP_

#include "text_lut/error.hpp"
#include "text_lut/lookup_table.hpp"

#include <string>
#include <vector>

namespace text_lut
{

/**
 * @brief Render a table to its aligned text form
 *
 * The output starts with a blank line, the x title centered over the body and
 * another blank line. The body has the bracketed x coordinates on top followed by
 * one line per row from the top row down to offset 0. Every column is left aligned
 * to its widest cell and columns are separated by two spaces. The y title sits on
 * the vertically centered body line.
 *
 * The result parses back to an equal table, the original spacing of parsed text
 * is not preserved.
 *
 * @param table Table to render
 * @return Text or LayoutError when the x title is wider than the body
 */
Result<std::string> render(const LookupTable & table);

/**
 * @brief Shortest text that reads back to the same number
 */
std::string format_number(double value);

/**
 * @brief Pad every cell with trailing spaces to the widest one
 */
std::vector<std::string> align_left(std::vector<std::string> cells);

}  // namespace text_lut

#endif  // TEXT_LUT__SERIALIZER_HPP_
