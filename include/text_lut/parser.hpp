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

#ifndef TEXT_LUT__PARSER_HPP_
#define TEXT_LUT__PARSER_HPP_

#include "text_lut/error.hpp"
#include "text_lut/lookup_table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace text_lut
{

/**
 * @brief Parse the text form of a look up table
 *
 * The expected layout is
 * @code
 *                      rpm
 *
 *            [1000]   [1500]  [2000]  [2500]
 *     [100]  14.0     15.5    16.4    17.9
 * map  [90]   13.0     14.5    15.3    16.8
 *     [80]   12.0     13.5    14.2    15.7
 * @endcode
 *
 * Lines are split on whitespace and classified by their token count: one token is
 * the x title, the first longer line holds the bracketed x coordinates (N of them),
 * N + 1 tokens form a data row and N + 2 tokens a data row led by the y title.
 * Spacing and blank lines are free. Rows are stored bottom first.
 *
 * @param text Table text
 * @return Parsed table or FormatError carrying the offending line number
 */
Result<LookupTable> parse(const std::string & text);

/**
 * @brief Split a line into tokens containing at least one word character
 */
std::vector<std::string> tokenize(const std::string & line);

/**
 * @brief Convert a whole token to a number
 * @return Value or std::nullopt when the token is not entirely numeric
 */
std::optional<double> parse_number(const std::string & token);

/**
 * @brief Convert a `[number]` coordinate token to a number
 * @return Value or std::nullopt when brackets are missing or the content is not numeric
 */
std::optional<double> parse_coordinate(const std::string & token);

}  // namespace text_lut

#endif  // TEXT_LUT__PARSER_HPP_
