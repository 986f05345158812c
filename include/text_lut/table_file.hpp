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

#ifndef TEXT_LUT__TABLE_FILE_HPP_
#define TEXT_LUT__TABLE_FILE_HPP_

#include "text_lut/error.hpp"
#include "text_lut/lookup_table.hpp"

#include <optional>
#include <string>

namespace text_lut
{

/**
 * @brief Read and parse a table file
 *
 * The path is remembered in the table so save_file() can be called without one.
 *
 * @param path Table file
 * @return Table, NotFound for a missing file, IoError or FormatError
 */
Result<LookupTable> load_file(const std::string & path);

/**
 * @brief Render a table and write it to a file
 * @param table Table to save, its last path is updated on success
 * @param path Target file, the last loaded/saved path is used when omitted or blank
 * @return NoFileSpecified when no path is known, LayoutError or IoError
 */
Result<void> save_file(LookupTable & table, const std::optional<std::string> & path = std::nullopt);

}  // namespace text_lut

#endif  // TEXT_LUT__TABLE_FILE_HPP_
