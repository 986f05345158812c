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

#ifndef TEXT_LUT__ERROR_HPP_
#define TEXT_LUT__ERROR_HPP_

#include "tl_expected/expected.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace text_lut
{

/**
 * @brief Failure categories reported by table operations
 */
enum class ErrorKind {
  FormatError,        //!< Malformed table text
  LayoutError,        //!< Table cannot be rendered (title wider than body)
  OutOfRange,         //!< Offset beyond the table dimension
  DimensionMismatch,  //!< Coordinate list or table sizes do not agree
  InvalidArgument,    //!< Bad construction or query parameter
  NotFound,           //!< Table file does not exist
  NoFileSpecified,    //!< Save requested without any known path
  IoError,            //!< File could not be opened, read or written
};

/**
 * @brief Reason an operation failed
 */
struct Error
{
  ErrorKind kind;
  std::string message;
  std::optional<std::size_t> line;  //!< 1-based source line for FormatError

  std::string what() const;
};

template <typename T>
using Result = tl::expected<T, Error>;

const char * to_string(ErrorKind kind);

inline tl::unexpected<Error> make_error(ErrorKind kind, std::string message)
{
  return tl::make_unexpected(Error{kind, std::move(message), std::nullopt});
}

inline tl::unexpected<Error> make_format_error(std::size_t line, std::string message)
{
  return tl::make_unexpected(Error{ErrorKind::FormatError, std::move(message), line});
}

}  // namespace text_lut

#endif  // TEXT_LUT__ERROR_HPP_
