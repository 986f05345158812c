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

#include "text_lut/error.hpp"

#include <fmt/format.h>

#include <string>

namespace text_lut
{

const char * to_string(const ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::FormatError:
      return "FormatError";
    case ErrorKind::LayoutError:
      return "LayoutError";
    case ErrorKind::OutOfRange:
      return "OutOfRange";
    case ErrorKind::DimensionMismatch:
      return "DimensionMismatch";
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::NoFileSpecified:
      return "NoFileSpecified";
    case ErrorKind::IoError:
      return "IoError";
  }
  return "UnknownError";
}

std::string Error::what() const
{
  if (line) {
    return fmt::format("{}: {} (line {})", to_string(kind), message, *line);
  }
  return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace text_lut
