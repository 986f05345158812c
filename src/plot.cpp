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

#include "text_lut/plot.hpp"

#include "text_lut/serializer.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

namespace text_lut
{

namespace
{
std::string join(const std::vector<double> & values)
{
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += format_number(values[i]);
  }
  return out;
}

std::string header(const char * description)
{
  return fmt::format(
    "\n"
    "#\n"
    "# {}\n"
    "# Generated by text_lut render_plot().\n"
    "#\n"
    "# start up R and then load this file by typing:\n"
    "# source(<this file name>)\n"
    "#\n"
    "\n",
    description);
}

std::string r_surface(const LookupTable & table, const std::vector<double> & z)
{
  std::string str = header("3D surface of the look up table, requires the rgl library.");
  str += "library(rgl);\n\n";
  str += fmt::format("x <- c({});\n", join(table.get_x_coords()));
  str += fmt::format("y <- c({});\n", join(table.get_y_coords()));
  str += fmt::format("z <- c({});\n", join(z));
  str += fmt::format("dim(z) <- c({}, {})\n", table.x_size(), table.y_size());
  str += "\n";
  str += "open3d()\n";
  str += "bg3d(\"white\")\n";
  str += "material3d(\"black\")\n";
  str += "\n";
  str += fmt::format(
    "persp3d(x, y, z, col=\"lightblue\", xlab=\"{}\", ylab=\"{}\", zlab=\"value\")\n",
    table.x_title(), table.y_title());
  return str;
}

std::string r_linear_fit(const LookupTable & table, const std::vector<double> & z)
{
  std::vector<double> xs;
  std::vector<double> ys;
  xs.reserve(z.size());
  ys.reserve(z.size());
  for (const double y : table.get_y_coords()) {
    for (const double x : table.get_x_coords()) {
      xs.push_back(x);
      ys.push_back(y);
    }
  }

  std::string str = header(
    "Least squares plane fit of the look up table, requires the scatterplot3d library.");
  str += "library(scatterplot3d);\n\n";
  str += fmt::format("# table dimensions: {} x {}\n", table.x_size(), table.y_size());
  str += fmt::format("n_x <- {}\n", table.x_size());
  str += fmt::format("n_y <- {}\n", table.y_size());
  str += fmt::format("x <- c({});\n", join(xs));
  str += fmt::format("y <- c({});\n", join(ys));
  str += fmt::format("z <- c({});\n", join(z));
  str += "\n";
  str += "fit <- lm(z ~ x + y)\n";
  str += "print(summary(fit))\n";
  str += "\n";
  str += fmt::format(
    "s3d <- scatterplot3d(x, y, z, type=\"h\", highlight.3d=TRUE, angle=55, "
    "xlab=\"{}\", ylab=\"{}\", zlab=\"value\", main=\"{} x {} look up table\")\n",
    table.x_title(), table.y_title(), table.x_size(), table.y_size());
  str += "s3d$plane3d(fit)\n";
  return str;
}
}  // namespace

Result<PlotFormat> parse_plot_format(const std::string & name)
{
  if (name == "R") {
    return PlotFormat::RSurface;
  }
  if (name == "R-fit") {
    return PlotFormat::RLinearFit;
  }
  return make_error(
    ErrorKind::InvalidArgument,
    fmt::format("unknown plot type '{}' (available types: R, R-fit)", name));
}

Result<std::string> render_plot(const LookupTable & table, const PlotFormat format)
{
  // grid order, x varies fastest
  std::vector<double> z;
  z.reserve(table.x_size() * table.y_size());
  for (std::size_t y = 0; y < table.y_size(); ++y) {
    const auto row = table.get_x_vals(y);
    if (!row) {
      return tl::make_unexpected(row.error());
    }
    z.insert(z.end(), row->begin(), row->end());
  }

  switch (format) {
    case PlotFormat::RSurface:
      return r_surface(table, z);
    case PlotFormat::RLinearFit:
      return r_linear_fit(table, z);
  }
  return make_error(ErrorKind::InvalidArgument, "unsupported plot format");
}

}  // namespace text_lut
