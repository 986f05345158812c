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

#ifndef TEXT_LUT__PLOT_HPP_
#define TEXT_LUT__PLOT_HPP_

#include "text_lut/error.hpp"
#include "text_lut/lookup_table.hpp"

#include <string>

namespace text_lut
{

enum class PlotFormat {
  RSurface,    //!< rgl persp3d surface, "R"
  RLinearFit,  //!< least squares plane over a scatterplot3d scatter, "R-fit"
};

/**
 * @brief Resolve a plot type name
 * @param name "R" or "R-fit"
 * @return Format or InvalidArgument
 */
Result<PlotFormat> parse_plot_format(const std::string & name);

/**
 * @brief Render an R script that plots the table
 *
 * Values are flattened in grid order, x offset varying fastest, which matches
 * the column major layout R uses for `dim(z) <- c(n_x, n_y)`. The table titles
 * become the axis labels. Source the output from an R session to show the plot.
 *
 * @param table Table to plot
 * @param format Script flavor
 * @return Script text
 */
Result<std::string> render_plot(const LookupTable & table, PlotFormat format);

}  // namespace text_lut

#endif  // TEXT_LUT__PLOT_HPP_
