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

#ifndef PLOT_EXPORT_NODE_HPP_
#define PLOT_EXPORT_NODE_HPP_

#include "text_lut/error.hpp"

#include <rclcpp/rclcpp.hpp>

#include <string>

namespace text_lut
{

/**
 * @brief Parameters for the plot export tool
 */
struct PlotExportParameters
{
  std::string table_path;   //!< Table file to plot
  std::string plot_type;    //!< "R" or "R-fit"
  std::string output_path;  //!< Script file, standard output when empty

  static PlotExportParameters load_parameters(rclcpp::Node * node);
};

/**
 * @brief One-shot node that writes a plotting script for a table file
 */
class PlotExportNode : public rclcpp::Node
{
public:
  explicit PlotExportNode(const rclcpp::NodeOptions & node_options);

  Result<void> run();

private:
  PlotExportParameters parameters_;
};

}  // namespace text_lut

#endif  // PLOT_EXPORT_NODE_HPP_
