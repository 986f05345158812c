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

#include "plot_export_node.hpp"

#include "text_lut/plot.hpp"
#include "text_lut/table_file.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iostream>
#include <string>

namespace text_lut
{

PlotExportParameters PlotExportParameters::load_parameters(rclcpp::Node * node)
{
  PlotExportParameters parameters;
  parameters.table_path = node->declare_parameter<std::string>("table_path");
  parameters.plot_type = node->declare_parameter<std::string>("plot_type", "R");
  parameters.output_path = node->declare_parameter<std::string>("output_path", "");
  return parameters;
}

PlotExportNode::PlotExportNode(const rclcpp::NodeOptions & node_options)
: Node("lut_as_plot", node_options), parameters_(PlotExportParameters::load_parameters(this))
{
}

Result<void> PlotExportNode::run()
{
  const auto format = parse_plot_format(parameters_.plot_type);
  if (!format) {
    RCLCPP_ERROR(get_logger(), "%s", format.error().what().c_str());
    return tl::make_unexpected(format.error());
  }

  const auto table = load_file(parameters_.table_path);
  if (!table) {
    RCLCPP_ERROR(get_logger(), "Unable to load table: %s", table.error().what().c_str());
    return tl::make_unexpected(table.error());
  }

  const auto script = render_plot(*table, *format);
  if (!script) {
    RCLCPP_ERROR(get_logger(), "Unable to render plot: %s", script.error().what().c_str());
    return tl::make_unexpected(script.error());
  }

  if (parameters_.output_path.empty()) {
    std::cout << *script;
    return {};
  }

  std::ofstream ofs(parameters_.output_path);
  if (!ofs.is_open()) {
    RCLCPP_ERROR(get_logger(), "Failed to open plot file : %s", parameters_.output_path.c_str());
    return make_error(
      ErrorKind::IoError, fmt::format("unable to open file '{}'", parameters_.output_path));
  }
  ofs << *script;
  ofs.close();
  if (ofs.fail()) {
    RCLCPP_ERROR(get_logger(), "Failed to write plot file : %s", parameters_.output_path.c_str());
    return make_error(
      ErrorKind::IoError, fmt::format("unable to write file '{}'", parameters_.output_path));
  }
  RCLCPP_INFO(
    get_logger(), "Wrote %s plot of %s to %s", parameters_.plot_type.c_str(),
    parameters_.table_path.c_str(), parameters_.output_path.c_str());
  return {};
}

}  // namespace text_lut
