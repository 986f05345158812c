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

#include "plane_table_node.hpp"

#include "text_lut/table_file.hpp"

#include <string>

namespace text_lut
{

PlaneTableParameters PlaneTableParameters::load_parameters(rclcpp::Node * node)
{
  PlaneTableParameters parameters;
  parameters.table_path = node->declare_parameter<std::string>("table_path");
  parameters.plane.a = node->declare_parameter<double>("a");
  parameters.plane.b = node->declare_parameter<double>("b");
  parameters.plane.c = node->declare_parameter<double>("c");
  parameters.round_digits = node->declare_parameter<int>("round_digits", 2);
  return parameters;
}

PlaneTableNode::PlaneTableNode(const rclcpp::NodeOptions & node_options)
: Node("plane_table", node_options), parameters_(PlaneTableParameters::load_parameters(this))
{
}

Result<void> PlaneTableNode::run()
{
  RCLCPP_INFO(
    get_logger(), "Plane z = %.3f * y + %.3f * x + %.3f on %s", parameters_.plane.a,
    parameters_.plane.b, parameters_.plane.c, parameters_.table_path.c_str());

  auto table = load_file(parameters_.table_path);
  if (!table) {
    RCLCPP_ERROR(get_logger(), "Unable to load table: %s", table.error().what().c_str());
    return tl::make_unexpected(table.error());
  }

  if (const auto filled = fill_plane(*table, parameters_.plane, parameters_.round_digits);
      !filled) {
    RCLCPP_ERROR(get_logger(), "Unable to fill table: %s", filled.error().what().c_str());
    return filled;
  }

  if (const auto saved = save_file(*table); !saved) {
    RCLCPP_ERROR(get_logger(), "Unable to save table: %s", saved.error().what().c_str());
    return saved;
  }

  RCLCPP_INFO(
    get_logger(), "Wrote %zu x %zu table to %s", table->x_size(), table->y_size(),
    parameters_.table_path.c_str());
  return {};
}

}  // namespace text_lut
