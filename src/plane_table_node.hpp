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

#ifndef PLANE_TABLE_NODE_HPP_
#define PLANE_TABLE_NODE_HPP_

#include "text_lut/error.hpp"
#include "text_lut/plane_fill.hpp"

#include <rclcpp/rclcpp.hpp>

#include <string>

namespace text_lut
{

/**
 * @brief Parameters for the plane table tool
 */
struct PlaneTableParameters
{
  std::string table_path;   //!< Table file, rewritten in place
  PlaneCoefficients plane;  //!< z = a * y + b * x + c
  int round_digits{};       //!< Digits kept after the decimal point

  static PlaneTableParameters load_parameters(rclcpp::Node * node);
};

/**
 * @brief One-shot node that replaces the values of a table file with a plane
 */
class PlaneTableNode : public rclcpp::Node
{
public:
  explicit PlaneTableNode(const rclcpp::NodeOptions & node_options);

  /**
   * @brief Load the table, fill it and save it back to the same file
   */
  Result<void> run();

private:
  PlaneTableParameters parameters_;
};

}  // namespace text_lut

#endif  // PLANE_TABLE_NODE_HPP_
