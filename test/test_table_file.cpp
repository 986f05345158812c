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

#include "text_lut/table_file.hpp"

#include "text_lut/serializer.hpp"

#include <rclcpp/rclcpp.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

/**
 * @file test_table_file.cpp
 * @brief Unit tests for loading and saving table files
 *
 * - load success, missing file and invalid content
 * - save to an explicit path and to the remembered path
 * - NoFileSpecified when no path is known
 *
 * @note Tests create temporary table files in /tmp and clean them up automatically
 */

namespace text_lut
{

class TableFileTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    rclcpp::init(0, nullptr);
    test_table_path_ = "/tmp/test_text_lut_table.tbl";
    test_output_path_ = "/tmp/test_text_lut_output.tbl";
    createTestTable();
  }

  void TearDown() override
  {
    std::remove(test_table_path_.c_str());
    std::remove(test_output_path_.c_str());
    rclcpp::shutdown();
  }

  void createTestTable()
  {
    std::ofstream file(test_table_path_);
    file << "\n";
    file << "                        rpm\n";
    file << "\n";
    file << "              [1000]   [1500]  [2000]  [2500]\n";
    file << "       [100]  14.0     15.5    16.4    17.9\n";
    file << "  map  [90]   13.0     14.5    15.3    16.8\n";
    file << "       [80]   12.0     13.5    14.2    15.7\n";
    file.close();
  }

  static std::string readFile(const std::string & path)
  {
    std::ifstream ifs(path);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
  }

  std::string test_table_path_;
  std::string test_output_path_;
};

TEST_F(TableFileTest, LoadFileSuccess)
{
  const auto table = load_file(test_table_path_);
  ASSERT_TRUE(table.has_value()) << table.error().what();

  EXPECT_EQ(table->x_size(), 4U);
  EXPECT_EQ(table->y_size(), 3U);
  EXPECT_DOUBLE_EQ(table->get(3, 2).value(), 17.9);
  ASSERT_TRUE(table->last_path().has_value());
  EXPECT_EQ(*table->last_path(), test_table_path_);
}

TEST_F(TableFileTest, LoadFileNotFound)
{
  const auto table = load_file("/nonexistent/file.tbl");
  ASSERT_FALSE(table.has_value());
  EXPECT_EQ(table.error().kind, ErrorKind::NotFound);
}

TEST_F(TableFileTest, LoadFileDirectory)
{
  const auto table = load_file(std::filesystem::temp_directory_path().string());
  ASSERT_FALSE(table.has_value());
  EXPECT_EQ(table.error().kind, ErrorKind::IoError);
}

TEST_F(TableFileTest, LoadFileInvalidContent)
{
  {
    std::ofstream file(test_table_path_);
    file << "rpm\n[1000] [1500]\n[100] 14.0\n";
  }

  const auto table = load_file(test_table_path_);
  ASSERT_FALSE(table.has_value());
  EXPECT_EQ(table.error().kind, ErrorKind::FormatError);
  EXPECT_EQ(table.error().line, 3U);
}

TEST_F(TableFileTest, SaveToRememberedPath)
{
  auto table = load_file(test_table_path_);
  ASSERT_TRUE(table.has_value());
  ASSERT_TRUE(table->set(0, 0, 11.5).has_value());

  ASSERT_TRUE(save_file(*table).has_value());

  const std::string saved = readFile(test_table_path_);
  EXPECT_EQ(saved, render(*table).value());

  const auto reloaded = load_file(test_table_path_);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_DOUBLE_EQ(reloaded->get(0, 0).value(), 11.5);
  EXPECT_FALSE(reloaded->differs(*table).value());
}

TEST_F(TableFileTest, SaveToExplicitPathUpdatesRememberedPath)
{
  auto table = load_file(test_table_path_);
  ASSERT_TRUE(table.has_value());

  ASSERT_TRUE(save_file(*table, test_output_path_).has_value());
  EXPECT_TRUE(std::filesystem::exists(test_output_path_));
  EXPECT_EQ(*table->last_path(), test_output_path_);

  // later saves without a path go to the new file
  ASSERT_TRUE(table->set(1, 1, 0.0).has_value());
  ASSERT_TRUE(save_file(*table).has_value());
  const auto reloaded = load_file(test_output_path_);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_DOUBLE_EQ(reloaded->get(1, 1).value(), 0.0);

  const auto original = load_file(test_table_path_);
  ASSERT_TRUE(original.has_value());
  EXPECT_DOUBLE_EQ(original->get(1, 1).value(), 14.5);
}

TEST_F(TableFileTest, SaveWithoutPath)
{
  auto table = LookupTable::build(2, 2, "rpm", "map");
  ASSERT_TRUE(table.has_value());

  const auto no_path = save_file(*table);
  ASSERT_FALSE(no_path.has_value());
  EXPECT_EQ(no_path.error().kind, ErrorKind::NoFileSpecified);

  const auto blank_path = save_file(*table, std::string("   "));
  ASSERT_FALSE(blank_path.has_value());
  EXPECT_EQ(blank_path.error().kind, ErrorKind::NoFileSpecified);
  EXPECT_FALSE(table->last_path().has_value());
}

TEST_F(TableFileTest, SaveUnwritablePath)
{
  auto table = LookupTable::build(2, 2, "rpm", "map");
  ASSERT_TRUE(table.has_value());

  const auto result = save_file(*table, std::string("/nonexistent/dir/table.tbl"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::IoError);
  EXPECT_FALSE(table->last_path().has_value());
}

TEST_F(TableFileTest, SaveLayoutError)
{
  auto table = LookupTable::build(1, 1, "a_title_much_wider_than_the_table", "y");
  ASSERT_TRUE(table.has_value());

  const auto result = save_file(*table, test_output_path_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::LayoutError);
  EXPECT_FALSE(std::filesystem::exists(test_output_path_));
}

}  // namespace text_lut
