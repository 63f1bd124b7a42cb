/* Hostctl: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "hostctl/transport/json_frame_scanner.hpp"
#include <gtest/gtest.h>
#include <string>

namespace hostctl::transport::test
{

using Result = Json_frame_scanner::Result;

TEST(Json_frame_scanner, Finds_end_of_one_object)
{
  Json_frame_scanner scanner;
  const std::string data = R"({"type": "a", "params": {"x": [1, {"y": 2}]}})";
  size_t frame_end = 0;
  EXPECT_EQ(scanner.scan(data.data(), data.size(), &frame_end), Result::S_COMPLETE);
  EXPECT_EQ(frame_end, data.size());
}

TEST(Json_frame_scanner, Incremental_across_reads)
{
  Json_frame_scanner scanner;
  const std::string data = R"(  {"type": "a", "params": {"s": "x"}})";
  size_t frame_end = 0;
  for (size_t size = 0; size < data.size(); ++size)
  {
    ASSERT_EQ(scanner.scan(data.data(), size, &frame_end), Result::S_NEED_MORE) << "size [" << size << "]";
  }
  EXPECT_EQ(scanner.scan(data.data(), data.size(), &frame_end), Result::S_COMPLETE);
  EXPECT_EQ(frame_end, data.size());
  EXPECT_TRUE(scanner.started());
}

TEST(Json_frame_scanner, Braces_inside_strings_do_not_count)
{
  Json_frame_scanner scanner;
  const std::string data = R"({"s": "}}{{\"}"} trailing)";
  size_t frame_end = 0;
  EXPECT_EQ(scanner.scan(data.data(), data.size(), &frame_end), Result::S_COMPLETE);
  EXPECT_EQ(data.substr(0, frame_end), R"({"s": "}}{{\"}"})");
}

TEST(Json_frame_scanner, Escaped_backslash_before_quote)
{
  Json_frame_scanner scanner;
  const std::string data = R"({"s": "a\\"}{)";
  size_t frame_end = 0;
  EXPECT_EQ(scanner.scan(data.data(), data.size(), &frame_end), Result::S_COMPLETE);
  EXPECT_EQ(data.substr(0, frame_end), R"({"s": "a\\"})");
}

TEST(Json_frame_scanner, Back_to_back_frames)
{
  Json_frame_scanner scanner;
  std::string data = "{\"a\": 1}\n{\"b\": 2}";
  size_t frame_end = 0;
  ASSERT_EQ(scanner.scan(data.data(), data.size(), &frame_end), Result::S_COMPLETE);
  EXPECT_EQ(data.substr(0, frame_end), "{\"a\": 1}");

  data.erase(0, frame_end);
  scanner.reset();
  EXPECT_FALSE(scanner.started());
  ASSERT_EQ(scanner.scan(data.data(), data.size(), &frame_end), Result::S_COMPLETE);
  EXPECT_EQ(data.substr(0, frame_end), "\n{\"b\": 2}");
}

TEST(Json_frame_scanner, Non_object_start_is_malformed)
{
  size_t frame_end = 0;
  for (const std::string data : { "not json", "[1, 2]", "  42", "\"str\"" })
  {
    Json_frame_scanner scanner;
    EXPECT_EQ(scanner.scan(data.data(), data.size(), &frame_end), Result::S_MALFORMED) << "[" << data << "]";
  }
}

TEST(Json_frame_scanner, Whitespace_only_needs_more)
{
  Json_frame_scanner scanner;
  const std::string data = " \r\n\t ";
  size_t frame_end = 0;
  EXPECT_EQ(scanner.scan(data.data(), data.size(), &frame_end), Result::S_NEED_MORE);
  EXPECT_FALSE(scanner.started());
}

} // namespace hostctl::transport::test
