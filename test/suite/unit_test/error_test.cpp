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

#include "hostctl/error.hpp"
#include "hostctl/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace hostctl::error::test
{

using hostctl::test::to_underlying;

TEST(Error_code, Category_and_messages)
{
  for (auto val = S_CODE_LOWEST_INT_VALUE; val != to_underlying(Code::S_END_SENTINEL); ++val)
  {
    const Error_code err_code = Code(val);
    EXPECT_TRUE(err_code) << "value [" << val << "]";
    EXPECT_STREQ(err_code.category().name(), "hostctl");
    EXPECT_FALSE(err_code.message().empty()) << "value [" << val << "]";
  }
}

TEST(Error_code, Symbolic_io)
{
  std::ostringstream os;
  os << Code::S_SERIALIZER_QUEUE_FULL;
  EXPECT_EQ(os.str(), "SERIALIZER_QUEUE_FULL");

  Code parsed = Code::S_END_SENTINEL;
  std::istringstream is("handler_failed");
  is >> parsed;
  EXPECT_EQ(parsed, Code::S_HANDLER_FAILED);

  std::istringstream bad_is("NO_SUCH_CODE");
  bad_is >> parsed;
  EXPECT_EQ(parsed, Code::S_END_SENTINEL);
}

TEST(Error_code, Distinct_from_system_errors)
{
  const Error_code ours = Code::S_TIMEOUT;
  const Error_code theirs = boost::asio::error::timed_out;
  EXPECT_NE(ours, theirs);
  EXPECT_EQ(ours, Code::S_TIMEOUT);
}

TEST(Error_code, Runtime_error_carries_code)
{
  try
  {
    throw flow::error::Runtime_error(Code::S_REMOTE_ERROR_RESPONSE, "context");
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Code::S_REMOTE_ERROR_RESPONSE);
  }
}

} // namespace hostctl::error::test
