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

/// @file
#include "hostctl/transport/json_frame_scanner.hpp"

namespace hostctl::transport
{

Json_frame_scanner::Json_frame_scanner()
{
  reset();
}

void Json_frame_scanner::reset()
{
  m_pos = 0;
  m_depth = 0;
  m_in_string = false;
  m_escape = false;
  m_started = false;
}

bool Json_frame_scanner::started() const
{
  return m_started;
}

Json_frame_scanner::Result Json_frame_scanner::scan(const char* data, size_t size, size_t* frame_end)
{
  assert(size >= m_pos);

  for (; m_pos != size; ++m_pos)
  {
    const char c = data[m_pos];

    if (!m_started)
    {
      if ((c == ' ') || (c == '\t') || (c == '\r') || (c == '\n'))
      {
        continue;
      }
      // else
      if (c != '{')
      {
        return Result::S_MALFORMED;
      }
      // else
      m_started = true;
      m_depth = 1;
      continue;
    }
    // else

    if (m_in_string)
    {
      if (m_escape)
      {
        m_escape = false;
      }
      else if (c == '\\')
      {
        m_escape = true;
      }
      else if (c == '"')
      {
        m_in_string = false;
      }
      continue;
    }
    // else

    switch (c)
    {
    case '"':
      m_in_string = true;
      break;
    case '{':
    case '[':
      ++m_depth;
      break;
    case '}':
    case ']':
      if (--m_depth == 0)
      {
        *frame_end = ++m_pos;
        return Result::S_COMPLETE;
      }
      break;
    default:
      break;
    }
  } // for (; m_pos != size; ++m_pos)

  return Result::S_NEED_MORE;
} // Json_frame_scanner::scan()

} // namespace hostctl::transport
