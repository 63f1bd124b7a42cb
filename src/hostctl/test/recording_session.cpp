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

#include "hostctl/test/recording_session.hpp"
#include <stdexcept>

namespace hostctl::test
{

Json Recording_session::invoke(const std::string& command_name, const Json& params)
{
  using flow::util::Lock_guard;

  const auto n_in_progress = ++m_n_in_progress;
  auto max_so_far = m_max_concurrency.load();
  while ((n_in_progress > max_so_far) && (!m_max_concurrency.compare_exchange_weak(max_so_far, n_in_progress)))
  {
    // Retry with the updated max_so_far.
  }

  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    m_invocations.push_back({ command_name, params, flow::util::this_thread::get_id() });
  }

  Json result;
  try
  {
    const auto handler_it = m_handlers.find(command_name);
    result = (handler_it == m_handlers.end())
               ? Json{ { "command", command_name }, { "params", params } }
               : handler_it->second(params);
  }
  catch (...)
  {
    --m_n_in_progress;
    throw; // Let the serializer see it.
  }

  --m_n_in_progress;
  return result;
}

void Recording_session::on(const std::string& command_name, Handler_func&& handler)
{
  m_handlers[command_name] = std::move(handler);
}

void Recording_session::throw_on(const std::string& command_name, const std::string& message)
{
  on(command_name, [message](const Json&) -> Json
  {
    throw std::runtime_error(message);
  });
}

void Recording_session::delay_on(const std::string& command_name, util::Fine_duration duration)
{
  on(command_name, [command_name, duration](const Json& params) -> Json
  {
    flow::util::this_thread::sleep_for(duration);
    return Json{ { "command", command_name }, { "params", params } };
  });
}

std::vector<Recording_session::Invocation> Recording_session::invocations() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_invocations;
}

size_t Recording_session::count(const std::string& command_name) const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  if (command_name.empty())
  {
    return m_invocations.size();
  }
  // else
  size_t n = 0;
  for (const auto& invocation : m_invocations)
  {
    if (invocation.m_name == command_name)
    {
      ++n;
    }
  }
  return n;
}

Json Recording_session::last_params(const std::string& command_name) const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  for (auto it = m_invocations.rbegin(); it != m_invocations.rend(); ++it)
  {
    if (it->m_name == command_name)
    {
      return it->m_params;
    }
  }
  return Json();
}

unsigned int Recording_session::max_concurrency() const
{
  return m_max_concurrency;
}

} // namespace hostctl::test
