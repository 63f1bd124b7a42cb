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
#include "hostctl/dispatch/command_registry.hpp"
#include "hostctl/dispatch/command.hpp"
#include "hostctl/dispatch/session_api.hpp"
#include "hostctl/error.hpp"
#include <flow/error/error.hpp>

namespace hostctl::dispatch
{

Command_registry::Command_registry(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_DISPATCH),
  m_sealed(false)
{
  // That's it.
}

void Command_registry::register_command(util::String_view name, Safety_tier tier, Handler_func&& handler,
                                        Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { register_command(name, tier, std::move(handler), actual_err_code); },
         err_code, "Command_registry::register_command()"))
  {
    return;
  }
  // else
  assert(err_code);

  if (m_sealed)
  {
    FLOW_LOG_WARNING("Command_registry: Cannot register [" << name << "]: registry is sealed.");
    *err_code = error::Code::S_REGISTRY_SEALED;
    return;
  }
  // else
  if (name.empty() || (!handler))
  {
    FLOW_LOG_WARNING("Command_registry: Cannot register [" << name << "]: empty name or handler.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  std::string name_str(name);
  if (m_descriptors.find(name_str) != m_descriptors.end())
  {
    FLOW_LOG_WARNING("Command_registry: Cannot register [" << name << "]: name already registered.");
    *err_code = error::Code::S_REGISTRY_DUPLICATE_NAME;
    return;
  }
  // else

  FLOW_LOG_TRACE("Command_registry: Registered [" << name << "] with tier [" << tier << "].");
  Command_descriptor descriptor{name_str, std::move(handler), tier};
  m_descriptors.emplace(std::move(name_str), std::move(descriptor));
  err_code->clear();
} // Command_registry::register_command()

void Command_registry::register_command(util::String_view name, Safety_tier tier, Error_code* err_code)
{
  register_command(name, tier, forwarding_handler(), err_code);
}

void Command_registry::seal()
{
  if (!m_sealed.exchange(true))
  {
    size_t n_lossy = 0;
    for (const auto& name_and_descriptor : m_descriptors)
    {
      if (name_and_descriptor.second.m_safety_tier == Safety_tier::S_LOSSY_ELIGIBLE)
      {
        ++n_lossy;
      }
    }
    FLOW_LOG_INFO("Command_registry: Sealed with [" << m_descriptors.size() << "] commands, of which "
                  "[" << n_lossy << "] are lossy-eligible.");
  }
}

bool Command_registry::sealed() const
{
  return m_sealed;
}

const Command_descriptor* Command_registry::classify(util::String_view name) const
{
  /* boost::unordered_map with std::string key won't look up by string_view without a heterogeneous-lookup hasher;
   * the temporary is fine at this scale. */
  const auto it = m_descriptors.find(std::string(name));
  return (it == m_descriptors.end()) ? nullptr : &it->second;
}

size_t Command_registry::size() const
{
  return m_descriptors.size();
}

Handler_func Command_registry::forwarding_handler() // Static.
{
  return [](Session_api& session, const Command& command) -> Json
  {
    return session.invoke(command.m_name, command.m_params);
  };
}

} // namespace hostctl::dispatch
