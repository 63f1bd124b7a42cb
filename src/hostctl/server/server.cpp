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
#include "hostctl/server/server.hpp"
#include "hostctl/dispatch/command_registry.hpp"
#include "hostctl/error.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <ostream>

namespace hostctl::server
{

Server::Server(flow::log::Logger* logger_ptr, dispatch::Session_api* session, dispatch::Command_registry* registry,
               const Server_config& config, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_SERVER),
  m_config(config)
{
  using flow::error::Runtime_error;
  using dispatch::Execution_serializer;
  using transport::Reliable_listener;
  using transport::Lossy_listener;
  using boost::movelib::make_unique;

  assert(session && registry);

  FLOW_LOG_INFO("Server [" << *this << "]: Starting with config [" << m_config << "].");

  Error_code our_err_code;
  const auto address = boost::asio::ip::make_address(m_config.m_host, our_err_code);
  if (our_err_code)
  {
    FLOW_LOG_WARNING("Server [" << *this << "]: Host [" << m_config.m_host << "] is not an IP address.");
    our_err_code = error::Code::S_INVALID_ARGUMENT;
  }
  else if (m_config.m_queue_capacity == 0)
  {
    FLOW_LOG_WARNING("Server [" << *this << "]: Queue capacity must be positive.");
    our_err_code = error::Code::S_INVALID_ARGUMENT;
  }
  else
  {
    registry->seal(); // Nothing may register from now on; listeners read it without locking.

    m_serializer = make_unique<Execution_serializer>(get_logger(), session, m_config.m_queue_capacity,
                                                     m_config.m_serializer_mode);
    m_reliable_listener
      = make_unique<Reliable_listener>(get_logger(), util::Tcp_endpoint(address, m_config.m_reliable_port),
                                       *registry, m_serializer.get(), m_config.m_reliable, &our_err_code);
    if (!our_err_code)
    {
      m_lossy_listener
        = make_unique<Lossy_listener>(get_logger(), util::Udp_endpoint(address, m_config.m_lossy_port),
                                      *registry, m_serializer.get(), m_config.m_max_datagram_size, &our_err_code);
    }
  }

  if (our_err_code)
  {
    FLOW_LOG_WARNING("Server [" << *this << "]: Startup failed ([" << our_err_code << "] "
                     "[" << our_err_code.message() << "]); tearing down whatever had started.");
    m_lossy_listener.reset();
    m_reliable_listener.reset();
    m_serializer.reset();

    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  FLOW_LOG_INFO("Server [" << *this << "]: Up.  Reliable endpoint [" << reliable_endpoint() << "]; lossy endpoint "
                "[" << lossy_endpoint() << "]; serializer [" << *m_serializer << "].");
  if (err_code)
  {
    err_code->clear();
  }
} // Server::Server()

Server::~Server()
{
  FLOW_LOG_INFO("Server [" << *this << "]: Shutting down.");

  // Producers first; so nothing is submitted to a stopping serializer except by a listener already gone.
  m_lossy_listener.reset();
  m_reliable_listener.reset();
  m_serializer.reset();

  FLOW_LOG_INFO("Server [" << *this << "]: Down.");
}

const util::Tcp_endpoint& Server::reliable_endpoint() const
{
  assert(m_reliable_listener);
  return m_reliable_listener->local_endpoint();
}

const util::Udp_endpoint& Server::lossy_endpoint() const
{
  assert(m_lossy_listener);
  return m_lossy_listener->local_endpoint();
}

dispatch::Execution_serializer& Server::serializer()
{
  assert(m_serializer);
  return *m_serializer;
}

transport::Lossy_listener_stats Server::lossy_stats() const
{
  assert(m_lossy_listener);
  return m_lossy_listener->stats();
}

size_t Server::reliable_connection_count() const
{
  assert(m_reliable_listener);
  return m_reliable_listener->connection_count();
}

const Server_config& Server::config() const
{
  return m_config;
}

std::ostream& operator<<(std::ostream& os, const Server& val)
{
  return os << val.config().m_host << ':' << val.config().m_reliable_port << '/' << val.config().m_lossy_port
            << '@' << static_cast<const void*>(&val);
}

} // namespace hostctl::server
