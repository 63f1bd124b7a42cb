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
#pragma once

#include "hostctl/server/server_config.hpp"
#include "hostctl/dispatch/execution_serializer.hpp"
#include "hostctl/transport/reliable_listener.hpp"
#include "hostctl/transport/lossy_listener.hpp"
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>

namespace hostctl::server
{

/**
 * The whole dispatch core in one object: owns a dispatch::Execution_serializer plus a transport::Reliable_listener
 * and a transport::Lossy_listener feeding it, all configured from one Server_config.
 *
 * Construction seals the registry, starts the serializer, then binds both listeners; upon successful return both
 * endpoints are live.  Destruction goes in reverse: listeners first (no more submissions), then the serializer
 * (pending commands get a shutting-down error).
 *
 * In dispatch::Serializer_mode::S_HOST_DRIVEN nothing executes until the host calls
 * `serializer().run_pending()` from its one permitted context.
 */
class Server :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Starts everything.
   *
   * #Error_code generated: error::Code::S_INVALID_ARGUMENT (`config.m_host` not an IP address, or zero queue
   * capacity); any from binding either listener.  On error nothing is left running.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param session
   *        The host; must outlive `*this`.
   * @param registry
   *        Command table; sealed by this ctor; must outlive `*this`.
   * @param config
   *        Knobs.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   */
  explicit Server(flow::log::Logger* logger_ptr, dispatch::Session_api* session,
                  dispatch::Command_registry* registry, const Server_config& config, Error_code* err_code = 0);

  /// Stops the listeners, then the serializer; joins all threads.
  ~Server();

  // Methods.

  /**
   * Bound reliable endpoint (actual port if 0 was configured).  Behavior undefined if ctor failed.
   * @return See above.
   */
  const util::Tcp_endpoint& reliable_endpoint() const;

  /**
   * Bound lossy endpoint (actual port if 0 was configured).  Behavior undefined if ctor failed.
   * @return See above.
   */
  const util::Udp_endpoint& lossy_endpoint() const;

  /**
   * The serializer; e.g., for `run_pending()` in host-driven mode.  Behavior undefined if ctor failed.
   * @return See above.
   */
  dispatch::Execution_serializer& serializer();

  /**
   * The lossy listener's counters.  Behavior undefined if ctor failed.
   * @return See above.
   */
  transport::Lossy_listener_stats lossy_stats() const;

  /**
   * Open reliable connections.  Behavior undefined if ctor failed.
   * @return See above.
   */
  size_t reliable_connection_count() const;

  /**
   * Config given to ctor.
   * @return See above.
   */
  const Server_config& config() const;

private:
  // Data.

  /// See config().
  const Server_config m_config;

  /// The serializer.  Declared ahead of the listeners, which submit to it.
  boost::movelib::unique_ptr<dispatch::Execution_serializer> m_serializer;

  /// The reliable listener.
  boost::movelib::unique_ptr<transport::Reliable_listener> m_reliable_listener;

  /// The lossy listener.
  boost::movelib::unique_ptr<transport::Lossy_listener> m_lossy_listener;
}; // class Server

} // namespace hostctl::server
