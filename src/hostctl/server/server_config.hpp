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

#include "hostctl/server/server_fwd.hpp"
#include "hostctl/transport/lossy_listener.hpp"
#include <flow/log/log.hpp>
#include <iosfwd>
#include <string>

namespace hostctl::server
{

// Types.

/**
 * Everything needed to construct a Server.  Defaults are the production values; a default-constructed
 * Server_config is a working configuration.
 */
struct Server_config
{
  // Data.

  /// Address on which both listeners bind.
  std::string m_host = "127.0.0.1";

  /// Reliable (TCP) port; 0 picks an ephemeral port.
  uint16_t m_reliable_port = 9877;

  /// Lossy (UDP) port; 0 picks an ephemeral port.
  uint16_t m_lossy_port = 9878;

  /// Reliable listener knobs (buffering and timeouts).
  transport::Reliable_listener_config m_reliable;

  /// Lossy listener receive buffer size.
  size_t m_max_datagram_size = transport::Lossy_listener::S_DEFAULT_MAX_DATAGRAM_SIZE;

  /// Max pending commands in the serializer; see dispatch::Execution_serializer.
  size_t m_queue_capacity = 4096;

  /// Who drains the serializer.
  dispatch::Serializer_mode m_serializer_mode = dispatch::Serializer_mode::S_OWN_THREAD;

  /// Verbosity for the executable's logger.  Not used by Server itself (it is given a ready Logger).
  flow::log::Sev m_log_severity = flow::log::Sev::S_INFO;
}; // struct Server_config

// Free functions.

/**
 * Fills `*config` from command-line arguments, leaving unmentioned members as they were.
 *
 * Recognized: `--host --reliable-port --lossy-port --queue-capacity --max-message-size --read-timeout-ms
 * --idle-timeout-ms --write-timeout-ms --completion-timeout-ms --host-driven --log-level --help`.
 * With `--help`, the option descriptions are written to `*os`, `*config` is untouched, and `true` is returned.
 *
 * #Error_code generated: error::Code::S_INVALID_ARGUMENT (unknown option, unparseable value, out-of-range value);
 * a description is written to `*os`, and (if throwing) is also the exception's context.
 *
 * @param argc
 *        As given to `main()`.
 * @param argv
 *        As given to `main()`.
 * @param config
 *        Target.
 * @param os
 *        Where help and problems are written.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.
 * @return `true` if help was requested (caller should exit); else `false`.
 */
bool parse_server_config(int argc, const char* const* argv, Server_config* config, std::ostream* os,
                         Error_code* err_code = 0);

} // namespace hostctl::server
