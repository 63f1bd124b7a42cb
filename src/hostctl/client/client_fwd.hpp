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

#include "hostctl/dispatch/dispatch_fwd.hpp"
#include <string>

/**
 * hostctl module for the consumer side: one reusable reliable connection with synchronous calls plus a lazily
 * created lossy sender for fire-and-forget casts.  See Client_connection.
 */
namespace hostctl::client
{

// Types.

// Find doc headers near the bodies of these compound types.

class Client_connection;

/**
 * Client_connection knobs.  Defaults match the server's defaults.
 */
struct Client_config
{
  // Data.

  /// Server host name or address.
  std::string m_host = "127.0.0.1";

  /// Server reliable (TCP) port.
  uint16_t m_reliable_port = 9877;

  /// Server lossy (UDP) port.
  uint16_t m_lossy_port = 9878;

  /// Minimum free space requested for each socket read; the response buffer grows by this as needed.
  size_t m_rcv_chunk_size = 8192;

  /// Max time for one call(), from sending the request through receiving the whole response.
  util::Fine_duration m_call_timeout = boost::chrono::seconds(15);

  /// Max time for one connection attempt.
  util::Fine_duration m_connect_timeout = boost::chrono::seconds(5);

  /// Connection attempts before giving up (at least 1).
  unsigned int m_connect_attempts = 3;

  /// Pause between connection attempts.
  util::Fine_duration m_connect_retry_delay = boost::chrono::seconds(1);

  /// A response larger than this is a protocol error.
  size_t m_max_response_size = 64 * 1024 * 1024;
}; // struct Client_config

// Free functions.

/**
 * Prints string representation of the given Client_connection to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Client_connection& val);

} // namespace hostctl::client
