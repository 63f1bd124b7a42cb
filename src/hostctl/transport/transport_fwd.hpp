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

/**
 * hostctl module providing the two network producers feeding dispatch::Execution_serializer.
 *
 * The two transports are deliberately asymmetric and are not unified behind one interface:
 *   - Reliable_listener (TCP): one connection per client, reused across many round trips; one request in flight
 *     per connection; exactly one Response per request, on the same connection.  Messages are JSON documents
 *     delimited only by their own syntax (see Json_frame_scanner), so both sides tolerate partial and multi-read
 *     messages.
 *   - Lossy_listener (UDP): one complete JSON command per datagram; never any answer; only
 *     dispatch::Safety_tier::S_LOSSY_ELIGIBLE commands are executed.
 *
 * There is no ordering between the two transports beyond the serializer's single FIFO of whatever has been
 * submitted.
 */
namespace hostctl::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Json_frame_scanner;
class Reliable_listener;
class Lossy_listener;

/**
 * Reliable_listener knobs.  Defaults are the production values.
 */
struct Reliable_listener_config
{
  // Data.

  /// Minimum free space requested for each socket read; the receive buffer grows by this as needed.
  size_t m_rcv_chunk_size = 8192;

  /// A framed request larger than this gets an error Response, and the connection closes.
  size_t m_max_message_size = 64 * 1024 * 1024;

  /// Max time between reads while a partially received request is pending.  Then the connection closes.
  util::Fine_duration m_read_timeout = boost::chrono::seconds(15);

  /// Max time a connection may sit with no partial request; zero means unlimited.
  util::Fine_duration m_idle_timeout = util::Fine_duration::zero();

  /// Max time to flush one Response.  Then the connection closes.
  util::Fine_duration m_write_timeout = boost::chrono::seconds(15);

  /**
   * Max time to await a submitted command's Response from the serializer.  Then the requester gets a timeout
   * error Response, and the connection closes; the late result is discarded.
   */
  util::Fine_duration m_completion_timeout = boost::chrono::seconds(10);

  /// Pause before accepting again after an accept failed for lack of resources (e.g., out of descriptors).
  util::Fine_duration m_accept_retry_delay = boost::chrono::milliseconds(100);
}; // struct Reliable_listener_config

/// Counters kept by Lossy_listener.  Each received datagram increments #m_received and at most one other member.
struct Lossy_listener_stats
{
  /// Datagrams received.
  uint64_t m_received = 0;
  /// Submitted to the serializer.
  uint64_t m_submitted = 0;
  /// Dropped: not a well-formed command.
  uint64_t m_dropped_malformed = 0;
  /// Dropped: name not registered.
  uint64_t m_dropped_unknown = 0;
  /// Dropped: never-lossy command.
  uint64_t m_rejected_never_lossy = 0;
  /// Dropped: serializer refused (full or stopped).
  uint64_t m_dropped_busy = 0;
}; // struct Lossy_listener_stats

// Free functions.

/**
 * Prints string representation of the given Reliable_listener to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Reliable_listener& val);

/**
 * Prints string representation of the given Lossy_listener to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Lossy_listener& val);

/**
 * Prints string representation of the given Lossy_listener_stats to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Lossy_listener_stats& val);

} // namespace hostctl::transport
