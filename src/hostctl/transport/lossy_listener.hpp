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

#include "hostctl/transport/transport_fwd.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <vector>

namespace hostctl::transport
{

/**
 * One receive loop on one UDP socket: each datagram is one complete JSON command, executed (if eligible) and never
 * answered.
 *
 * Per datagram:
 *   - not a well-formed command: dropped;
 *   - name not registered: dropped;
 *   - dispatch::Safety_tier::S_NEVER_LOSSY: dropped as a rejected unsafe submission, never executed;
 *   - else submitted to the serializer with a no-op completion; if the serializer refuses (full/stopped): dropped.
 *
 * Each dropped datagram produces exactly one WARNING-severity log message and increments one
 * Lossy_listener_stats counter; nothing ever goes back to the sender.  No failure ever stops the loop.
 *
 * Since nothing acknowledges or retries, a sender must not assume delivery.  That is why only commands whose
 * repeated application converges regardless of which submissions were lost are allowed here.  Commands execute in
 * serializer order, which approximates arrival order on this socket alone; there is no ordering relative to the
 * reliable transport.
 *
 * ### Threads ###
 * One thread (started by the ctor) runs the loop.  The destructor closes the socket and joins it.
 */
class Lossy_listener :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// Default for `max_datagram_size` ctor arg: the largest UDP payload.
  static constexpr size_t S_DEFAULT_MAX_DATAGRAM_SIZE = 65507;

  // Constructors/destructor.

  /**
   * Binds and starts the receive loop.  Upon successful return datagrams are being received.
   *
   * #Error_code generated: any from opening/binding (e.g., `boost::asio::error::address_in_use`).
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param endpoint
   *        Where to bind; port 0 picks an ephemeral port (see local_endpoint()).
   * @param registry
   *        Registry; should be sealed; must outlive `*this`.
   * @param serializer
   *        Serializer; must outlive `*this`.
   * @param max_datagram_size
   *        Receive buffer size; a longer datagram is truncated and hence dropped as malformed.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   */
  explicit Lossy_listener(flow::log::Logger* logger_ptr, const util::Udp_endpoint& endpoint,
                          const dispatch::Command_registry& registry,
                          dispatch::Execution_serializer* serializer,
                          size_t max_datagram_size = S_DEFAULT_MAX_DATAGRAM_SIZE,
                          Error_code* err_code = 0);

  /// Closes the socket; joins the thread.
  ~Lossy_listener();

  // Methods.

  /**
   * The bound endpoint (with the actual port if 0 was requested).
   * @return See above.
   */
  const util::Udp_endpoint& local_endpoint() const;

  /**
   * Snapshot of the counters.  Each member is individually accurate; they need not be mutually consistent.
   * @return See above.
   */
  Lossy_listener_stats stats() const;

private:
  // Types.

  /// Short-hand for the socket type.
  using Socket = boost::asio::ip::udp::socket;

  // Methods.

  /// Starts the next background receive.  Thread W.
  void receive_next();

  /**
   * Receive completion.  Thread W.
   *
   * @param sys_err_code
   *        Result.
   * @param n_rcvd
   *        Datagram size.
   */
  void on_receive(const Error_code& sys_err_code, size_t n_rcvd);

  /**
   * Handles one datagram.  Thread W.
   *
   * @param payload
   *        Its bytes.
   */
  void handle_datagram(util::String_view payload);

  // Data.

  /// Registry.
  const dispatch::Command_registry& m_registry;

  /// Serializer.
  dispatch::Execution_serializer* const m_serializer;

  /// See local_endpoint().
  util::Udp_endpoint m_local_endpoint;

  /// Sender of the datagram being received.
  util::Udp_endpoint m_sender_endpoint;

  /// Receive buffer.
  std::vector<char> m_rcv_buf;

  /// Thread W.  Must be declared ahead of everything bound to its `Task_engine`.
  flow::async::Single_thread_task_loop m_worker;

  /// The socket; null if ctor failed.
  boost::movelib::unique_ptr<Socket> m_socket;

  /// Counters; see Lossy_listener_stats.
  std::atomic<uint64_t> m_n_received;
  /// See Lossy_listener_stats.
  std::atomic<uint64_t> m_n_submitted;
  /// See Lossy_listener_stats.
  std::atomic<uint64_t> m_n_dropped_malformed;
  /// See Lossy_listener_stats.
  std::atomic<uint64_t> m_n_dropped_unknown;
  /// See Lossy_listener_stats.
  std::atomic<uint64_t> m_n_rejected_never_lossy;
  /// See Lossy_listener_stats.
  std::atomic<uint64_t> m_n_dropped_busy;
}; // class Lossy_listener

} // namespace hostctl::transport
