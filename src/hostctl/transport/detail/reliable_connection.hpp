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

#include "hostctl/transport/json_frame_scanner.hpp"
#include "hostctl/dispatch/command.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/noncopyable.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hostctl::transport::detail
{

/**
 * One accepted Reliable_listener connection: owns its socket, its growable receive buffer, and its own worker
 * thread C in which all of its logic runs.  At most one request is in flight: it reads until one complete JSON
 * object is framed, submits the Command, waits (asynchronously, in C only) for the Response, flushes it completely,
 * and only then looks at the next buffered or incoming bytes.
 *
 * ### State machine ###
 *   - State::S_READING: a read is outstanding, or the buffer holds another complete frame to handle now.
 *   - State::S_AWAITING: a Command is in the serializer; the completion timer runs.
 *   - State::S_WRITING: a Response is being flushed; the write timer runs.
 *   - State::S_CLOSED: terminal; the socket is closed and the owner has been told (see On_closed_func).
 *
 * ### Threads and lifetime ###
 * The serializer calls back from its consumer context; that callback only posts onto C, capturing C's `Task_engine`
 * by `shared_ptr`, so it is harmless even if `*this` has been destroyed by then: the destructor stops C for good,
 * and a task posted onto a stopped engine never runs.  A Response arriving after the requester was answered (by a
 * completion timeout) is recognized by its sequence number and discarded.
 *
 * The owner (Reliable_listener, in its thread W) destroys `*this` at any time after being told of the close, or at
 * its own shutdown; the destructor joins C.  C never blocks on anything but its own event loop.
 */
class Reliable_connection :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Told (from thread C, once) that the connection with the given ID has closed.  Must not block.
  using On_closed_func = Function<void (uint64_t id)>;

  /// Short-hand for the socket type.
  using Socket = boost::asio::ip::tcp::socket;

  // Constructors/destructor.

  /**
   * Takes over an accepted socket.  Does not start anything; see start().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param id
   *        Unique (per listener) ID.
   * @param protocol
   *        Protocol of `native_socket`.
   * @param native_socket
   *        Connected socket handle ejected from the acceptor's socket.
   * @param registry
   *        Sealed registry; must outlive `*this`.
   * @param serializer
   *        Serializer; must outlive `*this`.
   * @param config
   *        Knobs.
   * @param on_closed_func
   *        See #On_closed_func.
   */
  explicit Reliable_connection(flow::log::Logger* logger_ptr, uint64_t id,
                               const boost::asio::ip::tcp& protocol, Socket::native_handle_type native_socket,
                               const dispatch::Command_registry& registry,
                               dispatch::Execution_serializer* serializer,
                               const Reliable_listener_config& config,
                               On_closed_func&& on_closed_func);

  /// Stops thread C (see stop_worker()); closes the socket if still open.  Does not call #On_closed_func.
  ~Reliable_connection();

  // Methods.

  /// Starts thread C and, in it, the first read.
  void start();

  /**
   * Joins thread C; nothing of `*this` runs afterwards.  Idempotent.  Must not be called from thread C.
   */
  void stop_worker();

  /**
   * ID given to ctor.
   * @return See above.
   */
  uint64_t id() const;

  /**
   * Remote endpoint, as of construction.
   * @return See above.
   */
  const util::Tcp_endpoint& remote_endpoint() const;

private:
  // Types.

  /// See class doc header.
  enum class State
  {
    /// See class doc header.
    S_READING,
    /// See class doc header.
    S_AWAITING,
    /// See class doc header.
    S_WRITING,
    /// See class doc header.
    S_CLOSED
  };

  // Methods.

  /// Handles every complete frame in the buffer, one at a time, then reads more.  Thread C; State::S_READING.
  void process_buffer();

  /**
   * Decodes, classifies and submits one frame, or answers it with an error Response.  Thread C.
   *
   * @param frame
   *        One balanced JSON object.
   */
  void handle_frame(util::String_view frame);

  /// Starts the next read into the free tail of the buffer, growing it if needed.  Thread C.
  void start_read();

  /**
   * Read completion.  Thread C.
   *
   * @param sys_err_code
   *        Result.
   * @param n_rcvd
   *        Bytes appended.
   */
  void on_read(const Error_code& sys_err_code, size_t n_rcvd);

  /**
   * The serializer's Response, hopped into thread C.
   *
   * @param request_seq
   *        Which request it answers.
   * @param response
   *        The Response.
   */
  void on_response(uint64_t request_seq, dispatch::Response&& response);

  /**
   * Serializes and starts flushing `response`.  Thread C.
   *
   * @param response
   *        The Response.
   * @param close_after
   *        Whether to close once it is flushed (or fails to be).
   */
  void send_response(const dispatch::Response& response, bool close_after = false);

  /**
   * Write completion.  Thread C.
   *
   * @param sys_err_code
   *        Result.
   */
  void on_write(const Error_code& sys_err_code);

  /**
   * (Re)arms the one timer; `on_expired` runs if it expires before the next arm_timer() or cancel_timer().
   *
   * @param timeout
   *        From now.  Zero means do not arm (equivalent to cancel_timer()).
   * @param on_expired
   *        Thread C.
   */
  void arm_timer(util::Fine_duration timeout, util::Task&& on_expired);

  /// Disarms the timer.
  void cancel_timer();

  /**
   * Terminal: closes the socket and tells the owner.  Idempotent.  Thread C.
   *
   * @param why
   *        For logging.
   */
  void close(util::String_view why);

  // Data.

  /// See id().
  const uint64_t m_id;

  /// Registry.
  const dispatch::Command_registry& m_registry;

  /// Serializer.
  dispatch::Execution_serializer* const m_serializer;

  /// Knobs.
  const Reliable_listener_config m_config;

  /// See #On_closed_func.
  const On_closed_func m_on_closed_func;

  /// Thread C.  Must be declared ahead of everything bound to its `Task_engine`.
  flow::async::Single_thread_task_loop m_worker;

  /// The socket; bound to #m_worker's `Task_engine`.
  Socket m_socket;

  /// See remote_endpoint().
  util::Tcp_endpoint m_remote_endpoint;

  /// Read/idle, completion, or write timer; which one depends on #m_state.
  util::Timer m_timer;

  /// Incremented by each arm_timer() and cancel_timer(); a timer firing with a stale value is ignored.
  uint64_t m_timer_generation;

  /// Current state.
  State m_state;

  /// Receive buffer; `[0, m_rcv_size)` holds unconsumed bytes; the rest is read space.
  std::vector<char> m_rcv_buf;

  /// See #m_rcv_buf.
  size_t m_rcv_size;

  /// Delimits frames in #m_rcv_buf.
  Json_frame_scanner m_scanner;

  /// Serialized Response being written.
  std::string m_snd_buf;

  /// Whether to close after the current write.
  bool m_close_after_write;

  /// Incremented for each submitted Command; identifies the one in flight.
  uint64_t m_request_seq;

  /// Correlation of the Command in flight (for the timeout error Response).
  std::optional<Json> m_pending_correlation;

  /// Requests answered (any status).
  uint64_t m_n_answered;
}; // class Reliable_connection

/**
 * Prints string representation of the given Reliable_connection to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Reliable_connection& val);

} // namespace hostctl::transport::detail
