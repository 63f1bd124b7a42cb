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

#include "hostctl/client/client_fwd.hpp"
#include "hostctl/dispatch/command.hpp"
#include "hostctl/transport/json_frame_scanner.hpp"
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <optional>
#include <vector>

namespace hostctl::client
{

/**
 * Consumer-side manager of one long-lived reliable connection (synchronous call()) and one lazily created lossy
 * socket (fire-and-forget cast()).
 *
 * ### call() ###
 * Writes one request, then reads (growing its buffer across as many reads as it takes) until one complete JSON
 * document has arrived, and decodes it.  The whole exchange is bounded by Client_config::m_call_timeout.
 *
 * Two kinds of failure are kept apart:
 *   - *connection-level* (could not connect; timeout; peer closed; socket error; garbled response): the
 *     connection is dropped, and the error is reported as such.  The request may or may not have executed.
 *   - *application-level*: the server answered with an error Response.  The connection stays up.
 *
 * A call is never retried: the command may not be idempotent.  What *is* retried is establishing the connection:
 * if there is none, or the cached one turns out (before anything is written) to have been closed by the server,
 * connecting is attempted up to Client_config::m_connect_attempts times.
 *
 * ### cast() ###
 * Sends one datagram and returns.  Nothing is read back, and nothing tells the caller whether it arrived; failures
 * are logged and otherwise ignored.  Only lossy-eligible commands are executed by the server; others are silently
 * dropped there.
 *
 * ### Thread safety ###
 * All methods may be called concurrently; concurrent calls are serialized (one request in flight per connection).
 */
class Client_connection :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs without connecting; the first call() (or connect()) connects.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param config
   *        Knobs.
   */
  explicit Client_connection(flow::log::Logger* logger_ptr, const Client_config& config = Client_config());

  /// Closes both sockets.
  ~Client_connection();

  // Methods.

  /**
   * Connects now if not connected, with retries.
   *
   * #Error_code generated: error::Code::S_NOT_CONNECTED (all attempts failed; the last cause is logged).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   */
  void connect(Error_code* err_code = 0);

  /// Drops the reliable connection, if any.  The next call() reconnects.
  void disconnect();

  /**
   * Whether a reliable connection is currently held (it may nevertheless have been closed by the server).
   * @return See above.
   */
  bool connected() const;

  /**
   * Executes a command over the reliable transport and returns its Response, whatever its status.
   *
   * #Error_code generated (connection-level only; the returned value is then meaningless):
   * error::Code::S_NOT_CONNECTED, error::Code::S_TIMEOUT, error::Code::S_CONNECTION_CLOSED,
   * error::Code::S_PROTOCOL_MALFORMED_PAYLOAD, error::Code::S_PROTOCOL_MESSAGE_TOO_LARGE, or a system error.
   *
   * @param name
   *        Command name.
   * @param params
   *        Parameters: object or `null` (sent as `{}`).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   * @return The Response.
   */
  dispatch::Response call_for_response(util::String_view name, const Json& params = Json::object(),
                                       Error_code* err_code = 0);

  /**
   * Like call_for_response() but returns just the result.  An error Response is reported as
   * error::Code::S_REMOTE_ERROR_RESPONSE; if that is thrown, the exception's message includes the server's.
   *
   * @param name
   *        See call_for_response().
   * @param params
   *        See call_for_response().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   * @return The result (`null` on error).
   */
  Json call(util::String_view name, const Json& params = Json::object(), Error_code* err_code = 0);

  /**
   * Sends a command over the lossy transport; never waits and never reports failure (logs it instead).
   *
   * @param name
   *        Command name.
   * @param params
   *        Parameters: object or `null`.
   */
  void cast(util::String_view name, const Json& params = Json::object());

  /**
   * Knobs given to ctor.
   * @return See above.
   */
  const Client_config& config() const;

private:
  // Types.

  /// Short-hand for the TCP socket type.
  using Tcp_socket = boost::asio::ip::tcp::socket;

  /// Short-hand for the UDP socket type.
  using Udp_socket = boost::asio::ip::udp::socket;

  /// Completion of an async op run by sync_op().
  using On_op_done_func = Function<void (const Error_code& sys_err_code)>;

  // Methods.

  /**
   * connect() body; #m_call_mutex locked.
   *
   * @param err_code
   *        Not null.
   */
  void connect_impl(Error_code* err_code);

  /// disconnect() body; #m_call_mutex locked.
  void disconnect_impl();

  /**
   * Whether the held connection has been closed by the server (or has unexpected bytes pending).  Never blocks.
   * @return See above.
   */
  bool peer_closed();

  /**
   * Starts an async op on #m_socket via `start_op` and runs #m_task_engine until it completes or `timeout`
   * elapses; on timeout the op is canceled and error::Code::S_TIMEOUT returned.
   *
   * @param timeout
   *        Max wait; must be positive.
   * @param start_op
   *        Starts the op; it must call the given completion exactly once.
   * @return The op's result, or error::Code::S_TIMEOUT.
   */
  Error_code sync_op(util::Fine_duration timeout, const Function<void (On_op_done_func&& on_done)>& start_op);

  /**
   * Reads one complete JSON response into `frame`.  #m_call_mutex locked.
   *
   * @param deadline
   *        When to give up.
   * @param frame
   *        Result.
   * @return Error, or success.
   */
  Error_code read_frame(const util::Fine_time_pt& deadline, std::string* frame);

  // Data.

  /// Knobs.
  const Client_config m_config;

  /// Serializes calls; protects the reliable-connection state below.
  mutable flow::util::Mutex_non_recursive m_call_mutex;

  /// Runs the async ops behind the blocking-with-timeout calls; only from a thread holding #m_call_mutex.
  util::Task_engine m_task_engine;

  /// Reliable connection; open iff connected.
  Tcp_socket m_socket;

  /// Response bytes; `[0, m_rcv_size)` unconsumed.
  std::vector<char> m_rcv_buf;

  /// See #m_rcv_buf.
  size_t m_rcv_size;

  /// Delimits the response in #m_rcv_buf.
  transport::Json_frame_scanner m_scanner;

  /// Correlation `id` of the next request.
  uint64_t m_next_request_id;

  /// Protects the lossy state below.
  flow::util::Mutex_non_recursive m_cast_mutex;

  /// Task_engine for the lossy socket (only synchronous ops are used on it).
  util::Task_engine m_cast_task_engine;

  /// Lossy socket; created on first cast().
  boost::movelib::unique_ptr<Udp_socket> m_cast_socket;

  /// Resolved lossy endpoint; valid iff #m_cast_socket.
  util::Udp_endpoint m_cast_endpoint;
}; // class Client_connection

} // namespace hostctl::client
