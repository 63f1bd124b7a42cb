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
#include <boost/unordered_map.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>

namespace hostctl::transport
{

namespace detail
{
class Reliable_connection;
}

/**
 * Listens for TCP connections and serves each in its own thread, turning every framed request into exactly one
 * Response on the same connection.
 *
 * Per connection (see detail::Reliable_connection): accumulate bytes across reads, growing the buffer, until one
 * complete JSON object is framed; decode it; classify it against the registry; submit it to the serializer; await
 * its Response in that connection's thread only; flush it completely; repeat.  Any number of connections are served
 * concurrently, and a stalled or slow one never delays another one's reads or writes.  (Their *executions* do
 * queue behind each other in the serializer's global FIFO; that is the point.)
 *
 * Failures, all scoped to the one connection:
 *   - not JSON, or not a well-formed command object: error Response; nothing submitted; connection stays usable;
 *   - unknown command name: error Response `"Unknown command: <name>"`; nothing submitted;
 *   - handler threw: error Response with its message (produced by the serializer);
 *   - serializer refused (full/stopped): error Response;
 *   - request over the size limit: error Response, then close;
 *   - completion timeout: error Response `"Timeout waiting for operation to complete"`, then close; the command
 *     still runs and its result is discarded;
 *   - socket error or read/write timeout: close.  A submitted command still runs; its Response is discarded.
 *
 * ### Threads ###
 * Thread W (started by the ctor) accepts and owns the set of connections; each connection has its own thread C.
 * The destructor closes the acceptor and every connection and joins all of those threads.  Responses still in
 * the serializer for those connections are discarded when they arrive.
 */
class Reliable_listener :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Binds, listens, and starts accepting.  Upon successful return the endpoint accepts connections.
   *
   * #Error_code generated: any from binding/listening (e.g., `boost::asio::error::address_in_use`).
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param endpoint
   *        Where to listen; port 0 picks an ephemeral port (see local_endpoint()).
   * @param registry
   *        Registry; should be sealed; must outlive `*this`.
   * @param serializer
   *        Serializer; must outlive `*this`.
   * @param config
   *        Knobs.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   */
  explicit Reliable_listener(flow::log::Logger* logger_ptr, const util::Tcp_endpoint& endpoint,
                             const dispatch::Command_registry& registry,
                             dispatch::Execution_serializer* serializer,
                             const Reliable_listener_config& config = Reliable_listener_config(),
                             Error_code* err_code = 0);

  /// Stops accepting, closes all connections, joins all threads.
  ~Reliable_listener();

  // Methods.

  /**
   * The bound endpoint (with the actual port if 0 was requested).
   * @return See above.
   */
  const util::Tcp_endpoint& local_endpoint() const;

  /**
   * Connections currently open (accepted and not yet reaped).
   * @return See above.
   */
  size_t connection_count() const;

  /**
   * Connections accepted so far.
   * @return See above.
   */
  uint64_t accepted_count() const;

private:
  // Types.

  /// Short-hand for the acceptor type.
  using Acceptor = boost::asio::ip::tcp::acceptor;

  /// Short-hand for connection handle.
  using Connection_ptr = boost::movelib::unique_ptr<detail::Reliable_connection>;

  // Methods.

  /// Starts the next background accept.  Thread W.
  void accept_next();

  /**
   * Accept completion.  Thread W.
   *
   * @param sys_err_code
   *        Result.
   */
  void on_next_peer_socket_or_error(const Error_code& sys_err_code);

  /**
   * A connection closed; destroys it.  Thread W.
   *
   * @param id
   *        Its ID.
   */
  void on_connection_closed(uint64_t id);

  // Data.

  /// Registry.
  const dispatch::Command_registry& m_registry;

  /// Serializer.
  dispatch::Execution_serializer* const m_serializer;

  /// Knobs.
  const Reliable_listener_config m_config;

  /// See local_endpoint().
  util::Tcp_endpoint m_local_endpoint;

  /// Thread W.  Must be declared ahead of everything bound to its `Task_engine`.
  flow::async::Single_thread_task_loop m_worker;

  /// Listening socket; null if ctor failed.
  boost::movelib::unique_ptr<Acceptor> m_acceptor;

  /// Target of the outstanding async_accept(); its handle is then ejected and given to a new connection.
  Acceptor::protocol_type::socket m_next_peer_socket;

  /// Delays the next accept_next() after a resource failure.
  util::Timer m_accept_retry_timer;

  /// Next connection ID.
  uint64_t m_next_conn_id;

  /// Open connections, keyed by ID.  Thread W only (and the dtor after W is gone).
  boost::unordered_map<uint64_t, Connection_ptr> m_connections;

  /// See connection_count().
  std::atomic<size_t> m_n_connections;

  /// See accepted_count().
  std::atomic<uint64_t> m_n_accepted;
}; // class Reliable_listener

} // namespace hostctl::transport
