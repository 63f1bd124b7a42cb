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
#include "hostctl/transport/reliable_listener.hpp"
#include "hostctl/transport/detail/reliable_connection.hpp"
#include "hostctl/dispatch/command_registry.hpp"
#include <flow/error/error.hpp>
#include <flow/async/util.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/chrono/round.hpp>
#include <ostream>

namespace hostctl::transport
{

Reliable_listener::Reliable_listener(flow::log::Logger* logger_ptr, const util::Tcp_endpoint& endpoint,
                                     const dispatch::Command_registry& registry,
                                     dispatch::Execution_serializer* serializer,
                                     const Reliable_listener_config& config,
                                     Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_registry(registry),
  m_serializer(serializer),
  m_config(config),
  m_local_endpoint(endpoint),
  m_worker(get_logger(), "hostctl_tcp_acc"),
  m_next_peer_socket(*(m_worker.task_engine())),
  m_accept_retry_timer(*(m_worker.task_engine())),
  m_next_conn_id(1),
  m_n_connections(0),
  m_n_accepted(0)
{
  using flow::error::Runtime_error;
  using flow::async::reset_thread_pinning;
  using boost::system::system_error;

  assert(m_serializer);
  if (!m_registry.sealed())
  {
    FLOW_LOG_WARNING("Reliable_listener [" << *this << "]: Registry is not sealed; it must not be modified while "
                     "we run.");
  }

  /* Do all the setup in thread W; we promise that upon return (no later) the endpoint is listening (unless error).
   * So wait for that using the start() arg, which runs synchronously. */
  Error_code sys_err_code;

  m_worker.start([&]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.

    try
    {
      // Throws on error.  (No error-code-returning acceptor ctor; it is normal in boost.asio ctors.)
      m_acceptor = boost::movelib::make_unique<Acceptor>(*(m_worker.task_engine()), endpoint, true);
      m_local_endpoint = m_acceptor->local_endpoint();
    }
    catch (const system_error& exc)
    {
      m_acceptor.reset();
      FLOW_LOG_WARNING("Reliable_listener [" << *this << "]: Unable to open/bind/listen TCP socket; details "
                       "logged below.");
      sys_err_code = exc.code();
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return; // Escape the start() callback, that is.
    }

    FLOW_LOG_INFO("Reliable_listener [" << *this << "]: Listening.  Ready for connections.");
    accept_next();
  }); // m_worker.start()

  if (sys_err_code)
  {
    // Thread W stays up, idle, until the dtor; harmless.
    if (err_code)
    {
      *err_code = sys_err_code;
      return;
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else
  if (err_code)
  {
    err_code->clear();
  }
} // Reliable_listener::Reliable_listener()

Reliable_listener::~Reliable_listener()
{
  FLOW_LOG_INFO("Reliable_listener [" << *this << "]: Shutting down.  Acceptor closes; then each connection "
                "closes and its thread is joined.");

  m_worker.stop();
  // Thread W is (synchronously!) no more.  Now we may touch W-only state from here.

  Error_code sys_err_code;
  if (m_acceptor)
  {
    m_acceptor->close(sys_err_code); // Ignore: nothing useful to do.
  }
  m_next_peer_socket.close(sys_err_code);

  // Each connection's thread may still try to report its close to W (a no-op now); stop them before destroying.
  for (auto& id_and_conn : m_connections)
  {
    id_and_conn.second->stop_worker();
  }
  m_connections.clear();
  m_n_connections = 0;

  FLOW_LOG_INFO("Reliable_listener [" << *this << "]: Shut down after accepting [" << m_n_accepted << "] "
                "connections.");
}

void Reliable_listener::accept_next()
{
  // We are in thread W.
  FLOW_LOG_TRACE("Reliable_listener [" << *this << "]: Starting the next background accept.");
  m_acceptor->async_accept(m_next_peer_socket, [this](const Error_code& sys_err_code)
  {
    // We are in thread W.
    on_next_peer_socket_or_error(sys_err_code);
  });
}

void Reliable_listener::on_next_peer_socket_or_error(const Error_code& sys_err_code)
{
  using boost::movelib::make_unique;

  // We are in thread W.
  if (sys_err_code == boost::asio::error::operation_aborted)
  {
    return; // Stuff is shutting down.
  }
  // else

  if (sys_err_code)
  {
    Error_code dummy;
    m_next_peer_socket.close(dummy);

    if (sys_err_code == boost::asio::error::connection_aborted)
    {
      // That one peer gave up during the handshake; nothing wrong with us.
      FLOW_LOG_INFO("Reliable_listener [" << *this << "]: Peer aborted before accept completed; ignoring.");
      accept_next();
      return;
    }
    // else

    /* Resource trouble (out of descriptors, buffers...).  The pending connection stays in the backlog, so accepting
     * again right away would fail again right away.  Keep listening, as this may clear up once some connections
     * close, but only after a pause. */
    FLOW_LOG_WARNING("Reliable_listener [" << *this << "]: Background accept failed; will retry in "
                     "[" << boost::chrono::round<boost::chrono::milliseconds>(m_config.m_accept_retry_delay) << "].  "
                     "Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();

    m_accept_retry_timer.expires_after(m_config.m_accept_retry_delay);
    m_accept_retry_timer.async_wait([this](const Error_code& async_err_code)
    {
      // We are in thread W.
      if (async_err_code != boost::asio::error::operation_aborted)
      {
        accept_next();
      }
    });
    return;
  }
  // else

  /* The accepted socket is bound to W's Task_engine; the connection must run in its own thread C.  There's no
   * way to rebind a socket to another Task_engine, so eject the native handle and let the connection's socket
   * take it over.  Nothing has been done on it yet, so that's safe. */
  const auto protocol = m_local_endpoint.protocol();
  const auto native_socket = m_next_peer_socket.release();
  assert(!m_next_peer_socket.is_open());

  const auto id = m_next_conn_id++;
  auto conn = make_unique<detail::Reliable_connection>
                (get_logger(), id, protocol, native_socket, m_registry, m_serializer, m_config,
                 [this](uint64_t closed_id)
  {
    // We are in that connection's thread C.  Reap it in W.
    m_worker.post([this, closed_id]() { on_connection_closed(closed_id); });
  });

  FLOW_LOG_INFO("Reliable_listener [" << *this << "]: Accepted connection [" << *conn << "].");

  conn->start();
  m_connections.emplace(id, std::move(conn));
  ++m_n_accepted;
  m_n_connections = m_connections.size();

  accept_next();
} // Reliable_listener::on_next_peer_socket_or_error()

void Reliable_listener::on_connection_closed(uint64_t id)
{
  // We are in thread W.
  const auto it = m_connections.find(id);
  if (it == m_connections.end())
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Reliable_listener [" << *this << "]: Reaping closed connection [" << *it->second << "].");
  m_connections.erase(it); // Joins its thread C, which is idle or about to be.
  m_n_connections = m_connections.size();
}

const util::Tcp_endpoint& Reliable_listener::local_endpoint() const
{
  return m_local_endpoint;
}

size_t Reliable_listener::connection_count() const
{
  return m_n_connections;
}

uint64_t Reliable_listener::accepted_count() const
{
  return m_n_accepted;
}

std::ostream& operator<<(std::ostream& os, const Reliable_listener& val)
{
  return os << "tcp@" << val.local_endpoint();
}

} // namespace hostctl::transport
