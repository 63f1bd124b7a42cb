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
#include "hostctl/transport/lossy_listener.hpp"
#include "hostctl/dispatch/command_registry.hpp"
#include "hostctl/dispatch/execution_serializer.hpp"
#include "hostctl/error.hpp"
#include <flow/error/error.hpp>
#include <flow/async/util.hpp>
#include <boost/move/make_unique.hpp>
#include <ostream>

namespace hostctl::transport
{

Lossy_listener::Lossy_listener(flow::log::Logger* logger_ptr, const util::Udp_endpoint& endpoint,
                               const dispatch::Command_registry& registry,
                               dispatch::Execution_serializer* serializer,
                               size_t max_datagram_size,
                               Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_registry(registry),
  m_serializer(serializer),
  m_local_endpoint(endpoint),
  m_rcv_buf(max_datagram_size),
  m_worker(get_logger(), "hostctl_udp_rcv"),
  m_n_received(0),
  m_n_submitted(0),
  m_n_dropped_malformed(0),
  m_n_dropped_unknown(0),
  m_n_rejected_never_lossy(0),
  m_n_dropped_busy(0)
{
  using flow::error::Runtime_error;
  using flow::async::reset_thread_pinning;
  using boost::system::system_error;

  assert(m_serializer);
  assert(!m_rcv_buf.empty());

  // Same startup pattern as Reliable_listener: set up synchronously in thread W.
  Error_code sys_err_code;

  m_worker.start([&]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.

    try
    {
      m_socket = boost::movelib::make_unique<Socket>(*(m_worker.task_engine()), endpoint); // Throws on error.
      m_local_endpoint = m_socket->local_endpoint();
    }
    catch (const system_error& exc)
    {
      m_socket.reset();
      FLOW_LOG_WARNING("Lossy_listener [" << *this << "]: Unable to open/bind UDP socket; details logged below.");
      sys_err_code = exc.code();
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return;
    }

    FLOW_LOG_INFO("Lossy_listener [" << *this << "]: Bound.  Receiving datagrams.");
    receive_next();
  }); // m_worker.start()

  if (sys_err_code)
  {
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
} // Lossy_listener::Lossy_listener()

Lossy_listener::~Lossy_listener()
{
  FLOW_LOG_INFO("Lossy_listener [" << *this << "]: Shutting down; final stats: [" << stats() << "].");

  m_worker.stop();
  // Thread W is (synchronously!) no more.

  if (m_socket)
  {
    Error_code sys_err_code;
    m_socket->close(sys_err_code); // Ignore: nothing useful to do.
  }
}

void Lossy_listener::receive_next()
{
  using boost::asio::buffer;

  // We are in thread W.
  m_socket->async_receive_from(buffer(m_rcv_buf), m_sender_endpoint,
                               [this](const Error_code& sys_err_code, size_t n_rcvd)
  {
    on_receive(sys_err_code, n_rcvd);
  });
}

void Lossy_listener::on_receive(const Error_code& sys_err_code, size_t n_rcvd)
{
  // We are in thread W.
  if (sys_err_code == boost::asio::error::operation_aborted)
  {
    return; // Shutting down.
  }
  // else

  if (sys_err_code)
  {
    /* E.g., ICMP-induced connection_refused on some platforms, or message_size for an over-long datagram.  Either
     * way it's about one datagram (if any); keep going. */
    ++m_n_received;
    ++m_n_dropped_malformed;
    FLOW_LOG_WARNING("Lossy_listener [" << *this << "]: Receive failed; dropping the datagram (if any) and "
                     "continuing.  Error: [" << sys_err_code << "] [" << sys_err_code.message() << "].");
  }
  else
  {
    ++m_n_received;
    handle_datagram(util::String_view(m_rcv_buf.data(), n_rcvd));
  }

  receive_next();
}

void Lossy_listener::handle_datagram(util::String_view payload)
{
  using dispatch::Command;
  using dispatch::Response;
  using dispatch::Safety_tier;
  using dispatch::Transport;

  // We are in thread W.

  Command command;
  std::string problem;
  auto err_code = dispatch::decode_command(payload, Transport::S_LOSSY, &command, &problem);
  if (err_code)
  {
    ++m_n_dropped_malformed;
    FLOW_LOG_WARNING("Lossy_listener [" << *this << "]: Dropping malformed datagram of [" << payload.size() << "] "
                     "bytes from [" << m_sender_endpoint << "]: [" << problem << "].");
    return;
  }
  // else

  command.m_descriptor = m_registry.classify(command.m_name);
  if (!command.m_descriptor)
  {
    ++m_n_dropped_unknown;
    FLOW_LOG_WARNING("Lossy_listener [" << *this << "]: Dropping unknown command " << command << " from "
                     "[" << m_sender_endpoint << "].");
    return;
  }
  // else
  if (command.m_descriptor->m_safety_tier != Safety_tier::S_LOSSY_ELIGIBLE)
  {
    ++m_n_rejected_never_lossy;
    err_code = error::Code::S_CLASSIFICATION_NEVER_LOSSY_ON_LOSSY;
    FLOW_LOG_WARNING("Lossy_listener [" << *this << "]: Rejecting unsafe submission "
                     "([" << error::Code::S_CLASSIFICATION_NEVER_LOSSY_ON_LOSSY << "] [" << err_code.message() << "]): "
                     "command " << command << " from [" << m_sender_endpoint << "] is "
                     "[" << command.m_descriptor->m_safety_tier << "] and may only arrive over the reliable "
                     "transport.  Not executing it.");
    return;
  }
  // else

  FLOW_LOG_TRACE("Lossy_listener [" << *this << "]: Submitting command " << command << ".");
  m_serializer->submit(std::move(command), [](Response&&) {}, &err_code); // Nobody to answer.
  if (err_code)
  {
    ++m_n_dropped_busy;
    FLOW_LOG_WARNING("Lossy_listener [" << *this << "]: Dropping datagram from [" << m_sender_endpoint << "]: "
                     "serializer refused it ([" << err_code << "] [" << err_code.message() << "]).");
    return;
  }
  // else
  ++m_n_submitted;
} // Lossy_listener::handle_datagram()

const util::Udp_endpoint& Lossy_listener::local_endpoint() const
{
  return m_local_endpoint;
}

Lossy_listener_stats Lossy_listener::stats() const
{
  Lossy_listener_stats stats;
  stats.m_received = m_n_received;
  stats.m_submitted = m_n_submitted;
  stats.m_dropped_malformed = m_n_dropped_malformed;
  stats.m_dropped_unknown = m_n_dropped_unknown;
  stats.m_rejected_never_lossy = m_n_rejected_never_lossy;
  stats.m_dropped_busy = m_n_dropped_busy;
  return stats;
}

std::ostream& operator<<(std::ostream& os, const Lossy_listener& val)
{
  return os << "udp@" << val.local_endpoint();
}

std::ostream& operator<<(std::ostream& os, const Lossy_listener_stats& val)
{
  return os << "received=" << val.m_received << " submitted=" << val.m_submitted
            << " malformed=" << val.m_dropped_malformed << " unknown=" << val.m_dropped_unknown
            << " rejected_never_lossy=" << val.m_rejected_never_lossy << " busy=" << val.m_dropped_busy;
}

} // namespace hostctl::transport
