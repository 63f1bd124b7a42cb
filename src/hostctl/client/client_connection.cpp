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
#include "hostctl/client/client_connection.hpp"
#include "hostctl/error.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <algorithm>
#include <cstring>
#include <ostream>

namespace hostctl::client
{

Client_connection::Client_connection(flow::log::Logger* logger_ptr, const Client_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_CLIENT),
  m_config(config),
  m_socket(m_task_engine),
  m_rcv_size(0),
  m_next_request_id(1)
{
  FLOW_LOG_INFO("Client_connection [" << *this << "]: Created; will connect on first use.");
}

Client_connection::~Client_connection()
{
  Error_code sys_err_code;
  m_socket.close(sys_err_code); // Ignore: nothing useful to do.
  if (m_cast_socket)
  {
    m_cast_socket->close(sys_err_code);
  }
}

void Client_connection::connect(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { connect(actual_err_code); },
         err_code, "Client_connection::connect()"))
  {
    return;
  }
  // else

  flow::util::Lock_guard<decltype(m_call_mutex)> lock(m_call_mutex);
  connect_impl(err_code);
}

void Client_connection::connect_impl(Error_code* err_code)
{
  using boost::asio::ip::tcp;
  using flow::util::ostream_op_string;

  assert(err_code);

  if (m_socket.is_open())
  {
    err_code->clear();
    return;
  }
  // else

  const auto n_attempts = std::max(m_config.m_connect_attempts, 1u);
  Error_code sys_err_code;
  for (unsigned int attempt = 1; attempt <= n_attempts; ++attempt)
  {
    if (attempt != 1)
    {
      flow::util::this_thread::sleep_for(m_config.m_connect_retry_delay);
    }

    tcp::resolver resolver(m_task_engine);
    const auto endpoints = resolver.resolve(m_config.m_host, ostream_op_string(m_config.m_reliable_port),
                                            sys_err_code);
    if (!sys_err_code)
    {
      const util::Tcp_endpoint endpoint = endpoints.begin()->endpoint();
      sys_err_code = sync_op(m_config.m_connect_timeout, [&](On_op_done_func&& on_done)
      {
        m_socket.async_connect(endpoint, [on_done = std::move(on_done)](const Error_code& async_err_code)
        {
          on_done(async_err_code);
        });
      });

      if (!sys_err_code)
      {
        Error_code dummy;
        m_socket.set_option(tcp::no_delay(true), dummy); // Request/response; don't batch.
        m_rcv_size = 0;
        m_scanner.reset();
        FLOW_LOG_INFO("Client_connection [" << *this << "]: Connected to [" << endpoint << "] "
                      "(attempt [" << attempt << "] of [" << n_attempts << "]).");
        err_code->clear();
        return;
      }
      // else
      Error_code dummy;
      m_socket.close(dummy);
    }

    FLOW_LOG_WARNING("Client_connection [" << *this << "]: Connection attempt [" << attempt << "] of "
                     "[" << n_attempts << "] failed: [" << sys_err_code << "] [" << sys_err_code.message() << "].");
  } // for (attempt)

  FLOW_LOG_WARNING("Client_connection [" << *this << "]: Giving up connecting.");
  *err_code = error::Code::S_NOT_CONNECTED;
} // Client_connection::connect_impl()

void Client_connection::disconnect()
{
  flow::util::Lock_guard<decltype(m_call_mutex)> lock(m_call_mutex);
  disconnect_impl();
}

void Client_connection::disconnect_impl()
{
  if (!m_socket.is_open())
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Client_connection [" << *this << "]: Dropping connection.");
  Error_code sys_err_code;
  m_socket.shutdown(Tcp_socket::shutdown_both, sys_err_code); // Ignore: peer may be gone already.
  m_socket.close(sys_err_code);
  m_rcv_size = 0;
  m_scanner.reset();
}

bool Client_connection::connected() const
{
  flow::util::Lock_guard<decltype(m_call_mutex)> lock(m_call_mutex);
  return m_socket.is_open();
}

bool Client_connection::peer_closed()
{
  Error_code sys_err_code;
  char byte;

  m_socket.non_blocking(true, sys_err_code);
  const auto n_peeked = m_socket.receive(boost::asio::buffer(&byte, 1), Tcp_socket::message_peek, sys_err_code);
  Error_code dummy;
  m_socket.non_blocking(false, dummy);

  if (sys_err_code == boost::asio::error::would_block)
  {
    return false; // Alive and quiet, as it should be between calls.
  }
  // else
  if (sys_err_code)
  {
    FLOW_LOG_INFO("Client_connection [" << *this << "]: Cached connection is no longer usable "
                  "([" << sys_err_code << "] [" << sys_err_code.message() << "]); will reconnect.");
    return true;
  }
  // else

  // No request is outstanding, so nothing should be arriving.  Can't trust the stream's framing now.
  FLOW_LOG_WARNING("Client_connection [" << *this << "]: [" << n_peeked << "]+ unexpected bytes pending on idle "
                   "connection; will reconnect.");
  return true;
}

Error_code Client_connection::sync_op(util::Fine_duration timeout,
                                      const Function<void (On_op_done_func&& on_done)>& start_op)
{
  bool done = false;
  bool timed_out = false;
  Error_code op_err_code;

  start_op([&](const Error_code& async_err_code)
  {
    op_err_code = async_err_code;
    done = true;
  });

  util::Timer timer(m_task_engine);
  timer.expires_after(timeout);
  timer.async_wait([&](const Error_code& async_err_code)
  {
    if ((!async_err_code) && (!done))
    {
      timed_out = true;
      Error_code dummy;
      m_socket.cancel(dummy); // The op completes with operation_aborted.
    }
  });

  m_task_engine.restart();
  while (!done)
  {
    m_task_engine.run_one();
  }
  timer.cancel();
  m_task_engine.run(); // Runs the (canceled) timer handler; then there's no work left, so it returns.

  if (timed_out)
  {
    return error::Code::S_TIMEOUT;
  }
  // else
  return op_err_code;
} // Client_connection::sync_op()

Error_code Client_connection::read_frame(const util::Fine_time_pt& deadline, std::string* frame)
{
  using Scan_result = transport::Json_frame_scanner::Result;
  using boost::asio::buffer;

  while (true)
  {
    size_t frame_end;
    const auto result = m_scanner.scan(m_rcv_buf.data(), m_rcv_size, &frame_end);
    if (result == Scan_result::S_COMPLETE)
    {
      frame->assign(m_rcv_buf.data(), frame_end);
      m_rcv_size -= frame_end;
      std::memmove(m_rcv_buf.data(), m_rcv_buf.data() + frame_end, m_rcv_size);
      m_scanner.reset();
      return Error_code();
    }
    // else
    if (result == Scan_result::S_MALFORMED)
    {
      return error::Code::S_PROTOCOL_MALFORMED_PAYLOAD;
    }
    // else
    if (m_rcv_size > m_config.m_max_response_size)
    {
      return error::Code::S_PROTOCOL_MESSAGE_TOO_LARGE;
    }
    // else

    if ((m_rcv_buf.size() - m_rcv_size) < m_config.m_rcv_chunk_size)
    {
      m_rcv_buf.resize(m_rcv_size + m_config.m_rcv_chunk_size);
    }

    const auto now = flow::Fine_clock::now();
    if (now >= deadline)
    {
      return error::Code::S_TIMEOUT;
    }
    // else

    size_t n_rcvd = 0;
    const auto sys_err_code = sync_op(deadline - now, [&](On_op_done_func&& on_done)
    {
      m_socket.async_read_some(buffer(m_rcv_buf.data() + m_rcv_size, m_rcv_buf.size() - m_rcv_size),
                               [&n_rcvd, on_done = std::move(on_done)](const Error_code& async_err_code, size_t n)
      {
        n_rcvd = n;
        on_done(async_err_code);
      });
    });

    if (sys_err_code == boost::asio::error::eof)
    {
      return error::Code::S_CONNECTION_CLOSED;
    }
    // else
    if (sys_err_code)
    {
      return sys_err_code;
    }
    // else

    FLOW_LOG_TRACE("Client_connection [" << *this << "]: Received [" << n_rcvd << "] response bytes.");
    m_rcv_size += n_rcvd;
  } // while (true)
} // Client_connection::read_frame()

dispatch::Response Client_connection::call_for_response(util::String_view name, const Json& params,
                                                        Error_code* err_code)
{
  using flow::error::Runtime_error;
  using boost::asio::async_write;
  using boost::asio::buffer;

  Error_code our_err_code;
  dispatch::Response response;

  {
    flow::util::Lock_guard<decltype(m_call_mutex)> lock(m_call_mutex);

    // Reconnecting here is safe: nothing of this request has been written yet.
    if (m_socket.is_open() && peer_closed())
    {
      disconnect_impl();
    }
    connect_impl(&our_err_code);

    const auto deadline = flow::Fine_clock::now() + m_config.m_call_timeout;
    const Json correlation(m_next_request_id++);
    std::string frame;

    if (!our_err_code)
    {
      frame = dispatch::encode_command(name, params, &correlation);
      FLOW_LOG_TRACE("Client_connection [" << *this << "]: Sending request [" << name << "] of "
                     "[" << frame.size() << "] bytes.");

      our_err_code = sync_op(m_config.m_call_timeout, [&](On_op_done_func&& on_done)
      {
        // async_write() loops over partial writes until everything is out or an error occurs.
        async_write(m_socket, buffer(frame),
                    [on_done = std::move(on_done)](const Error_code& async_err_code, size_t)
        {
          on_done(async_err_code);
        });
      });
    }
    if (!our_err_code)
    {
      our_err_code = read_frame(deadline, &frame);
    }
    if ((!our_err_code) && dispatch::decode_response(frame, &response))
    {
      our_err_code = error::Code::S_PROTOCOL_MALFORMED_PAYLOAD;
    }
    if ((!our_err_code) && response.m_correlation && (*response.m_correlation != correlation))
    {
      FLOW_LOG_WARNING("Client_connection [" << *this << "]: Response id [" << response.m_correlation->dump() << "] "
                       "does not match request id [" << correlation.dump() << "].");
      our_err_code = error::Code::S_PROTOCOL_MALFORMED_PAYLOAD;
    }

    if (our_err_code && (our_err_code != error::Code::S_NOT_CONNECTED))
    {
      // The stream's state is unknown (maybe a response is still coming); it cannot be reused.
      FLOW_LOG_WARNING("Client_connection [" << *this << "]: Call [" << name << "] failed at the connection level: "
                       "[" << our_err_code << "] [" << our_err_code.message() << "].  The command may or may not "
                       "have executed; not retrying.");
      disconnect_impl();
    }
  } // Lock_guard lock(m_call_mutex)

  if (our_err_code)
  {
    if (err_code)
    {
      *err_code = our_err_code;
      return dispatch::Response();
    }
    // else
    throw Runtime_error(our_err_code, "Client_connection::call_for_response()");
  }
  // else
  if (err_code)
  {
    err_code->clear();
  }
  return response;
} // Client_connection::call_for_response()

Json Client_connection::call(util::String_view name, const Json& params, Error_code* err_code)
{
  using flow::error::Runtime_error;

  Error_code our_err_code;
  auto response = call_for_response(name, params, &our_err_code);
  std::string context = "Client_connection::call()";
  if ((!our_err_code) && (!response.ok()))
  {
    FLOW_LOG_TRACE("Client_connection [" << *this << "]: Call [" << name << "] answered with error "
                   "[" << response.m_message << "].");
    our_err_code = error::Code::S_REMOTE_ERROR_RESPONSE;
    context = response.m_message;
  }

  if (our_err_code)
  {
    if (err_code)
    {
      *err_code = our_err_code;
      return Json();
    }
    // else
    throw Runtime_error(our_err_code, context);
  }
  // else
  if (err_code)
  {
    err_code->clear();
  }
  return std::move(response.m_result);
} // Client_connection::call()

void Client_connection::cast(util::String_view name, const Json& params)
{
  using boost::asio::ip::udp;
  using boost::asio::buffer;
  using flow::util::ostream_op_string;

  flow::util::Lock_guard<decltype(m_cast_mutex)> lock(m_cast_mutex);

  Error_code sys_err_code;
  if (!m_cast_socket)
  {
    udp::resolver resolver(m_cast_task_engine);
    const auto endpoints = resolver.resolve(m_config.m_host, ostream_op_string(m_config.m_lossy_port),
                                            sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Client_connection [" << *this << "]: Cast [" << name << "] not sent: cannot resolve "
                       "[" << m_config.m_host << "]: [" << sys_err_code.message() << "].");
      return;
    }
    // else

    auto cast_socket = boost::movelib::make_unique<Udp_socket>(m_cast_task_engine);
    m_cast_endpoint = endpoints.begin()->endpoint();
    cast_socket->open(m_cast_endpoint.protocol(), sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Client_connection [" << *this << "]: Cast [" << name << "] not sent: cannot open UDP "
                       "socket: [" << sys_err_code.message() << "].");
      return;
    }
    // else
    m_cast_socket = std::move(cast_socket);
  } // if (!m_cast_socket)

  const auto payload = dispatch::encode_command(name, params);
  m_cast_socket->send_to(buffer(payload), m_cast_endpoint, 0, sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Client_connection [" << *this << "]: Cast [" << name << "] not sent: "
                     "[" << sys_err_code << "] [" << sys_err_code.message() << "].  Will reopen the socket "
                     "next time.");
    m_cast_socket.reset();
    return;
  }
  // else
  FLOW_LOG_TRACE("Client_connection [" << *this << "]: Cast [" << name << "] sent ([" << payload.size() << "] "
                 "bytes).");
} // Client_connection::cast()

const Client_config& Client_connection::config() const
{
  return m_config;
}

std::ostream& operator<<(std::ostream& os, const Client_connection& val)
{
  return os << val.config().m_host << ':' << val.config().m_reliable_port << '/' << val.config().m_lossy_port
            << '@' << static_cast<const void*>(&val);
}

} // namespace hostctl::client
