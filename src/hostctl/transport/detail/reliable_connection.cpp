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
#include "hostctl/transport/detail/reliable_connection.hpp"
#include "hostctl/dispatch/command_registry.hpp"
#include "hostctl/dispatch/execution_serializer.hpp"
#include "hostctl/error.hpp"
#include <flow/error/error.hpp>
#include <flow/async/util.hpp>
#include <boost/chrono/round.hpp>
#include <cstring>
#include <ostream>

namespace hostctl::transport::detail
{

namespace
{

/// Error Response text when the completion timeout expires.
constexpr char S_COMPLETION_TIMEOUT_MSG[] = "Timeout waiting for operation to complete";

/**
 * Error Response text for a refused submission.
 *
 * @param sys_err_code
 *        Why.
 * @return See above.
 */
std::string submit_failure_message(const Error_code& sys_err_code)
{
  if (sys_err_code == error::Code::S_SERIALIZER_QUEUE_FULL)
  {
    return "Server busy: command queue is full";
  }
  // else
  if (sys_err_code == error::Code::S_SERIALIZER_STOPPED)
  {
    return "Server is shutting down";
  }
  // else
  return sys_err_code.message();
}

} // namespace (anon)

Reliable_connection::Reliable_connection(flow::log::Logger* logger_ptr, uint64_t id,
                                         const boost::asio::ip::tcp& protocol,
                                         Socket::native_handle_type native_socket,
                                         const dispatch::Command_registry& registry,
                                         dispatch::Execution_serializer* serializer,
                                         const Reliable_listener_config& config,
                                         On_closed_func&& on_closed_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_id(id),
  m_registry(registry),
  m_serializer(serializer),
  m_config(config),
  m_on_closed_func(std::move(on_closed_func)),
  m_worker(get_logger(), flow::util::ostream_op_string("hostctl_conn", m_id)),
  m_socket(*(m_worker.task_engine()), protocol, native_socket),
  m_timer(*(m_worker.task_engine())),
  m_timer_generation(0),
  m_state(State::S_READING),
  m_rcv_size(0),
  m_close_after_write(false),
  m_request_seq(0),
  m_n_answered(0)
{
  Error_code sys_err_code;
  m_remote_endpoint = m_socket.remote_endpoint(sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_TRACE("Reliable_connection [" << *this << "]: Could not query remote endpoint; will find out why on "
                   "first read.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }

  m_socket.set_option(boost::asio::ip::tcp::no_delay(true), sys_err_code); // Request/response; don't batch.
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Could not disable Nagle; continuing anyway.");
  }
} // Reliable_connection::Reliable_connection()

Reliable_connection::~Reliable_connection()
{
  FLOW_LOG_TRACE("Reliable_connection [" << *this << "]: Destroying.");
  stop_worker();

  // Thread C is gone; touching the socket from here is safe.
  Error_code sys_err_code;
  m_socket.close(sys_err_code); // Ignore: nothing useful to do.
}

void Reliable_connection::start()
{
  using flow::async::reset_thread_pinning;

  m_worker.start([this]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.
  });

  m_worker.post([this]()
  {
    // We are in thread C.
    FLOW_LOG_INFO("Reliable_connection [" << *this << "]: Connection open; reading requests.");
    process_buffer();
  });
}

void Reliable_connection::stop_worker()
{
  m_worker.stop();
}

void Reliable_connection::process_buffer()
{
  using Scan_result = Json_frame_scanner::Result;

  // We are in thread C.
  assert(m_state == State::S_READING);

  size_t frame_end;
  const auto result = m_scanner.scan(m_rcv_buf.data(), m_rcv_size, &frame_end);

  if (result == Scan_result::S_NEED_MORE)
  {
    if (m_rcv_size > m_config.m_max_message_size)
    {
      FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Pending request exceeds [" <<
                       m_config.m_max_message_size << "] bytes; refusing it and closing.");
      send_response(dispatch::Response::failure(error::Code::S_PROTOCOL_MESSAGE_TOO_LARGE,
                                                "Request exceeds maximum message size"),
                    true);
      return;
    }
    // else
    start_read();
    return;
  }
  // else

  if (result == Scan_result::S_MALFORMED)
  {
    /* Nothing tells us where the garbage ends; drop everything buffered so far.  A sender that continues with
     * well-formed requests resynchronizes at its next write. */
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Received [" << m_rcv_size << "] bytes that do not "
                     "start a JSON object; discarding them and answering with an error.");
    m_rcv_size = 0;
    m_scanner.reset();
    send_response(dispatch::Response::failure(error::Code::S_PROTOCOL_MALFORMED_PAYLOAD,
                                              "Invalid JSON: request must be a JSON object"));
    return;
  }
  // else
  assert(result == Scan_result::S_COMPLETE);

  if (frame_end > m_config.m_max_message_size)
  {
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Request of [" << frame_end << "] bytes exceeds [" <<
                     m_config.m_max_message_size << "] bytes; refusing it and closing.");
    send_response(dispatch::Response::failure(error::Code::S_PROTOCOL_MESSAGE_TOO_LARGE,
                                              "Request exceeds maximum message size"),
                  true);
    return;
  }
  // else

  const std::string frame(m_rcv_buf.data(), frame_end);
  m_rcv_size -= frame_end;
  std::memmove(m_rcv_buf.data(), m_rcv_buf.data() + frame_end, m_rcv_size);
  m_scanner.reset();

  handle_frame(frame);
} // Reliable_connection::process_buffer()

void Reliable_connection::handle_frame(util::String_view frame)
{
  using dispatch::Command;
  using dispatch::Response;
  using dispatch::Transport;
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  // We are in thread C.

  Command command;
  std::string problem;
  auto err_code = dispatch::decode_command(frame, Transport::S_RELIABLE, &command, &problem);
  if (err_code)
  {
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Malformed request ([" << problem << "]); answering "
                     "with an error.");
    send_response(Response::failure(err_code, problem));
    return;
  }
  // else

  command.m_descriptor = m_registry.classify(command.m_name);
  if (!command.m_descriptor)
  {
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Unknown command " << command << "; answering with "
                     "an error.");
    auto response = Response::failure(error::Code::S_PROTOCOL_UNKNOWN_COMMAND,
                                      flow::util::ostream_op_string("Unknown command: ", command.m_name));
    response.m_correlation = std::move(command.m_correlation);
    send_response(response);
    return;
  }
  // else

  FLOW_LOG_TRACE("Reliable_connection [" << *this << "]: Submitting command " << command << ".");

  const auto request_seq = ++m_request_seq;
  m_pending_correlation = command.m_correlation;
  m_state = State::S_AWAITING;
  arm_timer(m_config.m_completion_timeout, [this]()
  {
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: No result within [" <<
                     round<milliseconds>(m_config.m_completion_timeout) << "]; answering with an error and "
                     "closing.  The command may still run; its result will be discarded.");
    auto response = Response::failure(error::Code::S_TIMEOUT, S_COMPLETION_TIMEOUT_MSG);
    response.m_correlation = std::move(m_pending_correlation);
    send_response(response, true);
  });

  const auto task_engine = m_worker.task_engine();
  m_serializer->submit(std::move(command), [this, task_engine, request_seq](Response&& response)
  {
    // We are in the serializer's consumer context.  Hop to thread C; see class doc header on why this is safe.
    boost::asio::post(*task_engine, [this, request_seq, response = std::move(response)]() mutable
    {
      on_response(request_seq, std::move(response));
    });
  }, &err_code);

  if (err_code)
  {
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Serializer refused the command ([" << err_code << "] "
                     "[" << err_code.message() << "]); answering with an error.");
    cancel_timer();
    auto response = Response::failure(err_code, submit_failure_message(err_code));
    response.m_correlation = std::move(m_pending_correlation);
    m_pending_correlation.reset();
    send_response(response);
  }
} // Reliable_connection::handle_frame()

void Reliable_connection::start_read()
{
  using boost::asio::buffer;
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  // We are in thread C.
  assert(m_state == State::S_READING);

  if ((m_rcv_buf.size() - m_rcv_size) < m_config.m_rcv_chunk_size)
  {
    m_rcv_buf.resize(m_rcv_size + m_config.m_rcv_chunk_size);
  }

  if (m_scanner.started())
  {
    arm_timer(m_config.m_read_timeout, [this]()
    {
      FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Partial request of [" << m_rcv_size << "] bytes "
                       "stalled for [" << round<milliseconds>(m_config.m_read_timeout) << "]; closing.");
      close("read timeout");
    });
  }
  else
  {
    arm_timer(m_config.m_idle_timeout, [this]()
    {
      FLOW_LOG_INFO("Reliable_connection [" << *this << "]: Idle for [" <<
                    round<milliseconds>(m_config.m_idle_timeout) << "]; closing.");
      close("idle timeout");
    });
  }

  m_socket.async_read_some(buffer(m_rcv_buf.data() + m_rcv_size, m_rcv_buf.size() - m_rcv_size),
                           [this](const Error_code& sys_err_code, size_t n_rcvd)
  {
    on_read(sys_err_code, n_rcvd);
  });
} // Reliable_connection::start_read()

void Reliable_connection::on_read(const Error_code& sys_err_code, size_t n_rcvd)
{
  // We are in thread C.
  if (m_state == State::S_CLOSED)
  {
    return; // Closed while the read was outstanding (timeout); it was canceled.
  }
  // else
  if (sys_err_code)
  {
    if ((sys_err_code == boost::asio::error::eof) && (!m_scanner.started()))
    {
      FLOW_LOG_INFO("Reliable_connection [" << *this << "]: Peer closed the connection.");
    }
    else
    {
      FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Read failed with [" << m_rcv_size << "] bytes "
                       "pending; closing.  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
    close("read error");
    return;
  }
  // else

  FLOW_LOG_TRACE("Reliable_connection [" << *this << "]: Received [" << n_rcvd << "] bytes.");
  cancel_timer();
  m_rcv_size += n_rcvd;
  process_buffer();
}

void Reliable_connection::on_response(uint64_t request_seq, dispatch::Response&& response)
{
  // We are in thread C.
  if ((m_state != State::S_AWAITING) || (request_seq != m_request_seq))
  {
    FLOW_LOG_TRACE("Reliable_connection [" << *this << "]: Discarding late result for request "
                   "[" << request_seq << "]; its requester was already answered.");
    return;
  }
  // else

  cancel_timer();
  m_pending_correlation.reset();
  send_response(response);
}

void Reliable_connection::send_response(const dispatch::Response& response, bool close_after)
{
  using boost::asio::async_write;
  using boost::asio::buffer;
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  // We are in thread C.
  assert(m_state != State::S_CLOSED);

  m_snd_buf = dispatch::encode_response(response);
  m_close_after_write = close_after;
  m_state = State::S_WRITING;
  ++m_n_answered;

  FLOW_LOG_TRACE("Reliable_connection [" << *this << "]: Sending [" << response.m_status << "] response of "
                 "[" << m_snd_buf.size() << "] bytes.");

  arm_timer(m_config.m_write_timeout, [this]()
  {
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Response not flushed within [" <<
                     round<milliseconds>(m_config.m_write_timeout) << "]; closing.");
    close("write timeout");
  });

  // async_write() loops over partial writes until everything is out or an error occurs.
  async_write(m_socket, buffer(m_snd_buf), [this](const Error_code& sys_err_code, size_t)
  {
    on_write(sys_err_code);
  });
} // Reliable_connection::send_response()

void Reliable_connection::on_write(const Error_code& sys_err_code)
{
  // We are in thread C.
  if (m_state == State::S_CLOSED)
  {
    return;
  }
  // else
  cancel_timer();

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Reliable_connection [" << *this << "]: Write failed; closing.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    close("write error");
    return;
  }
  // else
  if (m_close_after_write)
  {
    close("error response flushed");
    return;
  }
  // else

  m_snd_buf.clear();
  m_state = State::S_READING;
  process_buffer(); // There may be more requests already buffered (pipelining).
}

void Reliable_connection::arm_timer(util::Fine_duration timeout, util::Task&& on_expired)
{
  cancel_timer();
  if (timeout == util::Fine_duration::zero())
  {
    return;
  }
  // else

  const auto generation = m_timer_generation;
  m_timer.expires_after(timeout);
  m_timer.async_wait([this, generation, on_expired = std::move(on_expired)](const Error_code& sys_err_code)
  {
    // We are in thread C.
    if ((sys_err_code == boost::asio::error::operation_aborted) || (generation != m_timer_generation)
        || (m_state == State::S_CLOSED))
    {
      return;
    }
    // else
    on_expired();
  });
}

void Reliable_connection::cancel_timer()
{
  ++m_timer_generation;
  m_timer.cancel();
}

void Reliable_connection::close(util::String_view why)
{
  // We are in thread C.
  if (m_state == State::S_CLOSED)
  {
    return;
  }
  // else

  m_state = State::S_CLOSED;
  cancel_timer();

  Error_code sys_err_code;
  m_socket.shutdown(Socket::shutdown_both, sys_err_code); // Ignore: peer may be gone already.
  m_socket.close(sys_err_code);

  FLOW_LOG_INFO("Reliable_connection [" << *this << "]: Closed (" << why << ") after answering "
                "[" << m_n_answered << "] requests.");
  m_on_closed_func(m_id);
}

uint64_t Reliable_connection::id() const
{
  return m_id;
}

const util::Tcp_endpoint& Reliable_connection::remote_endpoint() const
{
  return m_remote_endpoint;
}

std::ostream& operator<<(std::ostream& os, const Reliable_connection& val)
{
  return os << "conn[" << val.id() << "]<-" << val.remote_endpoint();
}

} // namespace hostctl::transport::detail
