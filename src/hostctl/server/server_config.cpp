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
#include "hostctl/server/server_config.hpp"
#include "hostctl/error.hpp"
#include <flow/error/error.hpp>
#include <boost/program_options.hpp>
#include <boost/chrono/round.hpp>
#include <ostream>

namespace hostctl::server
{

bool parse_server_config(int argc, const char* const* argv, Server_config* config, std::ostream* os,
                         Error_code* err_code)
{
  namespace opts = boost::program_options;
  using flow::error::Runtime_error;
  using boost::chrono::milliseconds;
  using boost::chrono::duration_cast;

  assert(config && os);

  const auto to_ms = [](util::Fine_duration duration) -> uint64_t
  {
    return duration_cast<milliseconds>(duration).count();
  };

  Server_config parsed = *config;
  auto& reliable = parsed.m_reliable;
  uint64_t read_timeout_ms = to_ms(reliable.m_read_timeout);
  uint64_t idle_timeout_ms = to_ms(reliable.m_idle_timeout);
  uint64_t write_timeout_ms = to_ms(reliable.m_write_timeout);
  uint64_t completion_timeout_ms = to_ms(reliable.m_completion_timeout);
  bool host_driven = false;

  opts::options_description desc("hostctl server options");
  desc.add_options()
    ("help", "Print this help and exit.")
    ("host", opts::value<std::string>(&parsed.m_host)->default_value(parsed.m_host),
     "Address on which both transports listen.")
    ("reliable-port", opts::value<uint16_t>(&parsed.m_reliable_port)->default_value(parsed.m_reliable_port),
     "Reliable (TCP) port; 0 = ephemeral.")
    ("lossy-port", opts::value<uint16_t>(&parsed.m_lossy_port)->default_value(parsed.m_lossy_port),
     "Lossy (UDP) port; 0 = ephemeral.")
    ("queue-capacity", opts::value<size_t>(&parsed.m_queue_capacity)->default_value(parsed.m_queue_capacity),
     "Max commands pending execution; more are refused.")
    ("max-message-size",
     opts::value<size_t>(&reliable.m_max_message_size)->default_value(reliable.m_max_message_size),
     "Max framed reliable request, in bytes.")
    ("read-timeout-ms", opts::value<uint64_t>(&read_timeout_ms)->default_value(read_timeout_ms),
     "Max wait between reads of a partially received request.")
    ("idle-timeout-ms", opts::value<uint64_t>(&idle_timeout_ms)->default_value(idle_timeout_ms),
     "Max idle time of a reliable connection; 0 = unlimited.")
    ("write-timeout-ms", opts::value<uint64_t>(&write_timeout_ms)->default_value(write_timeout_ms),
     "Max time to flush one response.")
    ("completion-timeout-ms", opts::value<uint64_t>(&completion_timeout_ms)->default_value(completion_timeout_ms),
     "Max wait for a submitted command's result.")
    ("host-driven", opts::bool_switch(&host_driven),
     "Do not start an execution thread; the host drains commands itself.")
    ("log-level", opts::value<flow::log::Sev>(&parsed.m_log_severity)->default_value(parsed.m_log_severity),
     "Log verbosity (NONE, FATAL, ERROR, WARNING, INFO, DEBUG, TRACE, DATA).");

  std::string problem;
  opts::variables_map vm;
  try
  {
    opts::store(opts::parse_command_line(argc, argv, desc), vm);
    opts::notify(vm);
  }
  catch (const opts::error& exc)
  {
    problem = exc.what();
  }

  if (problem.empty() && vm.count("help"))
  {
    *os << desc;
    if (err_code)
    {
      err_code->clear();
    }
    return true;
  }
  // else

  if (problem.empty())
  {
    Error_code addr_err_code;
    boost::asio::ip::make_address(parsed.m_host, addr_err_code);
    if (addr_err_code)
    {
      problem = "--host [" + parsed.m_host + "] is not an IP address";
    }
    else if (parsed.m_queue_capacity == 0)
    {
      problem = "--queue-capacity must be positive";
    }
    else if (reliable.m_max_message_size == 0)
    {
      problem = "--max-message-size must be positive";
    }
    else if ((read_timeout_ms == 0) || (write_timeout_ms == 0) || (completion_timeout_ms == 0))
    {
      problem = "--read-timeout-ms, --write-timeout-ms and --completion-timeout-ms must be positive";
    }
  }

  if (!problem.empty())
  {
    *os << "Bad command line: " << problem << ".\n";
    if (err_code)
    {
      *err_code = error::Code::S_INVALID_ARGUMENT;
      return false;
    }
    // else
    throw Runtime_error(error::Code::S_INVALID_ARGUMENT, problem);
  }
  // else

  reliable.m_read_timeout = milliseconds(read_timeout_ms);
  reliable.m_idle_timeout = milliseconds(idle_timeout_ms);
  reliable.m_write_timeout = milliseconds(write_timeout_ms);
  reliable.m_completion_timeout = milliseconds(completion_timeout_ms);
  if (host_driven)
  {
    parsed.m_serializer_mode = dispatch::Serializer_mode::S_HOST_DRIVEN;
  }

  *config = std::move(parsed);
  if (err_code)
  {
    err_code->clear();
  }
  return false;
} // parse_server_config()

std::ostream& operator<<(std::ostream& os, const Server_config& val)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  const auto& reliable = val.m_reliable;
  return os << "host[" << val.m_host << "] reliable_port[" << val.m_reliable_port << "] "
               "lossy_port[" << val.m_lossy_port << "] queue_capacity[" << val.m_queue_capacity << "] "
               "mode[" << val.m_serializer_mode << "] max_message_size[" << reliable.m_max_message_size << "] "
               "timeouts(read/idle/write/completion)[" << round<milliseconds>(reliable.m_read_timeout) << '/'
            << round<milliseconds>(reliable.m_idle_timeout) << '/' << round<milliseconds>(reliable.m_write_timeout)
            << '/' << round<milliseconds>(reliable.m_completion_timeout) << ']';
}

} // namespace hostctl::server
