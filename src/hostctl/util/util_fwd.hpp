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

#include "hostctl/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>

/**
 * hostctl module containing miscellaneous general-use facilities used by ~all other hostctl modules.
 * As of this writing it is only short-hands; the point is that the other modules spell these types one way.
 */
namespace hostctl::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/// Short-hand for boost.asio event loop (a/k/a `io_context`), as owned by each `Single_thread_task_loop`.
using Task_engine = flow::util::Task_engine;

/// Short-hand for a boost.asio timer bound to a #Task_engine.
using Timer = flow::util::Timer;

/// Short-hand for the TCP endpoint type used by the reliable transport.
using Tcp_endpoint = boost::asio::ip::tcp::endpoint;

/// Short-hand for the UDP endpoint type used by the lossy transport.
using Udp_endpoint = boost::asio::ip::udp::endpoint;

} // namespace hostctl::util
