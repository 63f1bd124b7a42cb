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

#include <flow/util/util.hpp>

#include "hostctl/detail/common.hpp"
#include <nlohmann/json.hpp>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any hostctl/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for hostctl: the command dispatch core that lets external clients drive a stateful,
 * single-threaded host application over two deliberately asymmetric transports.
 *
 * Modules overview
 * ----------------
 *   - *hostctl::dispatch*: the transport-agnostic core.  Command and Response (plus their JSON wire codec),
 *     the Command_registry mapping each command name to a handler and a *safety tier*, the Session_api seam
 *     through which handlers reach host state, and the Execution_serializer: the single consumer context in which
 *     all host-touching work happens, one Command at a time, in FIFO order.
 *   - *hostctl::transport*: the two listeners.  Reliable_listener accepts TCP connections and answers exactly one
 *     Response per request on the same connection.  Lossy_listener receives UDP datagrams, refuses to execute
 *     anything not classified as safe to lose, and never answers.
 *   - *hostctl::client*: Client_connection, the consumer-side library: synchronous `call()` over one reused
 *     reliable connection; fire-and-forget `cast()` over a lazily opened datagram socket.
 *   - *hostctl::server*: wiring of the above into one object, plus its configuration.
 *
 * Ordering
 * --------
 * The only ordering promise anywhere in hostctl is the Execution_serializer's: commands execute in the order in
 * which they were accepted by `submit()`, across all producers combined.  There is *no* ordering relationship
 * between a command sent over the reliable transport and one sent over the lossy transport; nor is there any
 * delivery promise at all for the latter.
 *
 * Error reporting
 * ---------------
 * The conventions are inherited from Flow: a fallible API takes a trailing `Error_code* err_code` which, if null,
 * means "throw `flow::error::Runtime_error` on error," else "set `*err_code` (falsy on success)."
 *
 * Logging
 * -------
 * We use `flow::log`.  Every long-lived object takes a `flow::log::Logger*` (null means log nowhere) and logs
 * under one of the hostctl::Log_component values.
 */
namespace hostctl
{

// Types.  They're outside of `namespace ::hostctl::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

/// Short-hand for the JSON value type used for command parameters, results and the wire format.
using Json = nlohmann::json;

#ifdef HOSTCTL_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by hostctl internal logging.
 * The actual members are generated by `flow::log` macro magic from
 * `log_component_enum_declare.macros.hpp`; look there.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.  See above.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in hostctl::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_HOSTCTL_LOG_COMPONENT_NAME_MAP;

#endif // HOSTCTL_DOXYGEN_ONLY

} // namespace hostctl
