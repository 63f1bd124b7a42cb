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

/**
 * Namespace containing hostctl's extension of boost.system error conventions, so that its APIs can return
 * codes/messages from within its own set of error codes/messages.  Many errors hostctl reports are system errors
 * (e.g., `boost::asio::error::connection_refused`) and would not draw from this set but rather from
 * `boost::asio::error` or `boost::system::errc`.  Mixing is normal in boost.system.
 *
 * The codes fall into the families below.  Which family an error belongs to determines where, if anywhere, it
 * surfaces:
 *   - *Protocol* errors (`S_PROTOCOL_*`): the payload could not be turned into a known Command; detected before any
 *     handler runs.  Reliable caller gets an error Response; lossy sender gets nothing (logged only).
 *   - *Classification* errors (`S_CLASSIFICATION_*`): a command arrived over a transport its safety tier forbids.
 *     Never surfaced to any caller; logged.
 *   - *Handler* errors (`S_HANDLER_*`): the Session_api threw while executing a legitimately classified command.
 *   - Serializer/registry state errors.
 *   - *Transport* errors (`S_TIMEOUT`, `S_CONNECTION_CLOSED`, `S_NOT_CONNECTED`): scoped to one connection.
 *   - `S_REMOTE_ERROR_RESPONSE`: client side only; the server answered, and the answer was an error Response.
 *
 * See Flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace hostctl::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by hostctl functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::connection_reset`.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol to Category::code_symbol().  Add to the end, ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Protocol: payload is not a JSON object with a string `type` and (optional) object `params`.
  S_PROTOCOL_MALFORMED_PAYLOAD = S_CODE_LOWEST_INT_VALUE,

  /// Protocol: command name is not registered.
  S_PROTOCOL_UNKNOWN_COMMAND,

  /// Protocol: a single framed message exceeded the configured maximum size.
  S_PROTOCOL_MESSAGE_TOO_LARGE,

  /// Classification: a command whose safety tier forbids the lossy transport arrived over the lossy transport.
  S_CLASSIFICATION_NEVER_LOSSY_ON_LOSSY,

  /// Handler: the session API raised an error while executing the command.
  S_HANDLER_FAILED,

  /// Execution serializer queue is at capacity; command was not accepted.
  S_SERIALIZER_QUEUE_FULL,

  /// Execution serializer is stopped; command was not accepted.
  S_SERIALIZER_STOPPED,

  /// Command registry is sealed; registration is only allowed during startup.
  S_REGISTRY_SEALED,

  /// Command registry already contains a command by that name.
  S_REGISTRY_DUPLICATE_NAME,

  /// Invalid argument or configuration value.
  S_INVALID_ARGUMENT,

  /// A bounded timeout elapsed before the operation completed.
  S_TIMEOUT,

  /// Opposing side closed the connection before a complete message was exchanged.
  S_CONNECTION_CLOSED,

  /// Unable to establish a connection to the server.
  S_NOT_CONNECTED,

  /// The server executed or rejected the request and answered with an error Response.
  S_REMOTE_ERROR_RESPONSE,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes an error::Code from a standard input stream.  Accepts the `int` value or the case-insensitive
 * symbol minus the `S_` prefix (e.g., "TIMEOUT").  If none is recognized, Code::S_END_SENTINEL is the result.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes an error::Code to a standard output stream, e.g., Code::S_TIMEOUT => `"TIMEOUT"`.  Compatible with the
 * reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace hostctl::error

namespace boost::system
{

// Types.

/// Specialization allowing boost.system to treat hostctl::error::Code as convertible to `Error_code`.
template<>
struct is_error_code_enum<::hostctl::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
