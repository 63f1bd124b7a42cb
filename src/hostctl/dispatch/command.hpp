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

#include "hostctl/dispatch/dispatch_fwd.hpp"
#include <optional>
#include <string>

namespace hostctl::dispatch
{

// Types.

/**
 * One named operation with its parameters, as fully decoded from one wire message by a listener.
 *
 * Wire form (both transports), UTF-8 JSON: `{"type": <name>, "params": <object>, "id": <any>}`, where `params`
 * defaults to `{}` and `id` is optional.
 *
 * Lifetime: created by a listener when a message is decoded; moved into the Execution_serializer; destroyed after
 * it has executed (for a reliable-origin Command, after its Response has been produced).
 */
struct Command
{
  // Data.

  /// Command name (the wire `type`).
  std::string m_name;

  /// Parameters; always a JSON object.
  Json m_params = Json::object();

  /// Which transport carried this.
  Transport m_transport = Transport::S_RELIABLE;

  /// Opaque correlation value (the wire `id`), echoed in the Response if present.
  std::optional<Json> m_correlation;

  /**
   * The registry entry this name was classified to; null until classified.  Points into a sealed
   * Command_registry, which must outlive the Command.
   */
  const Command_descriptor* m_descriptor = nullptr;
}; // struct Command

/**
 * Outcome of one reliable-origin Command: success plus result, or error plus message.  Exactly one is produced per
 * reliable request.  (The Execution_serializer also produces one for a lossy-origin Command, but that one is
 * dropped by the lossy listener's no-op responder.)
 *
 * Wire form: `{"status": "success", "result": <any>}` or `{"status": "error", "message": <string>}`, plus `"id"`
 * if the request carried one.
 */
struct Response
{
  // Types.

  /// The wire `status`.
  enum class Status
  {
    /// `"success"`.
    S_SUCCESS,
    /// `"error"`.
    S_ERROR
  };

  // Constructors/destructor.

  /// Constructs a success Response with `null` result.
  Response();

  // Methods.

  /**
   * Makes a success Response.
   *
   * @param result
   *        Result value.
   * @return See above.
   */
  static Response success(Json&& result);

  /**
   * Makes an error Response.
   *
   * @param err_code
   *        Machine-readable reason; not transmitted on the wire.  Must be truthy.
   * @param message
   *        Human-readable message; transmitted.
   * @return See above.
   */
  static Response failure(const Error_code& err_code, util::String_view message);

  /**
   * Whether #m_status is `S_SUCCESS`.
   * @return See above.
   */
  bool ok() const;

  // Data.

  /// Success or error.
  Status m_status;

  /// Result (meaningful if success).
  Json m_result;

  /// Error message (meaningful if error).
  std::string m_message;

  /**
   * Why the error happened, for logging and local inspection.  Falsy on success.  Not on the wire: a decoded
   * (client-side) error Response carries error::Code::S_REMOTE_ERROR_RESPONSE here.
   */
  Error_code m_err_code;

  /// Echo of Command::m_correlation.
  std::optional<Json> m_correlation;
}; // struct Response

// Free functions.

/**
 * Decodes one complete wire message into a Command (not yet classified: `m_descriptor` is left null).
 *
 * #Error_code returned: falsy on success, else error::Code::S_PROTOCOL_MALFORMED_PAYLOAD (not JSON; not an object;
 * `type` missing or not a non-empty string; `params` present but not an object).
 *
 * @param payload
 *        Exactly one JSON document (leading/trailing whitespace OK).
 * @param transport
 *        Stored into Command::m_transport.
 * @param command
 *        On success, filled out.  On error, unspecified.
 * @param problem
 *        If not null, on error set to a description suitable for an error Response message.
 * @return See above.
 */
Error_code decode_command(util::String_view payload, Transport transport, Command* command, std::string* problem);

/**
 * Encodes a request into wire form.  `params` that is `null` is sent as `{}`.
 *
 * @param name
 *        Command name.
 * @param params
 *        Parameters; must be an object or `null`.
 * @param correlation
 *        If not null, sent as `id`.
 * @return Serialized message.
 */
std::string encode_command(util::String_view name, const Json& params, const Json* correlation = nullptr);

/**
 * Encodes a Response into wire form.  Invalid UTF-8 in strings is replaced rather than failing.
 *
 * @param response
 *        Response to encode.
 * @return Serialized message.
 */
std::string encode_response(const Response& response);

/**
 * Decodes one complete wire Response.
 *
 * #Error_code returned: falsy on success, else error::Code::S_PROTOCOL_MALFORMED_PAYLOAD.
 *
 * @param payload
 *        Exactly one JSON document.
 * @param response
 *        On success, filled out; an error Response gets error::Code::S_REMOTE_ERROR_RESPONSE in `m_err_code`.
 * @return See above.
 */
Error_code decode_response(util::String_view payload, Response* response);

/**
 * Prints string representation of the given Response status to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Response::Status val);

} // namespace hostctl::dispatch
