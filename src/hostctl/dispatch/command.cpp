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
#include "hostctl/dispatch/command.hpp"
#include "hostctl/dispatch/session_api.hpp"
#include "hostctl/error.hpp"
#include <ostream>

namespace hostctl::dispatch
{

namespace
{

/// Wire member names.
constexpr char S_KEY_TYPE[] = "type";
constexpr char S_KEY_PARAMS[] = "params";
constexpr char S_KEY_ID[] = "id";
constexpr char S_KEY_STATUS[] = "status";
constexpr char S_KEY_RESULT[] = "result";
constexpr char S_KEY_MESSAGE[] = "message";
constexpr char S_STATUS_SUCCESS[] = "success";
constexpr char S_STATUS_ERROR[] = "error";

/**
 * Parses `payload` into `doc` without throwing.
 *
 * @param payload
 *        Text.
 * @param doc
 *        Result, if returning `true`.
 * @param problem
 *        If not null, on failure set to the parser's complaint.
 * @return `true` on success.
 */
bool parse_json(util::String_view payload, Json* doc, std::string* problem)
{
  try
  {
    *doc = Json::parse(payload.begin(), payload.end());
  }
  catch (const Json::parse_error& exc)
  {
    if (problem)
    {
      *problem = flow::util::ostream_op_string("Invalid JSON: ", exc.what());
    }
    return false;
  }
  return true;
}

} // namespace (anon)

// Session_api implementations.

Session_api::~Session_api() = default;

// Response implementations.

Response::Response() :
  m_status(Status::S_SUCCESS)
{
  // That's it.
}

Response Response::success(Json&& result) // Static.
{
  Response response;
  response.m_result = std::move(result);
  return response;
}

Response Response::failure(const Error_code& err_code, util::String_view message) // Static.
{
  assert(err_code && "An error Response must carry a truthy Error_code.");

  Response response;
  response.m_status = Status::S_ERROR;
  response.m_message = std::string(message);
  response.m_err_code = err_code;
  return response;
}

bool Response::ok() const
{
  return m_status == Status::S_SUCCESS;
}

// Free function implementations.

Error_code decode_command(util::String_view payload, Transport transport, Command* command, std::string* problem)
{
  assert(command);

  Json doc;
  if (!parse_json(payload, &doc, problem))
  {
    return error::Code::S_PROTOCOL_MALFORMED_PAYLOAD;
  }
  // else

  const auto fail = [&](util::String_view what) -> Error_code
  {
    if (problem)
    {
      *problem = std::string(what);
    }
    return error::Code::S_PROTOCOL_MALFORMED_PAYLOAD;
  };

  if (!doc.is_object())
  {
    return fail("Invalid command: top-level JSON value must be an object");
  }
  // else
  const auto type_it = doc.find(S_KEY_TYPE);
  if ((type_it == doc.end()) || (!type_it->is_string()) || type_it->get_ref<const std::string&>().empty())
  {
    return fail("Invalid command: missing or non-string \"type\"");
  }
  // else
  const auto params_it = doc.find(S_KEY_PARAMS);
  if ((params_it != doc.end()) && (!params_it->is_object()))
  {
    return fail("Invalid command: \"params\" must be an object");
  }
  // else

  command->m_name = std::move(type_it->get_ref<std::string&>());
  command->m_params = (params_it == doc.end()) ? Json::object() : std::move(*params_it);
  command->m_transport = transport;
  command->m_descriptor = nullptr;

  const auto id_it = doc.find(S_KEY_ID);
  if (id_it == doc.end())
  {
    command->m_correlation.reset();
  }
  else
  {
    command->m_correlation = std::move(*id_it);
  }

  return Error_code();
} // decode_command()

std::string encode_command(util::String_view name, const Json& params, const Json* correlation)
{
  assert(params.is_object() || params.is_null());

  Json doc = Json::object();
  doc[S_KEY_TYPE] = std::string(name);
  doc[S_KEY_PARAMS] = params.is_null() ? Json::object() : params;
  if (correlation)
  {
    doc[S_KEY_ID] = *correlation;
  }
  return doc.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string encode_response(const Response& response)
{
  Json doc = Json::object();
  if (response.ok())
  {
    doc[S_KEY_STATUS] = S_STATUS_SUCCESS;
    doc[S_KEY_RESULT] = response.m_result;
  }
  else
  {
    doc[S_KEY_STATUS] = S_STATUS_ERROR;
    doc[S_KEY_MESSAGE] = response.m_message;
  }
  if (response.m_correlation)
  {
    doc[S_KEY_ID] = *response.m_correlation;
  }

  return doc.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Error_code decode_response(util::String_view payload, Response* response)
{
  assert(response);

  Json doc;
  if ((!parse_json(payload, &doc, nullptr)) || (!doc.is_object()))
  {
    return error::Code::S_PROTOCOL_MALFORMED_PAYLOAD;
  }
  // else
  const auto status_it = doc.find(S_KEY_STATUS);
  if ((status_it == doc.end()) || (!status_it->is_string()))
  {
    return error::Code::S_PROTOCOL_MALFORMED_PAYLOAD;
  }
  // else

  const auto& status = status_it->get_ref<const std::string&>();
  if (status == S_STATUS_SUCCESS)
  {
    const auto result_it = doc.find(S_KEY_RESULT);
    *response = Response::success((result_it == doc.end()) ? Json() : std::move(*result_it));
  }
  else if (status == S_STATUS_ERROR)
  {
    const auto msg_it = doc.find(S_KEY_MESSAGE);
    *response = Response::failure(error::Code::S_REMOTE_ERROR_RESPONSE,
                                  ((msg_it != doc.end()) && msg_it->is_string())
                                    ? msg_it->get_ref<const std::string&>()
                                    : std::string("Unknown error"));
  }
  else
  {
    return error::Code::S_PROTOCOL_MALFORMED_PAYLOAD;
  }

  const auto id_it = doc.find(S_KEY_ID);
  if (id_it != doc.end())
  {
    response->m_correlation = std::move(*id_it);
  }
  return Error_code();
} // decode_response()

std::ostream& operator<<(std::ostream& os, Transport val)
{
  return os << ((val == Transport::S_RELIABLE) ? "reliable" : "lossy");
}

std::ostream& operator<<(std::ostream& os, Safety_tier val)
{
  return os << ((val == Safety_tier::S_NEVER_LOSSY) ? "never-lossy" : "lossy-eligible");
}

std::ostream& operator<<(std::ostream& os, const Command& val)
{
  os << '[' << val.m_name << "] via [" << val.m_transport << ']';
  if (val.m_correlation)
  {
    os << " id [" << val.m_correlation->dump() << ']';
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, Response::Status val)
{
  return os << ((val == Response::Status::S_SUCCESS) ? S_STATUS_SUCCESS : S_STATUS_ERROR);
}

} // namespace hostctl::dispatch
