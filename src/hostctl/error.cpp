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
#include "hostctl/error.hpp"
#include "hostctl/util/util_fwd.hpp"

namespace hostctl::error
{

// Types.

/**
 * The boost.system category for errors returned by hostctl.  Think of it as the polymorphic
 * counterpart of error::Code; it kicks in when, for `Error_code ec`, something like `ec.message()` is invoked.
 * The declaration is private to this translation unit.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error.
   *
   * @param val
   *        A #Code `enum` value cast to `int`.
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_TIMEOUT => `"TIMEOUT"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "hostctl";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_PROTOCOL_MALFORMED_PAYLOAD:
    return "Protocol: payload is not a JSON object with a string `type` and (optional) object `params`.";
  case Code::S_PROTOCOL_UNKNOWN_COMMAND:
    return "Protocol: command name is not registered.";
  case Code::S_PROTOCOL_MESSAGE_TOO_LARGE:
    return "Protocol: a single framed message exceeded the configured maximum size.";
  case Code::S_CLASSIFICATION_NEVER_LOSSY_ON_LOSSY:
    return "Classification: a command whose safety tier forbids the lossy transport arrived over the lossy "
           "transport.";
  case Code::S_HANDLER_FAILED:
    return "Handler: the session API raised an error while executing the command.";
  case Code::S_SERIALIZER_QUEUE_FULL:
    return "Execution serializer queue is at capacity; command was not accepted.";
  case Code::S_SERIALIZER_STOPPED:
    return "Execution serializer is stopped; command was not accepted.";
  case Code::S_REGISTRY_SEALED:
    return "Command registry is sealed; registration is only allowed during startup.";
  case Code::S_REGISTRY_DUPLICATE_NAME:
    return "Command registry already contains a command by that name.";
  case Code::S_INVALID_ARGUMENT:
    return "Invalid argument or configuration value.";
  case Code::S_TIMEOUT:
    return "A bounded timeout elapsed before the operation completed.";
  case Code::S_CONNECTION_CLOSED:
    return "Opposing side closed the connection before a complete message was exchanged.";
  case Code::S_NOT_CONNECTED:
    return "Unable to establish a connection to the server.";
  case Code::S_REMOTE_ERROR_RESPONSE:
    return "The server executed or rejected the request and answered with an error Response.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_PROTOCOL_MALFORMED_PAYLOAD:
    return "PROTOCOL_MALFORMED_PAYLOAD";
  case Code::S_PROTOCOL_UNKNOWN_COMMAND:
    return "PROTOCOL_UNKNOWN_COMMAND";
  case Code::S_PROTOCOL_MESSAGE_TOO_LARGE:
    return "PROTOCOL_MESSAGE_TOO_LARGE";
  case Code::S_CLASSIFICATION_NEVER_LOSSY_ON_LOSSY:
    return "CLASSIFICATION_NEVER_LOSSY_ON_LOSSY";
  case Code::S_HANDLER_FAILED:
    return "HANDLER_FAILED";
  case Code::S_SERIALIZER_QUEUE_FULL:
    return "SERIALIZER_QUEUE_FULL";
  case Code::S_SERIALIZER_STOPPED:
    return "SERIALIZER_STOPPED";
  case Code::S_REGISTRY_SEALED:
    return "REGISTRY_SEALED";
  case Code::S_REGISTRY_DUPLICATE_NAME:
    return "REGISTRY_DUPLICATE_NAME";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_TIMEOUT:
    return "TIMEOUT";
  case Code::S_CONNECTION_CLOSED:
    return "CONNECTION_CLOSED";
  case Code::S_NOT_CONNECTED:
    return "NOT_CONNECTED";
  case Code::S_REMOTE_ERROR_RESPONSE:
    return "REMOTE_ERROR_RESPONSE";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace hostctl::error
