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

#include "hostctl/transport/transport_fwd.hpp"

namespace hostctl::transport
{

/**
 * Incremental delimiter for a byte stream carrying back-to-back JSON objects with no other framing: finds where
 * the first complete top-level object ends, resuming across calls as more bytes arrive, so no byte is examined
 * twice however the stream is split into reads.
 *
 * It tracks only nesting depth and string/escape state; it does not validate JSON.  A frame it returns is
 * therefore merely *balanced*; decoding it may still fail, which is a protocol error for that one message.
 *
 * Usage: append bytes to a buffer; call scan() on the whole not-yet-consumed buffer.  On Result::S_COMPLETE,
 * consume `[0, frame_end)` from the buffer and call reset() before scanning the remainder.
 */
class Json_frame_scanner
{
public:
  // Types.

  /// scan() outcome.
  enum class Result
  {
    /// No complete object yet; keep reading.
    S_NEED_MORE,
    /// An object ends at `*frame_end`.
    S_COMPLETE,
    /// The first non-whitespace byte is not `{`; the stream cannot be framed from here.
    S_MALFORMED
  };

  // Constructors/destructor.

  /// Constructs in the initial state.
  Json_frame_scanner();

  // Methods.

  /**
   * Continues scanning `[0, size)`; bytes before the previous call's `size` must not have changed.
   *
   * @param data
   *        Buffer start.
   * @param size
   *        Buffer size; not less than at the previous call since the last reset().
   * @param frame_end
   *        On Result::S_COMPLETE, set to one past the closing `}`.  Else untouched.
   * @return See Result.
   */
  Result scan(const char* data, size_t size, size_t* frame_end);

  /// Back to the initial state.
  void reset();

  /**
   * Whether any byte other than leading whitespace has been seen since the last reset().
   * @return See above.
   */
  bool started() const;

private:
  // Data.

  /// Bytes examined so far.
  size_t m_pos;

  /// Current `{`/`[` nesting depth.
  size_t m_depth;

  /// Whether #m_pos is inside a string literal.
  bool m_in_string;

  /// Whether the previous byte was an unconsumed backslash inside a string.
  bool m_escape;

  /// See started().
  bool m_started;
}; // class Json_frame_scanner

} // namespace hostctl::transport
