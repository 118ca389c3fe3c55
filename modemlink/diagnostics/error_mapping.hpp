/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "modemlink/base/error_codes.hpp"

namespace modemlink {
namespace diagnostics {

/**
 * @brief Maps boost::system::error_code from the serial link to ErrorCode
 */
inline ErrorCode to_error_code(const boost::system::error_code& ec) {
  if (!ec) return ErrorCode::Success;

  if (ec == boost::asio::error::timed_out) return ErrorCode::TimedOut;
  if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::bad_descriptor) {
    return ErrorCode::Closed;
  }
  if (ec == boost::asio::error::not_connected) return ErrorCode::NotConnected;
  if (ec == boost::asio::error::invalid_argument) return ErrorCode::InvalidArgument;

  return ErrorCode::TransportError;
}

/**
 * @brief Whether the background listener should back off and read again
 *
 * Only a closed handle ends the read loop; everything else is treated as a
 * transient link hiccup.
 */
inline bool is_retryable_read_error(const boost::system::error_code& ec) {
  if (!ec) return false;
  if (ec == boost::asio::error::operation_aborted) return false;
  if (ec == boost::asio::error::bad_descriptor) return false;
  return true;
}

}  // namespace diagnostics
}  // namespace modemlink
