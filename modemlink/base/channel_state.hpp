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

namespace modemlink {
namespace base {

/**
 * @brief Lifecycle of one physical modem link
 */
enum class ChannelState { Opening, Verifying, Initialized, Active, Closed, Failed };

inline const char* to_cstr(ChannelState s) {
  switch (s) {
    case ChannelState::Opening:
      return "Opening";
    case ChannelState::Verifying:
      return "Verifying";
    case ChannelState::Initialized:
      return "Initialized";
    case ChannelState::Active:
      return "Active";
    case ChannelState::Closed:
      return "Closed";
    case ChannelState::Failed:
      return "Failed";
  }
  return "?";
}

}  // namespace base
}  // namespace modemlink
