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

#include <string>

namespace modemlink {
namespace sms {
namespace unicode {

// Return false on malformed UTF-8; `out` is left unspecified
bool utf8_to_utf16(const std::string& in, std::u16string& out);
bool utf8_to_utf32(const std::string& in, std::u32string& out);

// Lone surrogates become U+FFFD
std::string utf16_to_utf8(const std::u16string& in);
std::string utf32_to_utf8(const std::u32string& in);

}  // namespace unicode
}  // namespace sms
}  // namespace modemlink
