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

#include "modemlink/sms/unicode.hpp"

#include <codecvt>
#include <locale>
#include <stdexcept>

namespace modemlink {
namespace sms {
namespace unicode {

namespace {

constexpr char16_t REPLACEMENT = 0xFFFD;

bool is_high_surrogate(char16_t c) { return c >= 0xD800 && c <= 0xDBFF; }
bool is_low_surrogate(char16_t c) { return c >= 0xDC00 && c <= 0xDFFF; }

}  // namespace

bool utf8_to_utf16(const std::string& in, std::u16string& out) {
  try {
    std::wstring_convert<std::codecvt_utf8_utf16<char16_t>, char16_t> converter;
    out = converter.from_bytes(in);
    // A truncated trailing sequence stops the conversion early without throwing
    return converter.converted() == in.size();
  } catch (const std::range_error&) {
    return false;
  }
}

bool utf8_to_utf32(const std::string& in, std::u32string& out) {
  try {
    std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t> converter;
    out = converter.from_bytes(in);
    // A truncated trailing sequence stops the conversion early without throwing
    return converter.converted() == in.size();
  } catch (const std::range_error&) {
    return false;
  }
}

std::string utf16_to_utf8(const std::u16string& in) {
  // A split surrogate pair at a fragment boundary must not fail the whole text
  std::u16string clean;
  clean.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    const char16_t c = in[i];
    if (is_high_surrogate(c)) {
      if (i + 1 < in.size() && is_low_surrogate(in[i + 1])) {
        clean.push_back(c);
        clean.push_back(in[++i]);
      } else {
        clean.push_back(REPLACEMENT);
      }
    } else if (is_low_surrogate(c)) {
      clean.push_back(REPLACEMENT);
    } else {
      clean.push_back(c);
    }
  }
  return std::wstring_convert<std::codecvt_utf8_utf16<char16_t>, char16_t>{}.to_bytes(clean);
}

std::string utf32_to_utf8(const std::u32string& in) {
  std::u32string clean;
  clean.reserve(in.size());
  for (char32_t c : in) {
    clean.push_back((c > 0x10FFFF || (c >= 0xD800 && c <= 0xDFFF)) ? char32_t(REPLACEMENT) : c);
  }
  return std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t>{}.to_bytes(clean);
}

}  // namespace unicode
}  // namespace sms
}  // namespace modemlink
