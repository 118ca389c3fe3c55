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

#include "modemlink/sms/gsm7.hpp"

#include "modemlink/sms/unicode.hpp"

namespace modemlink {
namespace sms {
namespace gsm7 {

namespace {

// GSM 03.38 default alphabet; 0x1B is the escape to the extension table
constexpr char32_t BASIC[128] = {
    U'@',    U'£', U'$',      U'¥', U'è', U'é', U'ù', U'ì',
    U'ò', U'Ç', U'\n',   U'Ø', U'ø', U'\r',     U'Å', U'å',
    U'Δ', U'_',      U'Φ', U'Γ', U'Λ', U'Ω', U'Π', U'Ψ',
    U'Σ', U'Θ', U'Ξ', U' ', U'Æ', U'æ', U'ß', U'É',
    U' ',    U'!',      U'"',      U'#',      U'¤', U'%',      U'&',      U'\'',
    U'(',    U')',      U'*',      U'+',      U',',      U'-',      U'.',      U'/',
    U'0',    U'1',      U'2',      U'3',      U'4',      U'5',      U'6',      U'7',
    U'8',    U'9',      U':',      U';',      U'<',      U'=',      U'>',      U'?',
    U'¡', U'A',    U'B',      U'C',      U'D',      U'E',      U'F',      U'G',
    U'H',    U'I',      U'J',      U'K',      U'L',      U'M',      U'N',      U'O',
    U'P',    U'Q',      U'R',      U'S',      U'T',      U'U',      U'V',      U'W',
    U'X',    U'Y',      U'Z',      U'Ä', U'Ö', U'Ñ', U'Ü', U'§',
    U'¿', U'a',    U'b',      U'c',      U'd',      U'e',      U'f',      U'g',
    U'h',    U'i',      U'j',      U'k',      U'l',      U'm',      U'n',      U'o',
    U'p',    U'q',      U'r',      U's',      U't',      U'u',      U'v',      U'w',
    U'x',    U'y',      U'z',      U'ä', U'ö', U'ñ', U'ü', U'à',
};

struct Extension {
  uint8_t code;
  char32_t ch;
};

constexpr Extension EXTENSION[] = {
    {0x0A, U'\f'}, {0x14, U'^'}, {0x28, U'{'}, {0x29, U'}'}, {0x2F, U'\\'},
    {0x3C, U'['},  {0x3D, U'~'}, {0x3E, U']'}, {0x40, U'|'}, {0x65, U'€'},
};

bool encode_char(char32_t ch, std::vector<uint8_t>& septets) {
  for (uint8_t code = 0; code < 128; ++code) {
    if (code != ESCAPE && BASIC[code] == ch) {
      septets.push_back(code);
      return true;
    }
  }
  for (const auto& ext : EXTENSION) {
    if (ext.ch == ch) {
      septets.push_back(ESCAPE);
      septets.push_back(ext.code);
      return true;
    }
  }
  return false;
}

}  // namespace

bool to_septets(const std::u32string& text, std::vector<uint8_t>& septets) {
  septets.clear();
  septets.reserve(text.size());
  for (char32_t ch : text) {
    if (!encode_char(ch, septets)) return false;
  }
  return true;
}

bool is_encodable(const std::u32string& text) {
  std::vector<uint8_t> septets;
  return to_septets(text, septets);
}

bool is_gsm7_encodable(const std::string& utf8) {
  std::u32string text;
  return unicode::utf8_to_utf32(utf8, text) && is_encodable(text);
}

std::u32string from_septets(const std::vector<uint8_t>& septets) {
  std::u32string text;
  text.reserve(septets.size());
  for (size_t i = 0; i < septets.size(); ++i) {
    const uint8_t code = septets[i] & 0x7F;
    if (code != ESCAPE) {
      text.push_back(BASIC[code]);
      continue;
    }
    if (i + 1 >= septets.size()) break;  // dangling escape
    const uint8_t next = septets[++i] & 0x7F;
    char32_t ch = BASIC[next];
    for (const auto& ext : EXTENSION) {
      if (ext.code == next) {
        ch = ext.ch;
        break;
      }
    }
    text.push_back(ch);
  }
  return text;
}

std::vector<uint8_t> pack(const std::vector<uint8_t>& septets, unsigned fill_bits) {
  const size_t total_bits = fill_bits + septets.size() * 7;
  std::vector<uint8_t> octets((total_bits + 7) / 8, 0);
  size_t bit = fill_bits;
  for (uint8_t septet : septets) {
    for (int i = 0; i < 7; ++i, ++bit) {
      if (septet & (1u << i)) {
        octets[bit / 8] |= static_cast<uint8_t>(1u << (bit % 8));
      }
    }
  }
  return octets;
}

std::vector<uint8_t> unpack(const uint8_t* data, size_t length, size_t septet_count, unsigned fill_bits) {
  std::vector<uint8_t> septets;
  septets.reserve(septet_count);
  const size_t available_bits = length * 8;
  for (size_t n = 0; n < septet_count; ++n) {
    const size_t start = fill_bits + n * 7;
    if (start + 7 > available_bits) break;
    uint8_t septet = 0;
    for (int i = 0; i < 7; ++i) {
      const size_t bit = start + static_cast<size_t>(i);
      if (data[bit / 8] & (1u << (bit % 8))) {
        septet |= static_cast<uint8_t>(1u << i);
      }
    }
    septets.push_back(septet);
  }
  return septets;
}

}  // namespace gsm7
}  // namespace sms
}  // namespace modemlink
