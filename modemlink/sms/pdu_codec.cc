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

#include "modemlink/sms/pdu_codec.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <utility>

#include "modemlink/base/constants.hpp"
#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/diagnostics/logger.hpp"
#include "modemlink/sms/gsm7.hpp"
#include "modemlink/sms/unicode.hpp"

namespace modemlink {
namespace sms {

using diagnostics::CodecException;

namespace {

constexpr uint8_t FIRST_OCTET_SUBMIT = 0x01;  // TP-MTI submit, no validity period
constexpr uint8_t TOA_INTERNATIONAL = 0x91;
constexpr uint8_t TOA_UNKNOWN = 0x81;
constexpr uint8_t DCS_GSM7 = 0x00;
constexpr uint8_t DCS_UCS2 = 0x08;
constexpr uint8_t UDHI_BIT = 0x40;
constexpr uint8_t IEI_CONCAT_8BIT = 0x00;
constexpr uint8_t IEI_CONCAT_16BIT = 0x08;

constexpr char SEMI_OCTET_DIGITS[] = "0123456789*#abc";

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

// Bounds-checked cursor over a binary PDU
class PduReader {
 public:
  explicit PduReader(const std::vector<uint8_t>& data) : data_(data) {}

  uint8_t byte(const char* field) {
    require(1, field);
    return data_[pos_++];
  }

  std::vector<uint8_t> bytes(size_t count, const char* field) {
    require(count, field);
    std::vector<uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                             data_.begin() + static_cast<std::ptrdiff_t>(pos_ + count));
    pos_ += count;
    return out;
  }

  void skip(size_t count, const char* field) {
    require(count, field);
    pos_ += count;
  }

 private:
  void require(size_t count, const char* field) const {
    if (data_.size() - pos_ < count) {
      throw CodecException(std::string("PDU truncated in ") + field, "decode_pdu");
    }
  }

  const std::vector<uint8_t>& data_;
  size_t pos_ = 0;
};

void append_address(const std::string& number, std::vector<uint8_t>& octets) {
  const bool international = !number.empty() && number[0] == '+';
  const std::string digits = international ? number.substr(1) : number;

  if (digits.empty() || digits.size() > base::constants::MAX_ADDRESS_DIGITS ||
      !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    throw CodecException("invalid destination number: " + number, "encode_submit");
  }

  octets.push_back(static_cast<uint8_t>(digits.size()));
  octets.push_back(international ? TOA_INTERNATIONAL : TOA_UNKNOWN);
  for (size_t i = 0; i < digits.size(); i += 2) {
    const uint8_t low = static_cast<uint8_t>(digits[i] - '0');
    const uint8_t high = i + 1 < digits.size() ? static_cast<uint8_t>(digits[i + 1] - '0') : 0x0F;
    octets.push_back(static_cast<uint8_t>((high << 4) | low));
  }
}

std::string utf16be_to_utf8(const uint8_t* data, size_t length) {
  std::u16string units;
  units.reserve(length / 2);
  for (size_t i = 0; i + 1 < length; i += 2) {
    units.push_back(static_cast<char16_t>((data[i] << 8) | data[i + 1]));
  }
  return unicode::utf16_to_utf8(units);
}

std::string latin1_to_utf8(const uint8_t* data, size_t length) {
  std::u32string text(data, data + length);
  return unicode::utf32_to_utf8(text);
}

std::string decode_semi_octets(const std::vector<uint8_t>& octets, size_t digit_count) {
  std::string out;
  out.reserve(digit_count);
  for (uint8_t octet : octets) {
    for (uint8_t nibble : {static_cast<uint8_t>(octet & 0x0F), static_cast<uint8_t>(octet >> 4)}) {
      if (out.size() == digit_count || nibble == 0x0F) return out;
      out.push_back(SEMI_OCTET_DIGITS[nibble]);
    }
  }
  return out;
}

std::string read_address(PduReader& reader) {
  const uint8_t digit_count = reader.byte("address length");
  const uint8_t type = reader.byte("address type");
  const auto octets = reader.bytes((digit_count + 1u) / 2u, "address");

  if ((type & 0x70) == 0x50) {
    // Alphanumeric sender, GSM-7 packed
    const auto septets = gsm7::unpack(octets.data(), octets.size(), digit_count * 4u / 7u);
    return unicode::utf32_to_utf8(gsm7::from_septets(septets));
  }

  std::string address = decode_semi_octets(octets, digit_count);
  if ((type & 0x70) == 0x10 && !address.empty()) {
    address.insert(0, "+");
  }
  return address;
}

int bcd_swapped(uint8_t octet) {
  const int low = octet & 0x0F;
  const int high = octet >> 4;
  if (low > 9 || high > 9) {
    throw CodecException("invalid timestamp digit", "decode_pdu");
  }
  return low * 10 + high;
}

// SCTS: YY MM DD hh mm ss tz, each semi-octet swapped; the zone is not rendered
std::string decode_timestamp(const std::vector<uint8_t>& scts) {
  std::ostringstream oss;
  oss << std::setfill('0') << "20" << std::setw(2) << bcd_swapped(scts[0]) << '/' << std::setw(2)
      << bcd_swapped(scts[1]) << '/' << std::setw(2) << bcd_swapped(scts[2]) << ' ' << std::setw(2)
      << bcd_swapped(scts[3]) << ':' << std::setw(2) << bcd_swapped(scts[4]) << ':' << std::setw(2)
      << bcd_swapped(scts[5]);
  return oss.str();
}

DataCoding coding_of(uint8_t dcs) {
  if ((dcs & 0x80) == 0) {
    // General data coding and automatic deletion groups: alphabet in bits 3..2
    switch ((dcs >> 2) & 0x03) {
      case 0x01:
        return DataCoding::EightBit;
      case 0x02:
        return DataCoding::Ucs2;
      default:
        return DataCoding::Gsm7;
    }
  }
  if ((dcs & 0xF0) == 0xF0) return (dcs & 0x04) ? DataCoding::EightBit : DataCoding::Gsm7;
  if ((dcs & 0xF0) == 0xE0) return DataCoding::Ucs2;
  return DataCoding::Gsm7;
}

struct Concatenation {
  int ref = 0;
  int total = 1;
  int seq = 1;
};

bool plausible(const Concatenation& c) { return c.total >= 1 && c.seq >= 1 && c.seq <= c.total; }

bool parse_concatenation(const uint8_t* header, size_t length, Concatenation& out) {
  size_t i = 0;
  while (i + 2 <= length) {
    const uint8_t iei = header[i];
    const uint8_t iel = header[i + 1];
    if (i + 2 + iel > length) break;
    const uint8_t* ie = header + i + 2;
    Concatenation c;
    if (iei == IEI_CONCAT_8BIT && iel == 3) {
      c.ref = ie[0];
      c.total = ie[1];
      c.seq = ie[2];
    } else if (iei == IEI_CONCAT_16BIT && iel == 4) {
      c.ref = (ie[0] << 8) | ie[1];
      c.total = ie[2];
      c.seq = ie[3];
    } else {
      i += 2u + iel;
      continue;
    }
    if (plausible(c)) {
      out = c;
      return true;
    }
    return false;
  }
  return false;
}

void decode_user_data(PduReader& reader, uint8_t udl, bool has_header, DecodedPdu& out) {
  const size_t ud_octets = out.coding == DataCoding::Gsm7 ? (udl * 7u + 7u) / 8u : udl;
  const auto ud = reader.bytes(ud_octets, "user data");

  size_t header_octets = 0;
  if (has_header) {
    if (ud.empty()) throw CodecException("missing user data header", "decode_pdu");
    header_octets = ud[0] + 1u;
    if (header_octets > ud.size()) throw CodecException("user data header overruns user data", "decode_pdu");

    Concatenation concat;
    if (parse_concatenation(ud.data() + 1, header_octets - 1, concat)) {
      out.ref = concat.ref;
      out.total = concat.total;
      out.seq = concat.seq;
    }
  }

  const uint8_t* body = ud.data() + header_octets;
  const size_t body_length = ud.size() - header_octets;

  switch (out.coding) {
    case DataCoding::Gsm7: {
      // Text after a header starts on the next septet boundary
      const unsigned fill_bits = header_octets ? static_cast<unsigned>((7 - (header_octets * 8) % 7) % 7) : 0u;
      const size_t header_septets = (header_octets * 8 + fill_bits) / 7;
      if (header_septets > udl) throw CodecException("user data header longer than user data", "decode_pdu");
      const auto septets = gsm7::unpack(body, body_length, udl - header_septets, fill_bits);
      out.text = unicode::utf32_to_utf8(gsm7::from_septets(septets));
      break;
    }
    case DataCoding::Ucs2:
      if (body_length % 2 != 0) throw CodecException("odd UCS2 user data length", "decode_pdu");
      out.text = utf16be_to_utf8(body, body_length);
      break;
    case DataCoding::EightBit:
      out.text = latin1_to_utf8(body, body_length);
      break;
  }
}

}  // namespace

std::string to_hex(const std::vector<uint8_t>& bytes) {
  static constexpr char DIGITS[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(DIGITS[b >> 4]);
    out.push_back(DIGITS[b & 0x0F]);
  }
  return out;
}

bool from_hex(const std::string& hex, std::vector<uint8_t>& bytes) {
  if (hex.size() % 2 != 0) return false;
  bytes.clear();
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int high = hex_value(hex[i]);
    const int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) return false;
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return true;
}

SubmitPdu encode_submit(const std::string& number, const std::string& text) {
  std::u32string code_points;
  if (!unicode::utf8_to_utf32(text, code_points)) {
    throw CodecException("message text is not valid UTF-8", "encode_submit");
  }

  SubmitPdu pdu;
  pdu.octets.push_back(0x00);  // SMSC: modem default
  pdu.octets.push_back(FIRST_OCTET_SUBMIT);
  pdu.octets.push_back(0x00);  // TP-MR, assigned by the modem
  append_address(number, pdu.octets);
  pdu.octets.push_back(0x00);  // TP-PID

  std::vector<uint8_t> septets;
  if (gsm7::to_septets(code_points, septets)) {
    if (septets.size() > base::constants::MAX_GSM7_SEPTETS) {
      throw CodecException("message needs " + std::to_string(septets.size()) + " septets, limit is " +
                               std::to_string(base::constants::MAX_GSM7_SEPTETS),
                           "encode_submit");
    }
    pdu.coding = DataCoding::Gsm7;
    pdu.octets.push_back(DCS_GSM7);
    pdu.octets.push_back(static_cast<uint8_t>(septets.size()));
    const auto packed = gsm7::pack(septets);
    pdu.octets.insert(pdu.octets.end(), packed.begin(), packed.end());
  } else {
    std::u16string units;
    if (!unicode::utf8_to_utf16(text, units)) {
      throw CodecException("message text is not valid UTF-8", "encode_submit");
    }
    const size_t octet_count = units.size() * 2;
    if (octet_count > base::constants::MAX_USER_DATA_OCTETS) {
      throw CodecException("message needs " + std::to_string(octet_count) + " UCS2 octets, limit is " +
                               std::to_string(base::constants::MAX_USER_DATA_OCTETS),
                           "encode_submit");
    }
    pdu.coding = DataCoding::Ucs2;
    pdu.octets.push_back(DCS_UCS2);
    pdu.octets.push_back(static_cast<uint8_t>(octet_count));
    for (char16_t unit : units) {
      pdu.octets.push_back(static_cast<uint8_t>(unit >> 8));
      pdu.octets.push_back(static_cast<uint8_t>(unit & 0xFF));
    }
  }

  pdu.tpdu_length = pdu.octets.size() - 1;
  pdu.hex = to_hex(pdu.octets);
  return pdu;
}

std::string encode_ucs2_hex(const std::string& text) {
  std::u16string units;
  if (!unicode::utf8_to_utf16(text, units)) {
    throw CodecException("text is not valid UTF-8", "encode_ucs2_hex");
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(units.size() * 2);
  for (char16_t unit : units) {
    bytes.push_back(static_cast<uint8_t>(unit >> 8));
    bytes.push_back(static_cast<uint8_t>(unit & 0xFF));
  }
  return to_hex(bytes);
}

FragmentPayload decode_fragment(const std::string& hex_payload) {
  FragmentPayload literal;
  literal.text = hex_payload;

  std::vector<uint8_t> bytes;
  if (!from_hex(trim(hex_payload), bytes)) {
    MODEMLINK_LOG_DEBUG("codec", "decode_fragment", "Payload is not hex, keeping it as text");
    return literal;
  }

  FragmentPayload out;
  size_t offset = 0;
  if (bytes.size() >= 6 && bytes[0] == 0x05 && bytes[1] == 0x00 && bytes[2] == 0x03) {
    out.ref = bytes[3];
    out.total = bytes[4];
    out.seq = bytes[5];
    offset = 6;
  } else if (bytes.size() >= 7 && bytes[0] == 0x06 && bytes[1] == 0x08 && bytes[2] == 0x04) {
    out.ref = (bytes[3] << 8) | bytes[4];
    out.total = bytes[5];
    out.seq = bytes[6];
    offset = 7;
  }

  if ((bytes.size() - offset) % 2 != 0) {
    MODEMLINK_LOG_DEBUG("codec", "decode_fragment", "Odd UCS2 byte count, keeping payload as text");
    return literal;
  }

  if (out.total < 1 || out.seq < 1 || out.seq > out.total) {
    out.ref = 0;
    out.total = 1;
    out.seq = 1;
  }
  out.text = utf16be_to_utf8(bytes.data() + offset, bytes.size() - offset);
  return out;
}

DecodedPdu decode_pdu(const std::string& hex) {
  std::vector<uint8_t> raw;
  if (!from_hex(trim(hex), raw)) {
    throw CodecException("PDU is not valid hex", "decode_pdu");
  }

  PduReader reader(raw);
  const uint8_t smsc_length = reader.byte("SMSC length");
  reader.skip(smsc_length, "SMSC address");

  const uint8_t first = reader.byte("first octet");
  DecodedPdu out;
  switch (first & 0x03) {
    case 0x00:
      out.address = read_address(reader);
      break;
    case 0x01:
      out.is_submit = true;
      reader.skip(1, "message reference");
      out.address = read_address(reader);
      break;
    default:
      throw CodecException("unsupported PDU type " + std::to_string(first & 0x03), "decode_pdu");
  }

  reader.skip(1, "protocol identifier");
  out.coding = coding_of(reader.byte("data coding scheme"));

  if (!out.is_submit) {
    out.timestamp = decode_timestamp(reader.bytes(7, "timestamp"));
  } else {
    switch ((first >> 3) & 0x03) {
      case 0x02:
        reader.skip(1, "validity period");
        break;
      case 0x01:
      case 0x03:
        reader.skip(7, "validity period");
        break;
      default:
        break;
    }
  }

  const uint8_t udl = reader.byte("user data length");
  decode_user_data(reader, udl, (first & UDHI_BIT) != 0, out);
  return out;
}

std::string decode_ucs2_hex(const std::string& hex) {
  std::vector<uint8_t> bytes;
  if (!from_hex(trim(hex), bytes) || bytes.size() % 2 != 0) {
    return hex;
  }
  return utf16be_to_utf8(bytes.data(), bytes.size());
}

std::vector<LogicalSms> reassemble(const std::vector<SmsFragment>& fragments) {
  auto as_message = [](const SmsFragment& f) {
    LogicalSms sms;
    sms.index = f.index;
    sms.status = f.status;
    sms.number = f.sender;
    sms.time = f.timestamp;
    sms.message = f.text;
    return sms;
  };

  std::vector<LogicalSms> result;
  std::map<std::pair<std::string, int>, std::vector<const SmsFragment*>> groups;

  for (const auto& fragment : fragments) {
    if (fragment.total <= 1) {
      result.push_back(as_message(fragment));
    } else {
      groups[{fragment.sender, fragment.ref}].push_back(&fragment);
    }
  }

  for (auto& entry : groups) {
    auto& parts = entry.second;
    std::stable_sort(parts.begin(), parts.end(),
                     [](const SmsFragment* a, const SmsFragment* b) { return a->seq < b->seq; });

    const int total = parts.front()->total;
    bool complete = parts.size() == static_cast<size_t>(total);
    for (size_t i = 0; complete && i < parts.size(); ++i) {
      complete = parts[i]->total == total && parts[i]->seq == static_cast<int>(i) + 1;
    }

    if (!complete) {
      MODEMLINK_LOG_DEBUG("codec", "reassemble",
                          "Incomplete group from " + entry.first.first + " ref " + std::to_string(entry.first.second) +
                              ": " + std::to_string(parts.size()) + "/" + std::to_string(total) + " parts");
      for (const auto* part : parts) result.push_back(as_message(*part));
      continue;
    }

    LogicalSms merged = as_message(*parts.front());
    merged.message.clear();
    for (const auto* part : parts) merged.message += part->text;
    result.push_back(std::move(merged));
  }

  std::stable_sort(result.begin(), result.end(),
                   [](const LogicalSms& a, const LogicalSms& b) { return a.index < b.index; });
  return result;
}

}  // namespace sms
}  // namespace modemlink
