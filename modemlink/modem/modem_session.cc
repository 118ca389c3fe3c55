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

#include "modemlink/modem/modem_session.hpp"

#include <chrono>

#include "modemlink/base/at_commands.hpp"
#include "modemlink/base/constants.hpp"
#include "modemlink/diagnostics/error_handler.hpp"
#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/diagnostics/logger.hpp"
#include "modemlink/modem/response_parser.hpp"
#include "modemlink/sms/pdu_codec.hpp"
#include "modemlink/util/input_validator.hpp"

namespace modemlink {
namespace modem {

using diagnostics::ProtocolException;

ModemSession::ModemSession(std::shared_ptr<channel::CommandChannel> channel) : channel_(std::move(channel)) {}

ModemSession::~ModemSession() = default;

const std::string& ModemSession::id() const { return channel_->device(); }

bool ModemSession::is_connected() const { return channel_->is_active(); }

std::string ModemSession::query(const std::string& command) { return channel_->send_command(command); }

ModemIdentity ModemSession::get_identity() {
  ModemIdentity identity;

  struct Field {
    const char* command;
    std::optional<std::string>* target;
  };
  const Field fields[] = {{base::at::MANUFACTURER, &identity.manufacturer},
                          {base::at::MODEL, &identity.model},
                          {base::at::IMEI, &identity.imei},
                          {base::at::IMSI, &identity.imsi}};

  for (const auto& field : fields) {
    try {
      const auto response = query(field.command);
      if (parser::has_error(response)) continue;
      auto value = parser::extract_value(response);
      if (!value.empty()) *field.target = std::move(value);
    } catch (const diagnostics::ModemException& e) {
      MODEMLINK_LOG_DEBUG("session", "get_identity", std::string(field.command) + " failed: " + e.what());
    }
  }

  try {
    if (auto op = parser::parse_cops(query(base::at::OPERATOR))) {
      identity.operator_name = op->name;
      if (op->act) identity.access_technology = parser::access_technology_name(*op->act);
    }
  } catch (const diagnostics::ModemException& e) {
    MODEMLINK_LOG_DEBUG("session", "get_identity", std::string("operator query failed: ") + e.what());
  }

  try {
    identity.phone_number = get_phone_number();
  } catch (const diagnostics::ModemException& e) {
    MODEMLINK_LOG_DEBUG("session", "get_identity", std::string("number query failed: ") + e.what());
  }

  return identity;
}

SignalReading ModemSession::get_signal() {
  const auto response = query(base::at::SIGNAL);
  if (parser::has_error(response)) {
    diagnostics::error_reporting::report_protocol_error("session", "get_signal", id(), "signal query rejected",
                                                        response);
    throw ProtocolException("signal query rejected", response, "get_signal");
  }
  auto reading = parser::parse_csq(response);
  if (!reading) {
    diagnostics::error_reporting::report_protocol_error("session", "get_signal", id(), "unparsable +CSQ reply",
                                                        response);
    throw ProtocolException("unparsable +CSQ reply", response, "get_signal");
  }
  return *reading;
}

std::string ModemSession::get_phone_number() {
  const auto response = query(base::at::OWN_NUMBER);
  auto raw = parser::parse_cnum(response);
  if (!raw) {
    throw ProtocolException("phone number not found", response, "get_phone_number");
  }
  return parser::decode_dial_string(*raw);
}

std::vector<sms::LogicalSms> ModemSession::list_sms() {
  const bool pdu = channel_->config().sms_mode == config::SmsMode::Pdu;
  const auto response = query(pdu ? base::at::LIST_ALL_PDU : base::at::LIST_ALL_TEXT);
  if (parser::has_error(response)) {
    diagnostics::error_reporting::report_protocol_error("session", "list_sms", id(), "listing rejected", response);
    throw ProtocolException("message listing rejected", response, "list_sms");
  }

  auto fragments = pdu ? read_pdu_listing(response) : read_text_listing(response);
  MODEMLINK_LOG_DEBUG("session", "list_sms", id() + ": " + std::to_string(fragments.size()) + " stored parts");
  return sms::reassemble(fragments);
}

std::vector<sms::SmsFragment> ModemSession::read_pdu_listing(const std::string& response) {
  std::vector<sms::SmsFragment> fragments;
  for (const auto& record : parser::split_cmgl(response)) {
    // <index>,<stat>,[<alpha>],<length>
    const auto fields = parser::split_fields(record.header);
    sms::SmsFragment fragment;
    int stat = -1;
    if (fields.empty() || !parser::parse_int(fields[0], fragment.index)) continue;
    if (fields.size() > 1) parser::parse_int(fields[1], stat);
    fragment.status = sms::pdu_status_name(stat);

    try {
      const auto decoded = sms::decode_pdu(record.body);
      fragment.sender = decoded.address;
      fragment.timestamp = decoded.timestamp;
      fragment.text = decoded.text;
      fragment.ref = decoded.ref;
      fragment.total = decoded.total;
      fragment.seq = decoded.seq;
    } catch (const diagnostics::CodecException& e) {
      diagnostics::error_reporting::report_codec_error("session", "list_sms", e.what(), record.body);
      fragment.text = record.body;
    }
    fragments.push_back(std::move(fragment));
  }
  return fragments;
}

std::vector<sms::SmsFragment> ModemSession::read_text_listing(const std::string& response) {
  std::vector<sms::SmsFragment> fragments;
  for (const auto& record : parser::split_cmgl(response)) {
    // <index>,"<stat>","<oa>",[<alpha>],"<scts>"
    const auto fields = parser::split_fields(record.header);
    sms::SmsFragment fragment;
    if (fields.size() < 5 || !parser::parse_int(fields[0], fragment.index)) continue;
    fragment.status = fields[1];
    fragment.sender = parser::decode_dial_string(fields[2]);
    fragment.timestamp = fields[4];

    const auto payload = sms::decode_fragment(record.body);
    fragment.text = payload.text;
    fragment.ref = payload.ref;
    fragment.total = payload.total;
    fragment.seq = payload.seq;
    fragments.push_back(std::move(fragment));
  }
  return fragments;
}

void ModemSession::send_sms(const std::string& number, const std::string& text) {
  util::InputValidator::validate_phone_number(number);
  if (channel_->config().sms_mode == config::SmsMode::Pdu) {
    send_sms_pdu(number, text);
  } else {
    send_sms_text(number, text);
  }
  MODEMLINK_LOG_INFO("session", "send_sms", id() + ": message submitted to " + number);
}

void ModemSession::send_sms_pdu(const std::string& number, const std::string& text) {
  const auto pdu = sms::encode_submit(number, text);
  submit_body(base::at::SEND_PREFIX + std::to_string(pdu.tpdu_length), pdu.hex, number);
}

void ModemSession::send_sms_text(const std::string& number, const std::string& text) {
  const auto body = sms::encode_ucs2_hex(text);
  if (body.size() / 2 > base::constants::MAX_USER_DATA_OCTETS) {
    throw diagnostics::CodecException("message needs " + std::to_string(body.size() / 2) +
                                          " UCS2 octets, limit is " +
                                          std::to_string(base::constants::MAX_USER_DATA_OCTETS),
                                      "send_sms");
  }
  submit_body(std::string(base::at::SEND_PREFIX) + "\"" + sms::encode_ucs2_hex(number) + "\"", body, number);
}

void ModemSession::submit_body(const std::string& prompt_command, const std::string& body,
                               const std::string& number) {
  const auto prompt = channel_->send_command(prompt_command);
  if (parser::has_error(prompt) || prompt.find('>') == std::string::npos) {
    diagnostics::error_reporting::report_protocol_error("session", "send_sms", id(), "no message prompt", prompt);
    throw ProtocolException("modem did not prompt for message body", prompt, "send_sms");
  }

  const auto reply = channel_->send_raw(body, base::at::CTRL_Z,
                                        std::chrono::milliseconds(channel_->config().sms_timeout_ms));
  if (parser::has_error(reply)) {
    diagnostics::error_reporting::report_protocol_error("session", "send_sms", id(),
                                                        "message to " + number + " rejected", reply);
    throw ProtocolException("message rejected by modem", reply, "send_sms");
  }
}

void ModemSession::delete_sms(int index) {
  util::InputValidator::validate_sms_index(index);
  const auto response = query(base::at::DELETE_PREFIX + std::to_string(index));
  if (!parser::has_ok_line(response)) {
    diagnostics::error_reporting::report_protocol_error("session", "delete_sms", id(),
                                                        "delete of index " + std::to_string(index) + " failed",
                                                        response);
    throw ProtocolException("delete of index " + std::to_string(index) + " failed", response, "delete_sms");
  }
}

std::vector<int> ModemSession::delete_sms(const std::vector<int>& indices) {
  std::vector<int> failed;
  for (int index : indices) {
    try {
      delete_sms(index);
    } catch (const diagnostics::ModemException& e) {
      MODEMLINK_LOG_WARNING("session", "delete_sms", id() + ": index " + std::to_string(index) + ": " + e.what());
      failed.push_back(index);
    }
  }
  return failed;
}

std::string ModemSession::send_raw_command(const std::string& command) {
  util::InputValidator::validate_non_empty_string(command, "command");
  return channel_->send_command(command);
}

void ModemSession::close() { channel_->close(); }

}  // namespace modem
}  // namespace modemlink
