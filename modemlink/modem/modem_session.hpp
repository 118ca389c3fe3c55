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

#include <memory>
#include <string>
#include <vector>

#include "modemlink/base/visibility.hpp"
#include "modemlink/channel/command_channel.hpp"
#include "modemlink/modem/modem_types.hpp"
#include "modemlink/sms/sms_types.hpp"

namespace modemlink {
namespace modem {

/**
 * @brief Modem-facing operations on top of one CommandChannel
 *
 * Every call is one or more serialized AT exchanges on the channel. Query
 * failures surface as exceptions from diagnostics/exceptions.hpp, except
 * for the batch operations which degrade per item.
 */
class MODEMLINK_API ModemSession {
 public:
  explicit ModemSession(std::shared_ptr<channel::CommandChannel> channel);
  ~ModemSession();

  ModemSession(const ModemSession&) = delete;
  ModemSession& operator=(const ModemSession&) = delete;

  const std::string& id() const;
  bool is_connected() const;

  /**
   * @brief Manufacturer, model, IMEI, IMSI, operator and own number
   *
   * Each field is queried on its own; a failing query leaves it empty.
   */
  ModemIdentity get_identity();

  /**
   * @throws ProtocolException when the reply carries ERROR or no +CSQ line
   */
  SignalReading get_signal();

  /**
   * @brief Own number from AT+CNUM
   * @throws ProtocolException when the SIM has no number stored
   */
  std::string get_phone_number();

  /**
   * @brief Every stored message, concatenated parts merged, ordered by index
   */
  std::vector<sms::LogicalSms> list_sms();

  /**
   * @throws ValidationException for a malformed number
   * @throws CodecException when the text does not fit one message
   * @throws ProtocolException when the modem rejects the command or never prompts
   */
  void send_sms(const std::string& number, const std::string& text);

  /**
   * @throws ProtocolException unless the modem answers OK
   */
  void delete_sms(int index);

  /**
   * @return indices that could not be deleted
   */
  std::vector<int> delete_sms(const std::vector<int>& indices);

  /**
   * @brief Pass-through: send one command line and return the trimmed reply
   */
  std::string send_raw_command(const std::string& command);

  void close();

  std::shared_ptr<channel::CommandChannel> get_channel() const { return channel_; }

 private:
  std::string query(const std::string& command);
  std::vector<sms::SmsFragment> read_pdu_listing(const std::string& response);
  std::vector<sms::SmsFragment> read_text_listing(const std::string& response);
  void send_sms_pdu(const std::string& number, const std::string& text);
  void send_sms_text(const std::string& number, const std::string& text);
  void submit_body(const std::string& prompt_command, const std::string& body, const std::string& number);

  std::shared_ptr<channel::CommandChannel> channel_;
};

}  // namespace modem
}  // namespace modemlink
