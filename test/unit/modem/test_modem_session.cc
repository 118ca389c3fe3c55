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

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "fixtures/fake_modem_port.hpp"
#include "modemlink/channel/command_channel.hpp"
#include "modemlink/concurrency/io_context_manager.hpp"
#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/modem/modem_session.hpp"

using namespace modemlink;
using namespace modemlink::modem;

namespace {

// DELIVER PDUs from +46708251358, concatenation ref 0x2A: "Hi" + "!"
const std::string PART_1 = "00440B916407281553F80008421051210000000A0500032A020100480069";
const std::string PART_2 = "00440B916407281553F8000842105121000000080500032A02020021";
const std::string CLASSIC = "07917283010010F5040BC87238880900F10000993092516195800AE8329BFD4697D9EC37";

class ModemSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    runtime_ = std::make_unique<concurrency::IoContextManager>(1);
    runtime_->start();
    cfg_.device = "/dev/ttyFAKE1";
    cfg_.command_timeout_ms = 200;
    cfg_.verify_timeout_ms = 200;
    cfg_.sms_timeout_ms = 500;
  }

  void TearDown() override {
    if (session_) {
      session_->close();
      session_.reset();
    }
    runtime_->stop();
  }

  ModemSession& open_session() {
    auto port = std::make_unique<test::FakeModemPort>(runtime_->get_context());
    port_ = port.get();
    auto channel = channel::CommandChannel::create(cfg_, std::move(port), runtime_->get_context());
    channel->open();
    channel->initialize();
    session_ = std::make_unique<ModemSession>(channel);
    return *session_;
  }

  bool wrote(const std::string& bytes) const {
    const auto written = port_->written();
    return std::find(written.begin(), written.end(), bytes) != written.end();
  }

  config::ChannelConfig cfg_;
  std::unique_ptr<concurrency::IoContextManager> runtime_;
  std::unique_ptr<ModemSession> session_;
  test::FakeModemPort* port_ = nullptr;
};

}  // namespace

// ---------------------------------------------------------------------------
// Identity and signal
// ---------------------------------------------------------------------------

TEST_F(ModemSessionTest, IdentityCollectsEveryField) {
  auto& session = open_session();
  port_->respond("AT+CGMI", "\r\nQuectel\r\n\r\nOK\r\n");
  port_->respond("AT+CGMM", "\r\nEC25\r\n\r\nOK\r\n");
  port_->respond("AT+CGSN", "\r\n867698040000000\r\n\r\nOK\r\n");
  port_->respond("AT+CIMI", "\r\n460001234567890\r\n\r\nOK\r\n");
  port_->respond("AT+COPS?", "\r\n+COPS: 0,0,\"CHINA MOBILE\",7\r\n\r\nOK\r\n");
  port_->respond("AT+CNUM", "\r\n+CNUM: \"\",\"+8613800138000\",145\r\n\r\nOK\r\n");

  const auto identity = session.get_identity();
  EXPECT_EQ(identity.manufacturer.value_or(""), "Quectel");
  EXPECT_EQ(identity.model.value_or(""), "EC25");
  EXPECT_EQ(identity.imei.value_or(""), "867698040000000");
  EXPECT_EQ(identity.imsi.value_or(""), "460001234567890");
  EXPECT_EQ(identity.operator_name.value_or(""), "CHINA MOBILE");
  EXPECT_EQ(identity.access_technology.value_or(""), "E-UTRAN");
  EXPECT_EQ(identity.phone_number.value_or(""), "+8613800138000");
}

TEST_F(ModemSessionTest, IdentityFieldsFailIndependently) {
  auto& session = open_session();
  port_->respond("AT+CGMI", "\r\nSIMCOM\r\n\r\nOK\r\n");
  port_->respond("AT+CGSN", "\r\n861234567890123\r\n\r\nOK\r\n");
  // CGMM, CIMI, COPS and CNUM fall through to ERROR

  const auto identity = session.get_identity();
  EXPECT_EQ(identity.manufacturer.value_or(""), "SIMCOM");
  EXPECT_FALSE(identity.model.has_value());
  EXPECT_EQ(identity.imei.value_or(""), "861234567890123");
  EXPECT_FALSE(identity.imsi.has_value());
  EXPECT_FALSE(identity.operator_name.has_value());
  EXPECT_FALSE(identity.phone_number.has_value());
}

TEST_F(ModemSessionTest, IdentitySurvivesSilentDevice) {
  cfg_.command_timeout_ms = 50;
  auto& session = open_session();
  port_->set_silent(true);

  ModemIdentity identity;
  EXPECT_NO_THROW(identity = session.get_identity());
  EXPECT_FALSE(identity.manufacturer.has_value());
  EXPECT_FALSE(identity.phone_number.has_value());
}

TEST_F(ModemSessionTest, SignalReading) {
  auto& session = open_session();
  port_->respond("AT+CSQ", "\r\n+CSQ: 15,99\r\n\r\nOK\r\n");
  const auto signal = session.get_signal();
  EXPECT_EQ(signal.rssi, 15);
  EXPECT_EQ(signal.quality, 99);
  EXPECT_EQ(signal.dbm_text(), "-83 dBm");
  EXPECT_EQ(signal.level, 4);
}

TEST_F(ModemSessionTest, SignalErrorsAreProtocolErrors) {
  auto& session = open_session();
  port_->respond("AT+CSQ", "\r\n+CME ERROR: 10\r\n");
  try {
    session.get_signal();
    FAIL() << "expected ProtocolException";
  } catch (const diagnostics::ProtocolException& e) {
    EXPECT_NE(e.get_raw_response().find("+CME ERROR: 10"), std::string::npos);
  }

  port_->respond("AT+CSQ", "\r\nOK\r\n");
  EXPECT_THROW(session.get_signal(), diagnostics::ProtocolException);
}

TEST_F(ModemSessionTest, SignalTimeoutPropagates) {
  auto& session = open_session();
  port_->set_silent(true);
  EXPECT_THROW(session.get_signal(), diagnostics::CommandTimeoutException);
}

TEST_F(ModemSessionTest, PhoneNumberFromUcs2) {
  auto& session = open_session();
  port_->respond("AT+CNUM", "\r\n+CNUM: \"\",\"002B0038003600310033003800300030\",145\r\n\r\nOK\r\n");
  EXPECT_EQ(session.get_phone_number(), "+8613800");
}

TEST_F(ModemSessionTest, PhoneNumberMissing) {
  auto& session = open_session();
  port_->respond("AT+CNUM", "\r\nOK\r\n");
  EXPECT_THROW(session.get_phone_number(), diagnostics::ProtocolException);
}

// ---------------------------------------------------------------------------
// Listing
// ---------------------------------------------------------------------------

TEST_F(ModemSessionTest, PduListingMergesAndDegrades) {
  auto& session = open_session();
  port_->respond("AT+CMGL=4", "\r\n+CMGL: 1,1,,30\r\n" + PART_1 + "\r\n+CMGL: 2,1,,28\r\n" + PART_2 +
                                  "\r\n+CMGL: 3,0,,28\r\n" + CLASSIC + "\r\n+CMGL: 4,1,,5\r\nZZZZ\r\n\r\nOK\r\n");

  const auto messages = session.list_sms();
  ASSERT_EQ(messages.size(), 3u);

  EXPECT_EQ(messages[0].index, 1);
  EXPECT_EQ(messages[0].status, "REC READ");
  EXPECT_EQ(messages[0].number, "+46708251358");
  EXPECT_EQ(messages[0].time, "2024/01/15 12:00:00");
  EXPECT_EQ(messages[0].message, "Hi!");

  EXPECT_EQ(messages[1].index, 3);
  EXPECT_EQ(messages[1].status, "REC UNREAD");
  EXPECT_EQ(messages[1].number, "27838890001");
  EXPECT_EQ(messages[1].message, "hellohello");

  // Undecodable record keeps its raw body
  EXPECT_EQ(messages[2].index, 4);
  EXPECT_EQ(messages[2].message, "ZZZZ");
  EXPECT_TRUE(messages[2].number.empty());
}

TEST_F(ModemSessionTest, EmptyListing) {
  auto& session = open_session();
  port_->respond("AT+CMGL=4", "\r\nOK\r\n");
  EXPECT_TRUE(session.list_sms().empty());
}

TEST_F(ModemSessionTest, RejectedListing) {
  auto& session = open_session();
  port_->respond("AT+CMGL=4", "\r\n+CMS ERROR: 310\r\n");
  EXPECT_THROW(session.list_sms(), diagnostics::ProtocolException);
}

TEST_F(ModemSessionTest, TextModeListing) {
  cfg_.sms_mode = config::SmsMode::Text;
  auto& session = open_session();
  port_->respond("AT+CMGL=\"ALL\"",
                 "\r\n+CMGL: 1,\"REC READ\",\"002B0038003600310033003800300030\",,\"24/01/15,12:00:00+32\"\r\n"
                 "0500030B0201004800690020\r\n"
                 "+CMGL: 2,\"REC READ\",\"002B0038003600310033003800300030\",,\"24/01/15,12:00:05+32\"\r\n"
                 "0500030B020200740068006500720065\r\n"
                 "+CMGL: 5,\"REC UNREAD\",\"10086\",,\"24/01/16,08:00:00+32\"\r\n"
                 "not hex at all\r\n\r\nOK\r\n");

  const auto messages = session.list_sms();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].index, 1);
  EXPECT_EQ(messages[0].number, "+8613800");
  EXPECT_EQ(messages[0].status, "REC READ");
  EXPECT_EQ(messages[0].time, "24/01/15,12:00:00+32");
  EXPECT_EQ(messages[0].message, "Hi there");
  EXPECT_EQ(messages[1].index, 5);
  EXPECT_EQ(messages[1].number, "10086");
  EXPECT_EQ(messages[1].message, "not hex at all");
}

// ---------------------------------------------------------------------------
// Sending
// ---------------------------------------------------------------------------

TEST_F(ModemSessionTest, SendPduWaitsForPromptThenSubmits) {
  auto& session = open_session();
  port_->respond("AT+CMGS=22", "\r\n> ");
  port_->respond("0001000B916407281553F800000AE8329BFD4697D9EC37", "\r\n+CMGS: 5\r\n\r\nOK\r\n");

  EXPECT_NO_THROW(session.send_sms("+46708251358", "hellohello"));
  EXPECT_TRUE(wrote("AT+CMGS=22\r\n"));
  EXPECT_TRUE(wrote(std::string("0001000B916407281553F800000AE8329BFD4697D9EC37\x1A")));
}

TEST_F(ModemSessionTest, SendWithoutPromptFails) {
  auto& session = open_session();
  port_->respond("AT+CMGS=22", "\r\n+CMS ERROR: 330\r\n");
  EXPECT_THROW(session.send_sms("+46708251358", "hellohello"), diagnostics::ProtocolException);
  for (const auto& w : port_->written()) {
    EXPECT_EQ(w.find('\x1A'), std::string::npos);
  }
}

TEST_F(ModemSessionTest, SendRejectedBody) {
  auto& session = open_session();
  port_->respond("AT+CMGS=22", "\r\n> ");
  port_->respond("0001000B916407281553F800000AE8329BFD4697D9EC37", "\r\n+CMS ERROR: 500\r\n");
  EXPECT_THROW(session.send_sms("+46708251358", "hellohello"), diagnostics::ProtocolException);
}

TEST_F(ModemSessionTest, SendValidatesNumberBeforeTalkingToModem) {
  auto& session = open_session();
  const auto writes_before = port_->written().size();
  EXPECT_THROW(session.send_sms("not-a-number", "hi"), diagnostics::ValidationException);
  EXPECT_THROW(session.send_sms("", "hi"), diagnostics::ValidationException);
  EXPECT_EQ(port_->written().size(), writes_before);
}

TEST_F(ModemSessionTest, SendTooLongTextFails) {
  auto& session = open_session();
  EXPECT_THROW(session.send_sms("+123", std::string(161, 'x')), diagnostics::CodecException);
}

TEST_F(ModemSessionTest, SendTextModeUsesUcs2) {
  cfg_.sms_mode = config::SmsMode::Text;
  auto& session = open_session();
  port_->respond("AT+CMGS=\"00310030003000380036\"", "\r\n> ");
  port_->respond("00480069", "\r\n+CMGS: 9\r\n\r\nOK\r\n");

  EXPECT_NO_THROW(session.send_sms("10086", "Hi"));
  EXPECT_TRUE(wrote(std::string("00480069\x1A")));
}

TEST_F(ModemSessionTest, SendTextModeLengthLimit) {
  cfg_.sms_mode = config::SmsMode::Text;
  auto& session = open_session();
  EXPECT_THROW(session.send_sms("10086", std::string(71, 'x')), diagnostics::CodecException);
}

// ---------------------------------------------------------------------------
// Deleting and raw commands
// ---------------------------------------------------------------------------

TEST_F(ModemSessionTest, DeleteRequiresOk) {
  auto& session = open_session();
  port_->respond("AT+CMGD=3", "\r\nOK\r\n");
  EXPECT_NO_THROW(session.delete_sms(3));
  EXPECT_THROW(session.delete_sms(4), diagnostics::ProtocolException);
  EXPECT_THROW(session.delete_sms(-1), diagnostics::ValidationException);
}

TEST_F(ModemSessionTest, BatchDeleteReportsFailures) {
  auto& session = open_session();
  port_->respond("AT+CMGD=1", "\r\nOK\r\n");
  port_->respond("AT+CMGD=3", "\r\nOK\r\n");

  const auto failed = session.delete_sms(std::vector<int>{1, 2, 3, -5});
  EXPECT_EQ(failed, (std::vector<int>{2, -5}));
  EXPECT_TRUE(wrote("AT+CMGD=3\r\n"));
}

TEST_F(ModemSessionTest, RawCommandPassesThrough) {
  auto& session = open_session();
  port_->respond("AT+QGMR", "\r\nEC25EFAR06A06M4G\r\n\r\nOK\r\n");
  EXPECT_EQ(session.send_raw_command("AT+QGMR"), "EC25EFAR06A06M4G\r\n\r\nOK");
  EXPECT_THROW(session.send_raw_command(""), diagnostics::ValidationException);
}

TEST_F(ModemSessionTest, ConnectedOnlyWhileActive) {
  auto& session = open_session();
  EXPECT_EQ(session.id(), "/dev/ttyFAKE1");
  EXPECT_FALSE(session.is_connected());
  session.get_channel()->start_listening();
  EXPECT_TRUE(session.is_connected());
  session.close();
  EXPECT_FALSE(session.is_connected());
}
