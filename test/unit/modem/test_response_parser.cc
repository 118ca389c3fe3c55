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

#include "modemlink/modem/response_parser.hpp"

using namespace modemlink::modem;

TEST(ResponseParserTest, ExtractValueSkipsEchoAndOk) {
  EXPECT_EQ(parser::extract_value("AT+CGMI\r\r\nQuectel\r\n\r\nOK"), "Quectel");
  EXPECT_EQ(parser::extract_value("\r\n867698040000000\r\nOK"), "867698040000000");
  EXPECT_EQ(parser::extract_value("OK"), "");
  EXPECT_EQ(parser::extract_value(""), "");
}

TEST(ResponseParserTest, OkAndErrorDetection) {
  EXPECT_TRUE(parser::has_ok_line("\r\nOK\r\n"));
  EXPECT_FALSE(parser::has_ok_line("TOKEN"));
  EXPECT_FALSE(parser::has_ok_line("+CMS ERROR: 321"));
  EXPECT_TRUE(parser::has_error("+CME ERROR: 10"));
  EXPECT_FALSE(parser::has_error("OK"));
}

TEST(ResponseParserTest, CsqWithSignal) {
  const auto reading = parser::parse_csq("+CSQ: 20,99\r\n\r\nOK");
  ASSERT_TRUE(reading.has_value());
  EXPECT_EQ(reading->rssi, 20);
  EXPECT_EQ(reading->quality, 99);
  ASSERT_TRUE(reading->dbm.has_value());
  EXPECT_EQ(*reading->dbm, -73);
  EXPECT_EQ(reading->dbm_text(), "-73 dBm");
  EXPECT_EQ(reading->level, 5);
}

TEST(ResponseParserTest, CsqUnknownSignal) {
  const auto reading = parser::parse_csq("+CSQ: 99,99\r\nOK");
  ASSERT_TRUE(reading.has_value());
  EXPECT_FALSE(reading->dbm.has_value());
  EXPECT_EQ(reading->dbm_text(), "unknown");
  EXPECT_EQ(reading->level, 0);
}

TEST(ResponseParserTest, CsqBoundaries) {
  EXPECT_EQ(*parser::parse_csq("+CSQ: 0,0")->dbm, -113);
  EXPECT_EQ(*parser::parse_csq("+CSQ: 31,0")->dbm, -51);
  EXPECT_FALSE(parser::parse_csq("+CSQ: 32,0")->dbm.has_value());
}

TEST(ResponseParserTest, CsqUnparsable) {
  EXPECT_FALSE(parser::parse_csq("OK").has_value());
  EXPECT_FALSE(parser::parse_csq("+CSQ: abc").has_value());
  EXPECT_FALSE(parser::parse_csq("+CSQ: 12").has_value());
}

TEST(ResponseParserTest, SignalLevels) {
  EXPECT_EQ(parser::signal_level(0), 0);
  EXPECT_EQ(parser::signal_level(1), 1);
  EXPECT_EQ(parser::signal_level(5), 2);
  EXPECT_EQ(parser::signal_level(10), 3);
  EXPECT_EQ(parser::signal_level(15), 4);
  EXPECT_EQ(parser::signal_level(31), 5);
  EXPECT_EQ(parser::signal_level(99), 0);
}

TEST(ResponseParserTest, CopsWithAccessTechnology) {
  const auto op = parser::parse_cops("+COPS: 0,0,\"CHINA MOBILE\",7\r\n\r\nOK");
  ASSERT_TRUE(op.has_value());
  EXPECT_EQ(op->name, "CHINA MOBILE");
  ASSERT_TRUE(op->act.has_value());
  EXPECT_EQ(*op->act, 7);
  EXPECT_EQ(parser::access_technology_name(*op->act), "E-UTRAN");
}

TEST(ResponseParserTest, CopsWithoutOperator) {
  EXPECT_FALSE(parser::parse_cops("+COPS: 0\r\nOK").has_value());
  const auto op = parser::parse_cops("+COPS: 0,0,\"Vodafone\"");
  ASSERT_TRUE(op.has_value());
  EXPECT_FALSE(op->act.has_value());
}

TEST(ResponseParserTest, CnumNumber) {
  EXPECT_EQ(parser::parse_cnum("+CNUM: \"\",\"+8613800138000\",145\r\nOK").value(), "+8613800138000");
  EXPECT_EQ(parser::parse_cnum("+CNUM: ,\"13800138000\",129").value(), "13800138000");
  EXPECT_FALSE(parser::parse_cnum("OK").has_value());
  EXPECT_FALSE(parser::parse_cnum("+CNUM: ").has_value());
}

TEST(ResponseParserTest, DialStringDecoding) {
  EXPECT_EQ(parser::decode_dial_string("002B0038003600310033003800300030"), "+8613800");
  EXPECT_EQ(parser::decode_dial_string("+8613800138000"), "+8613800138000");
  // Even-length digit strings are valid hex, but do not decode to a dial string
  EXPECT_EQ(parser::decode_dial_string("13800138"), "13800138");
}

TEST(ResponseParserTest, SplitFieldsHonoursQuotes) {
  const auto fields = parser::split_fields("3,\"REC READ\",\"+8613800\",,\"24/01/15,12:00:00+32\"");
  ASSERT_EQ(fields.size(), 5u);
  EXPECT_EQ(fields[0], "3");
  EXPECT_EQ(fields[1], "REC READ");
  EXPECT_EQ(fields[2], "+8613800");
  EXPECT_EQ(fields[3], "");
  EXPECT_EQ(fields[4], "24/01/15,12:00:00+32");
}

TEST(ResponseParserTest, SplitCmglRecords) {
  const std::string response =
      "+CMGL: 1,1,,24\r\n0011AABB\r\n"
      "+CMGL: 2,0,,30\r\nCCDD\r\n"
      "\r\nOK\r\n";
  const auto records = parser::split_cmgl(response);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].header, "1,1,,24");
  EXPECT_EQ(records[0].body, "0011AABB");
  EXPECT_EQ(records[1].header, "2,0,,30");
  EXPECT_EQ(records[1].body, "CCDD");
}

TEST(ResponseParserTest, SplitCmglEmptyListing) {
  EXPECT_TRUE(parser::split_cmgl("OK").empty());
  EXPECT_TRUE(parser::split_cmgl("+CMGL: 1,1,,24").empty());
}

TEST(ResponseParserTest, ParseInt) {
  int v = 0;
  EXPECT_TRUE(parser::parse_int(" 42 ", v));
  EXPECT_EQ(v, 42);
  EXPECT_FALSE(parser::parse_int("4x", v));
  EXPECT_FALSE(parser::parse_int("", v));
}
