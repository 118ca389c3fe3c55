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

#include <string>

#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/util/input_validator.hpp"

using namespace modemlink;
using modemlink::util::InputValidator;

TEST(InputValidatorTest, DevicePaths) {
  EXPECT_NO_THROW(InputValidator::validate_device_path("/dev/ttyUSB0"));
  EXPECT_NO_THROW(InputValidator::validate_device_path("/dev/serial/by-id/usb-Quectel_EC25-if02"));
  EXPECT_THROW(InputValidator::validate_device_path(""), diagnostics::ValidationException);
  EXPECT_THROW(InputValidator::validate_device_path("COM3"), diagnostics::ValidationException);
  EXPECT_THROW(InputValidator::validate_device_path("/dev/tty USB0"), diagnostics::ValidationException);
  EXPECT_THROW(InputValidator::validate_device_path("/dev/" + std::string(300, 'a')), diagnostics::ValidationException);
}

TEST(InputValidatorTest, PhoneNumbers) {
  EXPECT_NO_THROW(InputValidator::validate_phone_number("+46708251358"));
  EXPECT_NO_THROW(InputValidator::validate_phone_number("10086"));
  EXPECT_THROW(InputValidator::validate_phone_number(""), diagnostics::ValidationException);
  EXPECT_THROW(InputValidator::validate_phone_number("+"), diagnostics::ValidationException);
  EXPECT_THROW(InputValidator::validate_phone_number("+46-70"), diagnostics::ValidationException);
  EXPECT_THROW(InputValidator::validate_phone_number(std::string(21, '1')), diagnostics::ValidationException);
}

TEST(InputValidatorTest, SmsIndex) {
  EXPECT_NO_THROW(InputValidator::validate_sms_index(0));
  EXPECT_NO_THROW(InputValidator::validate_sms_index(254));
  EXPECT_THROW(InputValidator::validate_sms_index(-1), diagnostics::ValidationException);
}

TEST(InputValidatorTest, RangesAndTimeouts) {
  EXPECT_NO_THROW(InputValidator::validate_baud_rate(115200));
  EXPECT_THROW(InputValidator::validate_baud_rate(10), diagnostics::ValidationException);
  EXPECT_NO_THROW(InputValidator::validate_timeout(1000));
  EXPECT_THROW(InputValidator::validate_timeout(5), diagnostics::ValidationException);
}

TEST(InputValidatorTest, ExceptionNamesParameter) {
  try {
    InputValidator::validate_non_empty_string("", "command");
    FAIL() << "expected ValidationException";
  } catch (const diagnostics::ValidationException& e) {
    EXPECT_EQ(e.get_parameter(), "command");
    EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
  }
}
