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

#include "modemlink/base/channel_state.hpp"
#include "modemlink/base/constants.hpp"
#include "modemlink/base/error_codes.hpp"
#include "modemlink/base/visibility.hpp"

// Runtime, transport and AT exchange
#include "modemlink/channel/command_channel.hpp"
#include "modemlink/concurrency/io_context_manager.hpp"
#include "modemlink/interface/iserial_port.hpp"

// Modem operations and SMS codec
#include "modemlink/modem/modem_session.hpp"
#include "modemlink/modem/modem_types.hpp"
#include "modemlink/sms/gsm7.hpp"
#include "modemlink/sms/pdu_codec.hpp"
#include "modemlink/sms/sms_types.hpp"

// Discovery and fan-out
#include "modemlink/event/event_bus.hpp"
#include "modemlink/pool/device_scanner.hpp"
#include "modemlink/pool/modem_pool.hpp"

// Configuration Management API
#include "modemlink/config/config_factory.hpp"
#include "modemlink/config/config_manager.hpp"
#include "modemlink/config/iconfig_manager.hpp"

// Error handling and logging system
#include "modemlink/diagnostics/error_handler.hpp"
#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/diagnostics/logger.hpp"
#include "modemlink/util/input_validator.hpp"
