// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "core/thread_pool.hpp"
#include "gateway/configuration.hpp"
#include "gateway/protocol_adapter.hpp"
#include "gateway/request_orchestrator.hpp"
#include "inference/inference_client.hpp"
#include "network/dns/dns_message.hpp"
#include "network/dns/dns_types.hpp"
#include "network/http_client.hpp"
#include "network/udp_socket.hpp"
#include "text/text_chunker.hpp"
#include "text/utf8.hpp"

#define LODNS_VERSION "1.0.0"
