/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include "lk/http_request.hpp"
#include "lk/server_config.hpp"
#include "lk/service_context.hpp"
#include "lk/types.hpp"

namespace lk::internal {

// Version reported in every response ("api-version" header).
extern const char* const kApiVersion;

// Header set on an empty join answer caused by lock contention.
extern const char* const kJoinHeader;

bool api_version_supported(const std::string& v);

// [{"DevEUI":"..","PrimaryKey":"..","DevAddr":".."}], DevAddr omitted when empty.
std::string devices_to_json(const std::vector<DeviceKeyRecord>& devices);

/**
 * Routes:
 *   GET|POST /api/GetDevice          DevEUI+DevNonce+GatewayId, or DevAddr
 *   GET|POST /api/GetDeviceByDevEUI  DevEUI
 *   GET      /health
 * Never throws; collaborator faults become 500.
 */
lk::HttpResponse handle_api_request(const lk::HttpRequest& R,
                                    const lk::ServerConfig& cfg,
                                    lk::LazyServiceContext& ctx);

} // namespace lk::internal
