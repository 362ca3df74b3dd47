/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace lk {

// Base for faults that abort the current request (mapped to HTTP 500).
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Cache/lock provider unreachable or replied with an error.
class StoreError : public Error {
public:
    explicit StoreError(const std::string& what) : Error("store: " + what) {}
};

// Device registry unreachable, unreadable or replied with an error.
class RegistryError : public Error {
public:
    explicit RegistryError(const std::string& what) : Error("registry: " + what) {}
};

// Inconsistent or missing settings detected at start-up.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error("config: " + what) {}
};

} // namespace lk
