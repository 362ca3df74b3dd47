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
#include <cstddef>

namespace lk::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers
int  hexval(char c);
bool is_hex_string(const std::string& s);

// Lowercase copy (ASCII)
std::string lower_copy(std::string s);

// Constant-time equality (OpenSSL CRYPTO_memcmp); length mismatch returns false.
bool ct_equal(const std::string& a, const std::string& b);

// Escape for use inside a JSON string literal (quotes not included).
std::string json_escape(const std::string& s);

// Parse a decimal int; false on junk, overflow or trailing characters.
bool parse_int(const std::string& s, int& out);

} // namespace lk::internal
