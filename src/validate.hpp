/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Field extraction for session documents. Every failure throws
// CorruptedSessionError naming the offending key.
namespace certrun {

using Json = nlohmann::json;

[[nodiscard]] const Json& requireKey(const Json& obj, const std::string& key);
[[nodiscard]] const Json& requireObject(const Json& obj, const std::string& key);
[[nodiscard]] const Json& requireArray(const Json& obj, const std::string& key);
[[nodiscard]] std::string requireString(const Json& obj, const std::string& key);
[[nodiscard]] std::optional<std::string> nullableString(const Json& obj, const std::string& key);
[[nodiscard]] std::optional<long long> nullableInteger(const Json& obj, const std::string& key);
[[nodiscard]] std::optional<double> nullableNumber(const Json& obj, const std::string& key);
[[nodiscard]] std::vector<std::string> requireStringList(const Json& obj, const std::string& key);

// Type check for a value that is not addressed by key.
void requireType(const Json& value, Json::value_t type, const std::string& what);

}
