/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

namespace certrun {

// gzip container (RFC 1952), as written by the gzip tool.
[[nodiscard]] std::optional<std::string> gzipCompress(const std::string& data) noexcept;
[[nodiscard]] std::optional<std::string> gzipDecompress(const std::string& data) noexcept;

// Standard alphabet with padding.
[[nodiscard]] std::string base64Encode(const std::string& data);
[[nodiscard]] std::optional<std::string> base64Decode(const std::string& text);

}
