/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <optional>
#include <string>

#include "certrun/session_state.hpp"

namespace certrun {

// Encodes a session as the newest envelope format.
class SessionSuspendHelper final {
public:
    // IO logs stored under `location` are recorded relative to it.
    explicit SessionSuspendHelper(std::filesystem::path location = {});

    [[nodiscard]] nlohmann::json jsonRepr(const SessionState& session) const;

    // gzip-compressed compact JSON; nullopt if compression fails.
    [[nodiscard]] std::optional<std::string> suspend(const SessionState& session) const;

private:
    std::filesystem::path location_;

    [[nodiscard]] nlohmann::json resultRepr(const JobResult& result) const;
};

}
