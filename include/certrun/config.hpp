/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>

#include "certrun/logger.hpp"

namespace certrun {

struct Config {
    static constexpr double kDefaultManualOverhead = 30.0;

    LogLevel logLevel = LogLevel::INFO;
    std::filesystem::path sessionRoot;
    double manualOverhead = kDefaultManualOverhead;

    // CERTRUN_LOG_LEVEL, CERTRUN_SESSION_DIR, CERTRUN_MANUAL_OVERHEAD
    [[nodiscard]] static Config fromEnv();
};

// $XDG_CACHE_HOME/certrun/sessions, else $HOME/.cache/certrun/sessions.
[[nodiscard]] std::filesystem::path defaultSessionRoot();

}
