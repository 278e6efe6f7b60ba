/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/config.hpp"
#include <cstdlib>
#include <string>

namespace certrun {

namespace {
double env_double(const char* name, double defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t used = 0;
        double parsed = std::stod(val, &used);
        return (used != std::string(val).size() || parsed <= 0) ? defv : parsed;
    } catch (const std::exception&) {
        return defv;
    }
}

std::filesystem::path env_path(const char* name) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::filesystem::path(val) : std::filesystem::path();
}
}

std::filesystem::path defaultSessionRoot() {
    auto cache = env_path("XDG_CACHE_HOME");
    if (cache.empty()) {
        auto home = env_path("HOME");
        cache = home.empty() ? std::filesystem::temp_directory_path() / ".cache" : home / ".cache";
    }
    return cache / "certrun" / "sessions";
}

Config Config::fromEnv() {
    Config config;
    config.logLevel = Logger::level();
    config.sessionRoot = env_path("CERTRUN_SESSION_DIR");
    if (config.sessionRoot.empty()) {
        config.sessionRoot = defaultSessionRoot();
    }
    config.manualOverhead = env_double("CERTRUN_MANUAL_OVERHEAD", kDefaultManualOverhead);
    return config;
}

}
