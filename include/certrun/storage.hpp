/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace certrun {

/**
 * One directory holding a suspended session.
 *
 * Checkpoints are written to "session.next" and renamed over "session", so a
 * reader only ever sees a complete envelope. Single writer per directory.
 */
class SessionStorage final {
public:
    static constexpr const char* kSessionFile = "session";
    static constexpr const char* kNextSessionFile = "session.next";

    explicit SessionStorage(std::filesystem::path location);

    // Creates a fresh, uniquely named storage under root.
    [[nodiscard]] static std::optional<SessionStorage> create(const std::filesystem::path& root,
                                                              const std::string& prefix = "session");

    // Storages under root, most recently modified first.
    [[nodiscard]] static std::vector<SessionStorage> list(const std::filesystem::path& root) noexcept;

    [[nodiscard]] const std::filesystem::path& location() const noexcept { return location_; }
    [[nodiscard]] std::filesystem::path sessionFile() const { return location_ / kSessionFile; }

    [[nodiscard]] bool saveCheckpoint(const std::string& data) const noexcept;

    // Empty when nothing was saved yet; nullopt on read errors.
    [[nodiscard]] std::optional<std::string> loadCheckpoint() const noexcept;

    [[nodiscard]] bool remove() const noexcept;

private:
    std::filesystem::path location_;

    [[nodiscard]] static std::string generateName(const std::string& prefix);
};

}
