/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "certrun/types.hpp"

namespace certrun {

struct IOLogRecord {
    double delay = 0.0;
    std::string stream; // "stdout" or "stderr"
    std::string data;

    bool operator==(const IOLogRecord& other) const {
        return delay == other.delay && stream == other.stream && data == other.data;
    }
};

/**
 * Outcome of one job run. Immutable once built.
 *
 * The IO log either lives in memory or in an external gzip file of JSON
 * lines ([delay, stream, base64 data]), referenced by pathname.
 */
class JobResult final {
    struct Token {
        explicit Token() = default;
    };

public:
    explicit JobResult(Token) {}

    struct Builder {
        Outcome outcome = Outcome::None;
        std::optional<int> returnCode;
        std::optional<double> executionDuration;
        std::optional<std::string> comments;
    };

    [[nodiscard]] static std::shared_ptr<const JobResult> hollow();
    [[nodiscard]] static std::shared_ptr<const JobResult> inMemory(const Builder& fields,
                                                                   std::vector<IOLogRecord> ioLog = {});
    [[nodiscard]] static std::shared_ptr<const JobResult> onDisk(const Builder& fields,
                                                                 std::filesystem::path ioLogFilename);

    [[nodiscard]] Outcome outcome() const noexcept { return outcome_; }
    [[nodiscard]] const std::optional<int>& returnCode() const noexcept { return returnCode_; }
    [[nodiscard]] const std::optional<double>& executionDuration() const noexcept { return executionDuration_; }
    [[nodiscard]] const std::optional<std::string>& comments() const noexcept { return comments_; }
    [[nodiscard]] const std::optional<std::filesystem::path>& ioLogFilename() const noexcept { return ioLogFilename_; }
    [[nodiscard]] bool diskBacked() const noexcept { return ioLogFilename_.has_value(); }

    // Reads the disk log on every call; an unreadable file yields an empty log.
    [[nodiscard]] std::vector<IOLogRecord> loadIoLog() const;

    // Concatenated stdout payloads.
    [[nodiscard]] std::string stdoutText() const;

    // Carries no information at all.
    [[nodiscard]] bool isHollow() const noexcept;

private:
    Outcome outcome_ = Outcome::None;
    std::optional<int> returnCode_;
    std::optional<double> executionDuration_;
    std::optional<std::string> comments_;
    std::vector<IOLogRecord> ioLog_;
    std::optional<std::filesystem::path> ioLogFilename_;
};

using JobResultPtr = std::shared_ptr<const JobResult>;

// Writes records in the disk log format. Returns false on I/O failure.
[[nodiscard]] bool writeIoLogFile(const std::filesystem::path& path, const std::vector<IOLogRecord>& records) noexcept;

}
