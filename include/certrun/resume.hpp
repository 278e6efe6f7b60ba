/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "certrun/job.hpp"
#include "certrun/session_state.hpp"

namespace certrun {

// Newest envelope format this build reads and writes.
constexpr int kSessionFormatVersion = 6;

struct ResumeOptions {
    // Disk-backed IO logs must exist.
    bool checkFileReferences = false;
    // Retry missing IO logs under `location`. Implies checkFileReferences.
    bool rewriteLogPathnames = false;
    // Log checksum drift instead of failing.
    bool ignoreJobChecksums = false;
    // Directory of the session being resumed.
    std::filesystem::path location;
};

// Receives the fresh session before any result is replayed and returns the
// session to continue with (usually the same one, after connecting observers).
using EarlyCallback = std::function<std::unique_ptr<SessionState>(std::unique_ptr<SessionState>)>;

/**
 * Rebuilds a SessionState from a suspended envelope.
 *
 * Job definitions always come from the catalog given here; the envelope only
 * contributes results, selections and metadata. Any problem aborts the whole
 * resume with a SessionResumeError subclass.
 */
class SessionResumeHelper final {
public:
    SessionResumeHelper(std::vector<JobPtr> jobs, ResumeOptions options = {});

    [[nodiscard]] std::unique_ptr<SessionState> resume(const std::string& data,
                                                       const EarlyCallback& earlyCallback = nullptr) const;
    [[nodiscard]] std::unique_ptr<SessionState> resumeJson(const nlohmann::json& document,
                                                           const EarlyCallback& earlyCallback = nullptr) const;

private:
    std::vector<JobPtr> jobs_;
    ResumeOptions options_;
};

// Reads only the metadata of an envelope; no catalog required.
class SessionPeekHelper final {
public:
    [[nodiscard]] SessionMetadata peek(const std::string& data) const;
    [[nodiscard]] SessionMetadata peekJson(const nlohmann::json& document) const;
};

// Decompresses and parses an envelope, throwing CorruptedSessionError.
[[nodiscard]] nlohmann::json decodeEnvelope(const std::string& data);

}
