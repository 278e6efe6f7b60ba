/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

#include "certrun/job.hpp"

namespace certrun {

// Two different definitions share one id.
class DuplicateJobError : public std::runtime_error {
public:
    DuplicateJobError(JobPtr existing, JobPtr duplicate)
        : std::runtime_error("Duplicate job definition: " + existing->id()),
          existing_(std::move(existing)), duplicate_(std::move(duplicate)) {}

    [[nodiscard]] const JobPtr& existing() const noexcept { return existing_; }
    [[nodiscard]] const JobPtr& duplicate() const noexcept { return duplicate_; }

private:
    JobPtr existing_;
    JobPtr duplicate_;
};

class SessionResumeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or self-inconsistent envelope.
class CorruptedSessionError : public SessionResumeError {
public:
    using SessionResumeError::SessionResumeError;
};

// Well-formed envelope in a format version this build cannot read.
class IncompatibleSessionError : public SessionResumeError {
public:
    using SessionResumeError::SessionResumeError;
};

class IncompatibleJobError : public SessionResumeError {
public:
    explicit IncompatibleJobError(JobId jobId)
        : SessionResumeError("Definition of job " + jobId + " has changed"), jobId_(std::move(jobId)) {}

    [[nodiscard]] const JobId& jobId() const noexcept { return jobId_; }

private:
    JobId jobId_;
};

class BrokenReferenceToExternalFile : public SessionResumeError {
public:
    explicit BrokenReferenceToExternalFile(std::filesystem::path path)
        : SessionResumeError("Referenced file does not exist: " + path.string()), path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}
