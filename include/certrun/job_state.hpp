/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "certrun/job.hpp"
#include "certrun/result.hpp"

namespace certrun {

enum class InhibitorCause : uint8_t {
    Undesired,
    PendingDep,
    FailedDep,
    PendingResource,
    FailedResource
};

[[nodiscard]] const char* inhibitorCauseToString(InhibitorCause cause) noexcept;

struct ReadinessInhibitor {
    InhibitorCause cause = InhibitorCause::Undesired;
    JobPtr relatedJob;
    std::optional<std::string> relatedExpression;

    [[nodiscard]] std::string describe() const;

    bool operator==(const ReadinessInhibitor& other) const {
        return cause == other.cause && relatedJob == other.relatedJob &&
               relatedExpression == other.relatedExpression;
    }
    bool operator!=(const ReadinessInhibitor& other) const { return !(*this == other); }
};

// Per-job bookkeeping owned by SessionState.
class JobState final {
public:
    explicit JobState(JobPtr job);

    [[nodiscard]] const JobPtr& job() const noexcept { return job_; }
    [[nodiscard]] const JobResultPtr& result() const noexcept { return result_; }
    [[nodiscard]] const std::vector<ReadinessInhibitor>& inhibitors() const noexcept { return inhibitors_; }
    [[nodiscard]] const std::string& certificationStatus() const noexcept { return certificationStatus_; }

    [[nodiscard]] bool canStart() const noexcept { return inhibitors_.empty(); }
    [[nodiscard]] std::string readinessDescription() const;

    void setResult(JobResultPtr result) { result_ = std::move(result); }
    void setInhibitors(std::vector<ReadinessInhibitor> inhibitors) { inhibitors_ = std::move(inhibitors); }
    void addInhibitor(ReadinessInhibitor inhibitor) { inhibitors_.push_back(std::move(inhibitor)); }
    void setCertificationStatus(std::string status) { certificationStatus_ = std::move(status); }

private:
    JobPtr job_;
    JobResultPtr result_;
    std::vector<ReadinessInhibitor> inhibitors_;
    std::string certificationStatus_;
};

}
