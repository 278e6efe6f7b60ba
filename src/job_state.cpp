/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/job_state.hpp"

namespace certrun {

const char* inhibitorCauseToString(InhibitorCause cause) noexcept {
    switch (cause) {
        case InhibitorCause::Undesired: return "UNDESIRED";
        case InhibitorCause::PendingDep: return "PENDING_DEP";
        case InhibitorCause::FailedDep: return "FAILED_DEP";
        case InhibitorCause::PendingResource: return "PENDING_RESOURCE";
        case InhibitorCause::FailedResource: return "FAILED_RESOURCE";
    }
    return "UNKNOWN";
}

std::string ReadinessInhibitor::describe() const {
    switch (cause) {
        case InhibitorCause::Undesired:
            return "undesired";
        case InhibitorCause::PendingDep:
            return "required dependency " + relatedJob->id() + " did not run yet";
        case InhibitorCause::FailedDep:
            return "required dependency " + relatedJob->id() + " has failed";
        case InhibitorCause::PendingResource:
            return "resource job " + relatedJob->id() + " did not run yet (" +
                   relatedExpression.value_or("") + ")";
        case InhibitorCause::FailedResource:
            return "resource expression " + relatedExpression.value_or("") + " evaluates to false";
    }
    return "unknown";
}

JobState::JobState(JobPtr job)
    : job_(std::move(job)),
      result_(JobResult::hollow()),
      inhibitors_{ReadinessInhibitor{}},
      certificationStatus_(job_->certificationStatus()) {
}

std::string JobState::readinessDescription() const {
    if (inhibitors_.empty()) {
        return "job can be started";
    }
    std::string text = "job cannot be started: ";
    for (std::size_t i = 0; i < inhibitors_.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += inhibitors_[i].describe();
    }
    return text;
}

}
