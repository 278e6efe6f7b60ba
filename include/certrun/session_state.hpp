/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "certrun/depmgr.hpp"
#include "certrun/job.hpp"
#include "certrun/job_state.hpp"
#include "certrun/resource.hpp"
#include "certrun/result.hpp"
#include "certrun/rfc822.hpp"
#include "certrun/signal.hpp"

namespace certrun {

struct SessionMetadata {
    static constexpr const char* FLAG_INCOMPLETE = "incomplete";
    static constexpr const char* FLAG_SUBMITTED = "submitted";
    static constexpr const char* FLAG_BOOTSTRAPPING = "bootstrapping";

    std::optional<std::string> title;
    std::set<std::string> flags;
    // Job being executed when the session was last saved.
    std::optional<JobId> runningJobName;
    // Opaque application data, raw bytes.
    std::optional<std::string> appBlob;
    std::optional<std::string> appId;
};

enum class SessionOperation : uint8_t {
    UpdateDesiredJobList,
    UpdateMandatoryJobList,
    UpdateJobResult,
    AddUnit,
    RemoveUnit,
    TrimJobList,
    SetResourceList
};

[[nodiscard]] const char* sessionOperationToString(SessionOperation op) noexcept;

struct StateChangedEvent {
    SessionOperation operation;
};

struct JobAddedEvent {
    JobPtr job;
};

struct JobRemovedEvent {
    JobPtr job;
};

struct JobResultChangedEvent {
    JobPtr job;
    JobResultPtr oldResult;
    JobResultPtr newResult;
};

struct DesiredJobListChangedEvent {
    std::vector<JobPtr> desired;
    std::vector<DependencyProblem> problems;
};

struct MandatoryJobListChangedEvent {
    std::vector<JobPtr> mandatory;
};

struct EstimatedDuration {
    // nullopt when some job in the bucket has no usable estimate.
    std::optional<double> automated;
    std::optional<double> manual;
};

/**
 * Aggregate root of a testing session.
 *
 * Owns one JobState per known job, the resource map, the desired and
 * mandatory job lists, the run list derived from them and the session
 * metadata. Every mutating operation recomputes readiness before it returns
 * and then notifies observers: state-changed first, then the specific events.
 *
 * Not thread safe.
 */
class SessionState final {
public:
    explicit SessionState(std::vector<JobPtr> jobs,
                          std::shared_ptr<const DependencyResolver> resolver = nullptr,
                          std::shared_ptr<const RecordParser> parser = nullptr);

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    // Returns the dependency problems that forced jobs out of the run list.
    std::vector<DependencyProblem> updateDesiredJobList(const std::vector<JobPtr>& desired);

    // Takes effect on the next updateDesiredJobList().
    void updateMandatoryJobList(const std::vector<JobPtr>& mandatory);

    void updateJobResult(const JobPtr& job, JobResultPtr result);

    // An identical definition already present is ignored.
    void addUnit(const JobPtr& job);
    void removeUnit(const JobPtr& job);
    void trimJobList(const std::function<bool(const JobDefinition&)>& predicate);

    void setResourceList(const JobId& resourceId, std::vector<Resource> records);

    [[nodiscard]] EstimatedDuration estimatedDuration(double manualOverhead = 30.0) const;

    [[nodiscard]] const std::vector<JobPtr>& jobs() const noexcept { return jobs_; }
    [[nodiscard]] JobPtr findJob(const JobId& id) const;
    [[nodiscard]] const std::map<JobId, JobState>& jobStates() const noexcept { return states_; }
    [[nodiscard]] const JobState& jobState(const JobId& id) const;
    [[nodiscard]] const std::vector<JobPtr>& desiredJobList() const noexcept { return desired_; }
    [[nodiscard]] const std::vector<JobPtr>& mandatoryJobList() const noexcept { return mandatory_; }
    [[nodiscard]] const std::vector<JobPtr>& runList() const noexcept { return runList_; }
    [[nodiscard]] const ResourceMap& resourceMap() const noexcept { return resourceMap_; }
    [[nodiscard]] SessionMetadata& metadata() noexcept { return metadata_; }
    [[nodiscard]] const SessionMetadata& metadata() const noexcept { return metadata_; }

    Signal<StateChangedEvent>::ConnectionId onStateChanged(Signal<StateChangedEvent>::Handler handler) {
        return stateChanged_.connect(std::move(handler));
    }
    Signal<JobAddedEvent>::ConnectionId onJobAdded(Signal<JobAddedEvent>::Handler handler) {
        return jobAdded_.connect(std::move(handler));
    }
    Signal<JobRemovedEvent>::ConnectionId onJobRemoved(Signal<JobRemovedEvent>::Handler handler) {
        return jobRemoved_.connect(std::move(handler));
    }
    Signal<JobResultChangedEvent>::ConnectionId onJobResultChanged(Signal<JobResultChangedEvent>::Handler handler) {
        return jobResultChanged_.connect(std::move(handler));
    }
    Signal<DesiredJobListChangedEvent>::ConnectionId onDesiredJobListChanged(
        Signal<DesiredJobListChangedEvent>::Handler handler) {
        return desiredJobListChanged_.connect(std::move(handler));
    }
    Signal<MandatoryJobListChangedEvent>::ConnectionId onMandatoryJobListChanged(
        Signal<MandatoryJobListChangedEvent>::Handler handler) {
        return mandatoryJobListChanged_.connect(std::move(handler));
    }

private:
    std::vector<JobPtr> jobs_;
    std::map<JobId, JobState> states_;
    std::vector<JobPtr> desired_;
    std::vector<JobPtr> mandatory_;
    std::vector<JobPtr> runList_;
    ResourceMap resourceMap_;
    SessionMetadata metadata_;

    std::shared_ptr<const DependencyResolver> resolver_;
    std::shared_ptr<const RecordParser> parser_;

    Signal<StateChangedEvent> stateChanged_;
    Signal<JobAddedEvent> jobAdded_;
    Signal<JobRemovedEvent> jobRemoved_;
    Signal<JobResultChangedEvent> jobResultChanged_;
    Signal<DesiredJobListChangedEvent> desiredJobListChanged_;
    Signal<MandatoryJobListChangedEvent> mandatoryJobListChanged_;

    void recomputeReadiness();
    void requireKnown(const JobPtr& job) const;
    [[nodiscard]] bool onRunList(const JobId& id) const;
    void eraseJob(const JobId& id);

    [[nodiscard]] std::vector<Record> recordsFromOutput(const JobDefinition& job, const JobResult& result) const;
    void processResourceResult(const JobDefinition& job, const JobResult& result);
    [[nodiscard]] std::vector<JobPtr> processLocalResult(const JobDefinition& job, const JobResult& result);
};

}
