/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/session_state.hpp"
#include "certrun/errors.hpp"
#include "certrun/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace certrun {

namespace {
bool containsId(const std::vector<JobPtr>& jobs, const JobId& id) {
    return std::any_of(jobs.begin(), jobs.end(), [&](const JobPtr& j) { return j->id() == id; });
}

void eraseId(std::vector<JobPtr>& jobs, const JobId& id) {
    jobs.erase(std::remove_if(jobs.begin(), jobs.end(), [&](const JobPtr& j) { return j->id() == id; }),
               jobs.end());
}
}

const char* sessionOperationToString(SessionOperation op) noexcept {
    switch (op) {
        case SessionOperation::UpdateDesiredJobList: return "update-desired-job-list";
        case SessionOperation::UpdateMandatoryJobList: return "update-mandatory-job-list";
        case SessionOperation::UpdateJobResult: return "update-job-result";
        case SessionOperation::AddUnit: return "add-unit";
        case SessionOperation::RemoveUnit: return "remove-unit";
        case SessionOperation::TrimJobList: return "trim-job-list";
        case SessionOperation::SetResourceList: return "set-resource-list";
    }
    return "unknown";
}

SessionState::SessionState(std::vector<JobPtr> jobs,
                           std::shared_ptr<const DependencyResolver> resolver,
                           std::shared_ptr<const RecordParser> parser)
    : resolver_(resolver ? std::move(resolver) : std::make_shared<DependencySolver>()),
      parser_(parser ? std::move(parser) : std::make_shared<Rfc822Parser>()) {
    for (auto& job : jobs) {
        auto it = states_.find(job->id());
        if (it != states_.end()) {
            if (*it->second.job() != *job) {
                throw DuplicateJobError(it->second.job(), job);
            }
            LOG_DEBUG("Dropping identical duplicate of job " + job->id());
            continue;
        }
        states_.emplace(job->id(), JobState(job));
        jobs_.push_back(std::move(job));
    }
    LOG_DEBUG("Session created with " + std::to_string(jobs_.size()) + " jobs");
}

JobPtr SessionState::findJob(const JobId& id) const {
    auto it = states_.find(id);
    return it == states_.end() ? nullptr : it->second.job();
}

const JobState& SessionState::jobState(const JobId& id) const {
    auto it = states_.find(id);
    if (it == states_.end()) {
        throw std::invalid_argument("Unknown job: " + id);
    }
    return it->second;
}

void SessionState::requireKnown(const JobPtr& job) const {
    if (!job) {
        throw std::invalid_argument("Null job");
    }
    auto it = states_.find(job->id());
    if (it == states_.end() || *it->second.job() != *job) {
        throw std::invalid_argument("Job is not part of this session: " + job->id());
    }
}

bool SessionState::onRunList(const JobId& id) const {
    return containsId(runList_, id);
}

std::vector<DependencyProblem> SessionState::updateDesiredJobList(const std::vector<JobPtr>& desired) {
    for (const auto& job : desired) {
        requireKnown(job);
    }

    desired_.clear();
    for (const auto& job : desired) {
        if (!containsId(desired_, job->id())) {
            desired_.push_back(findJob(job->id()));
        }
    }

    std::vector<JobPtr> visitList = mandatory_;
    for (const auto& job : desired_) {
        if (!containsId(visitList, job->id())) {
            visitList.push_back(job);
        }
    }

    std::vector<DependencyProblem> problems;
    runList_.clear();
    while (!visitList.empty()) {
        auto solved = resolver_->resolve(jobs_, visitList);
        if (solved) {
            runList_ = std::move(solved.solution);
            break;
        }
        DependencyProblem problem = std::move(*solved.problem);
        JobId dropped;
        if (problem.affectedJob && containsId(visitList, problem.affectedJob->id())) {
            dropped = problem.affectedJob->id();
        } else if (problem.visitRoot && containsId(visitList, problem.visitRoot->id())) {
            dropped = problem.visitRoot->id();
        } else {
            dropped = visitList.front()->id();
        }
        LOG_WARN("Dropping job " + dropped + ": " + problem.describe());
        eraseId(visitList, dropped);
        eraseId(desired_, dropped);
        problems.push_back(std::move(problem));
    }

    recomputeReadiness();
    stateChanged_.emit({SessionOperation::UpdateDesiredJobList});
    desiredJobListChanged_.emit({desired_, problems});
    return problems;
}

void SessionState::updateMandatoryJobList(const std::vector<JobPtr>& mandatory) {
    for (const auto& job : mandatory) {
        requireKnown(job);
    }
    mandatory_.clear();
    for (const auto& job : mandatory) {
        if (!containsId(mandatory_, job->id())) {
            mandatory_.push_back(findJob(job->id()));
        }
    }
    stateChanged_.emit({SessionOperation::UpdateMandatoryJobList});
    mandatoryJobListChanged_.emit({mandatory_});
}

void SessionState::updateJobResult(const JobPtr& job, JobResultPtr result) {
    requireKnown(job);
    if (!result) {
        throw std::invalid_argument("Null result for job " + job->id());
    }

    auto& state = states_.at(job->id());
    JobResultPtr oldResult = state.result();
    state.setResult(result);

    std::vector<JobPtr> added;
    if (!result->isHollow()) {
        switch (job->plugin()) {
            case PluginKind::Resource:
                processResourceResult(*job, *result);
                break;
            case PluginKind::Local:
                added = processLocalResult(*job, *result);
                break;
            case PluginKind::Shell:
            case PluginKind::Manual:
            case PluginKind::UserInteract:
            case PluginKind::UserVerify:
            case PluginKind::UserInteractVerify:
            case PluginKind::Attachment:
                break;
        }
    }

    recomputeReadiness();
    stateChanged_.emit({SessionOperation::UpdateJobResult});
    jobResultChanged_.emit({state.job(), oldResult, result});
    for (const auto& newJob : added) {
        jobAdded_.emit({newJob});
    }
}

void SessionState::addUnit(const JobPtr& job) {
    if (!job) {
        throw std::invalid_argument("Null job");
    }
    auto it = states_.find(job->id());
    if (it != states_.end()) {
        if (*it->second.job() != *job) {
            throw DuplicateJobError(it->second.job(), job);
        }
        return;
    }
    LOG_INFO("Storing new job " + job->id());
    states_.emplace(job->id(), JobState(job));
    jobs_.push_back(job);

    recomputeReadiness();
    stateChanged_.emit({SessionOperation::AddUnit});
    jobAdded_.emit({job});
}

void SessionState::eraseJob(const JobId& id) {
    eraseId(jobs_, id);
    eraseId(desired_, id);
    eraseId(mandatory_, id);
    states_.erase(id);
    resourceMap_.erase(id);
}

void SessionState::removeUnit(const JobPtr& job) {
    requireKnown(job);
    if (onRunList(job->id())) {
        throw std::invalid_argument("Cannot remove job on the run list: " + job->id());
    }
    JobPtr removed = findJob(job->id());
    LOG_DEBUG("Removing job " + removed->id());
    eraseJob(removed->id());

    recomputeReadiness();
    stateChanged_.emit({SessionOperation::RemoveUnit});
    jobRemoved_.emit({removed});
}

void SessionState::trimJobList(const std::function<bool(const JobDefinition&)>& predicate) {
    std::vector<JobPtr> matched;
    for (const auto& job : jobs_) {
        if (predicate(*job)) {
            if (onRunList(job->id())) {
                throw std::invalid_argument("Cannot trim job on the run list: " + job->id());
            }
            matched.push_back(job);
        }
    }
    if (matched.empty()) {
        return;
    }

    for (const auto& job : matched) {
        eraseJob(job->id());
    }
    LOG_DEBUG("Trimmed " + std::to_string(matched.size()) + " jobs");

    recomputeReadiness();
    stateChanged_.emit({SessionOperation::TrimJobList});
    for (const auto& job : matched) {
        jobRemoved_.emit({job});
    }
}

void SessionState::setResourceList(const JobId& resourceId, std::vector<Resource> records) {
    resourceMap_[resourceId] = std::move(records);
    recomputeReadiness();
    stateChanged_.emit({SessionOperation::SetResourceList});
}

EstimatedDuration SessionState::estimatedDuration(double manualOverhead) const {
    EstimatedDuration total{0.0, 0.0};
    for (const auto& job : runList_) {
        const auto& estimate = job->estimatedDuration();
        if (job->automated()) {
            if (!total.automated) {
                continue;
            }
            if (estimate) {
                *total.automated += *estimate;
            } else if (job->plugin() != PluginKind::Local && job->plugin() != PluginKind::Resource) {
                total.automated.reset();
            }
        } else {
            if (!total.manual) {
                continue;
            }
            if (estimate) {
                *total.manual += manualOverhead + *estimate;
            } else {
                total.manual.reset();
            }
        }
    }
    return total;
}

void SessionState::recomputeReadiness() {
    for (auto& entry : states_) {
        entry.second.setInhibitors({ReadinessInhibitor{}});
    }

    // The run list is topologically sorted, so one pass is enough.
    for (const auto& job : runList_) {
        auto& state = states_.at(job->id());
        state.setInhibitors({});

        if (const auto& program = job->resourceProgram()) {
            for (const auto& evaluation : program->evaluate(resourceMap_)) {
                if (evaluation.status == EvaluationStatus::Satisfied) {
                    continue;
                }
                ReadinessInhibitor inhibitor;
                inhibitor.cause = evaluation.status == EvaluationStatus::CannotEvaluate
                                      ? InhibitorCause::PendingResource
                                      : InhibitorCause::FailedResource;
                inhibitor.relatedJob = findJob(evaluation.expression->resourceId());
                inhibitor.relatedExpression = evaluation.expression->text();
                state.addInhibitor(std::move(inhibitor));
            }
        }

        for (const auto& depId : job->directDependencies()) {
            auto dep = states_.find(depId);
            if (dep == states_.end()) {
                continue;
            }
            Outcome outcome = dep->second.result()->outcome();
            if (outcome == Outcome::None) {
                state.addInhibitor({InhibitorCause::PendingDep, dep->second.job(), std::nullopt});
            } else if (outcome != Outcome::Pass) {
                state.addInhibitor({InhibitorCause::FailedDep, dep->second.job(), std::nullopt});
            }
        }
    }
}

std::vector<Record> SessionState::recordsFromOutput(const JobDefinition& job, const JobResult& result) const {
    auto parsed = parser_->parse(result.stdoutText());
    for (const auto& error : parsed.errors) {
        LOG_WARN("Job " + job.id() + " produced a malformed record at line " + std::to_string(error.line) +
                 ": " + error.message);
    }
    return std::move(parsed.records);
}

void SessionState::processResourceResult(const JobDefinition& job, const JobResult& result) {
    std::vector<Resource> records;
    for (auto& record : recordsFromOutput(job, result)) {
        records.push_back(std::move(record.data));
    }
    LOG_DEBUG("Storing " + std::to_string(records.size()) + " resource records for " + job.id());
    resourceMap_[job.id()] = std::move(records);
}

std::vector<JobPtr> SessionState::processLocalResult(const JobDefinition& job, const JobResult& result) {
    std::vector<JobPtr> added;
    for (const auto& record : recordsFromOutput(job, result)) {
        auto loaded = JobDefinition::fromRecord(record);
        if (!loaded) {
            LOG_WARN("Local job " + job.id() + " produced an invalid job: " + loaded.message);
            continue;
        }
        auto existing = states_.find(loaded.job->id());
        if (existing != states_.end()) {
            if (*existing->second.job() != *loaded.job) {
                LOG_WARN("Local job " + job.id() + " produced job " + loaded.job->id() +
                         " that collides with an existing job, the new job was discarded");
            }
            continue;
        }
        LOG_INFO("Storing new job " + loaded.job->id());
        states_.emplace(loaded.job->id(), JobState(loaded.job));
        jobs_.push_back(loaded.job);
        added.push_back(loaded.job);
    }
    return added;
}

}
