/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/depmgr.hpp"
#include "certrun/logger.hpp"
#include <algorithm>
#include <map>
#include <utility>

namespace certrun {

namespace {
enum class Color : uint8_t { White, Gray, Black };

class Visitor {
public:
    explicit Visitor(std::map<JobId, JobPtr> jobMap) : jobMap_(std::move(jobMap)) {
        for (const auto& entry : jobMap_) {
            colors_[entry.first] = Color::White;
        }
    }

    std::optional<DependencyProblem> visit(const JobPtr& job, std::vector<JobPtr>& trail) {
        Color color = colors_[job->id()];
        if (color == Color::Black) {
            return std::nullopt;
        }
        if (color == Color::Gray) {
            auto start = std::find_if(trail.begin(), trail.end(),
                [&](const JobPtr& j) { return j->id() == job->id(); });
            DependencyProblem problem;
            problem.kind = DependencyErrorKind::Cycle;
            problem.cycle.assign(start, trail.end());
            problem.affectedJob = problem.cycle.front();
            problem.affectingJob = problem.cycle.back();
            return problem;
        }

        colors_[job->id()] = Color::Gray;
        std::vector<std::pair<DependencyType, JobId>> deps;
        for (const auto& dep : job->directDependencies()) {
            deps.emplace_back(DependencyType::Direct, dep);
        }
        for (const auto& dep : job->resourceDependencies()) {
            deps.emplace_back(DependencyType::Resource, dep);
        }

        for (const auto& dep : deps) {
            auto it = jobMap_.find(dep.second);
            if (it == jobMap_.end()) {
                DependencyProblem problem;
                problem.kind = DependencyErrorKind::Missing;
                problem.affectedJob = job;
                problem.missingJobId = dep.second;
                problem.depType = dep.first;
                return problem;
            }
            trail.push_back(it->second);
            auto problem = visit(it->second, trail);
            if (problem) {
                return problem;
            }
            trail.pop_back();
        }

        colors_[job->id()] = Color::Black;
        solution_.push_back(job);
        return std::nullopt;
    }

    std::vector<JobPtr> takeSolution() { return std::move(solution_); }

private:
    std::map<JobId, JobPtr> jobMap_;
    std::map<JobId, Color> colors_;
    std::vector<JobPtr> solution_;
};
}

std::string DependencyProblem::describe() const {
    switch (kind) {
        case DependencyErrorKind::Cycle: {
            std::string text = "dependency cycle detected:";
            for (const auto& job : cycle) {
                text += " " + job->id();
            }
            return text;
        }
        case DependencyErrorKind::Missing:
            return "missing " + std::string(depType == DependencyType::Direct ? "direct" : "resource") +
                   " dependency " + missingJobId + " (" + affectedJob->id() + ")";
        case DependencyErrorKind::Duplicate:
            return "duplicate job " + affectedJob->id();
    }
    return "dependency problem";
}

SolveResult DependencySolver::resolve(const std::vector<JobPtr>& jobs,
                                      const std::vector<JobPtr>& visitList) const {
    std::map<JobId, JobPtr> jobMap;
    for (const auto& job : jobs) {
        auto inserted = jobMap.emplace(job->id(), job);
        if (!inserted.second) {
            DependencyProblem problem;
            problem.kind = DependencyErrorKind::Duplicate;
            problem.affectedJob = inserted.first->second;
            problem.affectingJob = job;
            problem.visitRoot = inserted.first->second;
            return {false, {}, problem};
        }
    }

    Visitor visitor(std::move(jobMap));
    for (const auto& root : visitList) {
        std::vector<JobPtr> trail{root};
        auto problem = visitor.visit(root, trail);
        if (problem) {
            problem->visitRoot = root;
            LOG_DEBUG("Dependency solver stopped: " + problem->describe());
            return {false, {}, std::move(problem)};
        }
    }
    return {true, visitor.takeSolution(), std::nullopt};
}

}
