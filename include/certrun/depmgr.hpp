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

namespace certrun {

enum class DependencyErrorKind : uint8_t {
    Cycle,
    Missing,
    Duplicate
};

enum class DependencyType : uint8_t {
    Direct,
    Resource
};

struct DependencyProblem {
    DependencyErrorKind kind = DependencyErrorKind::Missing;
    // The job that cannot be scheduled.
    JobPtr affectedJob;
    // Duplicate: the second definition. Cycle: the job closing the loop.
    JobPtr affectingJob;
    std::vector<JobPtr> cycle;
    JobId missingJobId;
    DependencyType depType = DependencyType::Direct;
    // Requested job whose traversal hit the problem.
    JobPtr visitRoot;

    [[nodiscard]] std::string describe() const;
};

struct SolveResult {
    bool ok = false;
    std::vector<JobPtr> solution;
    std::optional<DependencyProblem> problem;
    explicit operator bool() const noexcept { return ok; }
};

class DependencyResolver {
public:
    virtual ~DependencyResolver() = default;

    // Orders the jobs reachable from visitList so that every job comes after
    // all of its direct and resource dependencies. Stops at the first problem.
    [[nodiscard]] virtual SolveResult resolve(const std::vector<JobPtr>& jobs,
                                              const std::vector<JobPtr>& visitList) const = 0;
};

// Colored depth-first search.
class DependencySolver final : public DependencyResolver {
public:
    [[nodiscard]] SolveResult resolve(const std::vector<JobPtr>& jobs,
                                      const std::vector<JobPtr>& visitList) const override;
};

}
