/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "certrun/types.hpp"

namespace certrun {

// One record parsed from the output of a resource job.
using Resource = std::map<std::string, std::string>;

// Resource job id -> records from its most recent result.
using ResourceMap = std::map<JobId, std::vector<Resource>>;

/**
 * A single line of a requirement program, e.g.
 *   package.name == "fwts" and package.version != "0"
 *
 * Every expression references exactly one resource. Values are compared as
 * strings; a record lacking the attribute never matches a comparison.
 */
class ResourceExpression {
public:
    struct Node;

    [[nodiscard]] static std::optional<ResourceExpression> compile(const std::string& text, std::string& error);

    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] const JobId& resourceId() const noexcept { return resourceId_; }

    // True if any of the records satisfies the expression.
    [[nodiscard]] bool evaluate(const std::vector<Resource>& resources) const;

    bool operator==(const ResourceExpression& other) const noexcept { return text_ == other.text_; }
    bool operator!=(const ResourceExpression& other) const noexcept { return text_ != other.text_; }

private:
    ResourceExpression(std::string text, JobId resourceId, std::shared_ptr<const Node> root);

    std::string text_;
    JobId resourceId_;
    std::shared_ptr<const Node> root_;
};

enum class EvaluationStatus : std::uint8_t {
    Satisfied,
    CannotEvaluate, // resource not in the map yet
    Failed          // resource known but no record matches
};

struct EvaluationResult {
    const ResourceExpression* expression = nullptr;
    EvaluationStatus status = EvaluationStatus::Satisfied;
};

class ResourceProgram {
public:
    // Compiles one expression per non-empty line.
    [[nodiscard]] static std::optional<ResourceProgram> compile(const std::string& text, std::string& error);

    [[nodiscard]] const std::vector<ResourceExpression>& expressions() const noexcept { return expressions_; }
    [[nodiscard]] std::set<JobId> requiredResources() const;

    // One entry per expression, in program order.
    [[nodiscard]] std::vector<EvaluationResult> evaluate(const ResourceMap& resources) const;

private:
    std::vector<ResourceExpression> expressions_;
};

}
