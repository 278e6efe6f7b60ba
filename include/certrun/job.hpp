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

#include "certrun/resource.hpp"
#include "certrun/rfc822.hpp"
#include "certrun/types.hpp"

namespace certrun {

class JobDefinition;
using JobPtr = std::shared_ptr<const JobDefinition>;

struct JobLoadResult {
    bool ok = false;
    JobPtr job;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

/**
 * Immutable catalog entry. Built from the key/value fields of a record;
 * everything else (dependencies, resource program, checksum) is derived
 * from those fields once at construction.
 */
class JobDefinition final {
    // Restricts construction to the factories while allowing make_shared.
    struct Token {
        explicit Token() = default;
    };

public:
    using Fields = std::map<std::string, std::string>;

    explicit JobDefinition(Token) {}

    [[nodiscard]] static JobLoadResult fromFields(Fields fields);
    [[nodiscard]] static JobLoadResult fromRecord(const Record& record);

    [[nodiscard]] const JobId& id() const noexcept { return id_; }
    [[nodiscard]] PluginKind plugin() const noexcept { return plugin_; }
    [[nodiscard]] const std::string& checksum() const noexcept { return checksum_; }
    [[nodiscard]] const std::set<JobId>& directDependencies() const noexcept { return depends_; }
    [[nodiscard]] const std::optional<ResourceProgram>& resourceProgram() const noexcept { return program_; }
    [[nodiscard]] std::set<JobId> resourceDependencies() const;
    [[nodiscard]] const std::optional<double>& estimatedDuration() const noexcept { return estimatedDuration_; }
    [[nodiscard]] const std::set<std::string>& flags() const noexcept { return flags_; }
    [[nodiscard]] std::string certificationStatus() const;
    [[nodiscard]] const Fields& fields() const noexcept { return fields_; }

    // Runs without an operator: shell, resource, local and attachment jobs.
    [[nodiscard]] bool automated() const noexcept;

    bool operator==(const JobDefinition& other) const { return fields_ == other.fields_; }
    bool operator!=(const JobDefinition& other) const { return fields_ != other.fields_; }

private:
    Fields fields_;
    JobId id_;
    PluginKind plugin_ = PluginKind::Shell;
    std::string checksum_;
    std::set<JobId> depends_;
    std::optional<ResourceProgram> program_;
    std::optional<double> estimatedDuration_;
    std::set<std::string> flags_;
};

struct CatalogLoadResult {
    std::vector<JobPtr> jobs;
    std::vector<std::string> errors;
};

// Parses a catalog file. Invalid records are reported and skipped.
[[nodiscard]] CatalogLoadResult loadJobDefinitions(const std::string& text,
                                                   const RecordParser& parser = Rfc822Parser{});

// FNV-1a 64 of the input, as 16 lowercase hex digits.
[[nodiscard]] std::string fnv1aHex(const std::string& data) noexcept;

}
