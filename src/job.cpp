/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/job.hpp"
#include "certrun/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdio>
#include <sstream>

namespace certrun {

namespace {
constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

std::set<std::string> splitWords(const std::string& text, const char* separators) {
    std::set<std::string> words;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t start = text.find_first_not_of(separators, pos);
        if (start == std::string::npos) {
            break;
        }
        std::size_t end = text.find_first_of(separators, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        words.insert(text.substr(start, end - start));
        pos = end;
    }
    return words;
}

const std::string* findField(const JobDefinition::Fields& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? nullptr : &it->second;
}
}

std::string fnv1aHex(const std::string& data) noexcept {
    std::uint64_t hash = kFnvOffsetBasis;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buffer, 16);
}

JobLoadResult JobDefinition::fromFields(Fields fields) {
    const std::string* id = findField(fields, "id");
    if (!id) {
        id = findField(fields, "name");
    }
    if (!id || id->empty()) {
        return {false, nullptr, "Job definition has no id"};
    }

    const std::string* plugin = findField(fields, "plugin");
    if (!plugin) {
        return {false, nullptr, "Job " + *id + " has no plugin"};
    }
    auto kind = pluginKindFromString(*plugin);
    if (!kind) {
        return {false, nullptr, "Job " + *id + " has unknown plugin: " + *plugin};
    }

    auto job = std::make_shared<JobDefinition>(Token{});
    job->id_ = *id;
    job->plugin_ = *kind;

    if (const std::string* depends = findField(fields, "depends")) {
        job->depends_ = splitWords(*depends, " \t\r\n,");
    }

    if (const std::string* requirements = findField(fields, "requires")) {
        std::string error;
        auto program = ResourceProgram::compile(*requirements, error);
        if (!program) {
            return {false, nullptr, "Job " + *id + " has invalid requires: " + error};
        }
        if (!program->expressions().empty()) {
            job->program_ = std::move(*program);
        }
    }

    if (const std::string* duration = findField(fields, "estimated_duration")) {
        try {
            std::size_t used = 0;
            double value = std::stod(*duration, &used);
            if (used != duration->size() || value < 0) {
                return {false, nullptr, "Job " + *id + " has invalid estimated_duration: " + *duration};
            }
            job->estimatedDuration_ = value;
        } catch (const std::exception&) {
            return {false, nullptr, "Job " + *id + " has invalid estimated_duration: " + *duration};
        }
    }

    if (const std::string* flags = findField(fields, "flags")) {
        job->flags_ = splitWords(*flags, " \t\r\n");
    }

    // std::map keys are already sorted, so the dump is canonical.
    try {
        job->checksum_ = fnv1aHex(nlohmann::json(fields).dump());
    } catch (const nlohmann::json::type_error& e) {
        return {false, nullptr, "Job " + *id + " is not valid UTF-8: " + e.what()};
    }
    job->fields_ = std::move(fields);

    return {true, job, ""};
}

JobLoadResult JobDefinition::fromRecord(const Record& record) {
    auto result = fromFields(record.data);
    if (!result.ok) {
        result.message += " (line " + std::to_string(record.lineStart) + ")";
    }
    return result;
}

std::set<JobId> JobDefinition::resourceDependencies() const {
    if (!program_) {
        return {};
    }
    return program_->requiredResources();
}

std::string JobDefinition::certificationStatus() const {
    const std::string* status = findField(fields_, "certification-status");
    return status ? *status : "unspecified";
}

bool JobDefinition::automated() const noexcept {
    switch (plugin_) {
        case PluginKind::Shell:
        case PluginKind::Resource:
        case PluginKind::Local:
        case PluginKind::Attachment:
            return true;
        case PluginKind::Manual:
        case PluginKind::UserInteract:
        case PluginKind::UserVerify:
        case PluginKind::UserInteractVerify:
            return false;
    }
    return false;
}

CatalogLoadResult loadJobDefinitions(const std::string& text, const RecordParser& parser) {
    CatalogLoadResult out;
    auto parsed = parser.parse(text);
    for (const auto& error : parsed.errors) {
        out.errors.push_back("line " + std::to_string(error.line) + ": " + error.message);
    }
    for (const auto& record : parsed.records) {
        auto result = JobDefinition::fromRecord(record);
        if (!result) {
            LOG_WARN("Skipping job definition: " + result.message);
            out.errors.push_back(result.message);
            continue;
        }
        out.jobs.push_back(result.job);
    }
    LOG_DEBUG("Loaded " + std::to_string(out.jobs.size()) + " job definitions");
    return out;
}

}
