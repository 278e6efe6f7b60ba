/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "resume_decoders.hpp"
#include "certrun/envelope.hpp"
#include "certrun/errors.hpp"
#include "certrun/logger.hpp"
#include <algorithm>
#include <deque>
#include <limits>
#include <map>
#include <regex>
#include <set>

namespace certrun {

namespace {

IOLogRecord buildIoLogRecord(const Json& recordRepr) {
    requireType(recordRepr, Json::value_t::array, "IO log record");
    if (recordRepr.size() != 3) {
        throw CorruptedSessionError("IO log record must have three items");
    }
    requireType(recordRepr[0], Json::value_t::number_float, "IO log record delay");
    double delay = recordRepr[0].get<double>();
    if (delay < 0) {
        throw CorruptedSessionError("delay cannot be negative");
    }
    requireType(recordRepr[1], Json::value_t::string, "IO log record stream");
    std::string stream = recordRepr[1].get<std::string>();
    if (stream != "stdout" && stream != "stderr") {
        throw CorruptedSessionError("Value for IO log record stream not in allowed set ['stdout', 'stderr']");
    }
    requireType(recordRepr[2], Json::value_t::string, "IO log record data");
    auto data = base64Decode(recordRepr[2].get<std::string>());
    if (!data) {
        throw CorruptedSessionError("record data is not correct base64");
    }
    return {delay, stream, *data};
}

// Swaps a stored ".../.cache/certrun/sessions/<name>" prefix for `location`.
std::filesystem::path rewriteLegacyPath(const std::string& stored, const std::filesystem::path& location) {
    static const std::regex legacyPrefix(R"(^.*/\.cache/certrun/sessions/[^/]+)");
    std::smatch match;
    if (!std::regex_search(stored, match, legacyPrefix)) {
        return stored;
    }
    std::string rest = match.suffix().str();
    rest.erase(0, rest.find_first_not_of('/'));
    return rest.empty() ? location : location / rest;
}

JobResultPtr buildResultCommon(const Json& resultRepr, const DecodeContext& ctx, bool relativeLogPaths) {
    requireType(resultRepr, Json::value_t::object, "result");

    JobResult::Builder fields;
    if (auto outcome = nullableString(resultRepr, "outcome")) {
        auto parsed = outcomeFromString(*outcome);
        if (!parsed) {
            throw CorruptedSessionError("Value for key 'outcome' not in allowed set: " + *outcome);
        }
        fields.outcome = *parsed;
    }
    fields.comments = nullableString(resultRepr, "comments");
    if (auto code = nullableInteger(resultRepr, "return_code")) {
        if (*code < std::numeric_limits<int>::min() || *code > std::numeric_limits<int>::max()) {
            throw CorruptedSessionError("Value of key 'return_code' is out of range: " + std::to_string(*code));
        }
        fields.returnCode = static_cast<int>(*code);
    }
    fields.executionDuration = nullableNumber(resultRepr, "execution_duration");

    bool hasFile = resultRepr.contains("io_log_filename");
    bool hasLog = resultRepr.contains("io_log");
    if (hasFile && hasLog) {
        throw CorruptedSessionError("Result has both 'io_log' and 'io_log_filename'");
    }

    if (!hasFile) {
        std::vector<IOLogRecord> ioLog;
        for (const auto& recordRepr : requireArray(resultRepr, "io_log")) {
            ioLog.push_back(buildIoLogRecord(recordRepr));
        }
        return JobResult::inMemory(fields, std::move(ioLog));
    }

    std::string stored = requireString(resultRepr, "io_log_filename");
    std::filesystem::path path(stored);
    if (relativeLogPaths && path.is_relative()) {
        path = ctx.options.location / path;
    }

    const ResumeOptions& opts = ctx.options;
    if (opts.checkFileReferences || opts.rewriteLogPathnames) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (!opts.rewriteLogPathnames) {
                throw BrokenReferenceToExternalFile(path);
            }
            std::filesystem::path rewritten = rewriteLegacyPath(path.string(), opts.location);
            if (rewritten == path || !std::filesystem::exists(rewritten, ec)) {
                throw BrokenReferenceToExternalFile(path);
            }
            LOG_DEBUG("Rewrote IO log path " + path.string() + " to " + rewritten.string());
            path = rewritten;
        }
    }
    return JobResult::onDisk(fields, path);
}

// Returns false if the job is not (yet) known to the session.
bool processJob(SessionState& session, const Json& jobsRepr, const Json& resultsRepr,
                const JobId& id, const DecodeContext& ctx) {
    std::string checksum = requireString(jobsRepr, id);
    JobPtr job = session.findJob(id);
    if (!job) {
        return false;
    }
    if (job->checksum() != checksum) {
        if (!ctx.options.ignoreJobChecksums) {
            throw IncompatibleJobError(id);
        }
        LOG_WARN("Definition of job " + id + " has changed, ignoring as requested");
    }

    std::vector<JobResultPtr> results;
    if (const Json* resultList = ctx.decoder.resultList(resultsRepr, id)) {
        for (const auto& resultRepr : *resultList) {
            results.push_back(ctx.decoder.buildResult(resultRepr, ctx));
        }
    }
    for (auto& result : results) {
        session.updateJobResult(job, std::move(result));
    }
    LOG_TRACE("Restored " + std::to_string(results.size()) + " results for " + id);
    return true;
}

std::vector<JobPtr> lookupJobs(const SessionState& session, const std::vector<std::string>& ids,
                               const std::string& listName) {
    std::vector<JobPtr> jobs;
    for (const auto& id : ids) {
        JobPtr job = session.findJob(id);
        if (!job) {
            throw CorruptedSessionError("'" + listName + "' refers to unknown job '" + id + "'");
        }
        jobs.push_back(job);
    }
    return jobs;
}

// Initial format.
class DecoderV1 : public SessionDecoder {
public:
    void restoreMetadata(SessionMetadata& metadata, const Json& metadataRepr) const override {
        metadata.title = nullableString(metadataRepr, "title");
        auto flags = requireStringList(metadataRepr, "flags");
        metadata.flags = std::set<std::string>(flags.begin(), flags.end());
        metadata.runningJobName = nullableString(metadataRepr, "running_job_name");
    }

    void restoreJobsAndResults(SessionState& session, const Json& sessionRepr,
                               const DecodeContext& ctx) const override {
        const Json& jobsRepr = requireObject(sessionRepr, "jobs");
        const Json& resultsRepr = requireObject(sessionRepr, "results");

        std::set<JobId> ids;
        for (auto it = jobsRepr.begin(); it != jobsRepr.end(); ++it) {
            ids.insert(it.key());
        }
        for (auto it = resultsRepr.begin(); it != resultsRepr.end(); ++it) {
            ids.insert(it.key());
        }

        // Generated jobs only appear once the local job that makes them has
        // been replayed, so unknown ids are retried until a round stalls.
        std::deque<JobId> leftover;
        for (const auto& id : ids) {
            if (!processJob(session, jobsRepr, resultsRepr, id, ctx)) {
                leftover.push_back(id);
            }
        }
        while (!leftover.empty()) {
            std::size_t round = leftover.size();
            bool progress = false;
            for (std::size_t i = 0; i < round; ++i) {
                JobId id = std::move(leftover.front());
                leftover.pop_front();
                if (processJob(session, jobsRepr, resultsRepr, id, ctx)) {
                    progress = true;
                } else {
                    leftover.push_back(std::move(id));
                }
            }
            if (!progress) {
                std::string names;
                for (const auto& id : leftover) {
                    names += names.empty() ? id : ", " + id;
                }
                throw CorruptedSessionError("Unknown jobs remaining: " + names);
            }
        }
    }

    void restoreJobList(SessionState& session, const Json& sessionRepr) const override {
        auto desired = lookupJobs(session, requireStringList(sessionRepr, "desired_job_list"), "desired_job_list");
        auto problems = session.updateDesiredJobList(desired);
        if (!problems.empty()) {
            throw CorruptedSessionError("'desired_job_list' cannot be satisfied: " + problems.front().describe());
        }
    }

    const Json* resultList(const Json& resultsRepr, const JobId& id) const override {
        const Json& value = requireKey(resultsRepr, id);
        if (value.is_null()) {
            return nullptr;
        }
        requireType(value, Json::value_t::array, "key '" + id + "'");
        return &value;
    }

    JobResultPtr buildResult(const Json& resultRepr, const DecodeContext& ctx) const override {
        return buildResultCommon(resultRepr, ctx, false);
    }
};

// Wraps the previous version; subclasses override what their format changed.
class DelegatingDecoder : public SessionDecoder {
public:
    explicit DelegatingDecoder(const SessionDecoder& previous) : previous_(previous) {}

    void restoreMetadata(SessionMetadata& metadata, const Json& metadataRepr) const override {
        previous_.restoreMetadata(metadata, metadataRepr);
    }
    void restoreJobsAndResults(SessionState& session, const Json& sessionRepr,
                               const DecodeContext& ctx) const override {
        previous_.restoreJobsAndResults(session, sessionRepr, ctx);
    }
    void restoreJobList(SessionState& session, const Json& sessionRepr) const override {
        previous_.restoreJobList(session, sessionRepr);
    }
    const Json* resultList(const Json& resultsRepr, const JobId& id) const override {
        return previous_.resultList(resultsRepr, id);
    }
    JobResultPtr buildResult(const Json& resultRepr, const DecodeContext& ctx) const override {
        return previous_.buildResult(resultRepr, ctx);
    }

protected:
    const SessionDecoder& previous_;
};

// Adds metadata.app_blob (base64 or null).
class DecoderV2 final : public DelegatingDecoder {
public:
    using DelegatingDecoder::DelegatingDecoder;

    void restoreMetadata(SessionMetadata& metadata, const Json& metadataRepr) const override {
        previous_.restoreMetadata(metadata, metadataRepr);
        metadata.appBlob.reset();
        if (auto blob = nullableString(metadataRepr, "app_blob")) {
            auto decoded = base64Decode(*blob);
            if (!decoded) {
                throw CorruptedSessionError("Value of key 'app_blob' is not correct base64");
            }
            metadata.appBlob = std::move(*decoded);
        }
    }
};

// Adds metadata.app_id.
class DecoderV3 final : public DelegatingDecoder {
public:
    using DelegatingDecoder::DelegatingDecoder;

    void restoreMetadata(SessionMetadata& metadata, const Json& metadataRepr) const override {
        previous_.restoreMetadata(metadata, metadataRepr);
        metadata.appId = nullableString(metadataRepr, "app_id");
    }
};

// Hollow results are no longer stored; a job may lack a results entry.
class DecoderV4 final : public DelegatingDecoder {
public:
    using DelegatingDecoder::DelegatingDecoder;

    const Json* resultList(const Json& resultsRepr, const JobId& id) const override {
        if (!resultsRepr.contains(id)) {
            return nullptr;
        }
        return previous_.resultList(resultsRepr, id);
    }
};

// IO log pathnames may be relative to the session location.
class DecoderV5 final : public DelegatingDecoder {
public:
    using DelegatingDecoder::DelegatingDecoder;

    JobResultPtr buildResult(const Json& resultRepr, const DecodeContext& ctx) const override {
        return buildResultCommon(resultRepr, ctx, true);
    }
};

// Stores the mandatory job list.
class DecoderV6 final : public DelegatingDecoder {
public:
    using DelegatingDecoder::DelegatingDecoder;

    void restoreJobList(SessionState& session, const Json& sessionRepr) const override {
        auto mandatory = lookupJobs(session, requireStringList(sessionRepr, "mandatory_job_list"),
                                    "mandatory_job_list");
        session.updateMandatoryJobList(mandatory);
        previous_.restoreJobList(session, sessionRepr);
    }
};

}

const SessionDecoder* decoderForVersion(int version) {
    static const DecoderV1 v1{};
    static const DecoderV2 v2{v1};
    static const DecoderV3 v3{v2};
    static const DecoderV4 v4{v3};
    static const DecoderV5 v5{v4};
    static const DecoderV6 v6{v5};
    static const std::map<int, const SessionDecoder*> table = {
        {1, &v1}, {2, &v2}, {3, &v3}, {4, &v4}, {5, &v5}, {6, &v6}
    };
    auto it = table.find(version);
    return it == table.end() ? nullptr : it->second;
}

}
