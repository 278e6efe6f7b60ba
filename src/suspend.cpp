/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/suspend.hpp"
#include "certrun/envelope.hpp"
#include "certrun/logger.hpp"
#include "certrun/resume.hpp"
#include <nlohmann/json.hpp>

namespace certrun {

namespace {
using Json = nlohmann::json;

Json idList(const std::vector<JobPtr>& jobs) {
    Json list = Json::array();
    for (const auto& job : jobs) {
        list.push_back(job->id());
    }
    return list;
}

template <typename T>
Json orNull(const std::optional<T>& value) {
    return value ? Json(*value) : Json(nullptr);
}
}

SessionSuspendHelper::SessionSuspendHelper(std::filesystem::path location)
    : location_(std::move(location)) {
}

Json SessionSuspendHelper::resultRepr(const JobResult& result) const {
    Json repr = Json::object();
    repr["outcome"] = result.outcome() == Outcome::None ? Json(nullptr) : Json(outcomeToString(result.outcome()));
    repr["comments"] = orNull(result.comments());
    repr["return_code"] = orNull(result.returnCode());
    repr["execution_duration"] = orNull(result.executionDuration());

    if (const auto& filename = result.ioLogFilename()) {
        std::filesystem::path stored = *filename;
        if (!location_.empty() && filename->is_absolute()) {
            auto relative = filename->lexically_relative(location_);
            if (!relative.empty() && *relative.begin() != "..") {
                stored = relative;
            }
        }
        repr["io_log_filename"] = stored.string();
    } else {
        Json log = Json::array();
        for (const auto& record : result.loadIoLog()) {
            log.push_back(Json::array({record.delay, record.stream, base64Encode(record.data)}));
        }
        repr["io_log"] = std::move(log);
    }
    return repr;
}

Json SessionSuspendHelper::jsonRepr(const SessionState& session) const {
    Json jobs = Json::object();
    Json results = Json::object();
    for (const auto& entry : session.jobStates()) {
        const JobState& state = entry.second;
        if (state.result()->isHollow()) {
            continue;
        }
        jobs[entry.first] = state.job()->checksum();
        results[entry.first] = Json::array({resultRepr(*state.result())});
    }

    const SessionMetadata& meta = session.metadata();
    Json flags = Json::array();
    for (const auto& flag : meta.flags) {
        flags.push_back(flag);
    }
    Json metadata = {
        {"title", orNull(meta.title)},
        {"flags", std::move(flags)},
        {"running_job_name", orNull(meta.runningJobName)},
        {"app_blob", meta.appBlob ? Json(base64Encode(*meta.appBlob)) : Json(nullptr)},
        {"app_id", orNull(meta.appId)},
    };

    return {
        {"version", kSessionFormatVersion},
        {"session", {
            {"jobs", std::move(jobs)},
            {"results", std::move(results)},
            {"desired_job_list", idList(session.desiredJobList())},
            {"mandatory_job_list", idList(session.mandatoryJobList())},
            {"metadata", std::move(metadata)},
        }},
    };
}

std::optional<std::string> SessionSuspendHelper::suspend(const SessionState& session) const {
    std::string text;
    try {
        text = jsonRepr(session).dump();
    } catch (const Json::type_error& e) {
        LOG_ERROR(std::string("Cannot encode session: ") + e.what());
        return std::nullopt;
    }
    LOG_DEBUG("Suspending session, " + std::to_string(text.size()) + " bytes of JSON");
    return gzipCompress(text);
}

}
