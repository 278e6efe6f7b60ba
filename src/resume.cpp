/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/resume.hpp"
#include "certrun/envelope.hpp"
#include "certrun/errors.hpp"
#include "certrun/logger.hpp"
#include "resume_decoders.hpp"
#include <set>
#include <stdexcept>

namespace certrun {

namespace {
const SessionDecoder& selectDecoder(const Json& document) {
    requireType(document, Json::value_t::object, "object");
    const Json& version = requireKey(document, "version");
    if (!version.is_number_integer()) {
        throw CorruptedSessionError(std::string("Value of key 'version' is of incorrect type ") +
                                    version.type_name());
    }
    auto number = version.get<long long>();
    const SessionDecoder* decoder = nullptr;
    if (number >= 1 && number <= kSessionFormatVersion) {
        decoder = decoderForVersion(static_cast<int>(number));
    }
    if (!decoder) {
        throw IncompatibleSessionError("Unsupported version " + std::to_string(number));
    }
    LOG_DEBUG("Decoding session format version " + std::to_string(number));
    return *decoder;
}
}

Json decodeEnvelope(const std::string& data) {
    auto text = gzipDecompress(data);
    if (!text) {
        throw CorruptedSessionError("Cannot decompress session data");
    }
    try {
        return Json::parse(*text);
    } catch (const Json::parse_error& e) {
        throw CorruptedSessionError(std::string("Cannot interpret session JSON: ") + e.what());
    }
}

SessionResumeHelper::SessionResumeHelper(std::vector<JobPtr> jobs, ResumeOptions options)
    : jobs_(std::move(jobs)), options_(std::move(options)) {
    if (options_.rewriteLogPathnames) {
        options_.checkFileReferences = true;
    }
}

std::unique_ptr<SessionState> SessionResumeHelper::resume(const std::string& data,
                                                          const EarlyCallback& earlyCallback) const {
    return resumeJson(decodeEnvelope(data), earlyCallback);
}

std::unique_ptr<SessionState> SessionResumeHelper::resumeJson(const Json& document,
                                                              const EarlyCallback& earlyCallback) const {
    const SessionDecoder& decoder = selectDecoder(document);
    const Json& sessionRepr = requireObject(document, "session");

    auto session = std::make_unique<SessionState>(jobs_);
    if (earlyCallback) {
        session = earlyCallback(std::move(session));
        if (!session) {
            throw std::invalid_argument("Early resume callback returned no session");
        }
    }

    DecodeContext ctx{options_, decoder};
    decoder.restoreJobsAndResults(*session, sessionRepr, ctx);
    decoder.restoreMetadata(session->metadata(), requireObject(sessionRepr, "metadata"));
    decoder.restoreJobList(*session, sessionRepr);

    // Keep only jobs that are selected or that the envelope has data for.
    std::set<JobId> evidenced;
    for (const char* key : {"jobs", "results"}) {
        const Json& section = requireObject(sessionRepr, key);
        for (auto it = section.begin(); it != section.end(); ++it) {
            evidenced.insert(it.key());
        }
    }
    std::set<JobId> running;
    for (const auto& job : session->runList()) {
        running.insert(job->id());
    }
    session->trimJobList([&](const JobDefinition& job) {
        return running.count(job.id()) == 0 && evidenced.count(job.id()) == 0;
    });

    LOG_DEBUG("Resumed session with " + std::to_string(session->jobs().size()) + " jobs, " +
              std::to_string(session->runList().size()) + " on the run list");
    return session;
}

SessionMetadata SessionPeekHelper::peek(const std::string& data) const {
    return peekJson(decodeEnvelope(data));
}

SessionMetadata SessionPeekHelper::peekJson(const Json& document) const {
    const SessionDecoder& decoder = selectDecoder(document);
    const Json& sessionRepr = requireObject(document, "session");
    SessionMetadata metadata;
    decoder.restoreMetadata(metadata, requireObject(sessionRepr, "metadata"));
    return metadata;
}

}
