/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>

#include "certrun/resume.hpp"
#include "validate.hpp"

namespace certrun {

class SessionDecoder;

struct DecodeContext {
    const ResumeOptions& options;
    // Decoder of the envelope's version; shared steps call back into it.
    const SessionDecoder& decoder;
};

/**
 * Reader for one envelope format version. Each version wraps the decoder of
 * the previous one and overrides only what changed in its format.
 */
class SessionDecoder {
public:
    virtual ~SessionDecoder() = default;

    virtual void restoreMetadata(SessionMetadata& metadata, const Json& metadataRepr) const = 0;
    virtual void restoreJobsAndResults(SessionState& session, const Json& sessionRepr,
                                       const DecodeContext& ctx) const = 0;
    virtual void restoreJobList(SessionState& session, const Json& sessionRepr) const = 0;

    // Results recorded for one job; may be empty.
    [[nodiscard]] virtual const Json* resultList(const Json& resultsRepr, const JobId& id) const = 0;
    [[nodiscard]] virtual JobResultPtr buildResult(const Json& resultRepr, const DecodeContext& ctx) const = 0;
};

// nullptr for versions this build does not know.
[[nodiscard]] const SessionDecoder* decoderForVersion(int version);

}
