/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <string>
#include <vector>

namespace certrun {

struct Record {
    std::map<std::string, std::string> data;
    int lineStart = 0;
    int lineEnd = 0;
};

struct RecordParseError {
    int line = 0;
    std::string message;
};

struct RecordParseResult {
    std::vector<Record> records;
    std::vector<RecordParseError> errors;
    [[nodiscard]] bool clean() const noexcept { return errors.empty(); }
};

// Turns raw job output into key/value records.
class RecordParser {
public:
    virtual ~RecordParser() = default;
    [[nodiscard]] virtual RecordParseResult parse(const std::string& text) const = 0;
};

// Debian-control style records: "key: value" lines, blank line separators,
// indented continuation lines ("." stands for an empty line), "#" comments.
// A malformed line drops the record it belongs to; parsing resumes at the
// next blank line.
class Rfc822Parser final : public RecordParser {
public:
    [[nodiscard]] RecordParseResult parse(const std::string& text) const override;
};

}
