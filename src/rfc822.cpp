/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/rfc822.hpp"
#include "certrun/logger.hpp"
#include <sstream>

namespace certrun {

namespace {

std::string trim(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

}

RecordParseResult Rfc822Parser::parse(const std::string& text) const {
    RecordParseResult result;

    Record current;
    std::string key;
    std::string value;
    bool inRecord = false;
    bool skipping = false;

    auto commitField = [&]() {
        if (!key.empty()) {
            current.data[key] = value;
        }
        key.clear();
        value.clear();
    };

    auto commitRecord = [&](int lineno) {
        commitField();
        if (inRecord && !skipping && !current.data.empty()) {
            current.lineEnd = lineno;
            result.records.push_back(std::move(current));
        }
        current = Record{};
        inRecord = false;
        skipping = false;
    };

    auto fail = [&](int lineno, const std::string& message) {
        result.errors.push_back({lineno, message});
        key.clear();
        value.clear();
        skipping = true;
    };

    std::istringstream stream(text);
    std::string line;
    int lineno = 0;
    while (std::getline(stream, line)) {
        ++lineno;
        if (isBlank(line)) {
            commitRecord(lineno - 1);
            continue;
        }
        if (line[0] == '#') {
            continue;
        }
        if (skipping) {
            continue;
        }
        if (!inRecord) {
            inRecord = true;
            current.lineStart = lineno;
        }
        if (line[0] == ' ' || line[0] == '\t') {
            if (key.empty()) {
                fail(lineno, "continuation line without a preceding key");
                continue;
            }
            std::string continued = trim(line);
            if (continued == ".") {
                continued.clear();
            }
            value += "\n" + continued;
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            fail(lineno, "expected 'key: value' but got '" + trim(line) + "'");
            continue;
        }
        std::string newKey = trim(line.substr(0, colon));
        if (newKey.empty()) {
            fail(lineno, "empty key");
            continue;
        }
        commitField();
        if (current.data.count(newKey) > 0) {
            fail(lineno, "duplicate key '" + newKey + "'");
            continue;
        }
        key = newKey;
        value = trim(line.substr(colon + 1));
    }
    commitRecord(lineno);

    for (const auto& error : result.errors) {
        LOG_DEBUG("Record syntax error at line " + std::to_string(error.line) + ": " + error.message);
    }
    return result;
}

}
