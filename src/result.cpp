/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/result.hpp"
#include "certrun/envelope.hpp"
#include "certrun/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace certrun {

namespace {
std::optional<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}
}

JobResultPtr JobResult::hollow() {
    static const JobResultPtr instance = std::make_shared<JobResult>(Token{});
    return instance;
}

JobResultPtr JobResult::inMemory(const Builder& fields, std::vector<IOLogRecord> ioLog) {
    auto result = std::make_shared<JobResult>(Token{});
    result->outcome_ = fields.outcome;
    result->returnCode_ = fields.returnCode;
    result->executionDuration_ = fields.executionDuration;
    result->comments_ = fields.comments;
    result->ioLog_ = std::move(ioLog);
    return result;
}

JobResultPtr JobResult::onDisk(const Builder& fields, std::filesystem::path ioLogFilename) {
    auto result = std::make_shared<JobResult>(Token{});
    result->outcome_ = fields.outcome;
    result->returnCode_ = fields.returnCode;
    result->executionDuration_ = fields.executionDuration;
    result->comments_ = fields.comments;
    result->ioLogFilename_ = std::move(ioLogFilename);
    return result;
}

std::vector<IOLogRecord> JobResult::loadIoLog() const {
    if (!ioLogFilename_) {
        return ioLog_;
    }

    auto compressed = readFile(*ioLogFilename_);
    if (!compressed) {
        LOG_WARN("Cannot read IO log: " + ioLogFilename_->string());
        return {};
    }
    auto text = gzipDecompress(*compressed);
    if (!text) {
        LOG_WARN("IO log is not a gzip file: " + ioLogFilename_->string());
        return {};
    }

    std::vector<IOLogRecord> records;
    std::istringstream lines(*text);
    std::string line;
    int lineNo = 0;
    while (std::getline(lines, line)) {
        ++lineNo;
        if (line.empty()) {
            continue;
        }
        try {
            auto value = nlohmann::json::parse(line);
            auto data = base64Decode(value.at(2).get<std::string>());
            if (!data) {
                throw std::invalid_argument("bad base64 payload");
            }
            records.push_back({value.at(0).get<double>(), value.at(1).get<std::string>(), *data});
        } catch (const std::exception& e) {
            LOG_WARN("Skipping IO log line " + std::to_string(lineNo) + " of " +
                     ioLogFilename_->string() + ": " + e.what());
        }
    }
    return records;
}

std::string JobResult::stdoutText() const {
    std::string text;
    for (const auto& record : loadIoLog()) {
        if (record.stream == "stdout") {
            text += record.data;
        }
    }
    return text;
}

bool JobResult::isHollow() const noexcept {
    return outcome_ == Outcome::None && !comments_ && !returnCode_ && !executionDuration_ &&
           ioLog_.empty() && !ioLogFilename_;
}

bool writeIoLogFile(const std::filesystem::path& path, const std::vector<IOLogRecord>& records) noexcept {
    try {
        std::string text;
        for (const auto& record : records) {
            nlohmann::json line = nlohmann::json::array({record.delay, record.stream, base64Encode(record.data)});
            text += line.dump();
            text += '\n';
        }
        auto compressed = gzipCompress(text);
        if (!compressed) {
            return false;
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_ERROR("Cannot open IO log for writing: " + path.string());
            return false;
        }
        out.write(compressed->data(), static_cast<std::streamsize>(compressed->size()));
        out.close();
        if (!out) {
            LOG_ERROR("Failed to write IO log: " + path.string());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write IO log " + path.string() + ": " + e.what());
        return false;
    }
}

}
