/*
 * certrun - Session inspection tool (crsession)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/config.hpp"
#include "certrun/errors.hpp"
#include "certrun/job.hpp"
#include "certrun/logger.hpp"
#include "certrun/resume.hpp"
#include "certrun/storage.hpp"
#include "certrun/suspend.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

using namespace certrun;

constexpr const char* VERSION = "0.1.0";

namespace {

void printUsage(const char* progName) {
    std::cout << "certrun Session Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " peek <session-file>\n";
    std::cout << "       " << progName << " list\n";
    std::cout << "       " << progName << " show <catalog> <session-dir> [--ignore-checksums] [--check-files] [--rewrite-paths]\n";
    std::cout << "       " << progName << " select <catalog> <session-dir|--new> <job-id>...\n";
    std::cout << "       " << progName << " record <catalog> <session-dir> <job-id> <outcome> [stdout-file]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --ignore-checksums  Resume even if job definitions changed\n";
    std::cout << "  --check-files       Fail if a referenced IO log is missing\n";
    std::cout << "  --rewrite-paths     Retry missing IO logs under the session directory\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  CERTRUN_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  CERTRUN_SESSION_DIR      Root for new sessions (default ~/.cache/certrun/sessions)\n";
    std::cout << "  CERTRUN_MANUAL_OVERHEAD  Seconds added per manual job (default 30)\n";
}

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<std::vector<JobPtr>> loadCatalog(const std::string& path) {
    auto text = readFile(path);
    if (!text) {
        std::cerr << "Error: cannot read catalog " << path << "\n";
        return std::nullopt;
    }
    auto loaded = loadJobDefinitions(*text);
    for (const auto& error : loaded.errors) {
        std::cerr << "Warning: " << path << ": " << error << "\n";
    }
    return loaded.jobs;
}

std::string formatDuration(const std::optional<double>& seconds) {
    if (!seconds) {
        return "unknown";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << *seconds << "s";
    return ss.str();
}

bool saveSession(const SessionState& session, const SessionStorage& storage) {
    auto data = SessionSuspendHelper(storage.location()).suspend(session);
    if (!data) {
        std::cerr << "Error: cannot encode session\n";
        return false;
    }
    if (!storage.saveCheckpoint(*data)) {
        std::cerr << "Error: cannot write checkpoint to " << storage.location() << "\n";
        return false;
    }
    return true;
}

std::unique_ptr<SessionState> resumeFrom(const std::vector<JobPtr>& jobs, const SessionStorage& storage,
                                         const ResumeOptions& options) {
    auto data = storage.loadCheckpoint();
    if (!data) {
        std::cerr << "Error: cannot read checkpoint in " << storage.location() << "\n";
        return nullptr;
    }
    if (data->empty()) {
        std::cerr << "Error: no saved session in " << storage.location() << "\n";
        return nullptr;
    }
    return SessionResumeHelper(jobs, options).resume(*data);
}

int cmdPeek(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: peek takes exactly one session file\n";
        return 1;
    }
    auto data = readFile(args[0]);
    if (!data) {
        std::cerr << "Error: cannot read " << args[0] << "\n";
        return 1;
    }
    SessionMetadata meta = SessionPeekHelper().peek(*data);
    std::cout << "title: " << meta.title.value_or("(none)") << "\n";
    std::cout << "flags:";
    for (const auto& flag : meta.flags) {
        std::cout << " " << flag;
    }
    std::cout << "\n";
    std::cout << "running_job_name: " << meta.runningJobName.value_or("(none)") << "\n";
    std::cout << "app_id: " << meta.appId.value_or("(none)") << "\n";
    std::cout << "app_blob: " << (meta.appBlob ? std::to_string(meta.appBlob->size()) + " bytes" : "(none)")
              << "\n";
    return 0;
}

int cmdList(const Config& config) {
    for (const auto& storage : SessionStorage::list(config.sessionRoot)) {
        std::cout << storage.location().string() << "\n";
    }
    return 0;
}

int cmdShow(const std::vector<std::string>& args, const Config& config) {
    if (args.size() < 2) {
        std::cerr << "Error: show needs <catalog> <session-dir>\n";
        return 1;
    }
    ResumeOptions options;
    options.location = args[1];
    for (std::size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--ignore-checksums") {
            options.ignoreJobChecksums = true;
        } else if (args[i] == "--check-files") {
            options.checkFileReferences = true;
        } else if (args[i] == "--rewrite-paths") {
            options.rewriteLogPathnames = true;
        } else {
            std::cerr << "Error: unknown option " << args[i] << "\n";
            return 1;
        }
    }

    auto jobs = loadCatalog(args[0]);
    if (!jobs) {
        return 1;
    }
    auto session = resumeFrom(*jobs, SessionStorage(args[1]), options);
    if (!session) {
        return 1;
    }

    const auto& meta = session->metadata();
    if (meta.title) {
        std::cout << "Session: " << *meta.title << "\n";
    }
    std::cout << "Run list:\n";
    for (const auto& job : session->runList()) {
        const JobState& state = session->jobState(job->id());
        std::cout << "  " << std::left << std::setw(32) << job->id() << " "
                  << std::setw(16) << outcomeToString(state.result()->outcome()) << " "
                  << state.readinessDescription() << "\n";
    }
    auto estimate = session->estimatedDuration(config.manualOverhead);
    std::cout << "Estimated duration: automated " << formatDuration(estimate.automated)
              << ", manual " << formatDuration(estimate.manual) << "\n";
    return 0;
}

int cmdSelect(const std::vector<std::string>& args, const Config& config) {
    if (args.size() < 3) {
        std::cerr << "Error: select needs <catalog> <session-dir|--new> <job-id>...\n";
        return 1;
    }
    auto jobs = loadCatalog(args[0]);
    if (!jobs) {
        return 1;
    }

    std::optional<SessionStorage> storage;
    if (args[1] == "--new") {
        storage = SessionStorage::create(config.sessionRoot);
    } else {
        std::error_code ec;
        std::filesystem::create_directories(args[1], ec);
        if (!ec) {
            storage.emplace(args[1]);
        }
    }
    if (!storage) {
        std::cerr << "Error: cannot prepare session directory\n";
        return 1;
    }

    SessionState session(*jobs);
    std::vector<JobPtr> desired;
    for (std::size_t i = 2; i < args.size(); ++i) {
        JobPtr job = session.findJob(args[i]);
        if (!job) {
            std::cerr << "Error: unknown job " << args[i] << "\n";
            return 1;
        }
        desired.push_back(job);
    }

    auto problems = session.updateDesiredJobList(desired);
    for (const auto& problem : problems) {
        std::cerr << "Warning: " << problem.describe() << "\n";
    }
    session.metadata().flags.insert(SessionMetadata::FLAG_INCOMPLETE);

    if (!saveSession(session, *storage)) {
        return 1;
    }
    std::cout << storage->location().string() << "\n";
    return 0;
}

int cmdRecord(const std::vector<std::string>& args) {
    if (args.size() < 4 || args.size() > 5) {
        std::cerr << "Error: record needs <catalog> <session-dir> <job-id> <outcome> [stdout-file]\n";
        return 1;
    }
    auto outcome = outcomeFromString(args[3]);
    if (!outcome) {
        std::cerr << "Error: unknown outcome " << args[3] << "\n";
        return 1;
    }
    auto jobs = loadCatalog(args[0]);
    if (!jobs) {
        return 1;
    }
    SessionStorage storage(args[1]);
    ResumeOptions options;
    options.location = args[1];
    auto session = resumeFrom(*jobs, storage, options);
    if (!session) {
        return 1;
    }

    JobPtr job = session->findJob(args[2]);
    if (!job) {
        std::cerr << "Error: job " << args[2] << " is not part of this session\n";
        return 1;
    }

    std::vector<IOLogRecord> ioLog;
    if (args.size() == 5) {
        auto output = readFile(args[4]);
        if (!output) {
            std::cerr << "Error: cannot read " << args[4] << "\n";
            return 1;
        }
        ioLog.push_back({0.0, "stdout", *output});
    }

    JobResult::Builder fields;
    fields.outcome = *outcome;
    session->updateJobResult(job, JobResult::inMemory(fields, std::move(ioLog)));
    session->metadata().runningJobName.reset();

    if (!saveSession(*session, storage)) {
        return 1;
    }
    std::cout << job->id() << ": " << session->jobState(job->id()).readinessDescription() << "\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; CERTRUN_LOG_LEVEL overrides
    if (!std::getenv("CERTRUN_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);
    Config config = Config::fromEnv();

    try {
        if (command == "peek") return cmdPeek(args);
        if (command == "list") return cmdList(config);
        if (command == "show") return cmdShow(args, config);
        if (command == "select") return cmdSelect(args, config);
        if (command == "record") return cmdRecord(args);
    } catch (const SessionResumeError& e) {
        std::cerr << "Error: cannot resume session: " << e.what() << "\n";
        return 1;
    } catch (const DuplicateJobError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Error: unknown command " << command << "\n";
    printUsage(argv[0]);
    return 1;
}
