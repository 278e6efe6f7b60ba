/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/storage.hpp"
#include "certrun/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace certrun {

namespace {
bool writeAll(int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

bool syncDirectory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}
}

SessionStorage::SessionStorage(std::filesystem::path location)
    : location_(std::move(location)) {
}

std::string SessionStorage::generateName(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::stringstream ss;
    ss << prefix << "-" << now << "_" << getpid() << "_" << counter.fetch_add(1);
    return ss.str();
}

std::optional<SessionStorage> SessionStorage::create(const std::filesystem::path& root, const std::string& prefix) {
    try {
        std::filesystem::create_directories(root);
        for (int attempt = 0; attempt < 16; ++attempt) {
            auto location = root / generateName(prefix);
            if (std::filesystem::create_directory(location)) {
                LOG_DEBUG("Created session storage: " + location.string());
                return SessionStorage(location);
            }
        }
        LOG_ERROR("Could not find a free session storage name under " + root.string());
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create session storage: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::vector<SessionStorage> SessionStorage::list(const std::filesystem::path& root) noexcept {
    std::vector<std::pair<std::filesystem::file_time_type, std::filesystem::path>> found;
    try {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            return {};
        }
        for (const auto& entry : std::filesystem::directory_iterator(root)) {
            if (!entry.is_directory()) {
                continue;
            }
            auto mtime = std::filesystem::last_write_time(entry.path(), ec);
            if (ec) {
                ec.clear();
                continue;
            }
            found.emplace_back(mtime, entry.path());
        }
        std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
            return a.first != b.first ? a.first > b.first : a.second < b.second;
        });
        std::vector<SessionStorage> storages;
        for (auto& item : found) {
            storages.emplace_back(std::move(item.second));
        }
        return storages;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list session storages: " + std::string(e.what()));
        return {};
    }
}

bool SessionStorage::saveCheckpoint(const std::string& data) const noexcept {
    try {
        auto nextPath = location_ / kNextSessionFile;
        auto finalPath = location_ / kSessionFile;

        std::error_code ec;
        std::filesystem::remove(nextPath, ec);

        int fd = ::open(nextPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            LOG_ERROR("Cannot open " + nextPath.string() + ": " + std::strerror(errno));
            return false;
        }
        bool ok = writeAll(fd, data) && ::fsync(fd) == 0;
        int err = errno;
        ::close(fd);
        if (!ok) {
            LOG_ERROR("Failed to write " + nextPath.string() + ": " + std::strerror(err));
            std::filesystem::remove(nextPath, ec);
            return false;
        }

        std::filesystem::rename(nextPath, finalPath, ec);
        if (ec) {
            LOG_ERROR("Failed to publish checkpoint " + finalPath.string() + ": " + ec.message());
            std::filesystem::remove(nextPath, ec);
            return false;
        }
        if (!syncDirectory(location_)) {
            LOG_WARN("Failed to sync directory " + location_.string());
        }
        LOG_DEBUG("Saved checkpoint (" + std::to_string(data.size()) + " bytes) to " + finalPath.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save checkpoint: " + std::string(e.what()));
        return false;
    }
}

std::optional<std::string> SessionStorage::loadCheckpoint() const noexcept {
    try {
        auto path = location_ / kSessionFile;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::string();
        }
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            LOG_ERROR("Cannot open checkpoint " + path.string());
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load checkpoint: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool SessionStorage::remove() const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(location_, ec);
    if (ec) {
        LOG_ERROR("Failed to remove session storage " + location_.string() + ": " + ec.message());
        return false;
    }
    return true;
}

}
