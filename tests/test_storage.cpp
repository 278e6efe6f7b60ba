/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "certrun/storage.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <thread>

using namespace certrun;
using certrun::test::TempDir;

TEST(SessionStorageTest, CreateMakesUniqueDirectories) {
    TempDir root;
    auto first = SessionStorage::create(root.path());
    auto second = SessionStorage::create(root.path());
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    EXPECT_NE(first->location().string(), second->location().string());
    EXPECT_TRUE(std::filesystem::is_directory(first->location()));
    EXPECT_EQ(first->location().parent_path().string(), root.path().string());
    EXPECT_EQ(first->location().filename().string().rfind("session-", 0), 0u);
}

TEST(SessionStorageTest, LoadBeforeSaveIsEmpty) {
    TempDir root;
    auto storage = SessionStorage::create(root.path());
    ASSERT_TRUE(storage);

    auto data = storage->loadCheckpoint();
    ASSERT_TRUE(data);
    EXPECT_TRUE(data->empty());
}

TEST(SessionStorageTest, SaveReplacesCheckpoint) {
    TempDir root;
    auto storage = SessionStorage::create(root.path());
    ASSERT_TRUE(storage);

    std::string first("\x1f\x8b first\0payload", 16);
    ASSERT_TRUE(storage->saveCheckpoint(first));
    EXPECT_EQ(storage->loadCheckpoint(), std::optional<std::string>(first));

    ASSERT_TRUE(storage->saveCheckpoint("second"));
    EXPECT_EQ(storage->loadCheckpoint(), std::optional<std::string>("second"));

    EXPECT_TRUE(std::filesystem::exists(storage->sessionFile()));
    EXPECT_FALSE(std::filesystem::exists(storage->location() / SessionStorage::kNextSessionFile));
}

TEST(SessionStorageTest, SaveFailsWithoutDirectory) {
    TempDir root;
    SessionStorage storage(root.path() / "gone");
    EXPECT_FALSE(storage.saveCheckpoint("data"));
}

TEST(SessionStorageTest, ListNewestFirst) {
    TempDir root;
    auto older = SessionStorage::create(root.path());
    ASSERT_TRUE(older);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto newer = SessionStorage::create(root.path());
    ASSERT_TRUE(newer);

    auto now = std::filesystem::file_time_type::clock::now();
    std::filesystem::last_write_time(older->location(), now - std::chrono::hours(1));
    std::filesystem::last_write_time(newer->location(), now);

    auto listed = SessionStorage::list(root.path());
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].location().string(), newer->location().string());
    EXPECT_EQ(listed[1].location().string(), older->location().string());

    EXPECT_TRUE(SessionStorage::list(root.path() / "nothing").empty());
}

TEST(SessionStorageTest, RemoveDeletesEverything) {
    TempDir root;
    auto storage = SessionStorage::create(root.path());
    ASSERT_TRUE(storage);
    ASSERT_TRUE(storage->saveCheckpoint("data"));

    EXPECT_TRUE(storage->remove());
    EXPECT_FALSE(std::filesystem::exists(storage->location()));
}
