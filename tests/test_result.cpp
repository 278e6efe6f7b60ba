/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "certrun/envelope.hpp"
#include "certrun/result.hpp"
#include "test_helpers.hpp"
#include <fstream>

using namespace certrun;
using certrun::test::TempDir;

TEST(JobResultTest, HollowResult) {
    auto hollow = JobResult::hollow();
    EXPECT_TRUE(hollow->isHollow());
    EXPECT_EQ(hollow->outcome(), Outcome::None);
    EXPECT_EQ(hollow, JobResult::hollow());

    JobResult::Builder fields;
    fields.comments = "looked fine";
    EXPECT_FALSE(JobResult::inMemory(fields)->isHollow());
}

TEST(JobResultTest, StdoutTextSkipsStderr) {
    JobResult::Builder fields;
    fields.outcome = Outcome::Pass;
    fields.returnCode = 0;
    auto result = JobResult::inMemory(fields, {{0.0, "stdout", "hello "},
                                               {0.1, "stderr", "warning\n"},
                                               {0.2, "stdout", "world\n"}});

    EXPECT_EQ(result->stdoutText(), "hello world\n");
    EXPECT_EQ(result->loadIoLog().size(), 3u);
    EXPECT_FALSE(result->diskBacked());
    EXPECT_EQ(result->returnCode(), std::optional<int>(0));
}

TEST(JobResultTest, DiskBackedLogIsReadFromFile) {
    TempDir dir;
    auto path = dir.path() / "job.record.gz";
    std::vector<IOLogRecord> records = {{0.0, "stdout", "id: a\n"}, {1.5, "stderr", "oops"}};
    ASSERT_TRUE(writeIoLogFile(path, records));

    JobResult::Builder fields;
    fields.outcome = Outcome::Fail;
    auto result = JobResult::onDisk(fields, path);

    EXPECT_TRUE(result->diskBacked());
    EXPECT_EQ(result->loadIoLog(), records);
    EXPECT_EQ(result->stdoutText(), "id: a\n");
}

TEST(JobResultTest, UnreadableDiskLogIsEmpty) {
    TempDir dir;
    JobResult::Builder fields;
    fields.outcome = Outcome::Pass;

    auto missing = JobResult::onDisk(fields, dir.path() / "missing.gz");
    EXPECT_TRUE(missing->loadIoLog().empty());

    auto plain = dir.path() / "plain.txt";
    std::ofstream(plain) << "not compressed";
    EXPECT_TRUE(JobResult::onDisk(fields, plain)->loadIoLog().empty());
}
