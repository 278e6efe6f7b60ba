/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "certrun/depmgr.hpp"
#include "test_helpers.hpp"

using namespace certrun;
using certrun::test::ids;
using certrun::test::makeJob;

TEST(DependencySolverTest, DependenciesComeFirst) {
    auto a = makeJob("a");
    auto b = makeJob("b", "shell", "a");
    auto c = makeJob("c", "shell", "b");

    auto result = DependencySolver().resolve({c, b, a}, {c});
    ASSERT_TRUE(result);
    EXPECT_EQ(ids(result.solution), (std::vector<JobId>{"a", "b", "c"}));
}

TEST(DependencySolverTest, ResourceDependenciesAreFollowed) {
    auto r = makeJob("r", "resource");
    auto a = makeJob("a", "shell", "", "r.attr == 'value'");

    auto result = DependencySolver().resolve({a, r}, {a});
    ASSERT_TRUE(result);
    EXPECT_EQ(ids(result.solution), (std::vector<JobId>{"r", "a"}));
}

TEST(DependencySolverTest, VisitOrderIsKept) {
    auto x = makeJob("x");
    auto y = makeJob("y");
    auto shared = makeJob("shared");
    auto z = makeJob("z", "shell", "shared");

    auto result = DependencySolver().resolve({x, y, z, shared}, {y, z, x});
    ASSERT_TRUE(result);
    EXPECT_EQ(ids(result.solution), (std::vector<JobId>{"y", "shared", "z", "x"}));
}

TEST(DependencySolverTest, ReportsMissingDependency) {
    auto a = makeJob("a", "shell", "ghost");
    auto top = makeJob("top", "shell", "a");

    auto result = DependencySolver().resolve({a, top}, {top});
    ASSERT_FALSE(result);
    ASSERT_TRUE(result.problem);
    EXPECT_EQ(result.problem->kind, DependencyErrorKind::Missing);
    EXPECT_EQ(result.problem->affectedJob->id(), "a");
    EXPECT_EQ(result.problem->missingJobId, "ghost");
    EXPECT_EQ(result.problem->depType, DependencyType::Direct);
    EXPECT_EQ(result.problem->visitRoot->id(), "top");
    EXPECT_NE(result.problem->describe().find("ghost"), std::string::npos);
}

TEST(DependencySolverTest, ReportsMissingResource) {
    auto a = makeJob("a", "shell", "", "nothere.x");

    auto result = DependencySolver().resolve({a}, {a});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.problem->depType, DependencyType::Resource);
}

TEST(DependencySolverTest, ReportsCycleTrail) {
    auto a = makeJob("a", "shell", "b");
    auto b = makeJob("b", "shell", "a");

    auto result = DependencySolver().resolve({a, b}, {a});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.problem->kind, DependencyErrorKind::Cycle);
    EXPECT_EQ(ids(result.problem->cycle), (std::vector<JobId>{"a", "b", "a"}));
    EXPECT_EQ(result.problem->affectedJob->id(), "a");
}

TEST(DependencySolverTest, ReportsDuplicates) {
    auto first = makeJob("a", "shell");
    auto second = makeJob("a", "manual");

    auto result = DependencySolver().resolve({first, second}, {first});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.problem->kind, DependencyErrorKind::Duplicate);
    EXPECT_EQ(result.problem->affectedJob, first);
    EXPECT_EQ(result.problem->affectingJob, second);
}
