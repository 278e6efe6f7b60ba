/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "certrun/resource.hpp"

using namespace certrun;

namespace {
ResourceExpression compileOrDie(const std::string& text) {
    std::string error;
    auto expression = ResourceExpression::compile(text, error);
    if (!expression) {
        throw std::runtime_error(error);
    }
    return *expression;
}

const std::vector<Resource> kPackages = {
    {{"name", "fwts"}, {"version", "1.0"}},
    {{"name", "bash"}, {"version", "5.1"}, {"essential", "yes"}},
};
}

TEST(ResourceExpressionTest, EqualityMatchesAnyRecord) {
    auto expr = compileOrDie("package.name == \"bash\"");
    EXPECT_EQ(expr.resourceId(), "package");
    EXPECT_TRUE(expr.evaluate(kPackages));
    EXPECT_FALSE(compileOrDie("package.name == 'zsh'").evaluate(kPackages));
}

TEST(ResourceExpressionTest, InequalityAndMissingAttribute) {
    EXPECT_TRUE(compileOrDie("package.name != \"fwts\"").evaluate(kPackages));
    // Only the bash record has "essential"; the fwts record never matches.
    EXPECT_FALSE(compileOrDie("package.essential != 'yes'").evaluate(kPackages));
}

TEST(ResourceExpressionTest, Membership) {
    EXPECT_TRUE(compileOrDie("package.name in ['zsh', 'fwts']").evaluate(kPackages));
    EXPECT_FALSE(compileOrDie("package.name in ['zsh']").evaluate(kPackages));
    EXPECT_TRUE(compileOrDie("package.name not in ['fwts']").evaluate(kPackages));
}

TEST(ResourceExpressionTest, TruthinessAndBooleanOperators) {
    EXPECT_TRUE(compileOrDie("package.essential").evaluate(kPackages));
    EXPECT_TRUE(compileOrDie("package.name == 'bash' and package.version == 5.1").evaluate(kPackages));
    // Both conditions must hold on the same record.
    EXPECT_FALSE(compileOrDie("package.name == 'fwts' and package.essential").evaluate(kPackages));
    EXPECT_TRUE(compileOrDie("package.name == 'zsh' or package.name == 'fwts'").evaluate(kPackages));
    EXPECT_TRUE(compileOrDie("not package.name == 'zsh'").evaluate(kPackages));
    EXPECT_TRUE(compileOrDie("(package.name == 'zsh' or package.essential) and package.version == '5.1'")
                    .evaluate(kPackages));
}

TEST(ResourceExpressionTest, EmptyResourceListNeverMatches) {
    EXPECT_FALSE(compileOrDie("package.name != 'x'").evaluate({}));
}

TEST(ResourceExpressionTest, RejectsInvalidExpressions) {
    std::string error;
    EXPECT_FALSE(ResourceExpression::compile("package.name == 'a' and device.category == 'b'", error));
    EXPECT_NE(error.find("more than one resource"), std::string::npos);

    EXPECT_FALSE(ResourceExpression::compile("package.name == ", error));
    EXPECT_FALSE(ResourceExpression::compile("package.name == 'open", error));
    EXPECT_FALSE(ResourceExpression::compile("package name", error));
    EXPECT_FALSE(ResourceExpression::compile("42", error));
}

TEST(ResourceProgramTest, OneExpressionPerLine) {
    std::string error;
    auto program = ResourceProgram::compile("package.name == 'bash'\n\n  device.category == 'NETWORK'\n", error);
    ASSERT_TRUE(program) << error;
    ASSERT_EQ(program->expressions().size(), 2u);
    EXPECT_EQ(program->requiredResources(), (std::set<JobId>{"device", "package"}));
}

TEST(ResourceProgramTest, EvaluationStatuses) {
    std::string error;
    auto program = ResourceProgram::compile("package.name == 'bash'\npackage.name == 'zsh'\ndevice.category", error);
    ASSERT_TRUE(program) << error;

    ResourceMap resources{{"package", kPackages}};
    auto results = program->evaluate(resources);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].status, EvaluationStatus::Satisfied);
    EXPECT_EQ(results[1].status, EvaluationStatus::Failed);
    EXPECT_EQ(results[1].expression->text(), "package.name == 'zsh'");
    EXPECT_EQ(results[2].status, EvaluationStatus::CannotEvaluate);
}

TEST(ResourceProgramTest, BadLineFailsWholeProgram) {
    std::string error;
    EXPECT_FALSE(ResourceProgram::compile("package.name == 'bash'\n==", error));
    EXPECT_FALSE(error.empty());
}
