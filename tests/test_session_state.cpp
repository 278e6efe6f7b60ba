/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "certrun/errors.hpp"
#include "certrun/session_state.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <array>

using namespace certrun;
using certrun::test::ids;
using certrun::test::makeJob;
using certrun::test::makeResult;

namespace {
std::vector<InhibitorCause> causes(const JobState& state) {
    std::vector<InhibitorCause> out;
    for (const auto& inhibitor : state.inhibitors()) {
        out.push_back(inhibitor.cause);
    }
    return out;
}
}

TEST(SessionStateTest, NewJobsAreUndesired) {
    SessionState session({makeJob("a"), makeJob("b")});

    const JobState& state = session.jobState("a");
    ASSERT_EQ(state.inhibitors().size(), 1u);
    EXPECT_EQ(state.inhibitors()[0].cause, InhibitorCause::Undesired);
    EXPECT_FALSE(state.canStart());
    EXPECT_TRUE(state.result()->isHollow());
    EXPECT_EQ(state.readinessDescription(), "job cannot be started: undesired");
    EXPECT_THROW((void)session.jobState("nope"), std::invalid_argument);
}

TEST(SessionStateTest, IdenticalDuplicatesCollapse) {
    SessionState session({makeJob("a"), makeJob("a")});
    EXPECT_EQ(session.jobs().size(), 1u);
}

TEST(SessionStateTest, ConflictingDuplicatesThrow) {
    std::vector<JobPtr> jobs = {makeJob("a"), makeJob("a", "manual")};
    EXPECT_THROW(SessionState{jobs}, DuplicateJobError);
}

TEST(SessionStateTest, DependenciesArePulledIntoRunList) {
    auto a = makeJob("a");
    auto b = makeJob("b", "shell", "a");
    SessionState session({a, b});

    auto problems = session.updateDesiredJobList({b});

    EXPECT_TRUE(problems.empty());
    EXPECT_EQ(ids(session.desiredJobList()), (std::vector<JobId>{"b"}));
    EXPECT_EQ(ids(session.runList()), (std::vector<JobId>{"a", "b"}));
    EXPECT_TRUE(session.jobState("a").canStart());
    EXPECT_EQ(causes(session.jobState("b")), (std::vector<InhibitorCause>{InhibitorCause::PendingDep}));
    EXPECT_EQ(session.jobState("b").inhibitors()[0].relatedJob, a);
}

TEST(SessionStateTest, DependencyOutcomeDrivesReadiness) {
    auto a = makeJob("a");
    auto b = makeJob("b", "shell", "a");
    SessionState session({a, b});
    (void)session.updateDesiredJobList({b});

    session.updateJobResult(a, makeResult(Outcome::Fail));
    EXPECT_EQ(causes(session.jobState("b")), (std::vector<InhibitorCause>{InhibitorCause::FailedDep}));
    EXPECT_EQ(session.jobState("b").readinessDescription(),
              "job cannot be started: required dependency a has failed");

    session.updateJobResult(a, makeResult(Outcome::Pass));
    EXPECT_TRUE(session.jobState("b").canStart());
    EXPECT_EQ(session.jobState("b").readinessDescription(), "job can be started");
}

TEST(SessionStateTest, UnknownDesiredJobIsRejected) {
    SessionState session({makeJob("a")});
    EXPECT_THROW((void)session.updateDesiredJobList({makeJob("stranger")}), std::invalid_argument);
}

TEST(SessionStateTest, MissingDependencyDropsJob) {
    auto a = makeJob("a", "shell", "ghost");
    auto b = makeJob("b");
    SessionState session({a, b});

    auto problems = session.updateDesiredJobList({a, b});

    ASSERT_EQ(problems.size(), 1u);
    EXPECT_EQ(problems[0].kind, DependencyErrorKind::Missing);
    EXPECT_EQ(problems[0].missingJobId, "ghost");
    EXPECT_EQ(ids(session.runList()), (std::vector<JobId>{"b"}));
    EXPECT_EQ(ids(session.desiredJobList()), (std::vector<JobId>{"b"}));
    EXPECT_EQ(causes(session.jobState("a")), (std::vector<InhibitorCause>{InhibitorCause::Undesired}));
}

TEST(SessionStateTest, CycleDropsBothJobs) {
    auto a = makeJob("a", "shell", "b");
    auto b = makeJob("b", "shell", "a");
    SessionState session({a, b});

    auto problems = session.updateDesiredJobList({a, b});

    ASSERT_EQ(problems.size(), 2u);
    EXPECT_EQ(problems[0].kind, DependencyErrorKind::Cycle);
    EXPECT_EQ(problems[1].kind, DependencyErrorKind::Cycle);
    EXPECT_TRUE(session.runList().empty());
    EXPECT_TRUE(session.desiredJobList().empty());
    EXPECT_FALSE(session.jobState("a").canStart());
    EXPECT_FALSE(session.jobState("b").canStart());
}

TEST(SessionStateTest, MandatoryJobsComeFirst) {
    auto m = makeJob("m");
    auto x = makeJob("x");
    SessionState session({m, x});

    session.updateMandatoryJobList({m});
    EXPECT_TRUE(session.runList().empty());

    (void)session.updateDesiredJobList({x});
    EXPECT_EQ(ids(session.mandatoryJobList()), (std::vector<JobId>{"m"}));
    EXPECT_EQ(ids(session.runList()), (std::vector<JobId>{"m", "x"}));
    EXPECT_EQ(ids(session.desiredJobList()), (std::vector<JobId>{"x"}));
}

TEST(SessionStateTest, ResourceResultGatesJob) {
    auto r = makeJob("R", "resource");
    auto a = makeJob("A", "shell", "", "R.attr == 'value'");
    SessionState session({r, a});
    (void)session.updateDesiredJobList({a});

    EXPECT_EQ(ids(session.runList()), (std::vector<JobId>{"R", "A"}));
    EXPECT_TRUE(session.jobState("R").canStart());
    const auto& pending = session.jobState("A").inhibitors();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].cause, InhibitorCause::PendingResource);
    EXPECT_EQ(pending[0].relatedJob, r);
    EXPECT_EQ(pending[0].relatedExpression, std::optional<std::string>("R.attr == 'value'"));

    session.updateJobResult(r, makeResult(Outcome::Pass, "attr: value\n"));
    ASSERT_EQ(session.resourceMap().at("R").size(), 1u);
    EXPECT_TRUE(session.jobState("A").canStart());

    // A second result replaces the records rather than appending to them.
    session.updateJobResult(r, makeResult(Outcome::Pass, "attr: other\n\nattr: another\n"));
    EXPECT_EQ(session.resourceMap().at("R").size(), 2u);
    EXPECT_EQ(causes(session.jobState("A")), (std::vector<InhibitorCause>{InhibitorCause::FailedResource}));
}

TEST(SessionStateTest, HollowResultLeavesResourcesAlone) {
    auto r = makeJob("R", "resource");
    SessionState session({r});
    session.updateJobResult(r, makeResult(Outcome::Pass, "attr: value\n"));

    session.updateJobResult(r, JobResult::hollow());

    EXPECT_EQ(session.resourceMap().at("R").size(), 1u);
    EXPECT_TRUE(session.jobState("R").result()->isHollow());
}

TEST(SessionStateTest, SetResourceList) {
    auto a = makeJob("A", "shell", "", "R.attr == 'value'");
    auto r = makeJob("R", "resource");
    SessionState session({a, r});
    (void)session.updateDesiredJobList({a});

    session.setResourceList("R", {Resource{{"attr", "value"}}});

    EXPECT_TRUE(session.jobState("A").canStart());
}

TEST(SessionStateTest, LocalJobAddsGeneratedJobs) {
    auto gen = makeJob("gen", "local");
    auto existing = makeJob("existing");
    SessionState session({gen, existing});

    std::vector<JobId> added;
    session.onJobAdded([&](const JobAddedEvent& e) { added.push_back(e.job->id()); });

    session.updateJobResult(gen, makeResult(Outcome::Pass,
                                            "id: fresh\nplugin: shell\n\n"
                                            "id: existing\nplugin: manual\n\n"
                                            "id: broken\nplugin: nonsense\n"));

    EXPECT_EQ(added, (std::vector<JobId>{"fresh"}));
    EXPECT_EQ(session.jobs().size(), 3u);
    ASSERT_TRUE(session.findJob("fresh"));
    EXPECT_EQ(session.findJob("existing")->plugin(), PluginKind::Shell);
    EXPECT_FALSE(session.findJob("broken"));
    EXPECT_EQ(causes(session.jobState("fresh")), (std::vector<InhibitorCause>{InhibitorCause::Undesired}));
}

TEST(SessionStateTest, InvalidGeneratedRecordStillCompletesUpdate) {
    auto gen = makeJob("gen", "local");
    auto after = makeJob("after", "shell", "gen");
    SessionState session({gen, after});
    (void)session.updateDesiredJobList({after});

    std::vector<std::string> events;
    session.onStateChanged([&](const StateChangedEvent&) { events.push_back("state"); });
    session.onJobResultChanged([&](const JobResultChangedEvent&) { events.push_back("result"); });
    session.onJobAdded([&](const JobAddedEvent& e) { events.push_back("added:" + e.job->id()); });

    ASSERT_NO_THROW(session.updateJobResult(gen, makeResult(Outcome::Pass,
                                                            "id: ok\nplugin: shell\n\n"
                                                            "id: latin\nplugin: shell\ndescription: caf\xe9" "\n")));

    EXPECT_EQ(events, (std::vector<std::string>{"state", "result", "added:ok"}));
    EXPECT_TRUE(session.findJob("ok"));
    EXPECT_FALSE(session.findJob("latin"));
    EXPECT_TRUE(session.jobState("after").canStart());
    EXPECT_EQ(causes(session.jobState("ok")), (std::vector<InhibitorCause>{InhibitorCause::Undesired}));
}

TEST(SessionStateTest, DeselectedJobIsUndesiredAgain) {
    auto a = makeJob("a");
    auto b = makeJob("b", "shell", "a");
    SessionState session({a, b});

    (void)session.updateDesiredJobList({b});
    EXPECT_EQ(causes(session.jobState("b")), (std::vector<InhibitorCause>{InhibitorCause::PendingDep}));

    (void)session.updateDesiredJobList({});
    EXPECT_TRUE(session.runList().empty());
    EXPECT_EQ(causes(session.jobState("a")), (std::vector<InhibitorCause>{InhibitorCause::Undesired}));
    EXPECT_EQ(causes(session.jobState("b")), (std::vector<InhibitorCause>{InhibitorCause::Undesired}));

    (void)session.updateDesiredJobList({b});
    EXPECT_EQ(causes(session.jobState("b")), (std::vector<InhibitorCause>{InhibitorCause::PendingDep}));
}

TEST(SessionStateTest, ReadinessDoesNotDependOnCallOrder) {
    std::array<int, 4> order = {0, 1, 2, 3};
    do {
        auto a = makeJob("a");
        auto b = makeJob("b", "shell", "a");
        auto m = makeJob("m");
        auto r = makeJob("R", "resource");
        auto extra = makeJob("extra", "shell", "", "R.kind == 'x'");
        SessionState session({a, b, m, r});

        for (int step : order) {
            switch (step) {
                case 0: session.addUnit(extra); break;
                case 1: session.updateMandatoryJobList({m}); break;
                case 2: (void)session.updateDesiredJobList({b}); break;
                case 3: session.setResourceList("R", {Resource{{"kind", "x"}}}); break;
            }
        }

        EXPECT_EQ(causes(session.jobState("b")), (std::vector<InhibitorCause>{InhibitorCause::PendingDep}));
        EXPECT_EQ(session.jobState("b").inhibitors()[0].relatedJob, a);
        EXPECT_TRUE(session.jobState("a").canStart());
        EXPECT_EQ(causes(session.jobState("extra")), (std::vector<InhibitorCause>{InhibitorCause::Undesired}));

        // The mandatory list applies from the next selection on.
        (void)session.updateDesiredJobList({b, extra});
        EXPECT_EQ(ids(session.runList()), (std::vector<JobId>{"m", "a", "b", "R", "extra"}));
        EXPECT_TRUE(session.jobState("extra").canStart());
        EXPECT_EQ(causes(session.jobState("b")), (std::vector<InhibitorCause>{InhibitorCause::PendingDep}));
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST(SessionStateTest, ObserversSeeStateChangeFirst) {
    auto a = makeJob("a");
    SessionState session({a});
    std::vector<std::string> events;
    session.onStateChanged([&](const StateChangedEvent& e) {
        events.push_back(std::string("state:") + sessionOperationToString(e.operation));
    });
    session.onJobResultChanged([&](const JobResultChangedEvent& e) {
        events.push_back("result:" + e.job->id());
        EXPECT_TRUE(e.oldResult->isHollow());
        EXPECT_EQ(e.newResult->outcome(), Outcome::Pass);
    });
    session.onDesiredJobListChanged([&](const DesiredJobListChangedEvent& e) {
        events.push_back("desired:" + std::to_string(e.desired.size()));
    });

    session.updateJobResult(a, makeResult(Outcome::Pass));
    (void)session.updateDesiredJobList({a});

    EXPECT_EQ(events, (std::vector<std::string>{"state:update-job-result", "result:a",
                                                "state:update-desired-job-list", "desired:1"}));
}

TEST(SessionStateTest, UpdateJobResultRejectsBadInput) {
    auto a = makeJob("a");
    SessionState session({a});
    EXPECT_THROW(session.updateJobResult(makeJob("other"), makeResult(Outcome::Pass)), std::invalid_argument);
    EXPECT_THROW(session.updateJobResult(a, nullptr), std::invalid_argument);
}

TEST(SessionStateTest, AddAndRemoveUnits) {
    auto a = makeJob("a");
    auto b = makeJob("b");
    SessionState session({a});
    std::vector<JobId> removed;
    session.onJobRemoved([&](const JobRemovedEvent& e) { removed.push_back(e.job->id()); });

    session.addUnit(b);
    session.addUnit(makeJob("b"));
    EXPECT_EQ(session.jobs().size(), 2u);
    EXPECT_THROW(session.addUnit(makeJob("b", "manual")), DuplicateJobError);

    (void)session.updateDesiredJobList({a});
    EXPECT_THROW(session.removeUnit(a), std::invalid_argument);

    session.removeUnit(b);
    EXPECT_EQ(removed, (std::vector<JobId>{"b"}));
    EXPECT_FALSE(session.findJob("b"));
}

TEST(SessionStateTest, TrimRefusesRunListJobs) {
    auto a = makeJob("a");
    auto b = makeJob("b");
    auto c = makeJob("c");
    SessionState session({a, b, c});
    (void)session.updateDesiredJobList({a});

    EXPECT_THROW(session.trimJobList([](const JobDefinition&) { return true; }), std::invalid_argument);
    EXPECT_EQ(session.jobs().size(), 3u);

    session.trimJobList([](const JobDefinition& job) { return job.id() != "a"; });
    EXPECT_EQ(ids(session.jobs()), (std::vector<JobId>{"a"}));
    EXPECT_EQ(session.jobStates().size(), 1u);
}

TEST(SessionStateTest, EstimatedDuration) {
    auto a = makeJob("a", "shell", "", "", {{"estimated_duration", "10"}});
    auto m = makeJob("m", "manual", "", "", {{"estimated_duration", "5"}});
    auto l = makeJob("l", "local");
    auto unknown = makeJob("u");
    SessionState session({a, m, l, unknown});

    (void)session.updateDesiredJobList({a, m, l});
    auto estimate = session.estimatedDuration();
    ASSERT_TRUE(estimate.automated);
    ASSERT_TRUE(estimate.manual);
    EXPECT_DOUBLE_EQ(*estimate.automated, 10.0);
    EXPECT_DOUBLE_EQ(*estimate.manual, 35.0);
    EXPECT_DOUBLE_EQ(*session.estimatedDuration(0).manual, 5.0);

    (void)session.updateDesiredJobList({a, m, unknown});
    estimate = session.estimatedDuration();
    EXPECT_FALSE(estimate.automated);
    ASSERT_TRUE(estimate.manual);
}
