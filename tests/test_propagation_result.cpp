// Included ahead of every other header so it must stand on its own.
#include "propagation/propagation_result.hpp"

#include <gtest/gtest.h>

using namespace ideodrift;

// ─── Records ───────────────────────────────────────────────────

TEST(PropagationResultTest, DefaultRecordIsContinuing) {
    PropagationResult r;
    EXPECT_EQ(r.hop_index, 0u);
    EXPECT_EQ(r.path_length, 0u);
    EXPECT_EQ(r.state, TransmissionState::Continuing);
    EXPECT_TRUE(r.transmissionSuccess());

    r.state = TransmissionState::Saturated;
    EXPECT_FALSE(r.transmissionSuccess());
}

// ─── Runs ──────────────────────────────────────────────────────

TEST(PropagationResultTest, EmptyRunHasNotReachedTarget) {
    PropagationRun run;
    EXPECT_FALSE(run.saturated());
    EXPECT_FALSE(run.reachedTarget());
}

TEST(PropagationResultTest, ReachedTargetCountsTraversals) {
    PropagationRun run;
    run.path = {0, 1, 2};
    run.traversals.push_back({0, 1, 0.2});
    EXPECT_FALSE(run.reachedTarget());

    run.traversals.push_back({1, 2, 0.69});
    EXPECT_TRUE(run.reachedTarget());
}
