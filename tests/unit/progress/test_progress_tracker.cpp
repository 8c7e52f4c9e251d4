//
// Created by gregorian-rayne on 10/18/26.
//

#include <gtest/gtest.h>
#include "rcp/progress/progress_tracker.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace rcp;

TEST(ProgressTrackerTest, InitialState) {
    const ProgressTracker tracker;

    const auto snap = tracker.snapshot();

    EXPECT_FLOAT_EQ(snap.percentage, 0.0f);
    EXPECT_EQ(snap.stage, "Initializing");
    EXPECT_EQ(snap.agent, "System");
    EXPECT_EQ(snap.activity, "Starting up");
    EXPECT_GE(snap.elapsed_seconds(), 0.0);
}

TEST(ProgressTrackerTest, UpdateReplacesTuple) {
    ProgressTracker tracker;

    tracker.update(42.5f, "Research", "Market Analyst", "Collecting sources");
    const auto snap = tracker.snapshot();

    EXPECT_FLOAT_EQ(snap.percentage, 42.5f);
    EXPECT_EQ(snap.stage, "Research");
    EXPECT_EQ(snap.agent, "Market Analyst");
    EXPECT_EQ(snap.activity, "Collecting sources");
}

TEST(ProgressTrackerTest, PercentageStoredAsGiven) {
    ProgressTracker tracker;

    tracker.update(150.0f, "s", "a", "x");
    EXPECT_FLOAT_EQ(tracker.snapshot().percentage, 150.0f);

    tracker.update(-1.0f, "s", "a", "x");
    EXPECT_FLOAT_EQ(tracker.snapshot().percentage, -1.0f);
}

TEST(ProgressTrackerTest, ResetRestoresInitialState) {
    ProgressTracker tracker;
    tracker.update(90.0f, "Writing", "Writer", "Drafting conclusion");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    const double before_reset = tracker.elapsed_seconds();

    tracker.reset();
    const auto snap = tracker.snapshot();

    EXPECT_FLOAT_EQ(snap.percentage, ProgressTracker::kInitialPercentage);
    EXPECT_EQ(snap.stage, ProgressTracker::kInitialStage);
    EXPECT_EQ(snap.agent, ProgressTracker::kInitialAgent);
    EXPECT_EQ(snap.activity, ProgressTracker::kInitialActivity);
    EXPECT_LT(snap.elapsed_seconds(), 0.5);
    EXPECT_LT(tracker.elapsed_seconds(), before_reset);
}

TEST(ProgressTrackerTest, ElapsedIsMonotonic) {
    const ProgressTracker tracker;

    const double first = tracker.elapsed_seconds();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const double second = tracker.elapsed_seconds();

    EXPECT_GE(second, first);
}

TEST(ProgressTrackerTest, SnapshotsAreConsistentUnderConcurrentUpdates) {
    ProgressTracker tracker;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread writer([&] {
        for (int i = 0; i < 5000; ++i) {
            const std::string tag = std::to_string(i);
            tracker.update(static_cast<float>(i), "stage-" + tag, "agent-" + tag, "activity-" + tag);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                const auto snap = tracker.snapshot();
                if (snap.stage == ProgressTracker::kInitialStage) {
                    continue;
                }
                const std::string tag = snap.stage.substr(6);
                if (snap.agent != "agent-" + tag || snap.activity != "activity-" + tag ||
                    snap.percentage != static_cast<float>(std::stoi(tag))) {
                    ++torn;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(tracker.snapshot().stage, "stage-4999");
}

TEST(ProgressTrackerTest, SnapshotToJson) {
    ProgressTracker tracker;
    tracker.update(10.0f, "Research", "Analyst", "Reading");

    const nlohmann::json j = tracker.snapshot();

    EXPECT_DOUBLE_EQ(j["percentage"].get<double>(), 10.0);
    EXPECT_EQ(j["stage"], "Research");
    EXPECT_EQ(j["agent"], "Analyst");
    EXPECT_EQ(j["activity"], "Reading");
    EXPECT_TRUE(j["elapsed_seconds"].is_number());
}
