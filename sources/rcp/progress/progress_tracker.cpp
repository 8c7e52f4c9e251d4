//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/progress/progress_tracker.hpp"

namespace rcp
{
    ProgressTracker::ProgressTracker()
        : percentage_(kInitialPercentage)
        , stage_(kInitialStage)
        , agent_(kInitialAgent)
        , activity_(kInitialActivity)
        , started_(Clock::now()) {}

    void ProgressTracker::update(const float percentage, std::string stage, std::string agent, std::string activity) {
        std::lock_guard lock(mutex_);
        percentage_ = percentage;
        stage_ = std::move(stage);
        agent_ = std::move(agent);
        activity_ = std::move(activity);
    }

    void ProgressTracker::reset() {
        std::lock_guard lock(mutex_);
        percentage_ = kInitialPercentage;
        stage_ = kInitialStage;
        agent_ = kInitialAgent;
        activity_ = kInitialActivity;
        started_ = Clock::now();
    }

    ProgressSnapshot ProgressTracker::snapshot() const {
        ProgressSnapshot snap;
        {
            std::lock_guard lock(mutex_);
            snap.percentage = percentage_;
            snap.stage = stage_;
            snap.agent = agent_;
            snap.activity = activity_;
            snap.elapsed = std::chrono::duration_cast<Duration>(Clock::now() - started_);
        }
        return snap;
    }

    double ProgressTracker::elapsed_seconds() const {
        Clock::time_point started;
        {
            std::lock_guard lock(mutex_);
            started = started_;
        }
        return std::chrono::duration<double>(Clock::now() - started).count();
    }

    void to_json(nlohmann::json& j, const ProgressSnapshot& snapshot) {
        j = nlohmann::json{
            {"percentage", snapshot.percentage},
            {"stage", snapshot.stage},
            {"agent", snapshot.agent},
            {"activity", snapshot.activity},
            {"elapsed_seconds", snapshot.elapsed_seconds()}
        };
    }

}  // namespace rcp
