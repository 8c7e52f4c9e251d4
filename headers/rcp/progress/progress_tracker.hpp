//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_PROGRESS_TRACKER_HPP
#define REPORTCONTENTPIPELINE_PROGRESS_TRACKER_HPP

/**
 * @file progress_tracker.hpp
 * @brief Thread-safe progress state for long-running report generation.
 *
 * One thread (the generator) calls update() while any number of observers
 * call snapshot(). Every snapshot is a consistent tuple: it never mixes the
 * stage of one update with the activity of another.
 */

#include "rcp/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <string>

namespace rcp {

    class ProgressTracker {
    public:
        static constexpr float kInitialPercentage = 0.0f;
        static constexpr auto kInitialStage = "Initializing";
        static constexpr auto kInitialAgent = "System";
        static constexpr auto kInitialActivity = "Starting up";

        ProgressTracker();

        ProgressTracker(const ProgressTracker&) = delete;
        ProgressTracker& operator=(const ProgressTracker&) = delete;

        /**
         * Replaces the whole progress tuple. percentage is stored as given.
         */
        void update(float percentage, std::string stage, std::string agent, std::string activity);

        /**
         * Restores the initial tuple and restarts the elapsed clock.
         */
        void reset();

        [[nodiscard]] ProgressSnapshot snapshot() const;

        [[nodiscard]] double elapsed_seconds() const;

    private:
        using Clock = std::chrono::steady_clock;

        mutable std::mutex mutex_;
        float percentage_;
        std::string stage_;
        std::string agent_;
        std::string activity_;
        Clock::time_point started_;
    };

    /**
     * {"percentage", "stage", "agent", "activity", "elapsed_seconds"}
     */
    void to_json(nlohmann::json& j, const ProgressSnapshot& snapshot);

}  // namespace rcp

#endif //REPORTCONTENTPIPELINE_PROGRESS_TRACKER_HPP
