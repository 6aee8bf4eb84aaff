#pragma once
/**
 * @file Analysis.h
 * @brief Post-run analyses over a recorded trajectory table and the course profile.
 */
#include <cstddef>
#include <vector>

#include "Collector.h"
#include "Course.h"

namespace trailsim {
    /**
     * @brief First recorded time (s) at which each runner is at or beyond `distanceM`; NaN if never.
     */
    std::vector<double> passageTimes(const TrajectoryTable& table, double distanceM);

    /**
     * @brief Centre of the fullest bin of a `bins`-bin histogram over the finite passage times.
     * @return NaN when no time is finite
     */
    double peakPassageTime(const std::vector<double>& times, int bins = 50);

    /**
     * @brief Field distribution at one instant.
     */
    struct Snapshot {
        double timeSec = 0.0; /**< time of the row actually used */
        size_t finished = 0;
        size_t dnf = 0;
        size_t active = 0;
        double meanActivePositionM = 0.0; /**< 0 without active runners */
        double binWidthM = 0.0;
        std::vector<long> histogram; /**< active runners per bin over [0, course length] */
    };

    /**
     * @brief Status counts and spatial density of active runners at the row nearest to `timeSec`.
     *
     * A runner is finished once its position reaches the course length. With `dnfTimes` (as produced by
     * RaceStatusCollector) a runner is DNF when its retirement time is <= the row time; without it, a runner that
     * has not finished and is already at its final position counts as DNF.
     * @throws std::invalid_argument on an empty table or bins < 1
     */
    Snapshot snapshot(const TrajectoryTable& table, double courseLengthM, double timeSec, int bins = 80,
                      const std::vector<double>& dnfTimes = {});

    /**
     * @brief Latitude/longitude of every runner at `row`, for map animations.
     * @throws std::out_of_range if `row` is not in the table
     */
    std::vector<GeoPoint> geoPositions(const TrajectoryTable& table, const Course& course, size_t row);
}
