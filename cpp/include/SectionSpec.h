#pragma once
/**
 * @file SectionSpec.h
 * @brief The three ways of describing single-track sections, and their common resolved form.
 */
#include <vector>

#include "RngEngine.h"

namespace trailsim {
    /**
     * @brief A distance range [startM, endM] (closed) with a fixed path capacity.
     */
    struct CapacityRange {
        double startM; /**< range start (m) */
        double endM; /**< range end (m), inclusive */
        int capacity; /**< runners allowed in one cell at the same time */
    };

    /**
     * @brief One single-track specification, explicit, percentage-based or random.
     *
     * Build instances through the static factories; `resolveSections` turns any mix of them into CapacityRanges.
     */
    struct SectionSpec {
        enum class Kind : int { Explicit = 0, Percentage = 1, Random = 2 };

        Kind kind;
        double from; /**< start_km (Explicit), start % (Percentage), total % of the course (Random) */
        double to; /**< end_km (Explicit), end % (Percentage), unused (Random) */
        int capacity;
        double chunkM; /**< placement granularity for Random specs (m) */

        /** @brief Capacity on [startKm, endKm]. */
        static SectionSpec explicitRange(double startKm, double endKm, int capacity);

        /** @brief Capacity on [startPct, endPct] percent of the course length. */
        static SectionSpec percentage(double startPct, double endPct, int capacity);

        /**
         * @brief Random non-overlapping chunks covering `totalPct` percent of the course.
         * @param chunkM  size of the placement chunks; consecutive chosen chunks merge into one range
         */
        static SectionSpec random(double totalPct, int capacity, double chunkM = 100.0);
    };

    /**
     * @brief Resolve specs, in order, into canonical ranges over a course of `courseLengthM` metres.
     *
     * Every spec is validated before anything is resolved, so a bad entry never yields a partial result.
     * Random specs draw from `rng`.
     * @throws std::invalid_argument describing the first invalid spec
     */
    std::vector<CapacityRange> resolveSections(const std::vector<SectionSpec>& specs, double courseLengthM,
                                               RngEngine& rng);
}
