#pragma once
/**
 * @file Course.h
 * @brief Immutable spatial profile of a race route.
 */
#include <cstddef>
#include <string>
#include <vector>

namespace trailsim {
    /**
     * @brief One point of the route profile.
     */
    struct CourseSample {
        double distance; /**< cumulative distance from the start (m) */
        double elevation; /**< elevation (m) */
        double gradient = 0.0; /**< slope from the previous sample (%), derived by Course */
        double latitude = 0.0; /**< degrees, 0 when the profile is synthetic */
        double longitude = 0.0; /**< degrees, 0 when the profile is synthetic */
    };

    /** @brief A geographic position on the route. */
    struct GeoPoint {
        double latitude;
        double longitude;
    };

    /**
     * @brief Ordered sample array with O(log n) lookups by distance.
     *
     * Gradients are always recomputed from consecutive samples; a zero-length segment (duplicate distance) gets
     * gradient 0.
     */
    class Course {
    public:
        /**
         * @param samples  samples in route order; gradient fields are ignored
         * @throws std::invalid_argument if empty, if the first distance is negative or if distances decrease
         */
        explicit Course(std::vector<CourseSample> samples);

        /**
         * @brief Load a course table written by the GPX converter.
         *
         * Requires a header with `distance` and `elevation` columns; `latitude` and `longitude` are optional,
         * other columns are ignored.
         * @throws std::runtime_error naming the file when it cannot be read or a row is malformed
         */
        static Course fromCsv(const std::string& path);

        /** @brief Total route length (m), the distance of the last sample. */
        double length() const noexcept { return samples_.back().distance; }

        size_t size() const noexcept { return samples_.size(); }

        const CourseSample& operator[](const size_t i) const noexcept { return samples_[i]; }

        const std::vector<CourseSample>& samples() const noexcept { return samples_; }

        /**
         * @brief Index of the sample closest to `distance`.
         *
         * Ties go to the sample with the lower distance.
         */
        size_t nearestIndex(double distance) const noexcept;

        /**
         * @brief Latitude/longitude at `distance`, linearly interpolated between the two bounding samples.
         *
         * Distances outside the route are clamped to its ends.
         */
        GeoPoint locate(double distance) const noexcept;

    private:
        std::vector<CourseSample> samples_;
    };
}
