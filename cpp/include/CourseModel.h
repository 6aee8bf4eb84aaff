#pragma once
/**
 * @file CourseModel.h
 * @brief Course profile with its path-capacity overlay, and the cell grid the engine works on.
 */
#include <vector>

#include "Course.h"
#include "SectionSpec.h"

namespace trailsim {
    /**
     * @brief Fixed-width slice [start, start + width) of the course.
     */
    struct Cell {
        double start; /**< cell start (m) */
        int capacity; /**< capacity of the course sample nearest to the midpoint */
        double gradient; /**< gradient (%) of that sample */
        double elevation; /**< elevation (m) of that sample */
        double midpoint; /**< start + width / 2 (m) */
    };

    /**
     * @brief Read-only course + per-sample capacity, shared by every runner of a run.
     */
    class CourseModel {
    public:
        static constexpr int DEFAULT_CAPACITY = 1000;
        static constexpr double DEFAULT_CELL_WIDTH = 10.0;

        /**
         * @brief Overlay `ranges` on a course whose samples default to `defaultCapacity`.
         *
         * A sample takes the capacity of every range whose closed interval contains its distance, applied in
         * order, so later ranges win where ranges overlap.
         * @throws std::invalid_argument on a capacity < 1 or a range with end < start
         */
        CourseModel(Course course, const std::vector<CapacityRange>& ranges, int defaultCapacity = DEFAULT_CAPACITY);

        const Course& course() const noexcept { return course_; }

        double length() const noexcept { return course_.length(); }

        /** @brief Capacity of the sample nearest to `distance`. */
        int capacityAt(double distance) const noexcept { return capacity_[course_.nearestIndex(distance)]; }

        /** @brief Capacity per course sample, parallel to course().samples(). */
        const std::vector<int>& sampleCapacities() const noexcept { return capacity_; }

        /**
         * @brief Discretize the course into ceil(length / width) cells.
         * @throws std::invalid_argument if width <= 0
         */
        std::vector<Cell> cells(double width = DEFAULT_CELL_WIDTH) const;

    private:
        Course course_;
        std::vector<int> capacity_;
    };
}
