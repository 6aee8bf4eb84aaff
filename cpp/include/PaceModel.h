#pragma once
/**
 * @file PaceModel.h
 * @brief Terrain-dependent multiplier applied to a runner's baseline pace.
 */
#include <memory>

#include "CourseModel.h"

namespace trailsim {
    /**
     * @brief Maps a cell to a pace-adjustment factor; pace × factor is the effective pace on that cell.
     *
     * The engine evaluates the model once per cell when it is built, never inside the step loop.
     */
    class PaceModel {
    public:
        virtual ~PaceModel() = default;

        /** @brief factor (> 0) for a runner currently in `cell` */
        virtual double factor(const Cell& cell) const = 0;

        /** @brief clone for per-run isolation */
        virtual std::unique_ptr<PaceModel> clone() const = 0;
    };

    /**
     * @brief Linear gradient penalty: 2 % slower per % of climb, 1 % faster per % of descent, floored.
     */
    class GradientPaceModel final : public PaceModel {
    public:
        static constexpr double UPHILL_PER_PCT = 0.02;
        static constexpr double DOWNHILL_PER_PCT = 0.01;
        static constexpr double MIN_FACTOR = 0.2;

        double factor(const Cell& cell) const override;

        std::unique_ptr<PaceModel> clone() const override;
    };
}
