#pragma once
/**
 * @file CompiledExpression.h
 * @brief An arithmetic expression evaluator over cell terrain, and the pace model built on it.
 */
#include <memory>
#include <string>

#include "PaceModel.h"

namespace trailsim {
    /**
     * @brief Holds a compiled expression for fast repeated evaluation.
     *
     * Not thread-safe: evaluation writes the bound variables, and copies share them. Compile a new instance per
     * thread.
     */
    class CompiledExpression {
    public:
        /**
         * @brief Compile a new expression from source.
         * @param expr  arithmetic (and/or boolean) expression over gradient (%), elevation (m) and
         *              distance (m, the cell midpoint)
         * @throws std::runtime_error on a syntax error or an unknown symbol
         */
        explicit CompiledExpression(const std::string& expr);

        /** @brief Evaluate on one cell; `distance` is the cell midpoint. */
        double eval(const Cell& cell) const;

        /** @brief expression text as compiled */
        std::string expr() const { return expr_; }

    private:
        std::string expr_;
        struct Impl;
        std::shared_ptr<Impl> impl_;
    };

    /**
     * @brief Pace factor given by a user expression, e.g. "if(gradient > 0, 1 + gradient / 25, 1)".
     *
     * Results are floored at GradientPaceModel::MIN_FACTOR, like the built-in model.
     */
    class ExpressionPaceModel final : public PaceModel {
    public:
        explicit ExpressionPaceModel(const std::string& expr);

        double factor(const Cell& cell) const override;

        std::unique_ptr<PaceModel> clone() const override;

        std::string expr() const { return expression_.expr(); }

    private:
        CompiledExpression expression_;
    };
}
