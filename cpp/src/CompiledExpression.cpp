#include "CompiledExpression.h"
#include <exprtk.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <memory>

using namespace trailsim;


struct CompiledExpression::Impl {
    exprtk::symbol_table<double> symbols;
    exprtk::expression<double> expression;
    exprtk::parser<double> parser;

    double gradient = 0.0, elevation = 0.0, distance = 0.0;

    explicit Impl(const std::string& expr) {
        symbols.add_variable("gradient", gradient);
        symbols.add_variable("elevation", elevation);
        symbols.add_variable("distance", distance);
        symbols.add_constants(); // math constants (pi, e, etc.)
        expression.register_symbol_table(symbols);

        if (!parser.compile(expr, expression))
            throw std::runtime_error("ExprTk compile error in '" + expr + "': " + parser.error());
    }
};

CompiledExpression::CompiledExpression(const std::string& expr):
    expr_(expr), impl_(std::make_shared<Impl>(expr)) {}


double CompiledExpression::eval(const Cell& cell) const {
    auto& impl = *impl_;
    impl.gradient = cell.gradient;
    impl.elevation = cell.elevation;
    impl.distance = cell.midpoint;

    return impl.expression.value();
}


// ExpressionPaceModel
ExpressionPaceModel::ExpressionPaceModel(const std::string& expr):
    expression_(expr) {}

double ExpressionPaceModel::factor(const Cell& cell) const {
    const double f = expression_.eval(cell);
    if (!std::isfinite(f))
        throw std::runtime_error("ExpressionPaceModel: '" + expression_.expr() + "' is not finite at " +
            std::to_string(cell.start) + " m");
    return std::max(f, GradientPaceModel::MIN_FACTOR);
}

std::unique_ptr<PaceModel> ExpressionPaceModel::clone() const {
    return std::make_unique<ExpressionPaceModel>(expression_.expr());
}
