#pragma once

#include "liblinreg/solvers/linear_regressor.hpp"
#include <Eigen/Dense>

namespace liblinreg {
namespace workflow {

/**
 * Side-by-side fitted parameters of a LinearRegressor and the reference
 * QR solver (solvers::OLSSolver) on the same data
 */
struct ParameterComparison {
	Eigen::VectorXd custom_coefficients;
	double custom_intercept = 0.0;
	Eigen::VectorXd reference_coefficients;
	double reference_intercept = 0.0;

	/// Largest absolute difference over intercept and all coefficients
	/// (NaN if any compared value is non-finite)
	double MaxAbsDifference() const;

	/// True if MaxAbsDifference() <= tolerance
	bool Agrees(double tolerance) const;
};

/**
 * Fit the training data with the reference solver and pair its parameters
 * with already fitted ones
 *
 * X may be a VectorXd, a column or a Map; a 1D predictor is one column.
 *
 * @param params Parameters from a completed fit
 * @param X Training predictors (n x p, p must match params)
 * @param y Training response
 * @throws core::DimensionMismatchError if X does not match params or y
 */
ParameterComparison CompareWithReference(const core::FittedParameters &params,
                                         const Eigen::Ref<const Eigen::MatrixXd> &X,
                                         const Eigen::Ref<const Eigen::VectorXd> &y);

/// @throws core::NotFittedError if model is unfitted
ParameterComparison CompareWithReference(const solvers::LinearRegressor &model,
                                         const Eigen::Ref<const Eigen::MatrixXd> &X,
                                         const Eigen::Ref<const Eigen::VectorXd> &y);

} // namespace workflow
} // namespace liblinreg
