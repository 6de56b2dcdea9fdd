#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <string>

namespace liblinreg {
namespace core {

/// Which fit routine produced a set of parameters
enum class FitMethod { SIMPLE, MULTIPLE };

inline std::string FitMethodName(FitMethod method) {
	switch (method) {
	case FitMethod::SIMPLE:
		return "simple";
	case FitMethod::MULTIPLE:
		return "multiple";
	default:
		return "unknown";
	}
}

/**
 * Parameters of a fitted linear model
 *
 * Produced as a whole by LinearRegressor::FitSimple / FitMultiple and
 * swapped into the regressor in one assignment, so coefficients and
 * intercept are always set together.
 *
 * Design notes:
 * - coefficients does NOT include the intercept; one entry per predictor
 *   in input column order (length 1 for simple regression)
 * - Values may be non-finite after a degenerate simple fit (zero-variance
 *   predictor) unless strict mode is enabled
 */
struct FittedParameters {
	/// Slope per predictor (length = n_features)
	Eigen::VectorXd coefficients;

	/// Intercept (bias) term
	double intercept = 0.0;

	/// Number of training observations
	size_t n_obs = 0;

	/// Fit routine used
	FitMethod method = FitMethod::SIMPLE;

	/// Number of predictors the model expects at prediction time
	size_t n_features() const {
		return static_cast<size_t>(coefficients.size());
	}

	/// True if every parameter is a finite number
	bool is_finite() const {
		return std::isfinite(intercept) && coefficients.allFinite();
	}
};

} // namespace core
} // namespace liblinreg
