#pragma once

#include <Eigen/Dense>
#include <vector>
#include <cstddef>
#include <limits>

namespace liblinreg {
namespace core {

/**
 * Result of a reference OLS fit (solvers::OLSSolver)
 *
 * Carries the fitted parameters in the same split as FittedParameters
 * (coefficients without intercept) so the two can be compared directly,
 * plus the rank information the QR-based solver produces.
 */
struct RegressionResult {
	/// Estimated feature coefficients (length = n_features)
	/// Aliased coefficients are set to NaN
	Eigen::VectorXd coefficients;

	/// Intercept term (0 if fitted without intercept)
	double intercept = 0.0;

	bool has_intercept = false;

	/// Residuals: y - y_hat (length = n_obs)
	Eigen::VectorXd residuals;

	/// Rank of the model (features + intercept)
	size_t rank = 0;

	size_t n_obs = 0;

	/// True if the feature was dropped as collinear/constant (length = n_features)
	std::vector<bool> is_aliased;

	/// Coefficient of determination: 1 - SSE/SST
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Residual standard error: sqrt(RSS / (n - rank))
	double rmse = std::numeric_limits<double>::quiet_NaN();

	RegressionResult() = default;

	RegressionResult(size_t n_obs_, size_t n_features_) : n_obs(n_obs_) {
		coefficients = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_features_),
		                                         std::numeric_limits<double>::quiet_NaN());
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		is_aliased.resize(n_features_, true);
	}

	size_t df_residual() const {
		if (n_obs <= rank) return 0;
		return n_obs - rank;
	}
};

} // namespace core
} // namespace liblinreg
