#pragma once

#include "liblinreg/core/errors.hpp"
#include "liblinreg/core/regression_result.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <string>

namespace liblinreg {
namespace solvers {

/**
 * Reference OLS solver (rank-revealing QR)
 *
 * Independent implementation used to cross-check LinearRegressor. Follows
 * R's lm(): constant or perfectly collinear features are aliased (NaN
 * coefficient) instead of raising, and the intercept is never aliased.
 *
 * Algorithm:
 * 1. Centre X and y (when fitting an intercept)
 * 2. QR decomposition with column pivoting: Xc*P = Q*R
 * 3. Solve the rank-r triangular system R_r * beta_r = (Q^T * yc)_r
 * 4. Map coefficients back to original column order
 * 5. intercept = mean(y) - sum(beta_j * mean(x_j)) over estimated features
 *
 * Stateless design (all methods are static).
 */
class OLSSolver {
public:
	/**
	 * @param y Response vector (length n)
	 * @param X Feature matrix (n x p), without a constant column
	 * @param intercept Fit an intercept term
	 * @param qr_tolerance Rank threshold (-1 = Eigen default)
	 * @throws core::DimensionMismatchError if X.rows() != y.size()
	 * @throws std::invalid_argument if n == 0
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, bool intercept = true,
	                                  double qr_tolerance = -1.0);

private:
	static void ComputeStatistics(const Eigen::VectorXd &y, core::RegressionResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RegressionResult OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, bool intercept,
                                             double qr_tolerance) {
	if (X.rows() != y.size()) {
		throw core::DimensionMismatchError("OLSSolver: X has " + std::to_string(X.rows()) + " rows but y has " +
		                                   std::to_string(y.size()));
	}
	if (y.size() == 0) {
		throw std::invalid_argument("OLSSolver requires at least one observation");
	}

	const Eigen::Index n = X.rows();
	const Eigen::Index p = X.cols();
	core::RegressionResult result(static_cast<size_t>(n), static_cast<size_t>(p));

	Eigen::VectorXd x_means = Eigen::VectorXd::Zero(p);
	double y_mean = 0.0;
	Eigen::MatrixXd X_work = X;
	Eigen::VectorXd y_work = y;
	if (intercept) {
		x_means = X.colwise().mean().transpose();
		y_mean = y.mean();
		X_work.rowwise() -= x_means.transpose();
		y_work.array() -= y_mean;
	}

	size_t feature_rank = 0;
	if (p > 0) {
		Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X_work);
		if (qr_tolerance > 0.0) {
			qr.setThreshold(qr_tolerance);
		}
		feature_rank = static_cast<size_t>(qr.rank());

		if (feature_rank > 0) {
			const auto r = static_cast<Eigen::Index>(feature_rank);
			Eigen::VectorXd QtY = qr.householderQ().transpose() * y_work;
			Eigen::VectorXd coef_reduced =
			    qr.matrixQR().topLeftCorner(r, r).triangularView<Eigen::Upper>().solve(QtY.head(r));

			const auto &P = qr.colsPermutation();
			for (Eigen::Index i = 0; i < r; i++) {
				const Eigen::Index original = P.indices()[i];
				result.coefficients[original] = coef_reduced[i];
				result.is_aliased[static_cast<size_t>(original)] = false;
			}
		}
	}
	result.rank = feature_rank + (intercept ? 1 : 0);

	if (intercept) {
		double b0 = y_mean;
		for (Eigen::Index j = 0; j < p; j++) {
			if (!result.is_aliased[static_cast<size_t>(j)]) {
				b0 -= result.coefficients[j] * x_means[j];
			}
		}
		result.intercept = b0;
		result.has_intercept = true;
	}

	Eigen::VectorXd y_pred = Eigen::VectorXd::Constant(n, result.intercept);
	for (Eigen::Index j = 0; j < p; j++) {
		if (!result.is_aliased[static_cast<size_t>(j)]) {
			y_pred += result.coefficients[j] * X.col(j);
		}
	}
	result.residuals = y - y_pred;

	ComputeStatistics(y, result);
	return result;
}

inline void OLSSolver::ComputeStatistics(const Eigen::VectorXd &y, core::RegressionResult &result) {
	const double ss_res = result.residuals.squaredNorm();
	const double ss_tot = (y.array() - y.mean()).square().sum();

	result.r_squared = (ss_tot > 1e-10) ? (1.0 - ss_res / ss_tot) : std::numeric_limits<double>::quiet_NaN();

	// Saturated model: no residual degrees of freedom
	if (result.df_residual() > 0) {
		result.rmse = std::sqrt(ss_res / static_cast<double>(result.df_residual()));
	} else {
		result.rmse = std::numeric_limits<double>::quiet_NaN();
	}
}

} // namespace solvers
} // namespace liblinreg
