#pragma once

#include "liblinreg/core/errors.hpp"
#include "liblinreg/core/regression_metrics.hpp"
#include "liblinreg/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace liblinreg {
namespace evaluation {

/**
 * Evaluate predictions against observed values
 *
 *   RSS  = sum (y_true - y_pred)^2
 *   TSS  = sum (y_true - mean(y_true))^2
 *   R2   = 1 - RSS / TSS
 *   RMSE = sqrt(RSS / n)
 *   MAE  = sum |y_true - y_pred| / n
 *
 * Pure function: inputs are not modified. When y_true is constant
 * (TSS = 0, including n = 1) R2 is non-finite unless strict_degenerate is set.
 *
 * @param y_true Observed values (length n >= 1)
 * @param y_pred Predicted values (length n)
 * @param strict_degenerate Raise instead of returning a non-finite R2
 * @throws std::invalid_argument if n == 0
 * @throws core::DimensionMismatchError if the lengths differ
 * @throws core::DegenerateInputError if TSS == 0 and strict_degenerate is set
 */
inline core::RegressionMetrics EvaluateRegression(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred,
                                                  bool strict_degenerate = false) {
	if (y_true.size() != y_pred.size()) {
		throw core::DimensionMismatchError("EvaluateRegression: y_true has " + std::to_string(y_true.size()) +
		                                   " values but y_pred has " + std::to_string(y_pred.size()));
	}
	if (y_true.size() == 0) {
		throw std::invalid_argument("EvaluateRegression requires at least one observation");
	}

	const double n = static_cast<double>(y_true.size());
	const Eigen::ArrayXd residuals = y_true.array() - y_pred.array();

	const double rss = residuals.square().sum();
	const double tss = (y_true.array() - y_true.mean()).square().sum();

	if (!(tss > 0.0)) {
		if (strict_degenerate) {
			throw core::DegenerateInputError("EvaluateRegression: y_true is constant, R2 is undefined");
		}
		LINREG_WARN("EvaluateRegression: y_true is constant (TSS=0), R2 will be non-finite");
	}

	const double r2 = 1.0 - rss / tss;
	const double rmse = std::sqrt(rss / n);
	const double mae = residuals.abs().sum() / n;

	return core::RegressionMetrics(r2, rmse, mae);
}

inline core::RegressionMetrics EvaluateRegression(const std::vector<double> &y_true, const std::vector<double> &y_pred,
                                                  bool strict_degenerate = false) {
	const Eigen::Map<const Eigen::VectorXd> true_map(y_true.data(), static_cast<Eigen::Index>(y_true.size()));
	const Eigen::Map<const Eigen::VectorXd> pred_map(y_pred.data(), static_cast<Eigen::Index>(y_pred.size()));
	return EvaluateRegression(Eigen::VectorXd(true_map), Eigen::VectorXd(pred_map), strict_degenerate);
}

} // namespace evaluation
} // namespace liblinreg
