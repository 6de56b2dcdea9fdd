#pragma once

#include "liblinreg/core/errors.hpp"
#include "liblinreg/core/fitted_parameters.hpp"
#include "liblinreg/core/regression_options.hpp"
#include "liblinreg/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace liblinreg {
namespace solvers {

/**
 * Ordinary least squares linear regressor (simple and multiple)
 *
 * State machine:
 *   UNFITTED --FitSimple/FitMultiple--> FITTED --fit again--> FITTED (overwrite)
 *
 * The fitted state is a std::optional<FittedParameters>; a fit computes the
 * complete parameter set first and assigns it in one step, so a fit that
 * throws leaves the previous state (fitted or not) untouched.
 *
 * Algorithms:
 * - FitSimple:   slope = Cov(x, y) / Var(x) with population (1/n) moments,
 *                intercept = mean(y) - slope * mean(x)
 * - FitMultiple: w = (X'^T X')^-1 X'^T y where X' = [1 | X]; w[0] is the
 *                intercept and w[1..p] the coefficients in column order.
 *                The "qr" solver solves X' w = y directly and decides rank
 *                on X' rather than X'^T X'
 *
 * Design notes:
 * - Header-only
 * - Inputs are never modified
 * - Degenerate simple fits (zero-variance x) yield non-finite parameters
 *   unless RegressionOptions::strict_degenerate is set
 */
class LinearRegressor {
public:
	/**
	 * @param options Solver configuration (validated here)
	 * @throws std::invalid_argument if options are invalid
	 */
	explicit LinearRegressor(const core::RegressionOptions &options = core::RegressionOptions::Default());

	/**
	 * Fit a single-predictor model
	 *
	 * Accepts any column-major Eigen expression with one column: VectorXd,
	 * an n x 1 MatrixXd, a Map over external storage, a column or segment
	 * of a larger matrix. Multi-column input is rejected rather than
	 * reshaped; use FitMultiple.
	 *
	 * @param x Predictor (n x 1)
	 * @param y Response (length n)
	 * @throws std::invalid_argument if n == 0
	 * @throws core::DimensionMismatchError if x has other than one column or lengths differ
	 * @throws core::DegenerateInputError if Var(x) == 0 and strict mode is enabled
	 */
	void FitSimple(const Eigen::Ref<const Eigen::MatrixXd> &x, const Eigen::Ref<const Eigen::VectorXd> &y);

	/**
	 * Fit a multi-predictor model by solving the normal equations
	 *
	 * @param X Predictor matrix (n x p), without a constant column
	 * @param y Response (length n)
	 * @throws std::invalid_argument if n == 0
	 * @throws core::DimensionMismatchError if X.rows() != y.size()
	 * @throws core::SingularMatrixError if the design matrix is rank deficient
	 */
	void FitMultiple(const Eigen::Ref<const Eigen::MatrixXd> &X, const Eigen::Ref<const Eigen::VectorXd> &y);

	/**
	 * Predict: intercept + X * coefficients
	 *
	 * A 1D predictor (VectorXd, a matrix column, a Map) is an n x 1 matrix
	 * here, so it is valid only for a single-feature model.
	 *
	 * @throws core::NotFittedError if no fit has succeeded
	 * @throws core::DimensionMismatchError if X.cols() differs from the fitted feature count
	 */
	Eigen::VectorXd Predict(const Eigen::Ref<const Eigen::MatrixXd> &X) const;

	bool IsFitted() const {
		return params_.has_value();
	}

	/// @throws core::NotFittedError if unfitted
	const Eigen::VectorXd &coefficients() const {
		return RequireFitted().coefficients;
	}

	/// @throws core::NotFittedError if unfitted
	double intercept() const {
		return RequireFitted().intercept;
	}

	/// Fitted parameters, empty while UNFITTED
	const std::optional<core::FittedParameters> &parameters() const {
		return params_;
	}

	const core::RegressionOptions &options() const {
		return options_;
	}

private:
	const core::FittedParameters &RequireFitted() const;

	/// Solve (D^T D) w = D^T y for the augmented design matrix D
	Eigen::VectorXd SolveNormalEquations(const Eigen::MatrixXd &design, const Eigen::Ref<const Eigen::VectorXd> &y) const;

	static void CheckObservations(Eigen::Index rows, Eigen::Index y_size, const char *operation);

	core::RegressionOptions options_;
	std::optional<core::FittedParameters> params_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline LinearRegressor::LinearRegressor(const core::RegressionOptions &options) : options_(options) {
	options_.Validate();
}

inline void LinearRegressor::CheckObservations(Eigen::Index rows, Eigen::Index y_size, const char *operation) {
	if (rows == 0 || y_size == 0) {
		throw std::invalid_argument(std::string(operation) + " requires at least one observation");
	}
	if (rows != y_size) {
		throw core::DimensionMismatchError(std::string(operation) + ": predictor has " + std::to_string(rows) +
		                                   " observations but response has " + std::to_string(y_size));
	}
}

inline void LinearRegressor::FitSimple(const Eigen::Ref<const Eigen::MatrixXd> &x,
                                       const Eigen::Ref<const Eigen::VectorXd> &y) {
	LINREG_TRACE("FitSimple: x is " << x.rows() << "x" << x.cols() << ", y has " << y.size() << " rows");
	if (x.cols() != 1) {
		throw core::DimensionMismatchError("FitSimple expects a single predictor but got " +
		                                   std::to_string(x.cols()) + " columns; use FitMultiple");
	}
	CheckObservations(x.rows(), y.size(), "FitSimple");

	const double n = static_cast<double>(x.rows());
	const double x_mean = x.mean();
	const double y_mean = y.mean();

	// Population moments (denominator n)
	const Eigen::ArrayXd dx = x.col(0).array() - x_mean;
	const double cov_xy = (dx * (y.array() - y_mean)).sum() / n;
	const double var_x = dx.square().sum() / n;

	if (!(var_x > 0.0)) {
		if (options_.strict_degenerate) {
			throw core::DegenerateInputError("FitSimple: predictor has zero variance, slope is undefined");
		}
		LINREG_WARN("FitSimple: predictor has zero variance (n=" << x.rows() << "), parameters will be non-finite");
	}

	core::FittedParameters fitted;
	const double slope = cov_xy / var_x;
	fitted.coefficients = Eigen::VectorXd::Constant(1, slope);
	fitted.intercept = y_mean - slope * x_mean;
	fitted.n_obs = static_cast<size_t>(x.rows());
	fitted.method = core::FitMethod::SIMPLE;

	LINREG_DEBUG("FitSimple: n=" << fitted.n_obs << ", slope=" << slope << ", intercept=" << fitted.intercept);
	params_ = std::move(fitted);
}

inline void LinearRegressor::FitMultiple(const Eigen::Ref<const Eigen::MatrixXd> &X,
                                         const Eigen::Ref<const Eigen::VectorXd> &y) {
	LINREG_TRACE("FitMultiple: X is " << X.rows() << "x" << X.cols() << ", y has " << y.size() << " rows");
	CheckObservations(X.rows(), y.size(), "FitMultiple");
	LINREG_TIMING_START();

	const Eigen::Index n = X.rows();
	const Eigen::Index p = X.cols();

	// Design matrix with a leading column of ones for the intercept
	Eigen::MatrixXd design(n, p + 1);
	design.col(0).setOnes();
	design.rightCols(p) = X;

	Eigen::VectorXd w = SolveNormalEquations(design, y);

	core::FittedParameters fitted;
	fitted.intercept = w(0);
	fitted.coefficients = w.tail(p);
	fitted.n_obs = static_cast<size_t>(n);
	fitted.method = core::FitMethod::MULTIPLE;

	LINREG_DEBUG("FitMultiple: n=" << n << ", p=" << p << ", solver=" << options_.solver
	                               << ", intercept=" << fitted.intercept);
	LINREG_TIMING_END("FitMultiple");
	params_ = std::move(fitted);
}

inline Eigen::VectorXd LinearRegressor::SolveNormalEquations(const Eigen::MatrixXd &design,
                                                             const Eigen::Ref<const Eigen::VectorXd> &y) const {
	const Eigen::Index params = design.cols();

	// QR decides rank on the design matrix itself, never on X'X
	if (options_.solver == "qr") {
		Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
		if (options_.singular_tolerance > 0.0) {
			qr.setThreshold(options_.singular_tolerance);
		}
		if (qr.rank() < params) {
			throw core::SingularMatrixError("FitMultiple: design matrix is rank deficient (rank " +
			                                std::to_string(qr.rank()) + " of " + std::to_string(params) +
			                                "), predictors are collinear or too few rows");
		}
		return qr.solve(y);
	}

	const Eigen::MatrixXd XtX = design.transpose() * design;
	const Eigen::VectorXd Xty = design.transpose() * y;

	// "inverse" and "cholesky" factor X'X, so X'X must be numerically invertible
	Eigen::FullPivLU<Eigen::MatrixXd> lu(XtX);
	if (options_.singular_tolerance > 0.0) {
		lu.setThreshold(options_.singular_tolerance);
	}
	if (!lu.isInvertible()) {
		throw core::SingularMatrixError("FitMultiple: X'X is singular (rank " + std::to_string(lu.rank()) + " of " +
		                                std::to_string(params) + "), predictors are collinear or too few rows");
	}

	if (options_.solver == "cholesky") {
		Eigen::LDLT<Eigen::MatrixXd> ldlt(XtX);
		if (ldlt.info() != Eigen::Success) {
			throw core::SingularMatrixError("FitMultiple: LDLT factorization of X'X failed");
		}
		return ldlt.solve(Xty);
	}
	return lu.inverse() * Xty;
}

inline const core::FittedParameters &LinearRegressor::RequireFitted() const {
	if (!params_) {
		throw core::NotFittedError();
	}
	return *params_;
}

inline Eigen::VectorXd LinearRegressor::Predict(const Eigen::Ref<const Eigen::MatrixXd> &X) const {
	const auto &fitted = RequireFitted();
	if (static_cast<size_t>(X.cols()) != fitted.n_features()) {
		throw core::DimensionMismatchError("Predict: input has " + std::to_string(X.cols()) +
		                                   " features but the model was fitted with " +
		                                   std::to_string(fitted.n_features()));
	}
	return ((X * fitted.coefficients).array() + fitted.intercept).matrix();
}

} // namespace solvers
} // namespace liblinreg
