#pragma once

#include <string>
#include <stdexcept>

namespace liblinreg {
namespace core {

/**
 * Configuration options for LinearRegressor
 *
 * All options have defaults that reproduce the textbook algorithm:
 * explicit normal-equations inversion and silent propagation of
 * non-finite values on degenerate input.
 *
 * Design notes:
 * - All defaults specified in-class for clarity
 * - Validation method to check for invalid values
 * - Stabilized solvers are an internal substitution only; they must agree
 *   with "inverse" on well-conditioned data
 */
struct RegressionOptions {
	// ========================================================================
	// Multiple regression solver
	// ========================================================================

	/// Algorithm used to solve the normal equations in FitMultiple
	/// Options: "inverse" (explicit (X'X)^-1), "cholesky" (LDLT), "qr" (column-pivoting QR)
	/// Default: "inverse"
	std::string solver = "inverse";

	/// Threshold for declaring X'X singular (-1 = auto, use Eigen default)
	/// Default: -1.0 (auto)
	double singular_tolerance = -1.0;

	// ========================================================================
	// Degenerate input handling
	// ========================================================================

	/// Raise DegenerateInputError on zero-variance predictor (FitSimple)
	/// instead of propagating Inf/NaN coefficients
	/// Default: false (propagate silently, log a warning)
	bool strict_degenerate = false;

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionOptions() = default;

	static RegressionOptions Default() {
		return RegressionOptions();
	}

	/// Options using a decomposition instead of explicit inversion
	static RegressionOptions Stabilized(const std::string &solver_ = "qr") {
		RegressionOptions opts;
		opts.solver = solver_;
		return opts;
	}

	/// Options raising on degenerate input
	static RegressionOptions Strict() {
		RegressionOptions opts;
		opts.strict_degenerate = true;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (solver != "inverse" && solver != "cholesky" && solver != "qr") {
			throw std::invalid_argument("solver must be 'inverse', 'cholesky', or 'qr' (got '" + solver + "')");
		}

		// -1 means auto; any other value must be a positive threshold
		if (singular_tolerance != -1.0 && !(singular_tolerance > 0.0)) {
			throw std::invalid_argument("singular_tolerance must be positive or -1 for auto (got " +
			                            std::to_string(singular_tolerance) + ")");
		}
	}
};

} // namespace core
} // namespace liblinreg
