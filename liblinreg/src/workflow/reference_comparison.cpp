#include "liblinreg/workflow/reference_comparison.hpp"
#include "liblinreg/solvers/ols_solver.hpp"
#include "liblinreg/utils/tracing.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace liblinreg {
namespace workflow {

double ParameterComparison::MaxAbsDifference() const {
	if (custom_coefficients.size() != reference_coefficients.size()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	double max_diff = std::abs(custom_intercept - reference_intercept);
	if (std::isnan(max_diff)) {
		return max_diff;
	}
	for (Eigen::Index i = 0; i < custom_coefficients.size(); i++) {
		const double diff = std::abs(custom_coefficients[i] - reference_coefficients[i]);
		if (std::isnan(diff)) {
			return diff;
		}
		max_diff = std::max(max_diff, diff);
	}
	return max_diff;
}

bool ParameterComparison::Agrees(double tolerance) const {
	const double diff = MaxAbsDifference();
	return std::isfinite(diff) && diff <= tolerance;
}

ParameterComparison CompareWithReference(const core::FittedParameters &params,
                                         const Eigen::Ref<const Eigen::MatrixXd> &X,
                                         const Eigen::Ref<const Eigen::VectorXd> &y) {
	if (X.cols() != params.coefficients.size()) {
		throw core::DimensionMismatchError("CompareWithReference: X has " + std::to_string(X.cols()) +
		                                   " columns but the model has " +
		                                   std::to_string(params.coefficients.size()) + " coefficients");
	}

	ParameterComparison comparison;
	comparison.custom_coefficients = params.coefficients;
	comparison.custom_intercept = params.intercept;

	const auto reference = solvers::OLSSolver::Fit(Eigen::VectorXd(y), Eigen::MatrixXd(X), true);
	comparison.reference_coefficients = reference.coefficients;
	comparison.reference_intercept = reference.intercept;

	LINREG_DEBUG("Reference comparison: custom intercept=" << comparison.custom_intercept
	                                                       << ", reference intercept=" << comparison.reference_intercept
	                                                       << ", max |diff|=" << comparison.MaxAbsDifference());
	return comparison;
}

ParameterComparison CompareWithReference(const solvers::LinearRegressor &model,
                                         const Eigen::Ref<const Eigen::MatrixXd> &X,
                                         const Eigen::Ref<const Eigen::VectorXd> &y) {
	if (!model.IsFitted()) {
		throw core::NotFittedError();
	}
	return CompareWithReference(*model.parameters(), X, y);
}

} // namespace workflow
} // namespace liblinreg
