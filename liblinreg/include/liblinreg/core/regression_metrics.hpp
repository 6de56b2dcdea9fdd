#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace liblinreg {
namespace core {

/**
 * Goodness-of-fit metrics for one evaluation
 *
 * Immutable value produced fresh by evaluation::EvaluateRegression.
 * Lookup by name mirrors the "R2" / "RMSE" / "MAE" keys consumers
 * (reports, plots) use.
 */
class RegressionMetrics {
public:
	RegressionMetrics(double r2, double rmse, double mae) : r2_(r2), rmse_(rmse), mae_(mae) {
	}

	/// Coefficient of determination: 1 - RSS/TSS
	double r2() const {
		return r2_;
	}

	/// Root mean squared error: sqrt(RSS / n)
	double rmse() const {
		return rmse_;
	}

	/// Mean absolute error: sum|y - y_hat| / n
	double mae() const {
		return mae_;
	}

	/**
	 * Look up a metric by name
	 *
	 * @param name One of "R2", "RMSE", "MAE"
	 * @throws std::out_of_range for any other name
	 */
	double At(const std::string &name) const {
		if (name == "R2") {
			return r2_;
		}
		if (name == "RMSE") {
			return rmse_;
		}
		if (name == "MAE") {
			return mae_;
		}
		throw std::out_of_range("Unknown regression metric '" + name + "' (expected R2, RMSE or MAE)");
	}

	/// Metric names in report order
	static const std::vector<std::string> &Names() {
		static const std::vector<std::string> names = {"R2", "RMSE", "MAE"};
		return names;
	}

	std::map<std::string, double> ToMap() const {
		return {{"R2", r2_}, {"RMSE", rmse_}, {"MAE", mae_}};
	}

private:
	double r2_;
	double rmse_;
	double mae_;
};

} // namespace core
} // namespace liblinreg
