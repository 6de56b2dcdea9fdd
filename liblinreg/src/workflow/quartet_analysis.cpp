#include "liblinreg/workflow/quartet_analysis.hpp"
#include "liblinreg/evaluation/regression_evaluator.hpp"
#include "liblinreg/solvers/linear_regressor.hpp"
#include "liblinreg/utils/tracing.hpp"

namespace liblinreg {
namespace workflow {

std::vector<DatasetReport> AnalyzeQuartet(const std::vector<datasets::Dataset> &datasets,
                                          const core::RegressionOptions &options) {
	std::vector<DatasetReport> reports;
	reports.reserve(datasets.size());

	for (const auto &dataset : datasets) {
		solvers::LinearRegressor model(options);
		model.FitSimple(dataset.x, dataset.y);

		Eigen::VectorXd y_pred = model.Predict(dataset.x);
		auto metrics = evaluation::EvaluateRegression(dataset.y, y_pred, options.strict_degenerate);

		LINREG_INFO("Dataset " << dataset.name << ": coefficient=" << model.coefficients()(0)
		                       << ", intercept=" << model.intercept() << ", R2=" << metrics.r2()
		                       << ", RMSE=" << metrics.rmse() << ", MAE=" << metrics.mae());

		reports.push_back(DatasetReport {dataset.name, *model.parameters(), metrics, std::move(y_pred)});
	}
	return reports;
}

std::map<std::string, std::vector<double>> CollectMetrics(const std::vector<DatasetReport> &reports) {
	std::map<std::string, std::vector<double>> series;
	for (const auto &name : core::RegressionMetrics::Names()) {
		auto &values = series[name];
		values.reserve(reports.size());
		for (const auto &report : reports) {
			values.push_back(report.metrics.At(name));
		}
	}
	return series;
}

} // namespace workflow
} // namespace liblinreg
