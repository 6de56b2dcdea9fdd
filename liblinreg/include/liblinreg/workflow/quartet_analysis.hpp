#pragma once

#include "liblinreg/core/fitted_parameters.hpp"
#include "liblinreg/core/regression_metrics.hpp"
#include "liblinreg/core/regression_options.hpp"
#include "liblinreg/datasets/dataset.hpp"
#include <map>
#include <string>
#include <vector>

namespace liblinreg {
namespace workflow {

/// Simple-regression fit and in-sample metrics for one dataset
struct DatasetReport {
	std::string name;
	core::FittedParameters parameters;
	core::RegressionMetrics metrics;
	Eigen::VectorXd predictions;
};

/**
 * Fit a simple regression to each dataset and evaluate it on its own
 * training data (the Anscombe exercise)
 *
 * @param datasets Series to analyse, reported in the same order
 * @param options Options for each LinearRegressor
 * @return One report per dataset
 */
std::vector<DatasetReport> AnalyzeQuartet(const std::vector<datasets::Dataset> &datasets,
                                          const core::RegressionOptions &options = core::RegressionOptions::Default());

/// Per-metric series across reports: {"R2": [...], "RMSE": [...], "MAE": [...]}
std::map<std::string, std::vector<double>> CollectMetrics(const std::vector<DatasetReport> &reports);

} // namespace workflow
} // namespace liblinreg
