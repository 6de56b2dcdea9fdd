#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace liblinreg {
namespace datasets {

/// Named paired predictor/response series
struct Dataset {
	std::string name;
	Eigen::VectorXd x;
	Eigen::VectorXd y;

	size_t size() const {
		return static_cast<size_t>(x.size());
	}
};

/**
 * Anscombe's quartet
 *
 * Four series ("I", "II", "III", "IV", in that order) of 11 observations
 * with near-identical OLS fits (slope ~0.5, intercept ~3, R2 ~0.67)
 * but very different shapes.
 */
std::vector<Dataset> AnscombeQuartet();

/**
 * Load datasets from a long-format CSV
 *
 * Expects a header row naming the columns `dataset`, `x` and `y` (any
 * order, extra columns ignored). Rows are grouped by `dataset` in order of
 * first appearance. Blank lines are skipped.
 *
 * @param filepath Path to the CSV file
 * @return One Dataset per distinct dataset name
 * @throws std::runtime_error if the file cannot be opened
 * @throws std::invalid_argument on a missing column, short row, or malformed number
 */
std::vector<Dataset> LoadGroupedCsv(const std::string &filepath);

/// Look up a dataset by name; throws std::out_of_range if absent
const Dataset &FindDataset(const std::vector<Dataset> &datasets, const std::string &name);

} // namespace datasets
} // namespace liblinreg
