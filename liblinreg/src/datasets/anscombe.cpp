#include "liblinreg/datasets/dataset.hpp"

#include <stdexcept>

namespace liblinreg {
namespace datasets {

namespace {

Dataset MakeDataset(const std::string &name, const std::vector<double> &x, const std::vector<double> &y) {
	Dataset dataset;
	dataset.name = name;
	dataset.x = Eigen::Map<const Eigen::VectorXd>(x.data(), static_cast<Eigen::Index>(x.size()));
	dataset.y = Eigen::Map<const Eigen::VectorXd>(y.data(), static_cast<Eigen::Index>(y.size()));
	return dataset;
}

} // namespace

std::vector<Dataset> AnscombeQuartet() {
	const std::vector<double> x_shared = {10, 8, 13, 9, 11, 14, 6, 4, 12, 7, 5};
	const std::vector<double> x_iv = {8, 8, 8, 8, 8, 8, 8, 19, 8, 8, 8};

	std::vector<Dataset> quartet;
	quartet.reserve(4);
	quartet.push_back(
	    MakeDataset("I", x_shared, {8.04, 6.95, 7.58, 8.81, 8.33, 9.96, 7.24, 4.26, 10.84, 4.82, 5.68}));
	quartet.push_back(
	    MakeDataset("II", x_shared, {9.14, 8.14, 8.74, 8.77, 9.26, 8.10, 6.13, 3.10, 9.13, 7.26, 4.74}));
	quartet.push_back(
	    MakeDataset("III", x_shared, {7.46, 6.77, 12.74, 7.11, 7.81, 8.84, 6.08, 5.39, 8.15, 6.42, 5.73}));
	quartet.push_back(MakeDataset("IV", x_iv, {6.58, 5.76, 7.71, 8.84, 8.47, 7.04, 5.25, 12.50, 5.56, 7.91, 6.89}));
	return quartet;
}

const Dataset &FindDataset(const std::vector<Dataset> &datasets, const std::string &name) {
	for (const auto &dataset : datasets) {
		if (dataset.name == name) {
			return dataset;
		}
	}
	throw std::out_of_range("Dataset '" + name + "' not found");
}

} // namespace datasets
} // namespace liblinreg
