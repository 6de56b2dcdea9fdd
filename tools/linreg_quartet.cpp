#include <liblinreg/datasets/dataset.hpp>
#include <liblinreg/utils/tracing.hpp>
#include <liblinreg/workflow/quartet_analysis.hpp>
#include <liblinreg/workflow/reference_comparison.hpp>

#include <exception>
#include <iomanip>
#include <iostream>

using namespace liblinreg;

int main(int argc, char **argv) {
	try {
		std::vector<datasets::Dataset> data;
		if (argc > 1) {
			data = datasets::LoadGroupedCsv(argv[1]);
		} else {
			data = datasets::AnscombeQuartet();
		}

		LINREG_TIMING_START();
		const auto reports = workflow::AnalyzeQuartet(data);
		LINREG_TIMING_END("Quartet analysis");

		std::cout << std::setprecision(6);
		for (size_t i = 0; i < reports.size(); i++) {
			const auto &report = reports[i];
			const auto &dataset = data[i];

			std::cout << "Dataset " << report.name << ": Coefficient: " << report.parameters.coefficients(0)
			          << ", Intercept: " << report.parameters.intercept << '\n';
			std::cout << "  R2: " << report.metrics.r2() << ", RMSE: " << report.metrics.rmse()
			          << ", MAE: " << report.metrics.mae() << '\n';

			const auto comparison = workflow::CompareWithReference(report.parameters, dataset.x, dataset.y);
			std::cout << "  Reference Coefficient: " << comparison.reference_coefficients(0)
			          << ", Reference Intercept: " << comparison.reference_intercept
			          << ", max |diff|: " << comparison.MaxAbsDifference() << '\n';
		}
	} catch (const std::exception &e) {
		LINREG_ERROR("linreg_quartet failed: " << e.what());
		return 1;
	}
	return 0;
}
