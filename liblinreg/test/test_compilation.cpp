#include <catch2/catch_test_macros.hpp>

// Test that all library headers compile correctly together
#include "liblinreg/core/errors.hpp"
#include "liblinreg/core/fitted_parameters.hpp"
#include "liblinreg/core/regression_metrics.hpp"
#include "liblinreg/core/regression_options.hpp"
#include "liblinreg/core/regression_result.hpp"
#include "liblinreg/datasets/dataset.hpp"
#include "liblinreg/evaluation/regression_evaluator.hpp"
#include "liblinreg/solvers/linear_regressor.hpp"
#include "liblinreg/solvers/ols_solver.hpp"
#include "liblinreg/utils/tracing.hpp"
#include "liblinreg/workflow/quartet_analysis.hpp"
#include "liblinreg/workflow/reference_comparison.hpp"

using namespace liblinreg;

TEST_CASE("Library headers compile together", "[compilation]") {
	SECTION("Can create core structures") {
		core::FittedParameters params;
		core::RegressionOptions options;
		core::RegressionResult result;
		core::RegressionMetrics metrics(1.0, 0.0, 0.0);

		REQUIRE(params.n_features() == 0);
		REQUIRE(options.solver == "inverse");
		REQUIRE(result.rank == 0);
		REQUIRE(metrics.r2() == 1.0);
	}

	SECTION("Can construct a regressor") {
		solvers::LinearRegressor model;
		REQUIRE_FALSE(model.IsFitted());
		REQUIRE_FALSE(model.parameters().has_value());
	}
}
