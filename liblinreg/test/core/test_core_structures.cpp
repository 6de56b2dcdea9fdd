#include <catch2/catch_test_macros.hpp>
#include "liblinreg/core/errors.hpp"
#include "liblinreg/core/fitted_parameters.hpp"
#include "liblinreg/core/regression_metrics.hpp"
#include "liblinreg/core/regression_options.hpp"
#include "liblinreg/core/regression_result.hpp"

#include <cmath>
#include <limits>

using namespace liblinreg::core;

TEST_CASE("FittedParameters - Basic construction", "[core][parameters]") {
	SECTION("Default constructor") {
		FittedParameters params;
		REQUIRE(params.n_features() == 0);
		REQUIRE(params.n_obs == 0);
		REQUIRE(params.intercept == 0.0);
		REQUIRE(params.method == FitMethod::SIMPLE);
	}

	SECTION("Feature count follows coefficients") {
		FittedParameters params;
		params.coefficients = Eigen::VectorXd::Zero(3);
		REQUIRE(params.n_features() == 3);
		REQUIRE(params.is_finite());
	}

	SECTION("Non-finite parameters are detected") {
		FittedParameters params;
		params.coefficients = Eigen::VectorXd::Constant(1, std::numeric_limits<double>::quiet_NaN());
		REQUIRE_FALSE(params.is_finite());

		params.coefficients(0) = 1.0;
		params.intercept = std::numeric_limits<double>::infinity();
		REQUIRE_FALSE(params.is_finite());
	}

	SECTION("Method names") {
		REQUIRE(FitMethodName(FitMethod::SIMPLE) == "simple");
		REQUIRE(FitMethodName(FitMethod::MULTIPLE) == "multiple");
	}
}

TEST_CASE("RegressionMetrics - Lookup by name", "[core][metrics]") {
	RegressionMetrics metrics(0.75, 1.5, 1.25);

	SECTION("Accessors") {
		REQUIRE(metrics.r2() == 0.75);
		REQUIRE(metrics.rmse() == 1.5);
		REQUIRE(metrics.mae() == 1.25);
	}

	SECTION("At() uses the report keys") {
		REQUIRE(metrics.At("R2") == 0.75);
		REQUIRE(metrics.At("RMSE") == 1.5);
		REQUIRE(metrics.At("MAE") == 1.25);
		REQUIRE_THROWS_AS(metrics.At("MSE"), std::out_of_range);
		REQUIRE_THROWS_AS(metrics.At("r2"), std::out_of_range);
	}

	SECTION("ToMap() has exactly three entries") {
		auto map = metrics.ToMap();
		REQUIRE(map.size() == 3);
		REQUIRE(map.at("R2") == 0.75);
		REQUIRE(map.at("RMSE") == 1.5);
		REQUIRE(map.at("MAE") == 1.25);
	}

	SECTION("Names are in report order") {
		const auto &names = RegressionMetrics::Names();
		REQUIRE(names.size() == 3);
		REQUIRE(names[0] == "R2");
		REQUIRE(names[1] == "RMSE");
		REQUIRE(names[2] == "MAE");
	}
}

TEST_CASE("RegressionResult - Basic construction", "[core][result]") {
	SECTION("Default constructor") {
		RegressionResult result;
		REQUIRE(result.rank == 0);
		REQUIRE(result.n_obs == 0);
		REQUIRE_FALSE(result.has_intercept);
	}

	SECTION("Constructor with dimensions") {
		RegressionResult result(20, 3);
		REQUIRE(result.n_obs == 20);
		REQUIRE(result.coefficients.size() == 3);
		REQUIRE(result.residuals.size() == 20);
		REQUIRE(result.is_aliased.size() == 3);
		REQUIRE(std::isnan(result.coefficients(0)));
	}

	SECTION("Residual degrees of freedom") {
		RegressionResult result(20, 3);
		result.rank = 4;
		REQUIRE(result.df_residual() == 16);

		result.rank = 25;
		REQUIRE(result.df_residual() == 0);
	}
}

TEST_CASE("Error taxonomy derives from the standard hierarchy", "[core][errors]") {
	REQUIRE_THROWS_AS(throw NotFittedError(), std::logic_error);
	REQUIRE_THROWS_AS(throw SingularMatrixError("singular"), std::runtime_error);
	REQUIRE_THROWS_AS(throw DimensionMismatchError("shape"), std::invalid_argument);
	REQUIRE_THROWS_AS(throw DegenerateInputError("variance"), std::domain_error);

	NotFittedError error;
	REQUIRE(std::string(error.what()) == "Model is not yet fitted");
}
