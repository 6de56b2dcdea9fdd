#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <liblinreg/evaluation/regression_evaluator.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <vector>

using namespace liblinreg;
using namespace liblinreg::evaluation;
using Catch::Matchers::WithinAbs;

const double TOLERANCE = 1e-12;

TEST_CASE("Evaluator: Perfect predictions", "[evaluation][metrics]") {
	Eigen::VectorXd y(5);
	y << 1.0, -2.0, 3.5, 10.0, 0.25;

	auto metrics = EvaluateRegression(y, y);

	REQUIRE(metrics.r2() == 1.0);
	REQUIRE(metrics.rmse() == 0.0);
	REQUIRE(metrics.mae() == 0.0);
}

TEST_CASE("Evaluator: Known values", "[evaluation][metrics]") {
	Eigen::VectorXd y_true(5);
	Eigen::VectorXd y_pred(5);
	y_true << 3.0, 5.0, 2.0, 8.0, 6.0;
	y_pred << 2.5, 5.5, 2.0, 7.0, 6.5;

	// RSS = 1.75, TSS = 22.8, sum|e| = 2.5
	auto metrics = EvaluateRegression(y_true, y_pred);

	REQUIRE_THAT(metrics.r2(), WithinAbs(1.0 - 1.75 / 22.8, TOLERANCE));
	REQUIRE_THAT(metrics.rmse(), WithinAbs(std::sqrt(0.35), TOLERANCE));
	REQUIRE_THAT(metrics.mae(), WithinAbs(0.5, TOLERANCE));

	REQUIRE(metrics.At("R2") == metrics.r2());
	REQUIRE(metrics.At("RMSE") == metrics.rmse());
	REQUIRE(metrics.At("MAE") == metrics.mae());
}

TEST_CASE("Evaluator: Translation invariance", "[evaluation][metrics]") {
	Eigen::VectorXd y_true(5);
	Eigen::VectorXd y_pred(5);
	y_true << 3.0, 5.0, 2.0, 8.0, 6.0;
	y_pred << 2.5, 5.5, 2.0, 7.0, 6.5;

	auto base = EvaluateRegression(y_true, y_pred);

	for (double shift : {-50.0, 0.5, 100.0, 1e4}) {
		Eigen::VectorXd shifted_true = (y_true.array() + shift).matrix();
		Eigen::VectorXd shifted_pred = (y_pred.array() + shift).matrix();
		auto shifted = EvaluateRegression(shifted_true, shifted_pred);

		INFO("shift " << shift);
		REQUIRE_THAT(shifted.r2(), WithinAbs(base.r2(), 1e-9));
		REQUIRE_THAT(shifted.rmse(), WithinAbs(base.rmse(), 1e-9));
		REQUIRE_THAT(shifted.mae(), WithinAbs(base.mae(), 1e-9));
	}
}

TEST_CASE("Evaluator: Worse than the mean gives negative R2", "[evaluation][metrics]") {
	Eigen::VectorXd y_true(3);
	Eigen::VectorXd y_pred(3);
	y_true << 1.0, 2.0, 3.0;
	y_pred << 3.0, 2.0, 1.0;

	auto metrics = EvaluateRegression(y_true, y_pred);
	REQUIRE_THAT(metrics.r2(), WithinAbs(-3.0, TOLERANCE));
}

TEST_CASE("Evaluator: Constant y_true", "[evaluation][degenerate]") {
	Eigen::VectorXd y_true(3);
	Eigen::VectorXd y_pred(3);
	y_true << 2.0, 2.0, 2.0;
	y_pred << 1.0, 2.0, 3.0;

	SECTION("Default propagates a non-finite R2") {
		auto metrics = EvaluateRegression(y_true, y_pred);
		REQUIRE_FALSE(std::isfinite(metrics.r2()));
		REQUIRE_THAT(metrics.rmse(), WithinAbs(std::sqrt(2.0 / 3.0), TOLERANCE));
		REQUIRE_THAT(metrics.mae(), WithinAbs(2.0 / 3.0, TOLERANCE));
	}

	SECTION("Single observation") {
		Eigen::VectorXd one(1);
		one << 4.0;
		auto metrics = EvaluateRegression(one, one);
		REQUIRE(std::isnan(metrics.r2()));
		REQUIRE(metrics.rmse() == 0.0);
	}

	SECTION("Strict mode raises") {
		REQUIRE_THROWS_AS(EvaluateRegression(y_true, y_pred, true), core::DegenerateInputError);
	}
}

TEST_CASE("Evaluator: Input validation", "[evaluation][validation]") {
	Eigen::VectorXd a(3);
	Eigen::VectorXd b(2);
	a << 1.0, 2.0, 3.0;
	b << 1.0, 2.0;
	REQUIRE_THROWS_AS(EvaluateRegression(a, b), core::DimensionMismatchError);

	Eigen::VectorXd empty(0);
	REQUIRE_THROWS_AS(EvaluateRegression(empty, empty), std::invalid_argument);
}

TEST_CASE("Evaluator: std::vector overload", "[evaluation][metrics]") {
	const std::vector<double> y_true = {3.0, 5.0, 2.0, 8.0, 6.0};
	const std::vector<double> y_pred = {2.5, 5.5, 2.0, 7.0, 6.5};

	auto metrics = EvaluateRegression(y_true, y_pred);
	REQUIRE_THAT(metrics.r2(), WithinAbs(1.0 - 1.75 / 22.8, TOLERANCE));
	REQUIRE_THAT(metrics.mae(), WithinAbs(0.5, TOLERANCE));

	const std::vector<double> shorter = {1.0};
	REQUIRE_THROWS_AS(EvaluateRegression(y_true, shorter), core::DimensionMismatchError);

	// Inputs are untouched
	REQUIRE(y_true[0] == 3.0);
	REQUIRE(y_pred[4] == 6.5);
}
