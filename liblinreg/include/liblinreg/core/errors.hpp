#pragma once

#include <stdexcept>
#include <string>

namespace liblinreg {
namespace core {

/**
 * Error taxonomy for liblinreg
 *
 * All failures are reported as exceptions derived from the standard
 * hierarchy, so callers may catch either the specific type or the
 * std:: base class:
 * - NotFittedError        : std::logic_error     (Predict before any fit)
 * - SingularMatrixError   : std::runtime_error   (X'X not invertible)
 * - DimensionMismatchError: std::invalid_argument (shape disagreement)
 * - DegenerateInputError  : std::domain_error    (zero variance, strict mode only)
 *
 * Empty inputs and invalid options are plain std::invalid_argument.
 */

class NotFittedError : public std::logic_error {
public:
	NotFittedError() : std::logic_error("Model is not yet fitted") {
	}
	explicit NotFittedError(const std::string &what) : std::logic_error(what) {
	}
};

class SingularMatrixError : public std::runtime_error {
public:
	explicit SingularMatrixError(const std::string &what) : std::runtime_error(what) {
	}
};

class DimensionMismatchError : public std::invalid_argument {
public:
	explicit DimensionMismatchError(const std::string &what) : std::invalid_argument(what) {
	}
};

class DegenerateInputError : public std::domain_error {
public:
	explicit DegenerateInputError(const std::string &what) : std::domain_error(what) {
	}
};

} // namespace core
} // namespace liblinreg
