#pragma once

#include <stdexcept>
#include <string>

namespace libeconreg {
namespace core {

/**
 * Error taxonomy for estimator calls
 *
 * All estimators validate their inputs before computing anything, so an
 * exception always means no partial result was produced.
 *
 * - DimensionMismatchError: matrix shapes are incompatible
 * - RankDeficiencyError: a matrix that must be inverted or factored is singular
 * - InsufficientDataError: too few observations / clusters for the request
 *
 * Non-convergence of iterative routines is NOT an exception: results carry a
 * `converged` flag and the last iterate. NaN inputs are not errors either;
 * they propagate to NaN outputs.
 */
class DimensionMismatchError : public std::invalid_argument {
public:
	explicit DimensionMismatchError(const std::string &message) : std::invalid_argument(message) {
	}
};

class RankDeficiencyError : public std::runtime_error {
public:
	explicit RankDeficiencyError(const std::string &message) : std::runtime_error(message) {
	}
};

class InsufficientDataError : public std::invalid_argument {
public:
	explicit InsufficientDataError(const std::string &message) : std::invalid_argument(message) {
	}
};

} // namespace core
} // namespace libeconreg
