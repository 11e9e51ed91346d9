#pragma once

#include "libeconreg/core/errors.hpp"
#include <Eigen/Dense>
#include <string>
#include <cstddef>

namespace libeconreg {
namespace utils {

/**
 * Shape checks shared by the estimators
 *
 * Every check throws core::DimensionMismatchError with the operation name
 * so the caller can tell which call rejected its inputs.
 */
class Validation {
public:
	/// rows(a) == rows(b)
	template <typename A, typename B>
	static void CheckSameRows(const Eigen::MatrixBase<A> &a, const Eigen::MatrixBase<B> &b, const std::string &a_name,
	                          const std::string &b_name, const std::string &operation) {
		if (a.rows() != b.rows()) {
			throw core::DimensionMismatchError(operation + ": " + a_name + " has " + std::to_string(a.rows()) +
			                                   " rows but " + b_name + " has " + std::to_string(b.rows()));
		}
	}

	/// At least one row and one column
	template <typename A>
	static void CheckNonEmpty(const Eigen::MatrixBase<A> &a, const std::string &name, const std::string &operation) {
		if (a.rows() == 0 || a.cols() == 0) {
			throw core::DimensionMismatchError(operation + ": " + name + " is empty (" + std::to_string(a.rows()) +
			                                   " x " + std::to_string(a.cols()) + ")");
		}
	}

	/// Exact shape
	template <typename A>
	static void CheckShape(const Eigen::MatrixBase<A> &a, Eigen::Index rows, Eigen::Index cols,
	                       const std::string &name, const std::string &operation) {
		if (a.rows() != rows || a.cols() != cols) {
			throw core::DimensionMismatchError(operation + ": " + name + " must be " + std::to_string(rows) + " x " +
			                                   std::to_string(cols) + " (got " + std::to_string(a.rows()) + " x " +
			                                   std::to_string(a.cols()) + ")");
		}
	}
};

} // namespace utils
} // namespace libeconreg
