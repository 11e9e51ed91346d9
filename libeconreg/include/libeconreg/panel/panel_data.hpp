#pragma once

#include "libeconreg/core/errors.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace libeconreg {
namespace panel {

/// Validity mask (T × N), true = usable observation
using PanelMask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

/**
 * Panel container: T periods, N units, K regressors
 *
 * y is T × N; x[i] is the T × K regressor block of unit i. Row t is the
 * same period in every unit.
 */
struct PanelData {
	Eigen::MatrixXd y;
	std::vector<Eigen::MatrixXd> x;

	Eigen::Index Periods() const {
		return y.rows();
	}

	Eigen::Index Units() const {
		return y.cols();
	}

	Eigen::Index Regressors() const {
		return x.empty() ? 0 : x.front().cols();
	}

	/**
	 * Check that every block agrees on T and K and there is one block per unit
	 *
	 * @throws core::InsufficientDataError on an empty panel
	 * @throws core::DimensionMismatchError on inconsistent shapes
	 */
	void Validate() const {
		if (Periods() == 0 || Units() == 0) {
			throw core::InsufficientDataError("panel has no observations (T = " + std::to_string(Periods()) +
			                                  ", N = " + std::to_string(Units()) + ")");
		}
		if (static_cast<Eigen::Index>(x.size()) != Units()) {
			throw core::DimensionMismatchError("panel has " + std::to_string(Units()) + " response columns but " +
			                                   std::to_string(x.size()) + " regressor blocks");
		}
		const Eigen::Index K = Regressors();
		if (K == 0) {
			throw core::InsufficientDataError("panel has no regressors");
		}
		for (size_t i = 0; i < x.size(); i++) {
			if (x[i].rows() != Periods() || x[i].cols() != K) {
				throw core::DimensionMismatchError("regressor block of unit " + std::to_string(i) + " is " +
				                                   std::to_string(x[i].rows()) + " x " + std::to_string(x[i].cols()) +
				                                   ", expected " + std::to_string(Periods()) + " x " +
				                                   std::to_string(K));
			}
		}
	}

	/// Mask shape must be T × N
	void CheckMask(const PanelMask &mask) const {
		if (mask.rows() != Periods() || mask.cols() != Units()) {
			throw core::DimensionMismatchError("panel mask is " + std::to_string(mask.rows()) + " x " +
			                                   std::to_string(mask.cols()) + ", expected " +
			                                   std::to_string(Periods()) + " x " + std::to_string(Units()));
		}
	}
};

} // namespace panel
} // namespace libeconreg
