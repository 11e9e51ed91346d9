#pragma once

#include "libeconreg/panel/panel_data.hpp"
#include "libeconreg/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>

namespace libeconreg {
namespace panel {

/// Neutralized copy of a panel together with its validity mask
struct NeutralizedPanel {
	PanelData data;
	PanelMask mask;
};

/**
 * Unbalanced panel neutralization
 *
 * A cell (t, i) with a non-finite y or any non-finite regressor has its
 * whole (y, x) row set to zero and is marked invalid. A zero row adds
 * nothing to X'X, X'y or any score sum, so the pooled estimator treats it
 * as absent while T and N keep their size.
 *
 * Neutralize() leaves the input untouched. NeutralizeInPlace() overwrites
 * the caller's panel and is the only mutating operation in the library.
 */
class UnbalancedPanel {
public:
	static NeutralizedPanel Neutralize(const PanelData &data) {
		NeutralizedPanel out;
		out.data = data;
		out.mask = NeutralizeInPlace(out.data);
		return out;
	}

	/// Zero invalid rows of data and return the mask
	static PanelMask NeutralizeInPlace(PanelData &data) {
		data.Validate();
		const Eigen::Index T = data.Periods();
		const Eigen::Index N = data.Units();

		PanelMask mask = PanelMask::Constant(T, N, true);
		Eigen::Index n_invalid = 0;
		for (Eigen::Index i = 0; i < N; i++) {
			Eigen::MatrixXd &xi = data.x[static_cast<size_t>(i)];
			for (Eigen::Index t = 0; t < T; t++) {
				if (std::isfinite(data.y(t, i)) && xi.row(t).allFinite()) {
					continue;
				}
				mask(t, i) = false;
				data.y(t, i) = 0.0;
				xi.row(t).setZero();
				n_invalid++;
			}
		}

		ECONREG_DEBUG("neutralized " << n_invalid << " of " << (T * N) << " panel cells");
		return mask;
	}

	/// Valid observations per period (Nb)
	static Eigen::VectorXi ObservationsPerPeriod(const PanelMask &mask) {
		return mask.cast<int>().rowwise().sum().matrix();
	}
};

} // namespace panel
} // namespace libeconreg
