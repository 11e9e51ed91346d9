#pragma once

#include "libeconreg/core/estimation_options.hpp"
#include "libeconreg/panel/panel_data.hpp"
#include "libeconreg/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace libeconreg {
namespace panel {

enum class FixedEffectsMode { INDIVIDUAL, TIME, BOTH };

/**
 * Fixed-effects (within) transform
 *
 * - INDIVIDUAL: subtract each unit's mean over time
 * - TIME: subtract each period's mean over units
 * - BOTH: two-way demeaning. Balanced: z - z̄_i - z̄_t + z̄.
 *   Masked: alternating unit/period demeaning over valid cells until the
 *   largest update falls below options.tolerance (at most max_iterations
 *   sweeps).
 *
 * With a mask every mean runs over valid cells only and invalid cells stay
 * zero. Columns that are constant within the demeaning groups (an
 * intercept in particular) become zero; RestoreConstant() refills one
 * when the caller wants it back.
 */
class FixedEffects {
public:
	static PanelData Transform(const PanelData &data, FixedEffectsMode mode, const PanelMask *mask = nullptr,
	                           const core::EstimationOptions &options = core::EstimationOptions());

	/// Set regressor column `column` to `value` in every (valid) cell
	static void RestoreConstant(PanelData &data, Eigen::Index column, double value, const PanelMask *mask = nullptr);

private:
	/// Demean one T × N slice in place; returns the largest absolute update
	static double DemeanUnits(Eigen::MatrixXd &z, const PanelMask *mask);
	static double DemeanPeriods(Eigen::MatrixXd &z, const PanelMask *mask);

	static void TransformSlice(Eigen::MatrixXd &z, FixedEffectsMode mode, const PanelMask *mask,
	                           const core::EstimationOptions &options);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double FixedEffects::DemeanUnits(Eigen::MatrixXd &z, const PanelMask *mask) {
	double max_update = 0.0;
	for (Eigen::Index i = 0; i < z.cols(); i++) {
		double sum = 0.0;
		Eigen::Index count = 0;
		for (Eigen::Index t = 0; t < z.rows(); t++) {
			if (mask == nullptr || (*mask)(t, i)) {
				sum += z(t, i);
				count++;
			}
		}
		if (count == 0) {
			continue;
		}
		const double mean = sum / static_cast<double>(count);
		for (Eigen::Index t = 0; t < z.rows(); t++) {
			if (mask == nullptr || (*mask)(t, i)) {
				z(t, i) -= mean;
			}
		}
		max_update = std::max(max_update, std::abs(mean));
	}
	return max_update;
}

inline double FixedEffects::DemeanPeriods(Eigen::MatrixXd &z, const PanelMask *mask) {
	double max_update = 0.0;
	for (Eigen::Index t = 0; t < z.rows(); t++) {
		double sum = 0.0;
		Eigen::Index count = 0;
		for (Eigen::Index i = 0; i < z.cols(); i++) {
			if (mask == nullptr || (*mask)(t, i)) {
				sum += z(t, i);
				count++;
			}
		}
		if (count == 0) {
			continue;
		}
		const double mean = sum / static_cast<double>(count);
		for (Eigen::Index i = 0; i < z.cols(); i++) {
			if (mask == nullptr || (*mask)(t, i)) {
				z(t, i) -= mean;
			}
		}
		max_update = std::max(max_update, std::abs(mean));
	}
	return max_update;
}

inline void FixedEffects::TransformSlice(Eigen::MatrixXd &z, FixedEffectsMode mode, const PanelMask *mask,
                                         const core::EstimationOptions &options) {
	if (mask != nullptr) {
		z = mask->select(z.array(), 0.0).matrix();
	}

	switch (mode) {
	case FixedEffectsMode::INDIVIDUAL:
		DemeanUnits(z, mask);
		return;
	case FixedEffectsMode::TIME:
		DemeanPeriods(z, mask);
		return;
	case FixedEffectsMode::BOTH:
		break;
	}

	if (mask == nullptr) {
		// Balanced: one pass of each projection is exact
		const double grand_mean = z.mean();
		Eigen::VectorXd period_means = z.rowwise().mean();
		Eigen::RowVectorXd unit_means = z.colwise().mean();
		z.colwise() -= period_means;
		z.rowwise() -= unit_means;
		z.array() += grand_mean;
		return;
	}

	double update = std::numeric_limits<double>::infinity();
	size_t sweep = 0;
	while (sweep < options.max_iterations) {
		update = std::max(DemeanUnits(z, mask), DemeanPeriods(z, mask));
		sweep++;
		if (!(update >= options.tolerance)) {
			break;
		}
	}
	if (update >= options.tolerance) {
		ECONREG_WARN("two-way fixed-effects projection stopped after " << sweep
		                                                               << " sweeps (last update " << update << ")");
	}
}

inline PanelData FixedEffects::Transform(const PanelData &data, FixedEffectsMode mode, const PanelMask *mask,
                                         const core::EstimationOptions &options) {
	options.Validate();
	data.Validate();
	if (mask != nullptr) {
		data.CheckMask(*mask);
	}

	const Eigen::Index T = data.Periods();
	const Eigen::Index N = data.Units();
	const Eigen::Index K = data.Regressors();

	ECONREG_DEBUG("fixed-effects transform: T=" << T << " N=" << N << " K=" << K
	                                            << " masked=" << (mask != nullptr));

	PanelData out = data;
	TransformSlice(out.y, mode, mask, options);

	// Regressor k across units as a T × N slice
	Eigen::MatrixXd slice(T, N);
	for (Eigen::Index k = 0; k < K; k++) {
		for (Eigen::Index i = 0; i < N; i++) {
			slice.col(i) = data.x[static_cast<size_t>(i)].col(k);
		}
		TransformSlice(slice, mode, mask, options);
		for (Eigen::Index i = 0; i < N; i++) {
			out.x[static_cast<size_t>(i)].col(k) = slice.col(i);
		}
	}
	return out;
}

inline void FixedEffects::RestoreConstant(PanelData &data, Eigen::Index column, double value, const PanelMask *mask) {
	data.Validate();
	if (column < 0 || column >= data.Regressors()) {
		throw core::DimensionMismatchError("constant column " + std::to_string(column) + " out of range for " +
		                                   std::to_string(data.Regressors()) + " regressors");
	}
	if (mask != nullptr) {
		data.CheckMask(*mask);
	}

	for (Eigen::Index i = 0; i < data.Units(); i++) {
		Eigen::MatrixXd &xi = data.x[static_cast<size_t>(i)];
		for (Eigen::Index t = 0; t < data.Periods(); t++) {
			xi(t, column) = (mask == nullptr || (*mask)(t, i)) ? value : 0.0;
		}
	}
}

} // namespace panel
} // namespace libeconreg
