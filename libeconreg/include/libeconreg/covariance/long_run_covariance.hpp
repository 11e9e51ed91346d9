#pragma once

#include "libeconreg/core/errors.hpp"
#include "libeconreg/core/estimation_options.hpp"
#include "libeconreg/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <string>

namespace libeconreg {
namespace covariance {

/**
 * Long-run covariance of a set of score / moment series
 *
 * Given a T × q score matrix g (row t is the time-t contribution to q moment
 * conditions) returns the q × q estimate of Var(sqrt(T) * mean(g)):
 *
 *   S = (1/T) [ Γ0 + Σ_{s=1..m} (1 - s/(m+1)) (Γs + Γs') ]
 *   Γs = Σ_{t=s+1..T} g_t g_{t-s}'      (g demeaned first)
 *
 * Special cases:
 * - m = 0: heteroskedasticity-robust (White)
 * - m > 0: Newey-West with Bartlett weights; S is positive semi-definite
 *          for every m
 *
 * Every robust covariance in the library (OLS, SURE, 2SLS, GMM and the
 * Driscoll-Kraay panel covariance) goes through Compute().
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - NaN scores propagate to a NaN S
 */
class LongRunCovariance {
public:
	/**
	 * Newey-West / White long-run covariance
	 *
	 * @param g Score matrix (T × q), q may be 1
	 * @param bandwidth Lag truncation m
	 * @param options clamp_bandwidth decides between clamping m to T-1 and failing
	 * @return q × q matrix S
	 * @throws core::InsufficientDataError if T = 0, or m > T-1 without clamping
	 */
	static Eigen::MatrixXd Compute(const Eigen::MatrixXd &g, size_t bandwidth,
	                               const core::EstimationOptions &options = core::EstimationOptions());

	/// Heteroskedasticity-only case, identical to Compute(g, 0)
	static Eigen::MatrixXd White(const Eigen::MatrixXd &g);

	/**
	 * Bandwidth after clamping to T-1
	 *
	 * @throws core::InsufficientDataError if T = 0, or m > T-1 and clamping is disabled
	 */
	static size_t EffectiveBandwidth(size_t n_obs, size_t bandwidth,
	                                 const core::EstimationOptions &options = core::EstimationOptions());

	/// Bartlett kernel weight 1 - lag/(m+1)
	static double BartlettWeight(size_t lag, size_t bandwidth) {
		return 1.0 - static_cast<double>(lag) / static_cast<double>(bandwidth + 1);
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline size_t LongRunCovariance::EffectiveBandwidth(size_t n_obs, size_t bandwidth,
                                                    const core::EstimationOptions &options) {
	if (n_obs == 0) {
		throw core::InsufficientDataError("insufficient observations for requested bandwidth (T = 0)");
	}

	if (bandwidth <= n_obs - 1) {
		return bandwidth;
	}

	if (!options.clamp_bandwidth) {
		throw core::InsufficientDataError("insufficient observations for requested bandwidth (T = " +
		                                  std::to_string(n_obs) + ", bandwidth = " + std::to_string(bandwidth) + ")");
	}

	ECONREG_WARN("bandwidth " << bandwidth << " exceeds T-1 = " << (n_obs - 1) << "; clamped to " << (n_obs - 1));
	return n_obs - 1;
}

inline Eigen::MatrixXd LongRunCovariance::Compute(const Eigen::MatrixXd &g, size_t bandwidth,
                                                  const core::EstimationOptions &options) {
	const auto T = static_cast<size_t>(g.rows());
	const size_t m = EffectiveBandwidth(T, bandwidth, options);

	// Demean the scores
	Eigen::MatrixXd gc = g.rowwise() - g.colwise().mean();

	// Lag-0 term
	Eigen::MatrixXd S = gc.transpose() * gc;

	// Bartlett-weighted symmetrized autocovariances
	for (size_t s = 1; s <= m; s++) {
		// Γs pairs rows s..T-1 with rows 0..T-s-1
		const auto len = static_cast<Eigen::Index>(T - s);
		Eigen::MatrixXd gamma = gc.bottomRows(len).transpose() * gc.topRows(len);
		S += BartlettWeight(s, m) * (gamma + gamma.transpose());
	}

	S /= static_cast<double>(T);

	ECONREG_TRACE("long-run covariance: T=" << T << " q=" << g.cols() << " m=" << m);
	return S;
}

inline Eigen::MatrixXd LongRunCovariance::White(const Eigen::MatrixXd &g) {
	return Compute(g, 0);
}

} // namespace covariance
} // namespace libeconreg
