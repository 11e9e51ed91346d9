#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <stdexcept>

namespace libeconreg {
namespace core {

/**
 * Configuration options shared by all estimators
 *
 * One structure configures OLS, SURE, 2SLS, GMM and the pooled panel
 * estimator. Every default is explicit here; no estimator substitutes a
 * different value after a failure.
 *
 * Design notes:
 * - All defaults specified in-class
 * - Validate() rejects invalid values before any computation starts
 * - Factories cover the common covariance choices
 */
struct EstimationOptions {
	// ========================================================================
	// Covariance estimation
	// ========================================================================

	/// Use the kernel (White / Newey-West) covariance instead of IID
	/// Default: false (IID / Gauss-Markov covariance)
	bool robust_se = false;

	/// Newey-West lag bandwidth m
	/// - bandwidth = 0: White (heteroskedasticity only)
	/// - bandwidth > 0: Bartlett-weighted autocovariances up to lag m
	/// Also used by the Driscoll-Kraay panel covariance and by GMM's S.
	/// Default: 0
	size_t bandwidth = 0;

	/// Clamp a bandwidth larger than T-1 down to T-1 (logged at WARN)
	/// When false, such a request raises InsufficientDataError.
	/// Default: true
	bool clamp_bandwidth = true;

	/// Divide residual sums of squares by T-k instead of T
	/// Default: false (large-sample scaling)
	bool small_sample_correction = false;

	// ========================================================================
	// Linear algebra
	// ========================================================================

	/// Fall back to the minimum-norm (pseudo-inverse) solution for a
	/// rank-deficient design instead of raising RankDeficiencyError
	/// Default: false
	bool allow_pseudo_inverse = false;

	/// QR rank threshold (-1 = auto, use Eigen default)
	/// Default: -1.0
	double rank_tolerance = -1.0;

	// ========================================================================
	// Iterative algorithms (GMM, root finding, minimization, two-way FE)
	// ========================================================================

	/// Convergence tolerance (sup-norm of the parameter change / moments)
	/// Default: 1e-8
	double tolerance = 1e-8;

	/// Cap on outer iterations (GMM re-weighting, alternating projections)
	/// Default: 100
	size_t max_iterations = 100;

	/// Cap on inner iterations of the Newton root finder / BFGS minimizer
	/// Default: 500
	size_t optimizer_max_iterations = 500;

	// ========================================================================
	// Constructors
	// ========================================================================

	EstimationOptions() = default;

	/// Homoskedastic, serially uncorrelated errors
	static EstimationOptions IID() {
		EstimationOptions opts;
		opts.robust_se = false;
		opts.bandwidth = 0;
		return opts;
	}

	/// Heteroskedasticity-robust covariance
	static EstimationOptions White() {
		EstimationOptions opts;
		opts.robust_se = true;
		opts.bandwidth = 0;
		return opts;
	}

	/// Heteroskedasticity and autocorrelation robust covariance
	static EstimationOptions NeweyWest(size_t bandwidth_) {
		EstimationOptions opts;
		opts.robust_se = true;
		opts.bandwidth = bandwidth_;
		return opts;
	}

	/// Options for GMM estimation
	static EstimationOptions GMM(double tolerance_ = 1e-8, size_t max_iterations_ = 100, size_t bandwidth_ = 0) {
		EstimationOptions opts;
		opts.robust_se = true;
		opts.tolerance = tolerance_;
		opts.max_iterations = max_iterations_;
		opts.bandwidth = bandwidth_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (!(tolerance > 0.0)) {
			throw std::invalid_argument("tolerance must be positive (got " + std::to_string(tolerance) + ")");
		}

		if (max_iterations == 0) {
			throw std::invalid_argument("max_iterations must be positive");
		}

		if (optimizer_max_iterations == 0) {
			throw std::invalid_argument("optimizer_max_iterations must be positive");
		}
	}
};

} // namespace core
} // namespace libeconreg
