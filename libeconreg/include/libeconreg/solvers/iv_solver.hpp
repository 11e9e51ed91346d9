#pragma once

#include "libeconreg/core/errors.hpp"
#include "libeconreg/core/estimation_options.hpp"
#include "libeconreg/core/estimation_result.hpp"
#include "libeconreg/covariance/long_run_covariance.hpp"
#include "libeconreg/solvers/ols_solver.hpp"
#include "libeconreg/utils/tracing.hpp"
#include "libeconreg/utils/validation.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace libeconreg {
namespace solvers {

/**
 * Two-Stage Least Squares (2SLS) Instrumental-Variables Solver
 *
 * Stage 1: regress every column of X on Z, δ = (Z'Z)⁻¹Z'X, X̂ = Zδ.
 *          Per-column R² and coefficient covariance are diagnostics only.
 * Stage 2: θ from the least-squares solution of X̂θ = y. Residuals and
 *          fitted values use the original X (structural residuals).
 *
 * Second-stage covariance, with Sxz = X'Z/T and Szz = Z'Z/T:
 *   B      = (Sxz Szz⁻¹ Szx)⁻¹ Sxz Szz⁻¹
 *   robust = B S B' / T,  S = long-run covariance of u⊙Z
 *   IID    = σ̂² (Sxz Szz⁻¹ Szx)⁻¹ / T
 *
 * With Z = X the estimator reduces to OLS.
 *
 * Failure: fewer instruments than regressors, a rank-deficient Z or a
 * rank-deficient X̂ raise RankDeficiencyError("instrument matrix insufficient rank").
 */
class IVSolver {
public:
	/**
	 * @param y Response (length T)
	 * @param X Regressors (T × k), exogenous ones included
	 * @param Z Instruments (T × L, L >= k), exogenous regressors included
	 * @param options robust_se / bandwidth select the covariance of both stages
	 */
	static core::IVResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, const Eigen::MatrixXd &Z,
	                          const core::EstimationOptions &options = core::EstimationOptions::IID());

	/// First-stage R² of one regressor: 1 when a column without variation is fitted exactly
	static double FirstStageRSquared(const Eigen::VectorXd &x, const Eigen::VectorXd &resid);

	/// A constant column counts as fitted exactly when ||resid||² <= this * max(1, ||x||²)
	static constexpr double kExactFitTolerance = 1e-20;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double IVSolver::FirstStageRSquared(const Eigen::VectorXd &x, const Eigen::VectorXd &resid) {
	const double var_x = OLSSolver::Variance(x);
	if (var_x > 0.0) {
		return 1.0 - OLSSolver::Variance(resid) / var_x;
	}
	// Intercept-like column: reproduced exactly by its own instrument
	if (resid.allFinite() && resid.squaredNorm() <= kExactFitTolerance * std::max(1.0, x.squaredNorm())) {
		return 1.0;
	}
	return std::numeric_limits<double>::quiet_NaN();
}

inline core::IVResult IVSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, const Eigen::MatrixXd &Z,
                                    const core::EstimationOptions &options) {
	static const char *kInsufficientRank = "instrument matrix insufficient rank";

	options.Validate();
	utils::Validation::CheckNonEmpty(X, "X", "2SLS");
	utils::Validation::CheckNonEmpty(Z, "Z", "2SLS");
	utils::Validation::CheckSameRows(y, X, "y", "X", "2SLS");
	utils::Validation::CheckSameRows(Z, X, "Z", "X", "2SLS");

	const auto T = static_cast<size_t>(X.rows());
	const Eigen::Index k = X.cols();
	const Eigen::Index L = Z.cols();
	const double dT = static_cast<double>(T);

	if (L < k) {
		throw core::RankDeficiencyError(std::string(kInsufficientRank) + " (" + std::to_string(L) +
		                                " instruments for " + std::to_string(k) + " regressors)");
	}

	ECONREG_DEBUG("2SLS fit: T=" << T << " k=" << k << " L=" << L << " robust=" << options.robust_se);

	// Z'Z must be invertible; no pseudo-inverse fallback for instruments
	core::EstimationOptions strict = options;
	strict.allow_pseudo_inverse = false;

	// Stage 1
	LeastSquaresSolution first = OLSSolver::Solve(X, Z, strict, kInsufficientRank);

	core::IVResult result;
	result.n_obs = T;
	result.n_params = static_cast<size_t>(k);
	result.n_instruments = static_cast<size_t>(L);
	result.first_stage_coefficients = first.coefficients;
	result.first_stage_fitted = Z * first.coefficients;
	Eigen::MatrixXd resx = X - result.first_stage_fitted;

	const size_t m = options.robust_se
	                     ? covariance::LongRunCovariance::EffectiveBandwidth(T, options.bandwidth, options)
	                     : 0;
	const Eigen::MatrixXd &Szz_inv_T = first.xtx_inverse; // (Z'Z)⁻¹ = Szz⁻¹ / T

	result.first_stage_r_squared.resize(k);
	result.first_stage_std_errors.resize(L, k);
	result.first_stage_vcov.reserve(static_cast<size_t>(k));
	for (Eigen::Index j = 0; j < k; j++) {
		result.first_stage_r_squared(j) = FirstStageRSquared(X.col(j), resx.col(j));

		Eigen::MatrixXd vcov_j;
		if (options.robust_se) {
			Eigen::MatrixXd S_j =
			    covariance::LongRunCovariance::Compute(OLSSolver::ComputeScores(resx.col(j), Z), m, options);
			Eigen::MatrixXd Szz_inv = dT * Szz_inv_T;
			vcov_j = Szz_inv * S_j * Szz_inv / dT;
		} else {
			const double sigma2_j = OLSSolver::ResidualVariance(resx.col(j).squaredNorm(), T,
			                                                    static_cast<size_t>(L), options.small_sample_correction);
			vcov_j = sigma2_j * Szz_inv_T;
		}
		result.first_stage_std_errors.col(j) = core::StdErrorsFromCovariance(vcov_j);
		result.first_stage_vcov.push_back(vcov_j);
	}

	// Stage 2
	LeastSquaresSolution second = OLSSolver::Solve(y, result.first_stage_fitted, strict, kInsufficientRank);
	result.coefficients = second.coefficients.col(0);
	result.fitted_values = X * result.coefficients;
	result.residuals = y - result.fitted_values;
	result.r_squared = OLSSolver::RSquared(y, result.residuals);
	result.sigma2 = OLSSolver::ResidualVariance(result.residuals.squaredNorm(), T, static_cast<size_t>(k),
	                                            options.small_sample_correction);

	// (Sxz Szz⁻¹ Szx)⁻¹ = T (X̂'X̂)⁻¹ since X'Z (Z'Z)⁻¹ Z'X = X̂'X̂
	Eigen::MatrixXd Sxz = X.transpose() * Z / dT;
	Eigen::MatrixXd Szz_inv = dT * Szz_inv_T;
	Eigen::MatrixXd A_inv = dT * second.xtx_inverse;

	if (options.robust_se) {
		Eigen::MatrixXd B = A_inv * Sxz * Szz_inv;
		Eigen::MatrixXd S =
		    covariance::LongRunCovariance::Compute(OLSSolver::ComputeScores(result.residuals, Z), m, options);
		result.vcov = B * S * B.transpose() / dT;
		result.bandwidth_used = m;
		result.covariance_type = (m == 0) ? core::CovarianceType::WHITE : core::CovarianceType::NEWEY_WEST;
	} else {
		result.vcov = result.sigma2 * A_inv / dT;
		result.covariance_type = core::CovarianceType::IID;
	}

	result.std_errors = core::StdErrorsFromCovariance(result.vcov);
	return result;
}

} // namespace solvers
} // namespace libeconreg
