#pragma once

#include "libeconreg/core/errors.hpp"
#include "libeconreg/core/estimation_options.hpp"
#include "libeconreg/core/estimation_result.hpp"
#include "libeconreg/covariance/long_run_covariance.hpp"
#include "libeconreg/utils/tracing.hpp"
#include "libeconreg/utils/validation.hpp"
#include <Eigen/Dense>
#include <limits>
#include <string>
#include <cmath>

namespace libeconreg {
namespace solvers {

/**
 * Least-squares solution of X B = Y shared by every linear estimator
 *
 * coefficients is k × n (one column per right-hand side), xtx_inverse is
 * (X'X)⁻¹ built from the triangular QR factor.
 */
struct LeastSquaresSolution {
	Eigen::MatrixXd coefficients;
	Eigen::MatrixXd xtx_inverse;
	size_t rank = 0;
	bool used_pseudo_inverse = false;
};

/**
 * Ordinary Least Squares (OLS) Regression Solver
 *
 * Uses Eigen's ColPivHouseholderQR decomposition, so X'X is never formed
 * and inverted to get the point estimate.
 *
 * Algorithm:
 * 1. QR decomposition with column pivoting: X*P = Q*R
 * 2. Numerical rank from R diagonal; rank < k is an error unless the
 *    caller opted into the pseudo-inverse fallback
 * 3. θ = R⁻¹ Q'y (mapped back through P)
 * 4. (X'X)⁻¹ = P R⁻¹ R⁻ᵀ P'
 * 5. Residuals, fitted values, R², σ̂² and the requested covariance
 *
 * Covariance:
 * - IID:    σ̂² (X'X)⁻¹
 * - Robust: Sxx⁻¹ S Sxx⁻¹ / T, Sxx = X'X/T, S = long-run covariance of u⊙X
 *
 * Non-finite inputs are not dropped: θ becomes NaN and every output
 * computed from it is NaN as well.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class OLSSolver {
public:
	/**
	 * Fit OLS regression with coefficient covariance
	 *
	 * @param y Response vector (length T)
	 * @param X Design matrix (T × k), intercept column supplied by the caller
	 * @param options robust_se / bandwidth select IID, White or Newey-West
	 * @return OLSResult
	 * @throws core::DimensionMismatchError if shapes disagree
	 * @throws core::RankDeficiencyError if X is rank-deficient (no pseudo-inverse requested)
	 */
	static core::OLSResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                           const core::EstimationOptions &options = core::EstimationOptions::IID());

	/**
	 * Solve X B = Y for every column of Y with one factorization
	 *
	 * @param failure_message Message of the RankDeficiencyError
	 */
	static LeastSquaresSolution Solve(const Eigen::MatrixXd &Y, const Eigen::MatrixXd &X,
	                                  const core::EstimationOptions &options,
	                                  const std::string &failure_message = "design matrix is rank-deficient");

	/// Row-wise scores u_t * x_t (T × k)
	static Eigen::MatrixXd ComputeScores(const Eigen::VectorXd &u, const Eigen::MatrixXd &X) {
		return (X.array().colwise() * u.array()).matrix();
	}

	/// Population variance (divisor T)
	static double Variance(const Eigen::VectorXd &v) {
		if (v.size() == 0) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		return (v.array() - v.mean()).square().mean();
	}

	/// 1 - Var(u)/Var(y); NaN when y has no variation
	static double RSquared(const Eigen::VectorXd &y, const Eigen::VectorXd &u) {
		const double var_y = Variance(y);
		if (!(var_y > 0.0)) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		return 1.0 - Variance(u) / var_y;
	}

	/// Residual sum of squares over T, or over T-k with the small-sample correction
	static double ResidualVariance(double ssr, size_t n_obs, size_t n_params, bool small_sample_correction) {
		if (!small_sample_correction) {
			return ssr / static_cast<double>(n_obs);
		}
		if (n_obs <= n_params) {
			// Saturated model: no degrees of freedom left
			return std::numeric_limits<double>::quiet_NaN();
		}
		return ssr / static_cast<double>(n_obs - n_params);
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline LeastSquaresSolution OLSSolver::Solve(const Eigen::MatrixXd &Y, const Eigen::MatrixXd &X,
                                             const core::EstimationOptions &options,
                                             const std::string &failure_message) {
	const Eigen::Index k = X.cols();
	LeastSquaresSolution solution;

	// NaN / Inf inputs propagate instead of being dropped
	if (!X.allFinite() || !Y.allFinite()) {
		ECONREG_DEBUG("non-finite values in least-squares input; results propagate NaN");
		const double nan = std::numeric_limits<double>::quiet_NaN();
		solution.coefficients = Eigen::MatrixXd::Constant(k, Y.cols(), nan);
		solution.xtx_inverse = Eigen::MatrixXd::Constant(k, k, nan);
		solution.rank = 0;
		return solution;
	}

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (options.rank_tolerance > 0.0) {
		qr.setThreshold(options.rank_tolerance);
	}
	solution.rank = static_cast<size_t>(qr.rank());

	if (qr.rank() < k) {
		if (!options.allow_pseudo_inverse) {
			throw core::RankDeficiencyError(failure_message + " (rank " + std::to_string(qr.rank()) + " < " +
			                                std::to_string(k) + ")");
		}

		ECONREG_WARN(failure_message << " (rank " << qr.rank() << " < " << k
		                             << "); using minimum-norm solution as requested");
		Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(X);
		solution.coefficients = cod.solve(Y);
		Eigen::MatrixXd XtX = X.transpose() * X;
		solution.xtx_inverse = XtX.completeOrthogonalDecomposition().pseudoInverse();
		solution.used_pseudo_inverse = true;
		return solution;
	}

	solution.coefficients = qr.solve(Y);

	// (X'X)⁻¹ = P R⁻¹ R⁻ᵀ P'
	Eigen::MatrixXd R = qr.matrixQR().topLeftCorner(k, k).triangularView<Eigen::Upper>();
	Eigen::MatrixXd R_inv = R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(k, k));
	Eigen::MatrixXd pivoted = R_inv * R_inv.transpose();
	const auto &P = qr.colsPermutation();
	solution.xtx_inverse = P * pivoted * P.transpose();

	return solution;
}

inline core::OLSResult OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                      const core::EstimationOptions &options) {
	options.Validate();
	utils::Validation::CheckNonEmpty(X, "X", "OLS");
	utils::Validation::CheckSameRows(y, X, "y", "X", "OLS");

	const auto T = static_cast<size_t>(X.rows());
	const auto k = static_cast<size_t>(X.cols());
	ECONREG_DEBUG("OLS fit: T=" << T << " k=" << k << " robust=" << options.robust_se
	                            << " bandwidth=" << options.bandwidth);

	LeastSquaresSolution solution = Solve(y, X, options);

	core::OLSResult result;
	result.n_obs = T;
	result.n_params = k;
	result.rank = solution.rank;
	result.used_pseudo_inverse = solution.used_pseudo_inverse;

	result.coefficients = solution.coefficients.col(0);
	result.fitted_values = X * result.coefficients;
	result.residuals = y - result.fitted_values;
	result.r_squared = RSquared(y, result.residuals);
	result.sigma2 = ResidualVariance(result.residuals.squaredNorm(), T, k, options.small_sample_correction);

	if (options.robust_se) {
		const size_t m = covariance::LongRunCovariance::EffectiveBandwidth(T, options.bandwidth, options);
		Eigen::MatrixXd S = covariance::LongRunCovariance::Compute(ComputeScores(result.residuals, X), m, options);
		Eigen::MatrixXd Sxx_inv = static_cast<double>(T) * solution.xtx_inverse;
		result.vcov = Sxx_inv * S * Sxx_inv / static_cast<double>(T);
		result.bandwidth_used = m;
		result.covariance_type = (m == 0) ? core::CovarianceType::WHITE : core::CovarianceType::NEWEY_WEST;
	} else {
		result.vcov = result.sigma2 * solution.xtx_inverse;
		result.covariance_type = core::CovarianceType::IID;
	}

	result.std_errors = core::StdErrorsFromCovariance(result.vcov);
	return result;
}

} // namespace solvers
} // namespace libeconreg
