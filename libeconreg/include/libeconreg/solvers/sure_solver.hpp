#pragma once

#include "libeconreg/core/estimation_options.hpp"
#include "libeconreg/core/estimation_result.hpp"
#include "libeconreg/covariance/long_run_covariance.hpp"
#include "libeconreg/solvers/ols_solver.hpp"
#include "libeconreg/utils/tracing.hpp"
#include "libeconreg/utils/validation.hpp"
#include <Eigen/Dense>

namespace libeconreg {
namespace solvers {

/**
 * Seemingly-Unrelated Regressions with a shared design matrix
 *
 * With identical regressors in every equation, joint GLS collapses to
 * equation-by-equation OLS, so the point estimates come from one QR of X
 * solved against all n response columns. Only the covariance is joint.
 *
 * Stacking contract: θ = vec(B) for the k × n coefficient matrix B, so
 * stacked entry i*k + j is regressor j of equation i. Restriction matrices
 * for Wald tests must use the same order.
 *
 * Covariance:
 * - IID:    Σ̂ ⊗ (X'X)⁻¹ with Σ̂ = U'U/T
 * - Robust: (I_n ⊗ Sxx⁻¹) S (I_n ⊗ Sxx⁻¹) / T where S is the long-run
 *           covariance of g_t = u_t ⊗ x_t (T × nk)
 *
 * With n = 1 every output equals OLSSolver::Fit.
 */
class SURESolver {
public:
	/**
	 * @param Y Responses (T × n), one column per equation
	 * @param X Shared design matrix (T × k)
	 * @param options robust_se / bandwidth select the covariance
	 * @throws core::DimensionMismatchError if shapes disagree
	 * @throws core::RankDeficiencyError if X is rank-deficient
	 */
	static core::SUREResult Fit(const Eigen::MatrixXd &Y, const Eigen::MatrixXd &X,
	                            const core::EstimationOptions &options = core::EstimationOptions::IID());

	/// Cross-equation scores: row t is u_t ⊗ x_t (T × nk)
	static Eigen::MatrixXd ComputeScores(const Eigen::MatrixXd &U, const Eigen::MatrixXd &X);

	/// A ⊗ B
	static Eigen::MatrixXd Kronecker(const Eigen::MatrixXd &A, const Eigen::MatrixXd &B);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::MatrixXd SURESolver::Kronecker(const Eigen::MatrixXd &A, const Eigen::MatrixXd &B) {
	Eigen::MatrixXd K(A.rows() * B.rows(), A.cols() * B.cols());
	for (Eigen::Index i = 0; i < A.rows(); i++) {
		for (Eigen::Index j = 0; j < A.cols(); j++) {
			K.block(i * B.rows(), j * B.cols(), B.rows(), B.cols()) = A(i, j) * B;
		}
	}
	return K;
}

inline Eigen::MatrixXd SURESolver::ComputeScores(const Eigen::MatrixXd &U, const Eigen::MatrixXd &X) {
	const Eigen::Index k = X.cols();
	Eigen::MatrixXd g(X.rows(), U.cols() * k);
	// One output block per equation
	for (Eigen::Index i = 0; i < U.cols(); i++) {
		g.middleCols(i * k, k) = OLSSolver::ComputeScores(U.col(i), X);
	}
	return g;
}

inline core::SUREResult SURESolver::Fit(const Eigen::MatrixXd &Y, const Eigen::MatrixXd &X,
                                        const core::EstimationOptions &options) {
	options.Validate();
	utils::Validation::CheckNonEmpty(X, "X", "SURE");
	utils::Validation::CheckNonEmpty(Y, "Y", "SURE");
	utils::Validation::CheckSameRows(Y, X, "Y", "X", "SURE");

	const auto T = static_cast<size_t>(X.rows());
	const Eigen::Index k = X.cols();
	const Eigen::Index n = Y.cols();
	ECONREG_DEBUG("SURE fit: T=" << T << " k=" << k << " equations=" << n << " robust=" << options.robust_se);

	LeastSquaresSolution solution = OLSSolver::Solve(Y, X, options);

	core::SUREResult result;
	result.n_obs = T;
	result.n_params = static_cast<size_t>(k);
	result.n_equations = static_cast<size_t>(n);
	result.coefficients = solution.coefficients;
	result.fitted_values = X * result.coefficients;
	result.residuals = Y - result.fitted_values;

	result.r_squared.resize(n);
	for (Eigen::Index i = 0; i < n; i++) {
		result.r_squared(i) = OLSSolver::RSquared(Y.col(i), result.residuals.col(i));
	}

	const double dof = options.small_sample_correction ? static_cast<double>(static_cast<Eigen::Index>(T) - k)
	                                                   : static_cast<double>(T);
	result.residual_covariance = result.residuals.transpose() * result.residuals / dof;
	if (options.small_sample_correction && static_cast<Eigen::Index>(T) <= k) {
		result.residual_covariance.setConstant(std::numeric_limits<double>::quiet_NaN());
	}

	if (options.robust_se) {
		const size_t m = covariance::LongRunCovariance::EffectiveBandwidth(T, options.bandwidth, options);
		Eigen::MatrixXd S = covariance::LongRunCovariance::Compute(ComputeScores(result.residuals, X), m, options);

		// I_n ⊗ Sxx⁻¹ is block diagonal
		Eigen::MatrixXd Sxx_inv = static_cast<double>(T) * solution.xtx_inverse;
		Eigen::MatrixXd bread = Eigen::MatrixXd::Zero(n * k, n * k);
		for (Eigen::Index i = 0; i < n; i++) {
			bread.block(i * k, i * k, k, k) = Sxx_inv;
		}
		result.vcov = bread * S * bread / static_cast<double>(T);
		result.bandwidth_used = m;
		result.covariance_type = (m == 0) ? core::CovarianceType::WHITE : core::CovarianceType::NEWEY_WEST;
	} else {
		result.vcov = Kronecker(result.residual_covariance, solution.xtx_inverse);
		result.covariance_type = core::CovarianceType::IID;
	}

	result.std_errors = core::StdErrorsFromCovariance(result.vcov);
	return result;
}

} // namespace solvers
} // namespace libeconreg
