#pragma once

#include <Eigen/Dense>
#include <vector>
#include <string>
#include <cstddef>
#include <cmath>
#include <limits>

namespace libeconreg {
namespace core {

/// Which asymptotic covariance an estimator reported
enum class CovarianceType { IID, WHITE, NEWEY_WEST };

inline const char *CovarianceTypeName(CovarianceType type) {
	switch (type) {
	case CovarianceType::IID:
		return "iid";
	case CovarianceType::WHITE:
		return "white";
	case CovarianceType::NEWEY_WEST:
		return "newey_west";
	default:
		return "unknown";
	}
}

/// Square roots of the diagonal of a covariance matrix (NaN stays NaN)
inline Eigen::VectorXd StdErrorsFromCovariance(const Eigen::MatrixXd &vcov) {
	Eigen::VectorXd se(vcov.rows());
	for (Eigen::Index i = 0; i < vcov.rows(); i++) {
		se(i) = std::sqrt(vcov(i, i));
	}
	return se;
}

/**
 * Result of a single-equation OLS fit
 *
 * Shapes: T observations, k regressors.
 */
struct OLSResult {
	/// Coefficient vector θ (length k), ordered as the columns of X
	Eigen::VectorXd coefficients;

	/// Residuals y - Xθ (length T)
	Eigen::VectorXd residuals;

	/// Fitted values Xθ (length T)
	Eigen::VectorXd fitted_values;

	/// Coefficient covariance (k × k), variant given by covariance_type
	Eigen::MatrixXd vcov;

	/// sqrt(diag(vcov)) (length k)
	Eigen::VectorXd std_errors;

	/// 1 - Var(u) / Var(y)
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Residual variance u'u/T (or u'u/(T-k) with small-sample correction)
	double sigma2 = std::numeric_limits<double>::quiet_NaN();

	CovarianceType covariance_type = CovarianceType::IID;

	/// Bandwidth actually used after clamping (0 for IID / White)
	size_t bandwidth_used = 0;

	/// True if the minimum-norm solution was used for a rank-deficient X
	bool used_pseudo_inverse = false;

	size_t n_obs = 0;
	size_t n_params = 0;
	size_t rank = 0;
};

/**
 * Result of a seemingly-unrelated regression system with shared regressors
 *
 * Shapes: T observations, k regressors, n equations.
 * Stacked coefficient ordering: entry i*k + j is regressor j of equation i.
 */
struct SUREResult {
	/// Coefficients (k × n), column i belongs to equation i
	Eigen::MatrixXd coefficients;

	/// Residuals (T × n)
	Eigen::MatrixXd residuals;

	/// Fitted values (T × n)
	Eigen::MatrixXd fitted_values;

	/// Joint covariance of the stacked coefficients (nk × nk)
	Eigen::MatrixXd vcov;

	/// sqrt(diag(vcov)) in stacked order (length nk)
	Eigen::VectorXd std_errors;

	/// Cross-equation residual covariance U'U/T (n × n)
	Eigen::MatrixXd residual_covariance;

	/// Per-equation R² (length n)
	Eigen::VectorXd r_squared;

	CovarianceType covariance_type = CovarianceType::IID;
	size_t bandwidth_used = 0;

	size_t n_obs = 0;
	size_t n_params = 0;
	size_t n_equations = 0;

	/// vec(coefficients): equation-major stacking (length nk)
	Eigen::VectorXd StackedCoefficients() const {
		Eigen::VectorXd stacked(coefficients.size());
		for (Eigen::Index i = 0; i < coefficients.cols(); i++) {
			stacked.segment(i * coefficients.rows(), coefficients.rows()) = coefficients.col(i);
		}
		return stacked;
	}
};

/**
 * Result of a two-stage least squares fit
 *
 * Shapes: T observations, k regressors, L instruments.
 */
struct IVResult {
	/// Second-stage coefficients (length k)
	Eigen::VectorXd coefficients;

	/// Structural residuals y - Xθ using the original X (length T)
	Eigen::VectorXd residuals;

	/// Xθ using the original X (length T)
	Eigen::VectorXd fitted_values;

	/// Second-stage covariance (k × k)
	Eigen::MatrixXd vcov;

	/// sqrt(diag(vcov)) (length k)
	Eigen::VectorXd std_errors;

	/// 1 - Var(u) / Var(y); may be negative for IV fits
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Structural residual variance
	double sigma2 = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// First stage (diagnostics only)
	// ========================================================================

	/// δ (L × k): column j regresses X_j on Z
	Eigen::MatrixXd first_stage_coefficients;

	/// X̂ = Zδ (T × k)
	Eigen::MatrixXd first_stage_fitted;

	/// R² of each X column against its own fitted values (length k)
	Eigen::VectorXd first_stage_r_squared;

	/// Standard errors of δ (L × k)
	Eigen::MatrixXd first_stage_std_errors;

	/// Covariance of each δ column (k entries of L × L)
	std::vector<Eigen::MatrixXd> first_stage_vcov;

	CovarianceType covariance_type = CovarianceType::IID;
	size_t bandwidth_used = 0;

	size_t n_obs = 0;
	size_t n_params = 0;
	size_t n_instruments = 0;
};

/**
 * Result of a GMM estimation
 *
 * Shapes: T observations, k parameters, q moment conditions.
 */
struct GMMResult {
	/// Parameter estimate θ (length k); the last iterate if not converged
	Eigen::VectorXd coefficients;

	/// Asymptotic covariance of θ (k × k)
	Eigen::MatrixXd vcov;

	/// sqrt(diag(vcov)) (length k)
	Eigen::VectorXd std_errors;

	/// Column means of g(θ) (length q)
	Eigen::VectorXd moment_means;

	/// D = ∂ḡ/∂θ' at θ (q × k)
	Eigen::MatrixXd jacobian;

	/// Weighting matrix used for the final θ (q × q); empty for root finding
	Eigen::MatrixXd weighting_matrix;

	/// Long-run covariance S of the moments at θ (q × q)
	Eigen::MatrixXd long_run_covariance;

	/// ḡ'Wḡ at θ; (Aḡ)'(Aḡ) for the root-finding forms (≈ 0 at a solution)
	double objective = std::numeric_limits<double>::quiet_NaN();

	/// Hansen J = T ḡ'S⁻¹ḡ (over-identified fits only)
	double j_statistic = std::numeric_limits<double>::quiet_NaN();
	double j_pvalue = std::numeric_limits<double>::quiet_NaN();
	size_t j_df = 0;

	/// Convergence state of the outermost loop
	bool converged = false;
	size_t iterations = 0;
	std::string status_message;

	size_t n_obs = 0;
	size_t n_params = 0;
	size_t n_moments = 0;
};

/// Panel covariance variants computed by one pooled fit
enum class PanelCovarianceType { TRADITIONAL, WHITE, CLUSTER, DRISCOLL_KRAAY };

/**
 * Result of a pooled panel regression
 *
 * Shapes: T periods, N units, K regressors.
 */
struct PanelResult {
	/// Pooled coefficient vector θ (length K)
	Eigen::VectorXd coefficients;

	/// Residuals e_{t,i} (T × N); zero at neutralized cells
	Eigen::MatrixXd residuals;

	/// Fitted values x_{t,i}'θ (T × N)
	Eigen::MatrixXd fitted_values;

	/// Valid observations per period Nb (length T)
	Eigen::VectorXi obs_per_period;

	/// σ̂²(X'X)⁻¹
	Eigen::MatrixXd vcov_traditional;

	/// Heteroskedasticity only
	Eigen::MatrixXd vcov_white;

	/// Arbitrary dependence within clusters of units
	Eigen::MatrixXd vcov_cluster;

	/// Cross-sectional plus serial dependence
	Eigen::MatrixXd vcov_driscoll_kraay;

	/// Pseudo-R² over valid observations
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Residual variance over valid observations
	double sigma2 = std::numeric_limits<double>::quiet_NaN();

	size_t bandwidth_used = 0;
	size_t n_clusters = 0;
	size_t n_obs = 0;
	size_t n_periods = 0;
	size_t n_units = 0;
	size_t n_params = 0;

	const Eigen::MatrixXd &Covariance(PanelCovarianceType type) const {
		switch (type) {
		case PanelCovarianceType::WHITE:
			return vcov_white;
		case PanelCovarianceType::CLUSTER:
			return vcov_cluster;
		case PanelCovarianceType::DRISCOLL_KRAAY:
			return vcov_driscoll_kraay;
		case PanelCovarianceType::TRADITIONAL:
		default:
			return vcov_traditional;
		}
	}
};

} // namespace core
} // namespace libeconreg
