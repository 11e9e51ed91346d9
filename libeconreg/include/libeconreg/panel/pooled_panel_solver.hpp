#pragma once

#include "libeconreg/core/errors.hpp"
#include "libeconreg/core/estimation_options.hpp"
#include "libeconreg/core/estimation_result.hpp"
#include "libeconreg/covariance/long_run_covariance.hpp"
#include "libeconreg/panel/panel_data.hpp"
#include "libeconreg/panel/unbalanced_panel.hpp"
#include "libeconreg/solvers/ols_solver.hpp"
#include "libeconreg/utils/tracing.hpp"
#include <Eigen/Dense>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace libeconreg {
namespace panel {

/**
 * Pooled panel OLS with four coefficient covariances
 *
 * All T·N observations are stacked unit-major (row i·T + t) and solved
 * with the shared QR least-squares path. With scores s_{t,i} = e_{t,i} x_{t,i}:
 *
 *   Traditional:     σ̂² (X'X)⁻¹
 *   White:           (X'X)⁻¹ [Σ_{t,i} s s'] (X'X)⁻¹
 *   Cluster:         (X'X)⁻¹ [Σ_c (Σ_{i∈c,t} s)(Σ_{i∈c,t} s)'] (X'X)⁻¹
 *   Driscoll-Kraay:  T (X'X)⁻¹ S_h (X'X)⁻¹, S_h = long-run covariance of
 *                    h_t = Σ_i s_{t,i} with options.bandwidth
 *
 * small_sample_correction divides the residual sum of squares by n-K
 * instead of n and scales the cluster meat by G/(G-1)·(n-1)/(n-K).
 *
 * Unbalanced panels: pass the mask returned by UnbalancedPanel. Masked cells
 * must already be zero; they add nothing to any sum and are excluded from
 * n, σ̂² and R². Driscoll-Kraay does not rescale h_t by the number of valid
 * units in period t. Without a mask, NaN cells propagate to every output.
 */
class PooledPanelSolver {
public:
	/**
	 * @param data Panel (T × N response, N blocks of T × K regressors)
	 * @param options bandwidth drives Driscoll-Kraay; rank handling as in OLS
	 * @param mask Validity mask from neutralization, or nullptr
	 * @param cluster_ids One id per unit; empty clusters by unit
	 *        (a single-unit panel then reports a NaN cluster covariance)
	 * @throws core::InsufficientDataError if cluster_ids name fewer than two clusters
	 * @throws std::invalid_argument if a masked cell is not neutralized
	 */
	static core::PanelResult Fit(const PanelData &data,
	                             const core::EstimationOptions &options = core::EstimationOptions(),
	                             const PanelMask *mask = nullptr, const std::vector<int> &cluster_ids = {});

	/// Map caller cluster ids to 0..G-1 (one id per unit)
	static std::vector<size_t> ClusterIndex(const std::vector<int> &cluster_ids, Eigen::Index n_units,
	                                        size_t &n_clusters);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::vector<size_t> PooledPanelSolver::ClusterIndex(const std::vector<int> &cluster_ids, Eigen::Index n_units,
                                                           size_t &n_clusters) {
	std::vector<size_t> index(static_cast<size_t>(n_units));
	if (cluster_ids.empty()) {
		for (size_t i = 0; i < index.size(); i++) {
			index[i] = i;
		}
		n_clusters = index.size();
		return index;
	}

	if (static_cast<Eigen::Index>(cluster_ids.size()) != n_units) {
		throw core::DimensionMismatchError("cluster ids must have one entry per unit (" + std::to_string(n_units) +
		                                   "), got " + std::to_string(cluster_ids.size()));
	}

	std::map<int, size_t> lookup;
	for (size_t i = 0; i < cluster_ids.size(); i++) {
		auto it = lookup.find(cluster_ids[i]);
		if (it == lookup.end()) {
			it = lookup.emplace(cluster_ids[i], lookup.size()).first;
		}
		index[i] = it->second;
	}
	n_clusters = lookup.size();
	return index;
}

inline core::PanelResult PooledPanelSolver::Fit(const PanelData &data, const core::EstimationOptions &options,
                                                const PanelMask *mask, const std::vector<int> &cluster_ids) {
	options.Validate();
	data.Validate();

	const Eigen::Index T = data.Periods();
	const Eigen::Index N = data.Units();
	const Eigen::Index K = data.Regressors();
	const double dT = static_cast<double>(T);

	if (mask != nullptr) {
		data.CheckMask(*mask);
		for (Eigen::Index i = 0; i < N; i++) {
			for (Eigen::Index t = 0; t < T; t++) {
				if (!(*mask)(t, i) &&
				    (data.y(t, i) != 0.0 || !data.x[static_cast<size_t>(i)].row(t).isZero(0.0))) {
					throw std::invalid_argument("masked panel cell (t = " + std::to_string(t) + ", unit = " +
					                            std::to_string(i) + ") is not neutralized");
				}
			}
		}
	}

	size_t n_clusters = 0;
	std::vector<size_t> cluster_of = ClusterIndex(cluster_ids, N, n_clusters);
	if (n_clusters < 2 && !cluster_ids.empty()) {
		throw core::InsufficientDataError("cluster covariance requires at least two clusters (got " +
		                                  std::to_string(n_clusters) + ")");
	}

	const size_t m = covariance::LongRunCovariance::EffectiveBandwidth(static_cast<size_t>(T), options.bandwidth,
	                                                                   options);

	ECONREG_DEBUG("pooled panel fit: T=" << T << " N=" << N << " K=" << K << " clusters=" << n_clusters
	                                     << " bandwidth=" << m << " masked=" << (mask != nullptr));

	// Stack unit-major
	Eigen::VectorXd y(T * N);
	Eigen::MatrixXd X(T * N, K);
	for (Eigen::Index i = 0; i < N; i++) {
		y.segment(i * T, T) = data.y.col(i);
		X.middleRows(i * T, T) = data.x[static_cast<size_t>(i)];
	}

	solvers::LeastSquaresSolution solution =
	    solvers::OLSSolver::Solve(y, X, options, "pooled panel design matrix is rank-deficient");
	const Eigen::VectorXd theta = solution.coefficients.col(0);
	const Eigen::VectorXd fitted = X * theta;
	const Eigen::VectorXd u = y - fitted;

	core::PanelResult result;
	result.coefficients = theta;
	result.residuals = Eigen::Map<const Eigen::MatrixXd>(u.data(), T, N);
	result.fitted_values = Eigen::Map<const Eigen::MatrixXd>(fitted.data(), T, N);
	if (mask != nullptr) {
		result.obs_per_period = UnbalancedPanel::ObservationsPerPeriod(*mask);
	} else {
		result.obs_per_period = Eigen::VectorXi::Constant(T, static_cast<int>(N));
	}
	result.n_obs = static_cast<size_t>(result.obs_per_period.sum());
	result.n_periods = static_cast<size_t>(T);
	result.n_units = static_cast<size_t>(N);
	result.n_params = static_cast<size_t>(K);
	result.n_clusters = n_clusters;
	result.bandwidth_used = m;

	if (result.n_obs == 0) {
		throw core::InsufficientDataError("pooled panel has no valid observations");
	}

	// Valid cells only for R² and σ̂²
	Eigen::VectorXd y_valid(result.n_obs);
	Eigen::VectorXd u_valid(result.n_obs);
	Eigen::Index n = 0;
	for (Eigen::Index r = 0; r < T * N; r++) {
		if (mask == nullptr || (*mask)(r % T, r / T)) {
			y_valid(n) = y(r);
			u_valid(n) = u(r);
			n++;
		}
	}
	result.r_squared = solvers::OLSSolver::RSquared(y_valid, u_valid);
	result.sigma2 = solvers::OLSSolver::ResidualVariance(u_valid.squaredNorm(), result.n_obs, result.n_params,
	                                                     options.small_sample_correction);

	const Eigen::MatrixXd &XtX_inv = solution.xtx_inverse;
	const Eigen::MatrixXd scores = solvers::OLSSolver::ComputeScores(u, X);

	result.vcov_traditional = result.sigma2 * XtX_inv;

	Eigen::MatrixXd meat_white = scores.transpose() * scores;
	result.vcov_white = XtX_inv * meat_white * XtX_inv;

	Eigen::MatrixXd cluster_sums = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(n_clusters), K);
	Eigen::MatrixXd h = Eigen::MatrixXd::Zero(T, K);
	for (Eigen::Index i = 0; i < N; i++) {
		auto block = scores.middleRows(i * T, T);
		cluster_sums.row(static_cast<Eigen::Index>(cluster_of[static_cast<size_t>(i)])) += block.colwise().sum();
		h += block;
	}
	Eigen::MatrixXd meat_cluster = cluster_sums.transpose() * cluster_sums;
	if (options.small_sample_correction && result.n_obs > result.n_params) {
		const double G = static_cast<double>(n_clusters);
		const double dn = static_cast<double>(result.n_obs);
		meat_cluster *= (G / (G - 1.0)) * ((dn - 1.0) / (dn - static_cast<double>(K)));
	}
	if (n_clusters < 2) {
		ECONREG_WARN("single-unit panel: cluster covariance is undefined and reported as NaN");
		result.vcov_cluster = Eigen::MatrixXd::Constant(K, K, std::numeric_limits<double>::quiet_NaN());
	} else {
		result.vcov_cluster = XtX_inv * meat_cluster * XtX_inv;
	}

	Eigen::MatrixXd S_h = covariance::LongRunCovariance::Compute(h, m, options);
	result.vcov_driscoll_kraay = dT * XtX_inv * S_h * XtX_inv;

	return result;
}

} // namespace panel
} // namespace libeconreg
