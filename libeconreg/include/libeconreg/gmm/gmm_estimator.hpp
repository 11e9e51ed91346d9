#pragma once

#include "libeconreg/core/errors.hpp"
#include "libeconreg/core/estimation_options.hpp"
#include "libeconreg/core/estimation_result.hpp"
#include "libeconreg/covariance/long_run_covariance.hpp"
#include "libeconreg/gmm/moment_function.hpp"
#include "libeconreg/gmm/optimizers.hpp"
#include "libeconreg/utils/distributions.hpp"
#include "libeconreg/utils/tracing.hpp"
#include "libeconreg/utils/validation.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <string>

namespace libeconreg {
namespace gmm {

/// State of the iterated optimal-weighting loop
struct IterationState {
	Eigen::VectorXd theta;
	Eigen::MatrixXd weighting;
	size_t iteration = 0;
	double max_change = std::numeric_limits<double>::infinity();
	bool converged = false;
};

/**
 * Generalized Method of Moments Estimator
 *
 * The caller supplies g(θ) as a T × q matrix of moment contributions and a
 * JacobianStrategy for D = ∂ḡ/∂θ'. S is always the long-run covariance of
 * g(θ) at the estimate (bandwidth from options).
 *
 * Estimation modes:
 * - SolveExactlyIdentified: q == k, Newton on ḡ(θ) = 0, V = D⁻¹ S D⁻ᵀ / T
 * - Minimize: fixed W, BFGS on ḡ'Wḡ,
 *   V = (D'WD)⁻¹ D'WSWD (D'WD)⁻¹ / T
 * - IterateOptimalWeighting: W ← S(θ)⁻¹ until θ settles, V = (D'S⁻¹D)⁻¹ / T
 * - SolveWithSelection: Newton on Aḡ(θ) = 0 with A k × q,
 *   V = (AD)⁻¹ ASA' (AD)⁻ᵀ / T
 *
 * Over-identified fits (q > k) also report Hansen's J = T ḡ'S⁻¹ḡ with
 * q - k degrees of freedom. It is chi-squared only under optimal weighting.
 *
 * Non-convergence is reported through converged / status_message; the last
 * iterate is returned. Singular D'WD, AD or S (where inverted) raise
 * RankDeficiencyError.
 */
class GMMEstimator {
public:
	static core::GMMResult SolveExactlyIdentified(const MomentFunction &moments, const Eigen::VectorXd &theta0,
	                                              const JacobianStrategy &jacobian,
	                                              const core::EstimationOptions &options = core::EstimationOptions::GMM());

	static core::GMMResult Minimize(const MomentFunction &moments, const Eigen::VectorXd &theta0,
	                                const Eigen::MatrixXd &W, const JacobianStrategy &jacobian,
	                                const core::EstimationOptions &options = core::EstimationOptions::GMM());

	static core::GMMResult IterateOptimalWeighting(const MomentFunction &moments, const Eigen::VectorXd &theta0,
	                                               const Eigen::MatrixXd &W0, const JacobianStrategy &jacobian,
	                                               const core::EstimationOptions &options =
	                                                   core::EstimationOptions::GMM());

	static core::GMMResult SolveWithSelection(const MomentFunction &moments, const Eigen::VectorXd &theta0,
	                                          const Eigen::MatrixXd &A, const JacobianStrategy &jacobian,
	                                          const core::EstimationOptions &options = core::EstimationOptions::GMM());

	/**
	 * Evaluate g(θ) and check it against the parameter count
	 *
	 * @throws core::InsufficientDataError if g has no rows
	 * @throws core::DimensionMismatchError if q < k
	 */
	static Eigen::MatrixXd EvaluateMoments(const MomentFunction &moments, const Eigen::VectorXd &theta);

	/// Inverse of a square matrix; NaN when the input is not finite
	static Eigen::MatrixXd Inverse(const Eigen::MatrixXd &M, const std::string &what);

private:
	static OptimizerResult MinimizeObjective(const MomentFunction &moments, const Eigen::VectorXd &theta0,
	                                         const Eigen::MatrixXd &W, const JacobianStrategy &jacobian,
	                                         const core::EstimationOptions &options);

	/// Fill moments, Jacobian, S and the J statistic at θ
	static void Finalize(core::GMMResult &result, const MomentFunction &moments, const Eigen::VectorXd &theta,
	                     const JacobianStrategy &jacobian, const core::EstimationOptions &options);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::MatrixXd GMMEstimator::EvaluateMoments(const MomentFunction &moments, const Eigen::VectorXd &theta) {
	Eigen::MatrixXd g = moments(theta);
	if (g.rows() == 0) {
		throw core::InsufficientDataError("GMM moment function returned no observations");
	}
	if (g.cols() < theta.size()) {
		throw core::DimensionMismatchError("GMM is under-identified: " + std::to_string(g.cols()) + " moments for " +
		                                   std::to_string(theta.size()) + " parameters");
	}
	return g;
}

inline Eigen::MatrixXd GMMEstimator::Inverse(const Eigen::MatrixXd &M, const std::string &what) {
	if (!M.allFinite()) {
		return Eigen::MatrixXd::Constant(M.rows(), M.cols(), std::numeric_limits<double>::quiet_NaN());
	}
	Eigen::FullPivLU<Eigen::MatrixXd> lu(M);
	if (!lu.isInvertible()) {
		throw core::RankDeficiencyError(what + " is singular (rank " + std::to_string(lu.rank()) + " < " +
		                                std::to_string(M.rows()) + ")");
	}
	return lu.inverse();
}

inline void GMMEstimator::Finalize(core::GMMResult &result, const MomentFunction &moments,
                                   const Eigen::VectorXd &theta, const JacobianStrategy &jacobian,
                                   const core::EstimationOptions &options) {
	Eigen::MatrixXd g = EvaluateMoments(moments, theta);
	const auto T = static_cast<size_t>(g.rows());
	const Eigen::Index q = g.cols();
	const Eigen::Index k = theta.size();

	result.coefficients = theta;
	result.n_obs = T;
	result.n_params = static_cast<size_t>(k);
	result.n_moments = static_cast<size_t>(q);
	result.moment_means = MomentMeans(g);
	result.jacobian = jacobian.Compute(moments, theta);
	result.long_run_covariance = covariance::LongRunCovariance::Compute(g, options.bandwidth, options);

	if (q > k) {
		result.j_df = static_cast<size_t>(q - k);
		Eigen::FullPivLU<Eigen::MatrixXd> lu(result.long_run_covariance);
		if (result.long_run_covariance.allFinite() && lu.isInvertible()) {
			result.j_statistic = static_cast<double>(T) * result.moment_means.dot(lu.solve(result.moment_means));
			result.j_pvalue = utils::chi_squared_pvalue(result.j_statistic, static_cast<double>(result.j_df));
		} else {
			ECONREG_DEBUG("GMM: long-run covariance not invertible; J statistic not reported");
		}
	}
}

inline OptimizerResult GMMEstimator::MinimizeObjective(const MomentFunction &moments, const Eigen::VectorXd &theta0,
                                                       const Eigen::MatrixXd &W, const JacobianStrategy &jacobian,
                                                       const core::EstimationOptions &options) {
	// ∇(ḡ'Wḡ) = D'(W + W')ḡ
	const Eigen::MatrixXd W2 = W + W.transpose();

	BFGSMinimizer::Objective objective = [&](const Eigen::VectorXd &theta, Eigen::VectorXd &grad) {
		Eigen::VectorXd gbar = MomentMeans(moments(theta));
		Eigen::MatrixXd D = jacobian.Compute(moments, theta);
		grad = D.transpose() * (W2 * gbar);
		return gbar.dot(W * gbar);
	};

	// Gauss-Newton curvature at the start; exact for linear moments
	const Eigen::Index k = theta0.size();
	Eigen::MatrixXd H0 = Eigen::MatrixXd::Identity(k, k);
	Eigen::MatrixXd D0 = jacobian.Compute(moments, theta0);
	Eigen::MatrixXd curvature = D0.transpose() * W2 * D0;
	if (curvature.allFinite()) {
		Eigen::FullPivLU<Eigen::MatrixXd> lu(curvature);
		if (lu.isInvertible()) {
			H0 = lu.inverse();
		}
	}

	return BFGSMinimizer::Minimize(objective, theta0, H0, options.tolerance, options.optimizer_max_iterations);
}

inline core::GMMResult GMMEstimator::SolveWithSelection(const MomentFunction &moments, const Eigen::VectorXd &theta0,
                                                        const Eigen::MatrixXd &A, const JacobianStrategy &jacobian,
                                                        const core::EstimationOptions &options) {
	options.Validate();
	Eigen::MatrixXd g0 = EvaluateMoments(moments, theta0);
	const Eigen::Index k = theta0.size();
	const Eigen::Index q = g0.cols();

	utils::Validation::CheckShape(A, k, q, "selection matrix A", "GMM");

	ECONREG_DEBUG("GMM selection solve: T=" << g0.rows() << " q=" << q << " k=" << k);

	NewtonRootFinder::ResidualFunction residual = [&](const Eigen::VectorXd &theta) {
		return Eigen::VectorXd(A * MomentMeans(moments(theta)));
	};
	NewtonRootFinder::JacobianFunction residual_jacobian = [&](const Eigen::VectorXd &theta) {
		return Eigen::MatrixXd(A * jacobian.Compute(moments, theta));
	};

	OptimizerResult solved =
	    NewtonRootFinder::Solve(residual, residual_jacobian, theta0, options.tolerance, options.optimizer_max_iterations);

	core::GMMResult result;
	Finalize(result, moments, solved.x, jacobian, options);
	result.converged = solved.converged;
	result.iterations = solved.iterations;
	if (!solved.converged) {
		result.status_message = "GMM root finder failed to converge";
		ECONREG_WARN(result.status_message << " after " << solved.iterations << " iterations (|Ag| = " << solved.value
		                                   << ")");
	}

	const double dT = static_cast<double>(result.n_obs);
	Eigen::VectorXd Ag = A * result.moment_means;
	result.objective = Ag.squaredNorm();

	Eigen::MatrixXd AD_inv = Inverse(A * result.jacobian, "GMM Jacobian A*D");
	result.vcov = AD_inv * A * result.long_run_covariance * A.transpose() * AD_inv.transpose() / dT;
	result.std_errors = core::StdErrorsFromCovariance(result.vcov);
	return result;
}

inline core::GMMResult GMMEstimator::SolveExactlyIdentified(const MomentFunction &moments,
                                                            const Eigen::VectorXd &theta0,
                                                            const JacobianStrategy &jacobian,
                                                            const core::EstimationOptions &options) {
	options.Validate();
	Eigen::MatrixXd g0 = EvaluateMoments(moments, theta0);
	if (g0.cols() != theta0.size()) {
		throw core::DimensionMismatchError("exactly identified GMM requires as many moments as parameters (" +
		                                   std::to_string(g0.cols()) + " moments, " +
		                                   std::to_string(theta0.size()) + " parameters)");
	}
	return SolveWithSelection(moments, theta0, Eigen::MatrixXd::Identity(theta0.size(), theta0.size()), jacobian,
	                          options);
}

inline core::GMMResult GMMEstimator::Minimize(const MomentFunction &moments, const Eigen::VectorXd &theta0,
                                              const Eigen::MatrixXd &W, const JacobianStrategy &jacobian,
                                              const core::EstimationOptions &options) {
	options.Validate();
	Eigen::MatrixXd g0 = EvaluateMoments(moments, theta0);
	const Eigen::Index q = g0.cols();
	utils::Validation::CheckShape(W, q, q, "weighting matrix W", "GMM");

	ECONREG_DEBUG("GMM minimize: T=" << g0.rows() << " q=" << q << " k=" << theta0.size());

	OptimizerResult minimized = MinimizeObjective(moments, theta0, W, jacobian, options);

	core::GMMResult result;
	Finalize(result, moments, minimized.x, jacobian, options);
	result.weighting_matrix = W;
	result.objective = result.moment_means.dot(W * result.moment_means);
	result.converged = minimized.converged;
	result.iterations = minimized.iterations;
	if (!minimized.converged) {
		result.status_message = "GMM minimizer failed to converge";
		ECONREG_WARN(result.status_message << " after " << minimized.iterations << " iterations");
	}

	const double dT = static_cast<double>(result.n_obs);
	const Eigen::MatrixXd Ws = 0.5 * (W + W.transpose());
	const Eigen::MatrixXd &D = result.jacobian;
	Eigen::MatrixXd bread = Inverse(D.transpose() * Ws * D, "GMM matrix D'WD");
	Eigen::MatrixXd meat = D.transpose() * Ws * result.long_run_covariance * Ws * D;
	result.vcov = bread * meat * bread / dT;
	result.std_errors = core::StdErrorsFromCovariance(result.vcov);
	return result;
}

inline core::GMMResult GMMEstimator::IterateOptimalWeighting(const MomentFunction &moments,
                                                             const Eigen::VectorXd &theta0, const Eigen::MatrixXd &W0,
                                                             const JacobianStrategy &jacobian,
                                                             const core::EstimationOptions &options) {
	options.Validate();
	Eigen::MatrixXd g0 = EvaluateMoments(moments, theta0);
	const Eigen::Index q = g0.cols();
	utils::Validation::CheckShape(W0, q, q, "initial weighting matrix W0", "iterated GMM");

	ECONREG_DEBUG("GMM iterated weighting: T=" << g0.rows() << " q=" << q << " k=" << theta0.size()
	                                           << " max_iterations=" << options.max_iterations);
	ECONREG_TIMING_START();

	IterationState state;
	state.weighting = W0;
	OptimizerResult inner = MinimizeObjective(moments, theta0, W0, jacobian, options);
	state.theta = inner.x;

	while (state.iteration < options.max_iterations) {
		Eigen::MatrixXd S = covariance::LongRunCovariance::Compute(EvaluateMoments(moments, state.theta),
		                                                           options.bandwidth, options);
		state.weighting = Inverse(S, "GMM long-run covariance S");

		inner = MinimizeObjective(moments, state.theta, state.weighting, jacobian, options);
		state.iteration++;
		state.max_change = (inner.x - state.theta).cwiseAbs().maxCoeff();
		state.theta = inner.x;

		ECONREG_TRACE("GMM iteration " << state.iteration << ": max |Δθ| = " << state.max_change);

		if (state.max_change < options.tolerance) {
			state.converged = true;
			break;
		}
		if (!std::isfinite(state.max_change)) {
			break;
		}
	}

	ECONREG_TIMING_END("GMM iterated weighting");

	core::GMMResult result;
	Finalize(result, moments, state.theta, jacobian, options);
	result.weighting_matrix = state.weighting;
	result.objective = result.moment_means.dot(state.weighting * result.moment_means);
	result.iterations = state.iteration;
	result.converged = state.converged && inner.converged;
	if (!state.converged) {
		result.status_message = "GMM iteration failed to converge within max iterations";
		ECONREG_WARN(result.status_message << " (" << state.iteration << " iterations, last max |Δθ| = "
		                                   << state.max_change << ")");
	} else if (!inner.converged) {
		result.status_message = "GMM minimizer failed to converge";
		ECONREG_WARN(result.status_message << " in the final weighting iteration");
	}

	const double dT = static_cast<double>(result.n_obs);
	const Eigen::MatrixXd &D = result.jacobian;
	Eigen::MatrixXd S_inv = Inverse(result.long_run_covariance, "GMM long-run covariance S");
	result.vcov = Inverse(D.transpose() * S_inv * D, "GMM matrix D'S⁻¹D") / dT;
	result.std_errors = core::StdErrorsFromCovariance(result.vcov);
	return result;
}

} // namespace gmm
} // namespace libeconreg
