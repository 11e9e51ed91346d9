#pragma once

#include "libeconreg/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>

namespace libeconreg {
namespace gmm {

/// Outcome of an iterative solver; x is the last iterate even when not converged
struct OptimizerResult {
	Eigen::VectorXd x;
	double value = std::numeric_limits<double>::quiet_NaN();
	size_t iterations = 0;
	bool converged = false;
};

/**
 * Damped Newton root finder for F(x) = 0 with a square Jacobian
 *
 * Each iteration solves J d = F with a full-pivoting LU and halves the
 * step until the sup-norm of F decreases. Converges when ||F||∞ < tolerance
 * or when the Newton step moves no coordinate by more than
 * tolerance * (1 + ||x||∞); the second test covers moments whose scale
 * keeps ||F||∞ at rounding level above an absolute tolerance. Stops
 * without converging when the Jacobian becomes singular or when
 * max_iterations is reached. value reports ||F(x)||∞ at the returned x.
 */
class NewtonRootFinder {
public:
	using ResidualFunction = std::function<Eigen::VectorXd(const Eigen::VectorXd &)>;
	using JacobianFunction = std::function<Eigen::MatrixXd(const Eigen::VectorXd &)>;

	static OptimizerResult Solve(const ResidualFunction &residual, const JacobianFunction &jacobian,
	                             const Eigen::VectorXd &x0, double tolerance, size_t max_iterations) {
		OptimizerResult result;
		result.x = x0;

		Eigen::VectorXd F = residual(result.x);
		double norm = F.cwiseAbs().maxCoeff();

		while (result.iterations < max_iterations) {
			if (norm < tolerance) {
				result.converged = true;
				break;
			}

			Eigen::MatrixXd J = jacobian(result.x);
			Eigen::FullPivLU<Eigen::MatrixXd> lu(J);
			if (!J.allFinite() || !lu.isInvertible()) {
				ECONREG_WARN("Newton root finder: singular Jacobian at iteration " << result.iterations);
				break;
			}
			Eigen::VectorXd d = lu.solve(F);
			const double step_limit = tolerance * (1.0 + result.x.cwiseAbs().maxCoeff());

			// Backtracking on ||F||∞
			double lambda = 1.0;
			bool accepted = false;
			Eigen::VectorXd x_new;
			Eigen::VectorXd F_new;
			for (int halving = 0; halving < 40; halving++) {
				x_new = result.x - lambda * d;
				F_new = residual(x_new);
				const double norm_new = F_new.cwiseAbs().maxCoeff();
				if (F_new.allFinite() && norm_new < norm) {
					accepted = true;
					norm = norm_new;
					break;
				}
				lambda *= 0.5;
			}

			result.iterations++;
			if (!accepted) {
				// F is at rounding level when the full step is already negligible
				if (d.allFinite() && d.cwiseAbs().maxCoeff() < step_limit) {
					result.converged = true;
				} else {
					ECONREG_DEBUG("Newton root finder: no decrease along the Newton direction at iteration "
					              << result.iterations);
				}
				break;
			}
			result.x = x_new;
			F = F_new;

			if (d.cwiseAbs().maxCoeff() < step_limit) {
				result.converged = true;
				break;
			}
		}

		if (!result.converged && norm < tolerance) {
			result.converged = true;
		}
		result.value = norm;
		return result;
	}
};

/**
 * BFGS minimizer with Armijo backtracking
 *
 * Line search and history update follow the usual quasi-Newton recipe; the
 * inverse Hessian is kept dense because GMM parameter vectors are small.
 * The caller provides the starting inverse Hessian (GMM passes the
 * Gauss-Newton curvature (2D'WD)⁻¹), so quadratic objectives converge in
 * one step.
 *
 * Converges when ||grad||∞ < tolerance or a step (accepted, or the full
 * step when the line search finds no decrease) moves no coordinate by more
 * than tolerance * (1 + ||x||∞).
 */
class BFGSMinimizer {
public:
	/// Returns f(x) and writes ∇f(x) into grad
	using Objective = std::function<double(const Eigen::VectorXd &x, Eigen::VectorXd &grad)>;

	static OptimizerResult Minimize(const Objective &objective, const Eigen::VectorXd &x0,
	                                const Eigen::MatrixXd &initial_inverse_hessian, double tolerance,
	                                size_t max_iterations) {
		const double armijo_c1 = 1e-4;
		const Eigen::Index k = x0.size();

		OptimizerResult result;
		result.x = x0;

		Eigen::VectorXd g(k);
		double f = objective(result.x, g);
		Eigen::MatrixXd H = initial_inverse_hessian;

		Eigen::VectorXd x_new(k);
		Eigen::VectorXd g_new(k);

		while (result.iterations < max_iterations) {
			if (!std::isfinite(f) || !g.allFinite()) {
				break;
			}
			if (g.cwiseAbs().maxCoeff() < tolerance) {
				result.converged = true;
				break;
			}

			Eigen::VectorXd d = -H * g;
			double g_dot_d = g.dot(d);
			if (!(g_dot_d < 0.0)) {
				// Lost positive definiteness: restart from the initial curvature
				H = initial_inverse_hessian;
				d = -H * g;
				g_dot_d = g.dot(d);
				if (!(g_dot_d < 0.0)) {
					d = -g;
					g_dot_d = -g.squaredNorm();
				}
			}

			double alpha = 1.0;
			bool accepted = false;
			double f_new = f;
			for (int i = 0; i < 40; i++) {
				x_new.noalias() = result.x + alpha * d;
				f_new = objective(x_new, g_new);
				if (std::isfinite(f_new) && f_new <= f + armijo_c1 * alpha * g_dot_d) {
					accepted = true;
					break;
				}
				alpha *= 0.5;
			}

			result.iterations++;
			if (!accepted) {
				if (d.cwiseAbs().maxCoeff() < tolerance * (1.0 + result.x.cwiseAbs().maxCoeff())) {
					result.converged = true;
				} else {
					ECONREG_DEBUG("BFGS: line search failed at iteration " << result.iterations);
				}
				break;
			}

			Eigen::VectorXd s = x_new - result.x;
			Eigen::VectorXd y = g_new - g;
			result.x = x_new;
			f = f_new;
			g = g_new;

			if (s.cwiseAbs().maxCoeff() < tolerance * (1.0 + result.x.cwiseAbs().maxCoeff())) {
				result.converged = true;
				break;
			}

			const double ys = y.dot(s);
			if (ys > 1e-12 * s.norm() * y.norm()) {
				const double rho = 1.0 / ys;
				Eigen::MatrixXd I = Eigen::MatrixXd::Identity(k, k);
				H = (I - rho * s * y.transpose()) * H * (I - rho * y * s.transpose()) + rho * s * s.transpose();
			}
		}

		if (!result.converged && g.allFinite() && g.cwiseAbs().maxCoeff() < tolerance) {
			result.converged = true;
		}
		result.value = f;
		return result;
	}
};

} // namespace gmm
} // namespace libeconreg
