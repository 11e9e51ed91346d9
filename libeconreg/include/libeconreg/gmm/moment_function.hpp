#pragma once

#include "libeconreg/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace libeconreg {
namespace gmm {

/// g(θ): returns the T × q matrix of moment contributions, row t for period t
using MomentFunction = std::function<Eigen::MatrixXd(const Eigen::VectorXd &theta)>;

/// D(θ) = ∂ḡ/∂θ' (q × k) supplied analytically by the caller
using JacobianFunction = std::function<Eigen::MatrixXd(const Eigen::VectorXd &theta)>;

/// ḡ: column means of a moment matrix (length q)
inline Eigen::VectorXd MomentMeans(const Eigen::MatrixXd &g) {
	return g.colwise().mean().transpose();
}

/**
 * JacobianStrategy: how D = ∂ḡ/∂θ' is obtained
 *
 * The caller picks the strategy explicitly and passes it to every
 * GMMEstimator call:
 * - AnalyticalJacobian wraps a caller-supplied derivative
 * - FiniteDifferenceJacobian differentiates the moment function numerically
 *
 * MaxDiscrepancy() compares two strategies at a point, which is how an
 * analytical derivative is checked against finite differences.
 */
class JacobianStrategy {
public:
	virtual ~JacobianStrategy() = default;

	/// Strategy name for logging ("analytical", "finite_difference")
	virtual std::string GetName() const = 0;

	/**
	 * Evaluate D at θ
	 *
	 * @param moments Moment function g(θ)
	 * @param theta Parameter vector (length k)
	 * @return q × k matrix
	 */
	virtual Eigen::MatrixXd Compute(const MomentFunction &moments, const Eigen::VectorXd &theta) const = 0;

	/// Largest absolute elementwise difference between two strategies at θ
	static double MaxDiscrepancy(const JacobianStrategy &a, const JacobianStrategy &b, const MomentFunction &moments,
	                             const Eigen::VectorXd &theta) {
		Eigen::MatrixXd Da = a.Compute(moments, theta);
		Eigen::MatrixXd Db = b.Compute(moments, theta);
		if (Da.rows() != Db.rows() || Da.cols() != Db.cols()) {
			throw core::DimensionMismatchError("Jacobian strategies '" + a.GetName() + "' and '" + b.GetName() +
			                                   "' disagree on shape");
		}
		return (Da - Db).cwiseAbs().maxCoeff();
	}
};

class AnalyticalJacobian : public JacobianStrategy {
public:
	explicit AnalyticalJacobian(JacobianFunction jacobian) : jacobian_(std::move(jacobian)) {
		if (!jacobian_) {
			throw std::invalid_argument("AnalyticalJacobian requires a callable");
		}
	}

	std::string GetName() const override {
		return "analytical";
	}

	Eigen::MatrixXd Compute(const MomentFunction &, const Eigen::VectorXd &theta) const override {
		Eigen::MatrixXd D = jacobian_(theta);
		if (D.cols() != theta.size()) {
			throw core::DimensionMismatchError("analytical Jacobian has " + std::to_string(D.cols()) +
			                                   " columns for " + std::to_string(theta.size()) + " parameters");
		}
		return D;
	}

private:
	JacobianFunction jacobian_;
};

/**
 * Central finite differences of ḡ
 *
 * Step for parameter j: step (if positive) or cbrt(machine epsilon) * max(1, |θ_j|).
 */
class FiniteDifferenceJacobian : public JacobianStrategy {
public:
	explicit FiniteDifferenceJacobian(double step = -1.0) : step_(step) {
		if (step != -1.0 && !(step > 0.0)) {
			throw std::invalid_argument("finite difference step must be positive or -1 (got " + std::to_string(step) +
			                            ")");
		}
	}

	std::string GetName() const override {
		return "finite_difference";
	}

	Eigen::MatrixXd Compute(const MomentFunction &moments, const Eigen::VectorXd &theta) const override {
		const Eigen::Index k = theta.size();
		const double auto_scale = std::cbrt(std::numeric_limits<double>::epsilon());

		Eigen::MatrixXd D;
		Eigen::VectorXd shifted = theta;
		for (Eigen::Index j = 0; j < k; j++) {
			const double h = (step_ > 0.0) ? step_ : auto_scale * std::max(1.0, std::abs(theta(j)));

			shifted(j) = theta(j) + h;
			Eigen::VectorXd upper = MomentMeans(moments(shifted));
			shifted(j) = theta(j) - h;
			Eigen::VectorXd lower = MomentMeans(moments(shifted));
			shifted(j) = theta(j);

			if (j == 0) {
				D.resize(upper.size(), k);
			}
			D.col(j) = (upper - lower) / (2.0 * h);
		}
		return D;
	}

private:
	double step_;
};

} // namespace gmm
} // namespace libeconreg
