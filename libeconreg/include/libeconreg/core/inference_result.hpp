#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <limits>

namespace libeconreg {
namespace core {

/**
 * Asymptotic inference for a coefficient vector
 *
 * All statistics use the standard normal reference distribution; NaN
 * entries mark coefficients whose variance is unavailable.
 */
struct CoefficientInferenceResult {
	/// sqrt(diag(V)) (length k)
	Eigen::VectorXd std_errors;

	/// θ_j / SE_j
	Eigen::VectorXd z_statistics;

	/// Two-sided p-values for H0: θ_j = 0
	Eigen::VectorXd p_values;

	/// θ_j ∓ z_{(1+level)/2} SE_j
	Eigen::VectorXd ci_lower;
	Eigen::VectorXd ci_upper;

	double confidence_level = 0.95;

	CoefficientInferenceResult() = default;

	explicit CoefficientInferenceResult(size_t n_params, double conf_level = 0.95) : confidence_level(conf_level) {
		const auto k = static_cast<Eigen::Index>(n_params);
		const double nan = std::numeric_limits<double>::quiet_NaN();
		std_errors = Eigen::VectorXd::Constant(k, nan);
		z_statistics = Eigen::VectorXd::Constant(k, nan);
		p_values = Eigen::VectorXd::Constant(k, nan);
		ci_lower = Eigen::VectorXd::Constant(k, nan);
		ci_upper = Eigen::VectorXd::Constant(k, nan);
	}
};

/// Wald test of H0: Rθ = r
struct WaldTestResult {
	double statistic = std::numeric_limits<double>::quiet_NaN();
	double p_value = std::numeric_limits<double>::quiet_NaN();
	size_t df = 0;
};

} // namespace core
} // namespace libeconreg
