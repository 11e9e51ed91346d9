#pragma once

#include "libeconreg/core/errors.hpp"
#include "libeconreg/core/estimation_result.hpp"
#include "libeconreg/core/inference_result.hpp"
#include "libeconreg/utils/distributions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <string>

namespace libeconreg {
namespace inference {

/**
 * CoefficientInference: hypothesis tests from (θ, V)
 *
 * Works with the coefficients and covariance of any estimator result:
 * - SE_j = sqrt(V_jj)
 * - z_j = θ_j / SE_j ~ N(0, 1) asymptotically
 * - p_j = 2 (1 - Φ(|z_j|))
 * - CI_j = θ_j ± z_{(1+level)/2} SE_j
 *
 * WaldTest: W = (Rθ - r)'(RVR')⁻¹(Rθ - r) ~ χ²(rows(R)).
 */
class CoefficientInference {
public:
	static core::CoefficientInferenceResult Compute(const Eigen::VectorXd &theta, const Eigen::MatrixXd &V,
	                                                double confidence_level = 0.95);

	/**
	 * @param R Restriction matrix (m × k)
	 * @param r Restricted values (length m)
	 * @throws core::DimensionMismatchError on incompatible shapes
	 * @throws core::RankDeficiencyError if RVR' is singular
	 */
	static core::WaldTestResult WaldTest(const Eigen::VectorXd &theta, const Eigen::MatrixXd &V,
	                                     const Eigen::MatrixXd &R, const Eigen::VectorXd &r);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::CoefficientInferenceResult CoefficientInference::Compute(const Eigen::VectorXd &theta,
                                                                      const Eigen::MatrixXd &V,
                                                                      double confidence_level) {
	if (V.rows() != theta.size() || V.cols() != theta.size()) {
		throw core::DimensionMismatchError("covariance must be " + std::to_string(theta.size()) + " x " +
		                                   std::to_string(theta.size()) + " (got " + std::to_string(V.rows()) +
		                                   " x " + std::to_string(V.cols()) + ")");
	}
	if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
		throw std::invalid_argument("confidence_level must be in (0, 1) (got " + std::to_string(confidence_level) +
		                            ")");
	}

	core::CoefficientInferenceResult result(static_cast<size_t>(theta.size()), confidence_level);
	result.std_errors = core::StdErrorsFromCovariance(V);

	const double z_crit = utils::normal_quantile(0.5 * (1.0 + confidence_level));
	for (Eigen::Index j = 0; j < theta.size(); j++) {
		const double se = result.std_errors(j);
		if (!(se > 0.0) || !std::isfinite(se)) {
			continue;
		}
		result.z_statistics(j) = theta(j) / se;
		result.p_values(j) = utils::normal_two_sided_pvalue(result.z_statistics(j));
		result.ci_lower(j) = theta(j) - z_crit * se;
		result.ci_upper(j) = theta(j) + z_crit * se;
	}
	return result;
}

inline core::WaldTestResult CoefficientInference::WaldTest(const Eigen::VectorXd &theta, const Eigen::MatrixXd &V,
                                                           const Eigen::MatrixXd &R, const Eigen::VectorXd &r) {
	if (R.cols() != theta.size()) {
		throw core::DimensionMismatchError("restriction matrix has " + std::to_string(R.cols()) + " columns for " +
		                                   std::to_string(theta.size()) + " coefficients");
	}
	if (R.rows() != r.size()) {
		throw core::DimensionMismatchError("restriction matrix has " + std::to_string(R.rows()) + " rows but r has " +
		                                   std::to_string(r.size()) + " entries");
	}
	if (V.rows() != theta.size() || V.cols() != theta.size()) {
		throw core::DimensionMismatchError("covariance must be " + std::to_string(theta.size()) + " x " +
		                                   std::to_string(theta.size()));
	}

	core::WaldTestResult result;
	result.df = static_cast<size_t>(R.rows());

	Eigen::VectorXd diff = R * theta - r;
	Eigen::MatrixXd middle = R * V * R.transpose();
	if (!middle.allFinite() || !diff.allFinite()) {
		return result;
	}

	Eigen::FullPivLU<Eigen::MatrixXd> lu(middle);
	if (!lu.isInvertible()) {
		throw core::RankDeficiencyError("Wald test matrix RVR' is singular");
	}
	result.statistic = diff.dot(lu.solve(diff));
	result.p_value = utils::chi_squared_pvalue(result.statistic, static_cast<double>(result.df));
	return result;
}

} // namespace inference
} // namespace libeconreg
