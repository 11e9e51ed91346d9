#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libeconreg/gmm/gmm_estimator.hpp"
#include "libeconreg/gmm/moment_function.hpp"
#include "libeconreg/inference/coefficient_inference.hpp"
#include "libeconreg/panel/fixed_effects.hpp"
#include "libeconreg/panel/pooled_panel_solver.hpp"
#include "libeconreg/panel/unbalanced_panel.hpp"
#include "libeconreg/solvers/iv_solver.hpp"
#include "libeconreg/solvers/ols_solver.hpp"
#include "libeconreg/solvers/sure_solver.hpp"
#include "panel/panel_fixtures.hpp"
#include "test_data.hpp"

#include <cmath>

using namespace libeconreg;
using Catch::Matchers::WithinAbs;
using test::json;

TEST_CASE("Integration: Exact line through OLS and inference", "[integration][workflow]") {
	json c = test::LoadReferenceCases()["ols_exact_line"];
	Eigen::VectorXd y = test::ToVector(c["y"]);
	Eigen::MatrixXd X = test::WithIntercept(test::ToVector(c["x"]));

	auto result = solvers::OLSSolver::Fit(y, X);
	REQUIRE_THAT(result.coefficients(0), WithinAbs(1.0, 1e-12));
	REQUIRE_THAT(result.coefficients(1), WithinAbs(1.0, 1e-12));
	REQUIRE_THAT(result.r_squared, WithinAbs(1.0, 1e-12));
	REQUIRE(result.residuals.cwiseAbs().maxCoeff() < 1e-12);

	// A perfect fit has no sampling variance to test against
	auto inf = inference::CoefficientInference::Compute(result.coefficients, result.vcov);
	REQUIRE(inf.std_errors.cwiseAbs().maxCoeff() < 1e-12);
}

TEST_CASE("Integration: Method of moments for mean and variance", "[integration][workflow][gmm]") {
	json c = test::LoadReferenceCases()["gmm_mean_variance"];
	Eigen::VectorXd x = test::ToVector(c["x"]);
	Eigen::VectorXd theta0 = test::ToVector(c["theta0"]);

	gmm::MomentFunction moments = [x](const Eigen::VectorXd &theta) {
		Eigen::MatrixXd g(x.size(), 2);
		Eigen::ArrayXd dev = x.array() - theta(0);
		g.col(0) = dev.matrix();
		g.col(1) = (dev.square() - theta(1)).matrix();
		return g;
	};

	auto result = gmm::GMMEstimator::SolveExactlyIdentified(moments, theta0, gmm::FiniteDifferenceJacobian());
	REQUIRE(result.converged);
	REQUIRE_THAT(result.coefficients(0), WithinAbs(3.0, 1e-8));
	REQUIRE_THAT(result.coefficients(1), WithinAbs(2.0, 1e-8));
	REQUIRE(result.moment_means.cwiseAbs().maxCoeff() < 1e-8);

	auto inf = inference::CoefficientInference::Compute(result.coefficients, result.vcov);
	Eigen::VectorXd se = test::ToVector(c["std_errors"]);
	REQUIRE_THAT(inf.std_errors(0), WithinAbs(se(0), 1e-6));
	REQUIRE_THAT(inf.std_errors(1), WithinAbs(se(1), 1e-6));
	REQUIRE(inf.p_values(0) < 0.001);
}

TEST_CASE("Integration: Unbalanced two-way panel", "[integration][workflow][panel]") {
	panel::PanelData raw = test::MakePanel(30, 6, 2718);
	for (auto &xi : raw.x) {
		Eigen::MatrixXd slope = xi.rightCols(1);
		xi = slope;
	}
	raw.y(3, 0) = std::nan("");
	raw.y(17, 4) = std::nan("");
	raw.x[5](29, 0) = std::nan("");

	panel::NeutralizedPanel neutral = panel::UnbalancedPanel::Neutralize(raw);
	REQUIRE(neutral.mask.count() == 177);

	core::EstimationOptions opts;
	opts.bandwidth = 3;
	opts.tolerance = 1e-12;
	opts.max_iterations = 2000;
	panel::PanelData within =
	    panel::FixedEffects::Transform(neutral.data, panel::FixedEffectsMode::BOTH, &neutral.mask, opts);
	auto fit = panel::PooledPanelSolver::Fit(within, opts, &neutral.mask);

	REQUIRE(fit.n_obs == 177);
	REQUIRE(fit.obs_per_period(3) == 5);
	REQUIRE(fit.obs_per_period(29) == 5);
	REQUIRE(fit.bandwidth_used == 3);

	for (auto type : {core::PanelCovarianceType::TRADITIONAL, core::PanelCovarianceType::WHITE,
	                  core::PanelCovarianceType::CLUSTER, core::PanelCovarianceType::DRISCOLL_KRAAY}) {
		const Eigen::MatrixXd &V = fit.Covariance(type);
		REQUIRE(V.rows() == 1);
		REQUIRE(V(0, 0) > 0.0);
	}

	auto inf = inference::CoefficientInference::Compute(fit.coefficients, fit.vcov_white);
	REQUIRE(std::abs(fit.coefficients(0) - 0.5) < 5.0 * inf.std_errors(0));
	REQUIRE(inf.p_values(0) < 0.01);
	REQUIRE(inf.ci_lower(0) < fit.coefficients(0));
	REQUIRE(inf.ci_upper(0) > fit.coefficients(0));
}

TEST_CASE("Integration: Cross-equation restriction after SURE", "[integration][workflow][sure]") {
	test::DeterministicNormal rng(17);
	const Eigen::Index T = 150;
	Eigen::MatrixXd X(T, 2);
	X.col(0).setOnes();
	X.col(1) = rng.Vector(T);
	Eigen::VectorXd common = rng.Vector(T);

	Eigen::MatrixXd Y(T, 2);
	Y.col(0) = (1.0 + 0.7 * X.col(1).array() + common.array() + 0.5 * rng.Vector(T).array()).matrix();
	Y.col(1) = (-1.0 + 0.7 * X.col(1).array() + common.array() + 0.5 * rng.Vector(T).array()).matrix();

	auto fit = solvers::SURESolver::Fit(Y, X, core::EstimationOptions::NeweyWest(2));
	Eigen::VectorXd theta = fit.StackedCoefficients();
	REQUIRE(theta.size() == 4);

	// Slopes are equal across equations: R θ = 0 with R = [0 1 0 -1]
	Eigen::MatrixXd R = Eigen::MatrixXd::Zero(1, 4);
	R(0, 1) = 1.0;
	R(0, 3) = -1.0;
	auto wald = inference::CoefficientInference::WaldTest(theta, fit.vcov, R, Eigen::VectorXd::Zero(1));
	REQUIRE(wald.df == 1);
	REQUIRE(std::isfinite(wald.statistic));
	REQUIRE(wald.p_value >= 0.0);
	REQUIRE(wald.p_value <= 1.0);

	// Intercepts clearly differ
	R.setZero();
	R(0, 0) = 1.0;
	R(0, 2) = -1.0;
	auto intercepts = inference::CoefficientInference::WaldTest(theta, fit.vcov, R, Eigen::VectorXd::Zero(1));
	REQUIRE(intercepts.p_value < 1e-6);
}

TEST_CASE("Integration: 2SLS and linear GMM agree", "[integration][workflow][iv]") {
	json c = test::LoadReferenceCases()["iv_overidentified"];
	Eigen::VectorXd y = test::ToVector(c["y"]);
	Eigen::MatrixXd X = test::WithIntercept(test::ToVector(c["x"]));
	Eigen::VectorXd z1 = test::ToVector(c["z1"]);
	Eigen::VectorXd z2 = test::ToVector(c["z2"]);
	Eigen::MatrixXd Z(y.size(), 3);
	Z.col(0).setOnes();
	Z.col(1) = z1;
	Z.col(2) = z2;

	auto iv = solvers::IVSolver::Fit(y, X, Z, core::EstimationOptions::White());

	gmm::MomentFunction moments = [y, X, Z](const Eigen::VectorXd &theta) {
		Eigen::VectorXd u = y - X * theta;
		return Eigen::MatrixXd((Z.array().colwise() * u.array()).matrix());
	};
	const double dT = static_cast<double>(y.size());
	Eigen::MatrixXd W = (Z.transpose() * Z / dT).inverse();
	auto fit = gmm::GMMEstimator::Minimize(moments, Eigen::VectorXd::Zero(2), W, gmm::FiniteDifferenceJacobian());

	REQUIRE(fit.converged);
	REQUIRE((fit.coefficients - iv.coefficients).cwiseAbs().maxCoeff() < 1e-6);
	REQUIRE((fit.std_errors - iv.std_errors).cwiseAbs().maxCoeff() < 1e-6);
	REQUIRE(fit.j_df == 1);
	REQUIRE(std::isfinite(fit.j_statistic));
}
