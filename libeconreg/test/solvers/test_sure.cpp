#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libeconreg/solvers/ols_solver.hpp"
#include "libeconreg/solvers/sure_solver.hpp"
#include "test_data.hpp"

using namespace libeconreg;
using namespace libeconreg::solvers;
using Catch::Matchers::WithinAbs;

namespace {

struct SystemData {
	Eigen::MatrixXd X;
	Eigen::MatrixXd Y;
};

SystemData MakeSystem(Eigen::Index T, Eigen::Index n) {
	test::DeterministicNormal rng(2024);
	SystemData data;
	data.X.resize(T, 3);
	data.X.col(0).setOnes();
	data.X.col(1) = rng.Vector(T);
	data.X.col(2) = rng.Vector(T);

	Eigen::VectorXd common = rng.Vector(T);
	data.Y.resize(T, n);
	for (Eigen::Index i = 0; i < n; i++) {
		data.Y.col(i) = static_cast<double>(i + 1) * data.X.col(1) - 0.5 * data.X.col(2) + common + rng.Vector(T);
	}
	return data;
}

} // namespace

TEST_CASE("SURE: One equation equals OLS", "[sure][properties]") {
	SystemData data = MakeSystem(80, 1);

	SECTION("IID") {
		auto sure = SURESolver::Fit(data.Y, data.X, core::EstimationOptions::IID());
		auto ols = OLSSolver::Fit(data.Y.col(0), data.X, core::EstimationOptions::IID());
		REQUIRE((sure.StackedCoefficients() - ols.coefficients).cwiseAbs().maxCoeff() < 1e-12);
		REQUIRE((sure.vcov - ols.vcov).cwiseAbs().maxCoeff() < 1e-12);
		REQUIRE_THAT(sure.r_squared(0), WithinAbs(ols.r_squared, 1e-12));
	}

	SECTION("Newey-West") {
		auto sure = SURESolver::Fit(data.Y, data.X, core::EstimationOptions::NeweyWest(3));
		auto ols = OLSSolver::Fit(data.Y.col(0), data.X, core::EstimationOptions::NeweyWest(3));
		REQUIRE((sure.vcov - ols.vcov).cwiseAbs().maxCoeff() < 1e-12);
		REQUIRE(sure.covariance_type == core::CovarianceType::NEWEY_WEST);
		REQUIRE(sure.bandwidth_used == 3);
	}
}

TEST_CASE("SURE: Shared regressors give equation-by-equation estimates", "[sure]") {
	SystemData data = MakeSystem(60, 3);
	auto sure = SURESolver::Fit(data.Y, data.X, core::EstimationOptions::White());

	REQUIRE(sure.coefficients.rows() == 3);
	REQUIRE(sure.coefficients.cols() == 3);
	REQUIRE(sure.vcov.rows() == 9);

	Eigen::VectorXd stacked = sure.StackedCoefficients();
	for (Eigen::Index i = 0; i < 3; i++) {
		auto ols = OLSSolver::Fit(data.Y.col(i), data.X, core::EstimationOptions::White());
		for (Eigen::Index j = 0; j < 3; j++) {
			// Entry i*k + j is regressor j of equation i
			REQUIRE_THAT(stacked(i * 3 + j), WithinAbs(ols.coefficients(j), 1e-12));
		}
		// Diagonal blocks are the single-equation robust covariances
		REQUIRE((sure.vcov.block(i * 3, i * 3, 3, 3) - ols.vcov).cwiseAbs().maxCoeff() < 1e-12);
	}

	// The common shock shows up in the cross-equation blocks
	REQUIRE(sure.vcov.block(0, 3, 3, 3).cwiseAbs().maxCoeff() > 0.0);
	REQUIRE((sure.vcov - sure.vcov.transpose()).cwiseAbs().maxCoeff() < 1e-14);
}

TEST_CASE("SURE: IID covariance is Σ ⊗ (X'X)⁻¹", "[sure]") {
	SystemData data = MakeSystem(40, 2);
	auto sure = SURESolver::Fit(data.Y, data.X, core::EstimationOptions::IID());

	Eigen::MatrixXd sigma = sure.residuals.transpose() * sure.residuals / 40.0;
	Eigen::MatrixXd xtx_inv = (data.X.transpose() * data.X).inverse();
	Eigen::MatrixXd expected = SURESolver::Kronecker(sigma, xtx_inv);

	REQUIRE((sure.residual_covariance - sigma).cwiseAbs().maxCoeff() < 1e-12);
	REQUIRE((sure.vcov - expected).cwiseAbs().maxCoeff() < 1e-10);
}

TEST_CASE("SURE: Kronecker product", "[sure]") {
	Eigen::MatrixXd A(2, 2);
	A << 1, 2, 3, 4;
	Eigen::MatrixXd B = Eigen::MatrixXd::Identity(2, 2);
	Eigen::MatrixXd K = SURESolver::Kronecker(A, B);
	REQUIRE(K.rows() == 4);
	REQUIRE(K(0, 2) == 2.0);
	REQUIRE(K(3, 1) == 3.0);
	REQUIRE(K(1, 0) == 0.0);
}

TEST_CASE("SURE: Errors", "[sure][errors]") {
	SystemData data = MakeSystem(20, 2);

	SECTION("Row mismatch") {
		REQUIRE_THROWS_AS(SURESolver::Fit(data.Y.topRows(19), data.X), core::DimensionMismatchError);
	}

	SECTION("Rank-deficient shared design") {
		Eigen::MatrixXd X = data.X;
		X.col(2) = 2.0 * X.col(1);
		REQUIRE_THROWS_AS(SURESolver::Fit(data.Y, X), core::RankDeficiencyError);
	}
}
