#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libeconreg/gmm/optimizers.hpp"

#include <cmath>

using namespace libeconreg::gmm;
using Catch::Matchers::WithinAbs;

TEST_CASE("Newton root finder", "[gmm][optimizer]") {
	SECTION("Square root of two") {
		NewtonRootFinder::ResidualFunction F = [](const Eigen::VectorXd &x) {
			Eigen::VectorXd r(1);
			r(0) = x(0) * x(0) - 2.0;
			return r;
		};
		NewtonRootFinder::JacobianFunction J = [](const Eigen::VectorXd &x) {
			Eigen::MatrixXd d(1, 1);
			d(0, 0) = 2.0 * x(0);
			return d;
		};

		auto result = NewtonRootFinder::Solve(F, J, Eigen::VectorXd::Ones(1), 1e-12, 50);
		REQUIRE(result.converged);
		REQUIRE_THAT(result.x(0), WithinAbs(std::sqrt(2.0), 1e-12));
		REQUIRE(result.value < 1e-12);
		REQUIRE(result.iterations < 10);
	}

	SECTION("Linear system solves in one step") {
		Eigen::MatrixXd A(2, 2);
		A << 3.0, 1.0, 1.0, 2.0;
		Eigen::VectorXd b(2);
		b << 9.0, 8.0;
		NewtonRootFinder::ResidualFunction F = [&](const Eigen::VectorXd &x) { return Eigen::VectorXd(A * x - b); };
		NewtonRootFinder::JacobianFunction J = [&](const Eigen::VectorXd &) { return A; };

		auto result = NewtonRootFinder::Solve(F, J, Eigen::VectorXd::Zero(2), 1e-10, 50);
		REQUIRE(result.converged);
		REQUIRE(result.iterations == 1);
		REQUIRE_THAT(result.x(0), WithinAbs(2.0, 1e-12));
		REQUIRE_THAT(result.x(1), WithinAbs(3.0, 1e-12));
	}

	SECTION("Singular Jacobian stops without converging") {
		NewtonRootFinder::ResidualFunction F = [](const Eigen::VectorXd &x) {
			Eigen::VectorXd r(1);
			r(0) = x(0) * x(0) + 1.0;
			return r;
		};
		NewtonRootFinder::JacobianFunction J = [](const Eigen::VectorXd &x) {
			Eigen::MatrixXd d(1, 1);
			d(0, 0) = 2.0 * x(0);
			return d;
		};

		auto result = NewtonRootFinder::Solve(F, J, Eigen::VectorXd::Zero(1), 1e-10, 50);
		REQUIRE_FALSE(result.converged);
		REQUIRE(result.x(0) == 0.0);
		REQUIRE_THAT(result.value, WithinAbs(1.0, 1e-15));
	}

	SECTION("Residual scale above the tolerance") {
		// At the root F is only accurate to about 1e10 * eps
		NewtonRootFinder::ResidualFunction F = [](const Eigen::VectorXd &x) {
			Eigen::VectorXd r(1);
			r(0) = 1e10 * (x(0) * x(0) - 2.0);
			return r;
		};
		NewtonRootFinder::JacobianFunction J = [](const Eigen::VectorXd &x) {
			Eigen::MatrixXd d(1, 1);
			d(0, 0) = 2e10 * x(0);
			return d;
		};

		auto result = NewtonRootFinder::Solve(F, J, Eigen::VectorXd::Ones(1), 1e-12, 50);
		REQUIRE(result.converged);
		REQUIRE_THAT(result.x(0), WithinAbs(std::sqrt(2.0), 1e-12));
		REQUIRE(result.iterations < 50);
	}

	SECTION("Stalled backtracking away from the root is not convergence") {
		// F has no root; the Newton step stays large
		NewtonRootFinder::ResidualFunction F = [](const Eigen::VectorXd &x) {
			Eigen::VectorXd r(1);
			r(0) = x(0) * x(0) + 1.0;
			return r;
		};
		NewtonRootFinder::JacobianFunction J = [](const Eigen::VectorXd &x) {
			Eigen::MatrixXd d(1, 1);
			d(0, 0) = 2.0 * x(0);
			return d;
		};

		auto result = NewtonRootFinder::Solve(F, J, Eigen::VectorXd::Constant(1, 0.5), 1e-10, 50);
		REQUIRE_FALSE(result.converged);
	}

	SECTION("Iteration cap") {
		NewtonRootFinder::ResidualFunction F = [](const Eigen::VectorXd &x) {
			Eigen::VectorXd r(1);
			r(0) = std::exp(x(0)) - 1.0;
			return r;
		};
		NewtonRootFinder::JacobianFunction J = [](const Eigen::VectorXd &x) {
			Eigen::MatrixXd d(1, 1);
			d(0, 0) = std::exp(x(0));
			return d;
		};

		auto result = NewtonRootFinder::Solve(F, J, Eigen::VectorXd::Constant(1, 10.0), 1e-12, 2);
		REQUIRE_FALSE(result.converged);
		REQUIRE(result.iterations == 2);
	}
}

TEST_CASE("BFGS minimizer", "[gmm][optimizer]") {
	// f = (x - 1)² + 10 (y + 2)²
	BFGSMinimizer::Objective f = [](const Eigen::VectorXd &x, Eigen::VectorXd &grad) {
		grad.resize(2);
		grad(0) = 2.0 * (x(0) - 1.0);
		grad(1) = 20.0 * (x(1) + 2.0);
		return (x(0) - 1.0) * (x(0) - 1.0) + 10.0 * (x(1) + 2.0) * (x(1) + 2.0);
	};

	SECTION("Identity start converges") {
		auto result = BFGSMinimizer::Minimize(f, Eigen::VectorXd::Zero(2), Eigen::MatrixXd::Identity(2, 2), 1e-8, 200);
		REQUIRE(result.converged);
		REQUIRE_THAT(result.x(0), WithinAbs(1.0, 1e-6));
		REQUIRE_THAT(result.x(1), WithinAbs(-2.0, 1e-6));
		REQUIRE(result.value < 1e-10);
	}

	SECTION("Exact inverse Hessian takes one step") {
		Eigen::MatrixXd H0 = Eigen::MatrixXd::Zero(2, 2);
		H0(0, 0) = 0.5;
		H0(1, 1) = 0.05;
		auto result = BFGSMinimizer::Minimize(f, Eigen::VectorXd::Zero(2), H0, 1e-8, 200);
		REQUIRE(result.converged);
		REQUIRE(result.iterations <= 2);
		REQUIRE_THAT(result.x(0), WithinAbs(1.0, 1e-12));
		REQUIRE_THAT(result.x(1), WithinAbs(-2.0, 1e-12));
	}

	SECTION("Iteration cap reports non-convergence") {
		auto result = BFGSMinimizer::Minimize(f, Eigen::VectorXd::Zero(2), Eigen::MatrixXd::Identity(2, 2), 1e-8, 1);
		REQUIRE_FALSE(result.converged);
		REQUIRE(result.iterations == 1);
		REQUIRE(result.value < 40.0);
	}
}
