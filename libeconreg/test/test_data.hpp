#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace libeconreg {
namespace test {

using json = nlohmann::json;

/// Reference cases shared by the solver, GMM and integration tests
inline json LoadReferenceCases() {
	const std::string path = std::string(LIBECONREG_TEST_DATA_DIR) + "/reference_cases.json";
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open file: " + path);
	}
	json j;
	file >> j;
	return j;
}

inline Eigen::VectorXd ToVector(const json &values) {
	auto v = values.get<std::vector<double>>();
	return Eigen::Map<Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

/// [1, x] design matrix
inline Eigen::MatrixXd WithIntercept(const Eigen::VectorXd &x) {
	Eigen::MatrixXd X(x.size(), 2);
	X.col(0).setOnes();
	X.col(1) = x;
	return X;
}

/// Deterministic pseudo-random normal draws (Box-Muller over a fixed LCG)
class DeterministicNormal {
public:
	explicit DeterministicNormal(unsigned long long seed) : state_(seed) {
	}

	double Uniform() {
		state_ = state_ * 6364136223846793005ULL + 1442695040888963407ULL;
		return (static_cast<double>(state_ >> 11) + 0.5) / 9007199254740992.0;
	}

	double Next() {
		const double u1 = Uniform();
		const double u2 = Uniform();
		return std::sqrt(-2.0 * std::log(u1)) * std::cos(6.283185307179586 * u2);
	}

	Eigen::VectorXd Vector(Eigen::Index n) {
		Eigen::VectorXd v(n);
		for (Eigen::Index i = 0; i < n; i++) {
			v(i) = Next();
		}
		return v;
	}

private:
	unsigned long long state_;
};

} // namespace test
} // namespace libeconreg
