#pragma once

#include "libeconreg/panel/panel_data.hpp"
#include "test_data.hpp"

#include <Eigen/Dense>

namespace libeconreg {
namespace test {

/// Balanced panel with an intercept and one regressor: y = 1 + 0.5 x + α_i + e
inline panel::PanelData MakePanel(Eigen::Index T, Eigen::Index N, unsigned long long seed = 314) {
	DeterministicNormal rng(seed);
	panel::PanelData data;
	data.y.resize(T, N);
	data.x.resize(static_cast<size_t>(N));

	Eigen::VectorXd common = rng.Vector(T);
	for (Eigen::Index i = 0; i < N; i++) {
		Eigen::MatrixXd xi(T, 2);
		xi.col(0).setOnes();
		xi.col(1) = rng.Vector(T) + 0.3 * static_cast<double>(i) * Eigen::VectorXd::Ones(T);
		Eigen::VectorXd e = rng.Vector(T);
		const double alpha = 0.25 * static_cast<double>(i);
		data.y.col(i) = (1.0 + alpha + 0.5 * xi.col(1).array() + 0.5 * common.array() + e.array()).matrix();
		data.x[static_cast<size_t>(i)] = xi;
	}
	return data;
}

/// Stack a panel unit-major, dropping cells where keep(t, i) is false
inline void StackPanel(const panel::PanelData &data, const panel::PanelMask &keep, Eigen::VectorXd &y,
                       Eigen::MatrixXd &X) {
	const Eigen::Index n = keep.count();
	y.resize(n);
	X.resize(n, data.Regressors());
	Eigen::Index r = 0;
	for (Eigen::Index i = 0; i < data.Units(); i++) {
		for (Eigen::Index t = 0; t < data.Periods(); t++) {
			if (!keep(t, i)) {
				continue;
			}
			y(r) = data.y(t, i);
			X.row(r) = data.x[static_cast<size_t>(i)].row(t);
			r++;
		}
	}
}

} // namespace test
} // namespace libeconreg
