#pragma once

#include <cmath>
#include <limits>

namespace libeconreg {
namespace utils {

/**
 * Distribution functions needed for asymptotic inference
 *
 * Everything in this library is asymptotic, so only the standard normal
 * and the chi-squared distribution are required.
 */

/// Standard normal CDF
inline double normal_cdf(double x) {
	return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

/// Two-sided p-value of a standard normal statistic
inline double normal_two_sided_pvalue(double z) {
	if (!std::isfinite(z)) {
		return std::isnan(z) ? std::numeric_limits<double>::quiet_NaN() : 0.0;
	}
	return std::erfc(std::abs(z) / std::sqrt(2.0));
}

/**
 * Standard normal quantile (Acklam's rational approximation, one Halley step)
 */
inline double normal_quantile(double p) {
	if (p <= 0.0 || p >= 1.0) {
		if (p == 0.0) {
			return -std::numeric_limits<double>::infinity();
		}
		if (p == 1.0) {
			return std::numeric_limits<double>::infinity();
		}
		return std::numeric_limits<double>::quiet_NaN();
	}

	static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
	                           1.383577518672690e+02,  -3.066479806614716e+01, 2.506628277459239e+00};
	static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
	                           6.680131188771972e+01,  -1.328068155288572e+01};
	static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
	                           -2.549732539343734e+00, 4.374664141464968e+00,  2.938163982698783e+00};
	static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
	                           3.754408661907416e+00};

	const double p_low = 0.02425;
	double x;
	if (p < p_low) {
		double q = std::sqrt(-2.0 * std::log(p));
		x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		    ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	} else if (p <= 1.0 - p_low) {
		double q = p - 0.5;
		double r = q * q;
		x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
		    (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
	} else {
		double q = std::sqrt(-2.0 * std::log(1.0 - p));
		x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		    ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}

	// Halley refinement
	double e = normal_cdf(x) - p;
	const double sqrt_two_pi = 2.50662827463100050242;
	double u = e * sqrt_two_pi * std::exp(x * x / 2.0);
	x = x - u / (1.0 + x * u / 2.0);
	return x;
}

/**
 * Regularized lower incomplete gamma function P(a, x)
 *
 * Series expansion for x < a + 1, continued fraction (modified Lentz) otherwise.
 */
inline double regularized_gamma_p(double a, double x) {
	if (std::isnan(a) || std::isnan(x) || a <= 0.0 || x < 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (x == 0.0) {
		return 0.0;
	}
	if (std::isinf(x)) {
		return 1.0;
	}

	const int max_iter = 500;
	const double eps = 1e-15;
	const double log_prefactor = -x + a * std::log(x) - std::lgamma(a);

	if (x < a + 1.0) {
		double ap = a;
		double sum = 1.0 / a;
		double del = sum;
		for (int n = 0; n < max_iter; n++) {
			ap += 1.0;
			del *= x / ap;
			sum += del;
			if (std::abs(del) < std::abs(sum) * eps) {
				break;
			}
		}
		return sum * std::exp(log_prefactor);
	}

	const double tiny = 1e-300;
	double b = x + 1.0 - a;
	double c = 1.0 / tiny;
	double d = 1.0 / b;
	double h = d;
	for (int i = 1; i <= max_iter; i++) {
		double an = -i * (i - a);
		b += 2.0;
		d = an * d + b;
		if (std::abs(d) < tiny) {
			d = tiny;
		}
		c = b + an / c;
		if (std::abs(c) < tiny) {
			c = tiny;
		}
		d = 1.0 / d;
		double del = d * c;
		h *= del;
		if (std::abs(del - 1.0) < eps) {
			break;
		}
	}
	return 1.0 - std::exp(log_prefactor) * h;
}

/// Chi-squared CDF with df degrees of freedom
inline double chi_squared_cdf(double x, double df) {
	if (std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (x <= 0.0) {
		return 0.0;
	}
	return regularized_gamma_p(df / 2.0, x / 2.0);
}

/// Upper-tail p-value of a chi-squared statistic
inline double chi_squared_pvalue(double x, double df) {
	return 1.0 - chi_squared_cdf(x, df);
}

} // namespace utils
} // namespace libeconreg
