/**
 * DO NOT REMOVE COPYRIGHT NOTICES OR THIS HEADER.
 *
 * Contributor(s):
 *
 * The Original Software is RateStrap.
 * The Initial Developer of the Original Software is REDUKTI LIMITED (http://redukti.com).
 *
 * Copyright 2017-2019 REDUKTI LIMITED. All Rights Reserved.
 *
 * The contents of this file are subject to the the GNU General Public License
 * Version 3 (https://www.gnu.org/licenses/gpl.txt).
 */
/**
 * Portions derived from Quantlib.
 * License: http://quantlib.org/license.shtml
 */

#include <interpolators.h>

#include <matrix.h>

#include <logger.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <vector>

namespace ratestrap
{

static inline size_t locate_x(const double *xBegin_, const double *xEnd_, double x)
{
	if (x < *xBegin_)
		return 0;
	else if (x > *(xEnd_ - 1))
		return xEnd_ - xBegin_ - 2;
	else
		return std::upper_bound(xBegin_, xEnd_ - 1, x) - xBegin_ - 1;
}

// Cubic Hermite polynomial on each segment:
// y[j] + dx * (a[j] + dx * (b[j] + dx * c[j]))
// where a[j] is the slope at x[j]. Subclasses compute
// the slopes, this class derives the coefficients.
class CubicInterpolator : public Interpolator
{
	protected:
	std::vector<double> x_;
	std::vector<double> y_;
	std::vector<double> a_, b_, c_;
	InterpolatorType type_;

	CubicInterpolator(const double *x, const double *y, unsigned int size, InterpolatorType type)
	    : x_(x, x + size), y_(y, y + size), type_(type)
	{
	}

	// Given the secants S and the slopes m at every node
	// sets the polynomial coefficients
	void set_coefficients(const std::vector<double> &S, const std::vector<double> &m)
	{
		size_t n = x_.size();
		a_.resize(n - 1);
		b_.resize(n - 1);
		c_.resize(n - 1);
		for (size_t i = 0; i < n - 1; i++) {
			double dx = x_[i + 1] - x_[i];
			a_[i] = m[i];
			b_[i] = (3.0 * S[i] - m[i + 1] - 2.0 * m[i]) / dx;
			c_[i] = (m[i + 1] + m[i] - 2.0 * S[i]) / (dx * dx);
		}
	}

	size_t locate(double x) const { return locate_x(x_.data(), x_.data() + x_.size(), x); }

	public:
	double interpolate(double x) const override
	{
		size_t j = locate(x);
		double dx = x - x_[j];
		return y_[j] + dx * (a_[j] + dx * (b_[j] + dx * c_[j]));
	}
	double derivative(double x) const override
	{
		size_t j = locate(x);
		double dx = x - x_[j];
		return a_[j] + (2.0 * b_[j] + 3.0 * c_[j] * dx) * dx;
	}
	double derivative2(double x) const override
	{
		size_t j = locate(x);
		double dx = x - x_[j];
		return 2.0 * b_[j] + 6.0 * c_[j] * dx;
	}
	InterpolatorType type() const override { return type_; }
};

// Cubic spline with zero second derivative at both ends.
// The slopes satisfy a tridiagonal system that is solved
// with LAPACK dgtsv.
class NaturalCubicSpline : public CubicInterpolator
{
	public:
	NaturalCubicSpline(const double *x, const double *y, unsigned int size)
	    : CubicInterpolator(x, y, size, InterpolatorType::CUBIC_SPLINE)
	{
	}

	// Returns false if the system is singular
	bool update()
	{
		int n = (int)x_.size();
		std::vector<double> dx(n - 1), S(n - 1);
		for (int i = 0; i < n - 1; i++) {
			dx[i] = x_[i + 1] - x_[i];
			S[i] = (y_[i + 1] - y_[i]) / dx[i];
		}
		std::vector<double> lower(n - 1), diagonal(n), upper(n - 1), rhs(n);
		for (int i = 1; i < n - 1; i++) {
			lower[i - 1] = dx[i];
			diagonal[i] = 2.0 * (dx[i] + dx[i - 1]);
			upper[i] = dx[i - 1];
			rhs[i] = 3.0 * (dx[i] * S[i - 1] + dx[i - 1] * S[i]);
		}
		// left boundary condition: second derivative is 0
		diagonal[0] = 2.0;
		upper[0] = 1.0;
		rhs[0] = 3.0 * S[0];
		// right boundary condition: second derivative is 0
		lower[n - 2] = 1.0;
		diagonal[n - 1] = 2.0;
		rhs[n - 1] = 3.0 * S[n - 2];

		int info = ratestrap_tridiagonal_solve(n, lower.data(), diagonal.data(), upper.data(), rhs.data());
		if (info != 0) {
			debug("dgtsv failed with info %d\n", info);
			return false;
		}
		set_coefficients(S, rhs);
		return true;
	}
};

// Fritsch-Carlson monotone piecewise cubic Hermite interpolation.
// The interpolant is monotone on every segment where the data is.
class MonotoneCubic : public CubicInterpolator
{
	public:
	MonotoneCubic(const double *x, const double *y, unsigned int size)
	    : CubicInterpolator(x, y, size, InterpolatorType::MONOTONIC_CUBIC)
	{
	}

	void update()
	{
		size_t n = x_.size();
		std::vector<double> S(n - 1), m(n);
		for (size_t i = 0; i < n - 1; i++) {
			S[i] = (y_[i + 1] - y_[i]) / (x_[i + 1] - x_[i]);
		}
		m[0] = S[0];
		m[n - 1] = S[n - 2];
		for (size_t i = 1; i < n - 1; i++) {
			if (S[i - 1] * S[i] <= 0.0)
				m[i] = 0.0;
			else
				m[i] = (S[i - 1] + S[i]) / 2.0;
		}
		for (size_t i = 0; i < n - 1; i++) {
			if (S[i] == 0.0) {
				m[i] = 0.0;
				m[i + 1] = 0.0;
				continue;
			}
			double alpha = m[i] / S[i];
			double beta = m[i + 1] / S[i];
			double r = alpha * alpha + beta * beta;
			if (r > 9.0) {
				double tau = 3.0 / std::sqrt(r);
				m[i] = tau * alpha * S[i];
				m[i + 1] = tau * beta * S[i];
			}
		}
		set_coefficients(S, m);
	}
};

std::unique_ptr<Interpolator> make_interpolator(InterpolatorType type, const double *x, const double *y,
						unsigned int size)
{
	for (unsigned int i = 1; i < size; i++) {
		if (!(x[i] > x[i - 1])) {
			debug("Interpolator x values are not strictly increasing at %u\n", i);
			return nullptr;
		}
	}
	switch (type) {
	case InterpolatorType::CUBIC_SPLINE: {
		if (size < 3)
			return nullptr;
		std::unique_ptr<NaturalCubicSpline> spline(new NaturalCubicSpline(x, y, size));
		if (!spline->update())
			return nullptr;
		return std::move(spline);
	}
	case InterpolatorType::MONOTONIC_CUBIC: {
		if (size < 2)
			return nullptr;
		std::unique_ptr<MonotoneCubic> cubic(new MonotoneCubic(x, y, size));
		cubic->update();
		return std::move(cubic);
	}
	default:
		return nullptr;
	}
}

static int test_interp(const double *x_data, const double *y_data, size_t n, InterpolatorType T,
		       const double *test_x, const double *test_y, const double *test_dy, size_t test_n)
{
	int status = 0;

	auto interp = make_interpolator(T, x_data, y_data, (unsigned int)n);
	if (!interp) {
		fprintf(stderr, "Failed to create interpolator\n");
		return 1;
	}
	for (size_t i = 0; i < test_n; i++) {
		double x = test_x[i];
		double diff_y = interp->interpolate(x) - test_y[i];
		double diff_deriv = interp->derivative(x) - test_dy[i];
		if (std::fabs(diff_y) > 1.e-10 || std::fabs(diff_deriv) > 1.0e-10) {
			fprintf(stderr, "Failed to match: %d %.10f %.10f\n", (int)i, diff_y, diff_deriv);
			status++;
		}
	}
	return status;
}

static int test_cspline_linear(void)
{
	double data_x[3] = {0.0, 1.0, 2.0};
	double data_y[3] = {0.0, 1.0, 2.0};
	double test_x[4] = {0.0, 0.5, 1.0, 2.0};
	double test_y[4] = {0.0, 0.5, 1.0, 2.0};
	double test_dy[4] = {1.0, 1.0, 1.0, 1.0};

	return test_interp(data_x, data_y, std::end(data_x) - std::begin(data_x), InterpolatorType::CUBIC_SPLINE,
			   test_x, test_y, test_dy, std::end(test_x) - std::begin(test_x));
}

static int test_cspline_natural_ends(void)
{
	int failure_count = 0;
	// Second derivative at the middle node is -3, zero at the ends
	double data_x[3] = {0.0, 1.0, 2.0};
	double data_y[3] = {0.0, 1.0, 0.0};
	double test_x[3] = {0.0, 0.5, 2.0};
	double test_y[3] = {0.0, 0.6875, 0.0};
	double test_dy[3] = {1.5, 1.125, -1.5};

	failure_count += test_interp(data_x, data_y, 3, InterpolatorType::CUBIC_SPLINE, test_x, test_y, test_dy, 3);
	auto interp = make_interpolator(InterpolatorType::CUBIC_SPLINE, data_x, data_y, 3);
	if (!interp || std::fabs(interp->derivative2(0.0)) > 1e-10 || std::fabs(interp->derivative2(2.0)) > 1e-10 ||
	    std::fabs(interp->derivative2(1.0) + 3.0) > 1e-10)
		failure_count++;
	return failure_count;
}

static int test_exact_at_nodes(InterpolatorType type)
{
	int failure_count = 0;
	double x[] = {0.25, 0.5, 1.0, 2.0, 5.0, 10.0};
	double y[] = {0.011, 0.0125, 0.014, 0.019, 0.026, 0.031};
	unsigned int n = std::end(x) - std::begin(x);
	auto interp = make_interpolator(type, x, y, n);
	if (!interp)
		return 1;
	for (unsigned int i = 0; i < n; i++) {
		if (std::fabs(interp->interpolate(x[i]) - y[i]) > 1e-10) {
			fprintf(stderr, "Value at node %u: expected %.12f, got %.12f\n", i, y[i],
				interp->interpolate(x[i]));
			failure_count++;
		}
	}
	return failure_count;
}

static int test_monotone(void)
{
	int failure_count = 0;
	// Data with a sharp step which makes an ordinary spline overshoot
	double x[] = {0.0, 1.0, 2.0, 3.0, 4.0, 5.0};
	double y[] = {0.0, 0.0, 0.1, 5.0, 5.1, 5.1};
	unsigned int n = std::end(x) - std::begin(x);
	auto interp = make_interpolator(InterpolatorType::MONOTONIC_CUBIC, x, y, n);
	if (!interp)
		return 1;
	double prev = interp->interpolate(0.0);
	for (int i = 1; i <= 500; i++) {
		double v = interp->interpolate(i * 0.01);
		if (v < prev - 1e-14) {
			fprintf(stderr, "Monotone cubic decreased at %f\n", i * 0.01);
			failure_count++;
			break;
		}
		prev = v;
	}
	// Two points degenerate to a straight line
	double x2[] = {1.0, 3.0};
	double y2[] = {2.0, 6.0};
	auto line = make_interpolator(InterpolatorType::MONOTONIC_CUBIC, x2, y2, 2);
	if (!line || std::fabs(line->interpolate(2.0) - 4.0) > 1e-12)
		failure_count++;
	return failure_count;
}

static int test_bad_inputs(void)
{
	int failure_count = 0;
	double x[] = {1.0, 2.0, 3.0};
	double y[] = {1.0, 2.0, 3.0};
	if (make_interpolator(InterpolatorType::CUBIC_SPLINE, x, y, 2) != nullptr)
		failure_count++;
	if (make_interpolator(InterpolatorType::MONOTONIC_CUBIC, x, y, 1) != nullptr)
		failure_count++;
	if (make_interpolator(InterpolatorType::LOG_LINEAR, x, y, 3) != nullptr)
		failure_count++;
	double bad_x[] = {1.0, 1.0, 3.0};
	if (make_interpolator(InterpolatorType::CUBIC_SPLINE, bad_x, y, 3) != nullptr)
		failure_count++;
	return failure_count;
}

int test_interpolators()
{
	int rc = 0;
	rc += test_cspline_linear();
	rc += test_cspline_natural_ends();
	rc += test_exact_at_nodes(InterpolatorType::CUBIC_SPLINE);
	rc += test_exact_at_nodes(InterpolatorType::MONOTONIC_CUBIC);
	rc += test_monotone();
	rc += test_bad_inputs();
	if (rc == 0)
		printf("Interpolator Tests OK\n");
	else
		printf("Interpolator Tests FAILED\n");
	return rc;
}

} // namespace ratestrap
