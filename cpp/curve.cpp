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

#include <curve.h>
#include <dual.h>

#include <logger.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace ratestrap
{

static const double kPillarMatchTolerance = 1e-12;

template <typename T>
InterpolatedCurve<T>::InterpolatedCurve(InterpolatorType type, bool allow_extrapolation)
    : type_(type), allow_extrapolation_(allow_extrapolation)
{
}

template <typename T> Status InterpolatedCurve<T>::add_pillar(T t, T df)
{
	double time = scalar_value(t);
	double value = scalar_value(df);
	if (!(time > 0.0)) {
		error("Pillar maturity %g is not positive\n", time);
		return Status::make(StatusCode::kCRV_NonPositiveMaturity, ", got %g", time)
		    .with_index((int)pillars_.size())
		    .with_maturity(time);
	}
	if (!(value > 0.0)) {
		error("Discount factor %g at maturity %g is not positive\n", value, time);
		return Status::make(StatusCode::kCRV_NonPositiveDiscountFactor, ": %g at maturity %g", value, time)
		    .with_index((int)pillars_.size())
		    .with_maturity(time)
		    .with_value(value);
	}
	if (!times_.empty() && !(time > times_.back())) {
		error("Pillar maturity %g is not above the last pillar %g\n", time, times_.back());
		return Status::make(StatusCode::kCRV_NonIncreasingPillars, ": %g after %g", time, times_.back())
		    .with_index((int)pillars_.size())
		    .with_maturity(time);
	}
	pillars_.push_back(t);
	dfs_.push_back(df);
	log_dfs_.push_back(log(df));
	times_.push_back(time);
	update_spline();
	return Status();
}

template <typename T> void InterpolatedCurve<T>::update_spline()
{
	spline_.reset();
	if (type_ != InterpolatorType::CUBIC_SPLINE && type_ != InterpolatorType::MONOTONIC_CUBIC)
		return;
	std::vector<double> y(times_.size());
	for (size_t i = 0; i < times_.size(); i++) {
		if (type_ == InterpolatorType::CUBIC_SPLINE)
			y[i] = -scalar_value(log_dfs_[i]) / times_[i];
		else
			y[i] = scalar_value(log_dfs_[i]);
	}
	spline_ = make_interpolator(type_, times_.data(), y.data(), (unsigned int)times_.size());
	if (!spline_)
		debug("%s curve with %d pillars falls back to log linear interpolation\n",
		      InterpolatorType_Name(type_).c_str(), (int)times_.size());
}

// Flat zero rate from the edge pillar
template <typename T> T InterpolatedCurve<T>::extrapolate(double t, size_t edge) const
{
	T rate = -log_dfs_[edge] / pillars_[edge];
	return exp(-rate * t);
}

// Interpolates within segment [i, i+1]
template <typename T> T InterpolatedCurve<T>::interpolate(double t, size_t i) const
{
	const T &t1 = pillars_[i];
	const T &t2 = pillars_[i + 1];
	switch (type_) {
	case InterpolatorType::LINEAR_ZERO_RATE: {
		T r1 = -log_dfs_[i] / t1;
		T r2 = -log_dfs_[i + 1] / t2;
		T r = r1 + (r2 - r1) * ((t - t1) / (t2 - t1));
		return exp(-r * t);
	}
	case InterpolatorType::FLAT_FORWARD: {
		T f = (log_dfs_[i] - log_dfs_[i + 1]) / (t2 - t1);
		return dfs_[i] * exp(-f * (t - t1));
	}
	case InterpolatorType::CUBIC_SPLINE:
		if (spline_)
			return ScalarTraits<T>::from_value(std::exp(-spline_->interpolate(t) * t));
		break;
	case InterpolatorType::MONOTONIC_CUBIC:
		if (spline_)
			return ScalarTraits<T>::from_value(std::exp(spline_->interpolate(t)));
		break;
	default:
		break;
	}
	T w = (t - t1) / (t2 - t1);
	return exp(log_dfs_[i] + (log_dfs_[i + 1] - log_dfs_[i]) * w);
}

template <typename T> Status InterpolatedCurve<T>::discount_factor(T t, T &df) const
{
	double time = scalar_value(t);
	if (!std::isfinite(time)) {
		error("Discount factor requested for non finite time\n");
		return Status::make(StatusCode::kBadArgument, ": discount factor time %g is not finite", time);
	}
	if (time < 0.0) {
		error("Discount factor requested for negative time %g\n", time);
		return Status::make(StatusCode::kCRV_NegativeTime, ", got %g", time).with_maturity(time);
	}
	if (time == 0.0) {
		df = ScalarTraits<T>::from_value(1.0);
		return Status();
	}
	if (pillars_.empty()) {
		error("Discount factor requested from a curve with no pillars\n");
		return Status(StatusCode::kCRV_NoPillars);
	}
	double tmin = times_.front();
	double tmax = times_.back();
	if (time < tmin - kPillarMatchTolerance || time > tmax + kPillarMatchTolerance) {
		if (!allow_extrapolation_) {
			error("Time %g is outside curve domain [%g, %g]\n", time, tmin, tmax);
			return Status::make(StatusCode::kCRV_OutOfBounds, ": %g not in [%g, %g]", time, tmin, tmax)
			    .with_maturity(time)
			    .with_value(time < tmin ? tmin : tmax);
		}
		df = extrapolate(time, time < tmin ? 0 : times_.size() - 1);
		return Status();
	}
	auto it = std::lower_bound(times_.begin(), times_.end(), time - kPillarMatchTolerance);
	size_t i = it - times_.begin();
	if (i < times_.size() && std::fabs(times_[i] - time) < kPillarMatchTolerance) {
		df = dfs_[i];
		return Status();
	}
	// times_[i-1] < time < times_[i]
	df = interpolate(time, i - 1);
	return Status();
}

template <typename T> Status InterpolatedCurve<T>::zero_rate(T t, T &rate) const
{
	double time = scalar_value(t);
	if (!std::isfinite(time)) {
		error("Zero rate requested for non finite time\n");
		return Status::make(StatusCode::kBadArgument, ": zero rate time %g is not finite", time);
	}
	if (time < 0.0) {
		error("Zero rate requested for negative time %g\n", time);
		return Status::make(StatusCode::kCRV_NegativeTime, ", got %g", time).with_maturity(time);
	}
	if (pillars_.empty()) {
		error("Zero rate requested from a curve with no pillars\n");
		return Status(StatusCode::kCRV_NoPillars);
	}
	if (time == 0.0) {
		rate = -log_dfs_[0] / pillars_[0];
		return Status();
	}
	T df;
	Status status = discount_factor(t, df);
	if (!status.ok())
		return status;
	rate = -log(df) / t;
	return Status();
}

template <typename T> Status InterpolatedCurve<T>::forward_rate(T t1, T t2, T &rate) const
{
	if (!std::isfinite(scalar_value(t1)) || !std::isfinite(scalar_value(t2))) {
		error("Forward rate requested for non finite time\n");
		return Status::make(StatusCode::kBadArgument, ": forward rate times %g, %g must be finite",
				    scalar_value(t1), scalar_value(t2));
	}
	if (!(scalar_value(t2) > scalar_value(t1))) {
		error("Forward rate requested with t2 %g not after t1 %g\n", scalar_value(t2), scalar_value(t1));
		return Status::make(StatusCode::kBadArgument, ": forward rate end %g must be after start %g",
				    scalar_value(t2), scalar_value(t1))
		    .with_maturity(scalar_value(t2));
	}
	T df1, df2;
	Status status = discount_factor(t1, df1);
	if (!status.ok())
		return status;
	status = discount_factor(t2, df2);
	if (!status.ok())
		return status;
	rate = log(df1 / df2) / (t2 - t1);
	return Status();
}

template <typename T> void InterpolatedCurve<T>::dump(FILE *fp) const
{
	fprintf(fp, "InterpolatedCurve(%s, extrapolation %s, %d pillars)\n", InterpolatorType_Name(type_).c_str(),
		allow_extrapolation_ ? "on" : "off", (int)pillars_.size());
	for (size_t i = 0; i < pillars_.size(); i++) {
		fprintf(fp, "  %3d  %10.6f  %.12f  %.8f\n", (int)i, times_[i], scalar_value(dfs_[i]),
			-scalar_value(log_dfs_[i]) / times_[i]);
	}
}

template <typename T>
Status make_curve(const std::vector<T> &pillars, const std::vector<T> &discount_factors, InterpolatorType type,
		  bool allow_extrapolation, std::unique_ptr<InterpolatedCurve<T>> &curve)
{
	if (pillars.size() != discount_factors.size()) {
		error("Curve has %d pillars but %d discount factors\n", (int)pillars.size(),
		      (int)discount_factors.size());
		return Status::make(StatusCode::kCRV_MismatchedPillars, ": %d pillars, %d discount factors",
				    (int)pillars.size(), (int)discount_factors.size())
		    .with_counts((int)pillars.size(), (int)discount_factors.size());
	}
	if (pillars.empty()) {
		error("Curve has no pillars\n");
		return Status(StatusCode::kCRV_NoPillars);
	}
	if (!(scalar_value(pillars[0]) > 0.0)) {
		error("First pillar %g is not positive\n", scalar_value(pillars[0]));
		return Status::make(StatusCode::kCRV_NonPositiveMaturity, ", got %g", scalar_value(pillars[0]))
		    .with_index(0)
		    .with_maturity(scalar_value(pillars[0]));
	}
	for (size_t i = 1; i < pillars.size(); i++) {
		if (!(scalar_value(pillars[i]) > scalar_value(pillars[i - 1]))) {
			error("Pillar %d at %g is not above previous pillar %g\n", (int)i, scalar_value(pillars[i]),
			      scalar_value(pillars[i - 1]));
			return Status::make(StatusCode::kCRV_NonIncreasingPillars, " at index %d", (int)i)
			    .with_index((int)i)
			    .with_maturity(scalar_value(pillars[i]));
		}
	}
	for (size_t i = 0; i < discount_factors.size(); i++) {
		if (!(scalar_value(discount_factors[i]) > 0.0)) {
			error("Discount factor %d is %g\n", (int)i, scalar_value(discount_factors[i]));
			return Status::make(StatusCode::kCRV_NonPositiveDiscountFactor, " at index %d", (int)i)
			    .with_index((int)i)
			    .with_maturity(scalar_value(pillars[i]))
			    .with_value(scalar_value(discount_factors[i]));
		}
	}
	std::unique_ptr<InterpolatedCurve<T>> result(new InterpolatedCurve<T>(type, allow_extrapolation));
	result->pillars_ = pillars;
	result->dfs_ = discount_factors;
	result->log_dfs_.reserve(pillars.size());
	result->times_.reserve(pillars.size());
	for (size_t i = 0; i < pillars.size(); i++) {
		result->log_dfs_.push_back(log(discount_factors[i]));
		result->times_.push_back(scalar_value(pillars[i]));
	}
	result->update_spline();
	curve = std::move(result);
	return Status();
}

template class InterpolatedCurve<double>;
template Status make_curve<double>(const std::vector<double> &, const std::vector<double> &, InterpolatorType, bool,
				   std::unique_ptr<InterpolatedCurve<double>> &);
template class InterpolatedCurve<Dual>;
template Status make_curve<Dual>(const std::vector<Dual> &, const std::vector<Dual> &, InterpolatorType, bool,
				 std::unique_ptr<InterpolatedCurve<Dual>> &);

static const std::vector<double> test_pillars = {0.5, 1.0, 2.0, 5.0, 10.0};
static const std::vector<double> test_dfs = {0.9901, 0.9802, 0.9560, 0.8800, 0.7600};

static int test_exact_at_pillars()
{
	int failure_count = 0;
	InterpolatorType types[] = {InterpolatorType::LOG_LINEAR, InterpolatorType::LINEAR_ZERO_RATE,
				    InterpolatorType::FLAT_FORWARD, InterpolatorType::CUBIC_SPLINE,
				    InterpolatorType::MONOTONIC_CUBIC};
	for (InterpolatorType type : types) {
		std::unique_ptr<InterpolatedCurve<double>> curve;
		Status status = make_curve(test_pillars, test_dfs, type, true, curve);
		if (!status.ok()) {
			failure_count++;
			continue;
		}
		for (size_t i = 0; i < test_pillars.size(); i++) {
			double df = 0.0;
			// Just below the pillar so that the interpolation
			// formula is used rather than the stored value
			if (!curve->discount_factor(test_pillars[i] - 1e-11, df).ok() ||
			    std::fabs(df - test_dfs[i]) > 1e-10) {
				fprintf(stderr, "%s: df at pillar %f was %.12f\n", InterpolatorType_Name(type).c_str(),
					test_pillars[i], df);
				failure_count++;
			}
		}
		double df = 0.0;
		if (!curve->discount_factor(0.0, df).ok() || df != 1.0)
			failure_count++;
		// Discount factors decrease between pillars for this data
		double prev = 1.0;
		for (int j = 1; j <= 100; j++) {
			if (!curve->discount_factor(j * 0.1, df).ok() || df > prev) {
				fprintf(stderr, "%s: df not decreasing at %f\n", InterpolatorType_Name(type).c_str(),
					j * 0.1);
				failure_count++;
				break;
			}
			prev = df;
		}
	}
	return failure_count;
}

static int test_interpolation_methods()
{
	int failure_count = 0;
	std::vector<double> pillars = {1.0, 3.0};
	std::vector<double> dfs = {0.97, 0.90};
	std::unique_ptr<InterpolatedCurve<double>> log_linear, flat_forward, zero_linear, cubic;
	make_curve(pillars, dfs, InterpolatorType::LOG_LINEAR, true, log_linear);
	make_curve(pillars, dfs, InterpolatorType::FLAT_FORWARD, true, flat_forward);
	make_curve(pillars, dfs, InterpolatorType::LINEAR_ZERO_RATE, true, zero_linear);
	// Too few pillars for a natural spline
	make_curve(pillars, dfs, InterpolatorType::CUBIC_SPLINE, true, cubic);
	if (!log_linear || !flat_forward || !zero_linear || !cubic)
		return 1;
	for (int j = 0; j <= 20; j++) {
		double t = 1.0 + j * 0.1;
		double a = 0, b = 0, c = 0;
		log_linear->discount_factor(t, a);
		flat_forward->discount_factor(t, b);
		cubic->discount_factor(t, c);
		if (std::fabs(a - b) > 1e-10 || std::fabs(a - c) > 1e-14)
			failure_count++;
	}
	// Log linear at the mid point is the geometric mean
	double df = 0.0;
	log_linear->discount_factor(2.0, df);
	if (std::fabs(df - std::sqrt(0.97 * 0.90)) > 1e-14)
		failure_count++;
	// Linear zero rate at the mid point
	double r1 = -std::log(0.97) / 1.0;
	double r2 = -std::log(0.90) / 3.0;
	zero_linear->discount_factor(2.0, df);
	if (std::fabs(df - std::exp(-0.5 * (r1 + r2) * 2.0)) > 1e-14)
		failure_count++;
	if (zero_linear->interpolator_type() != InterpolatorType::LINEAR_ZERO_RATE)
		failure_count++;
	return failure_count;
}

static int test_extrapolation()
{
	int failure_count = 0;
	std::unique_ptr<InterpolatedCurve<double>> curve;
	make_curve(test_pillars, test_dfs, InterpolatorType::LOG_LINEAR, true, curve);
	double df = 0.0;
	double r_last = -std::log(test_dfs.back()) / test_pillars.back();
	if (!curve->discount_factor(20.0, df).ok() || std::fabs(df - std::exp(-r_last * 20.0)) > 1e-14)
		failure_count++;
	double r_first = -std::log(test_dfs.front()) / test_pillars.front();
	if (!curve->discount_factor(0.25, df).ok() || std::fabs(df - std::exp(-r_first * 0.25)) > 1e-14)
		failure_count++;
	double rate = 0.0;
	if (!curve->zero_rate(0.0, rate).ok() || std::fabs(rate - r_first) > 1e-14)
		failure_count++;
	if (!curve->zero_rate(20.0, rate).ok() || std::fabs(rate - r_last) > 1e-14)
		failure_count++;

	std::unique_ptr<InterpolatedCurve<double>> bounded;
	make_curve(test_pillars, test_dfs, InterpolatorType::LOG_LINEAR, false, bounded);
	Status status = bounded->discount_factor(20.0, df);
	if (status.code() != StatusCode::kCRV_OutOfBounds || status.maturity() != 20.0 || status.value() != 10.0)
		failure_count++;
	status = bounded->discount_factor(0.25, df);
	if (status.code() != StatusCode::kCRV_OutOfBounds)
		failure_count++;
	if (!bounded->discount_factor(10.0, df).ok() || df != test_dfs.back())
		failure_count++;
	if (bounded->domain().first != 0.5 || bounded->domain().second != 10.0 || bounded->allow_extrapolation())
		failure_count++;
	return failure_count;
}

static int test_rates()
{
	int failure_count = 0;
	std::unique_ptr<InterpolatedCurve<double>> curve;
	make_curve(test_pillars, test_dfs, InterpolatorType::LOG_LINEAR, true, curve);
	double rate = 0.0;
	if (!curve->forward_rate(1.0, 2.0, rate).ok() || std::fabs(rate - std::log(0.9802 / 0.9560)) > 1e-14)
		failure_count++;
	if (curve->forward_rate(2.0, 2.0, rate).code() != StatusCode::kBadArgument)
		failure_count++;
	if (curve->forward_rate(2.0, 1.0, rate).code() != StatusCode::kBadArgument)
		failure_count++;
	double df;
	if (curve->discount_factor(-1.0, df).code() != StatusCode::kCRV_NegativeTime)
		failure_count++;
	if (curve->zero_rate(-1.0, rate).code() != StatusCode::kCRV_NegativeTime)
		failure_count++;
	if (!curve->zero_rate(2.0, rate).ok() || std::fabs(rate + std::log(0.9560) / 2.0) > 1e-14)
		failure_count++;
	return failure_count;
}

static int test_construction_errors()
{
	int failure_count = 0;
	std::unique_ptr<InterpolatedCurve<double>> curve;
	Status status = make_curve(std::vector<double>{1.0, 2.0}, std::vector<double>{0.99}, InterpolatorType::LOG_LINEAR,
				   true, curve);
	if (status.code() != StatusCode::kCRV_MismatchedPillars || curve)
		failure_count++;
	status = make_curve(std::vector<double>{}, std::vector<double>{}, InterpolatorType::LOG_LINEAR, true, curve);
	if (status.code() != StatusCode::kCRV_NoPillars)
		failure_count++;
	status = make_curve(std::vector<double>{1.0, 2.0, 2.0}, std::vector<double>{0.99, 0.98, 0.97},
			    InterpolatorType::LOG_LINEAR, true, curve);
	if (status.code() != StatusCode::kCRV_NonIncreasingPillars || status.index() != 2)
		failure_count++;
	status = make_curve(std::vector<double>{1.0, 2.0}, std::vector<double>{0.99, -0.1}, InterpolatorType::LOG_LINEAR,
			    true, curve);
	if (status.code() != StatusCode::kCRV_NonPositiveDiscountFactor || status.index() != 1)
		failure_count++;
	status = make_curve(std::vector<double>{0.0, 2.0}, std::vector<double>{1.0, 0.98}, InterpolatorType::LOG_LINEAR,
			    true, curve);
	if (status.code() != StatusCode::kCRV_NonPositiveMaturity)
		failure_count++;

	InterpolatedCurve<double> empty;
	double df;
	if (empty.discount_factor(1.0, df).code() != StatusCode::kCRV_NoPillars)
		failure_count++;
	if (!empty.add_pillar(1.0, 0.98).ok() || !empty.add_pillar(2.0, 0.96).ok())
		failure_count++;
	if (empty.add_pillar(2.0, 0.95).code() != StatusCode::kCRV_NonIncreasingPillars)
		failure_count++;
	if (empty.add_pillar(3.0, 0.0).code() != StatusCode::kCRV_NonPositiveDiscountFactor)
		failure_count++;
	if (empty.pillar_count() != 2 || empty.min_maturity() != 1.0 || empty.max_maturity() != 2.0)
		failure_count++;
	return failure_count;
}

static int test_non_finite_time()
{
	int failure_count = 0;
	std::unique_ptr<InterpolatedCurve<double>> curve;
	if (!make_curve(std::vector<double>{1.0, 2.0, 3.0}, std::vector<double>{0.97, 0.94, 0.91},
			InterpolatorType::LOG_LINEAR, true, curve)
		 .ok())
		return 1;
	double nan = std::numeric_limits<double>::quiet_NaN();
	double inf = std::numeric_limits<double>::infinity();
	double df = -1.0, rate = -1.0;
	if (curve->discount_factor(nan, df).code() != StatusCode::kBadArgument || df != -1.0)
		failure_count++;
	if (curve->discount_factor(inf, df).code() != StatusCode::kBadArgument)
		failure_count++;
	if (curve->zero_rate(nan, rate).code() != StatusCode::kBadArgument || rate != -1.0)
		failure_count++;
	if (curve->forward_rate(nan, 2.0, rate).code() != StatusCode::kBadArgument ||
	    curve->forward_rate(1.0, nan, rate).code() != StatusCode::kBadArgument)
		failure_count++;
	return failure_count;
}

int test_curves()
{
	int failure_count = 0;
	failure_count += test_exact_at_pillars();
	failure_count += test_interpolation_methods();
	failure_count += test_extrapolation();
	failure_count += test_rates();
	failure_count += test_construction_errors();
	failure_count += test_non_finite_time();
	if (failure_count == 0)
		printf("Curve Tests OK\n");
	else
		printf("Curve Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
