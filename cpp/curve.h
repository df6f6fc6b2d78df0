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

#ifndef _RATESTRAP_CURVE_H
#define _RATESTRAP_CURVE_H

#include <enums.pb.h>

#include <interpolators.h>
#include <scalar.h>
#include <status.h>

#include <stdio.h>

#include <memory>
#include <utility>
#include <vector>

namespace ratestrap
{

// A discount curve on year fractions from the reference date.
// All lookups report failure through the returned Status and
// write the result to the output parameter.
template <typename T> class YieldCurve
{
	public:
	YieldCurve() {}
	virtual ~YieldCurve() noexcept {}

	// Discount factor from t to the reference date;
	// t = 0 always gives 1
	virtual Status discount_factor(T t, T &df) const = 0;

	// Continuously compounded zero rate -ln(df) / t; at t = 0
	// the rate of the first pillar is returned
	virtual Status zero_rate(T t, T &rate) const = 0;

	// Continuously compounded forward rate between t1 and t2.
	// t2 must be greater than t1.
	virtual Status forward_rate(T t1, T t2, T &rate) const = 0;

	// First and last pillar maturities
	virtual std::pair<double, double> domain() const = 0;

	virtual InterpolatorType interpolator_type() const = 0;

	virtual void dump(FILE *fp = stdout) const = 0;

	private:
	YieldCurve(const YieldCurve &) = delete;
	YieldCurve &operator=(const YieldCurve &) = delete;
};

// Curve defined by (maturity, discount factor) pillars with
// interpolation in between. Pillars are strictly increasing
// and positive, discount factors are positive; the implicit
// pillar (0, 1) is not stored. Pillars can only be appended.
//
// Outside the pillars the zero rate of the nearest pillar is held
// flat, unless extrapolation is disabled in which case lookups
// fail with kCRV_OutOfBounds.
//
// The spline methods work on double values; if the spline cannot
// be built (too few pillars) the curve interpolates log-linearly.
template <typename T> class InterpolatedCurve final : public YieldCurve<T>
{
	public:
	explicit InterpolatedCurve(InterpolatorType type = InterpolatorType::LOG_LINEAR,
				   bool allow_extrapolation = true);

	// Appends a pillar; t must be above the last pillar
	Status add_pillar(T t, T df);

	Status discount_factor(T t, T &df) const override;
	Status zero_rate(T t, T &rate) const override;
	Status forward_rate(T t1, T t2, T &rate) const override;
	std::pair<double, double> domain() const override
	{
		return std::pair<double, double>(min_maturity(), max_maturity());
	}
	InterpolatorType interpolator_type() const override { return type_; }
	void dump(FILE *fp = stdout) const override;

	const std::vector<T> &pillars() const { return pillars_; }
	const std::vector<T> &discount_factors() const { return dfs_; }
	// 0 if there are no pillars
	double min_maturity() const { return times_.empty() ? 0.0 : times_.front(); }
	double max_maturity() const { return times_.empty() ? 0.0 : times_.back(); }
	size_t pillar_count() const { return pillars_.size(); }
	bool allow_extrapolation() const { return allow_extrapolation_; }

	private:
	T interpolate(double t, size_t i) const;
	T extrapolate(double t, size_t edge) const;
	void update_spline();

	InterpolatorType type_;
	bool allow_extrapolation_;
	std::vector<T> pillars_;
	std::vector<T> dfs_;
	std::vector<T> log_dfs_;
	// pillar maturities as double for searching
	std::vector<double> times_;
	// only set for the spline methods
	std::unique_ptr<Interpolator> spline_;

	template <typename U>
	friend Status make_curve(const std::vector<U> &pillars, const std::vector<U> &discount_factors,
				 InterpolatorType type, bool allow_extrapolation,
				 std::unique_ptr<InterpolatedCurve<U>> &curve);
};

// Validates the arrays and creates a curve. Fails if the arrays
// differ in length or are empty, if the first pillar is not
// positive, or if pillars are not strictly increasing or a
// discount factor is not positive (the index of the offending
// entry is recorded in the status).
template <typename T>
Status make_curve(const std::vector<T> &pillars, const std::vector<T> &discount_factors, InterpolatorType type,
		  bool allow_extrapolation, std::unique_ptr<InterpolatedCurve<T>> &curve);

extern int test_curves();

} // namespace ratestrap

#endif
