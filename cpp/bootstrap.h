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

#ifndef _RATESTRAP_BOOTSTRAP_H
#define _RATESTRAP_BOOTSTRAP_H

#include <enums.pb.h>

#include <config.h>
#include <curve.h>
#include <instrument.h>
#include <scalar.h>
#include <status.h>

#include <memory>
#include <vector>

namespace ratestrap
{

// The pillars solved so far during a bootstrap. Discount factors
// are interpolated log-linearly between pillars and the zero rate
// of the edge pillar is held flat outside them; with no pillars
// every discount factor is 1.
template <typename T> class PartialCurve
{
	public:
	explicit PartialCurve(size_t capacity = 0)
	{
		pillars_.reserve(capacity);
		dfs_.reserve(capacity);
		log_dfs_.reserve(capacity);
		times_.reserve(capacity);
	}

	// t must be above the last pillar
	void append(T t, T df);
	T discount(T t) const;
	// Replaces the discount factor of pillar i
	void set_discount_factor(size_t i, T df);

	size_t size() const { return pillars_.size(); }
	bool empty() const { return pillars_.empty(); }
	const std::vector<T> &pillars() const { return pillars_; }
	const std::vector<T> &discount_factors() const { return dfs_; }

	// The returned function refers to this object
	DiscountFunction<T> as_function() const
	{
		return [this](T t) -> T { return discount(t); };
	}

	private:
	std::vector<T> pillars_;
	std::vector<T> dfs_;
	std::vector<T> log_dfs_;
	std::vector<double> times_;
};

// Output of a bootstrap. The vectors are parallel and in pillar
// (ascending maturity) order; order[i] is the position in the input
// list of the instrument that fixed pillar i.
template <typename T> struct BootstrapResult {
	std::shared_ptr<const InterpolatedCurve<T>> curve;
	std::vector<T> pillars;
	std::vector<T> discount_factors;
	// Residual of each instrument at its solved discount factor
	std::vector<T> residuals;
	// Newton iterations used per pillar
	std::vector<int> iterations;
	std::vector<SolverType> solvers;
	std::vector<size_t> order;
};

// Solves one pillar per instrument in ascending maturity order,
// each against the curve built from the earlier pillars. Newton's
// method is tried first; for double a MINPACK hybrid solve on the
// log discount factor is attempted when Newton fails.
// Either every pillar is solved and a curve produced, or an
// error is returned and the result is left untouched.
template <typename T> class SequentialBootstrapper
{
	public:
	explicit SequentialBootstrapper(const BootstrapConfig &config = BootstrapConfig()) : config_(config) {}

	Status bootstrap(const std::vector<Instrument<T>> &instruments, BootstrapResult<T> &result) const;

	const BootstrapConfig &config() const { return config_; }

	private:
	Status solve_pillar(const Instrument<T> &instrument, size_t input_index, const PartialCurve<T> &partial,
			    T &df, T &residual, int &iterations, SolverType &solver) const;

	BootstrapConfig config_;
};

// Stable sort of instrument positions by maturity
template <typename T> std::vector<size_t> sort_by_maturity(const std::vector<Instrument<T>> &instruments);

extern int test_bootstrap();

} // namespace ratestrap

#endif
