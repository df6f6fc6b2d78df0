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

#ifndef _RATESTRAP_MULTI_CURVE_H
#define _RATESTRAP_MULTI_CURVE_H

#include <enums.pb.h>

#include <bootstrap.h>
#include <config.h>
#include <curve.h>
#include <instrument.h>
#include <status.h>
#include <threadpool.h>

#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace ratestrap
{

// Tenor used when a caller does not name one
const Tenor kDefaultTenor = Tenor::TENOR_3M;

// Index period in years: 1/365, 1/12, 0.25, 0.5, 1
extern double tenor_period_years(Tenor tenor);
// "ON", "1M", "3M", "6M" or "12M"
extern const char *tenor_name(Tenor tenor);

// Instruments for each forward curve, in the order the caller listed them
template <typename T> using ForwardInstruments = std::vector<std::pair<Tenor, std::vector<Instrument<T>>>>;

// Everything needed to build one CurveSet
template <typename T> struct CurveSetInstruments {
	std::vector<Instrument<T>> discount;
	ForwardInstruments<T> forwards;
};

// A discount curve plus optional forward curves by index tenor.
// Looking up a tenor without its own curve gives the discount curve.
template <typename T> class CurveSet
{
	public:
	typedef std::shared_ptr<const InterpolatedCurve<T>> CurvePointer;

	CurveSet() {}
	explicit CurveSet(const BootstrapResult<T> &discount) : discount_(discount) {}

	const CurvePointer &discount_curve() const { return discount_.curve; }
	const CurvePointer &forward_curve(Tenor tenor) const
	{
		auto iter = forwards_.find(tenor);
		if (iter == forwards_.end())
			return discount_.curve;
		return iter->second.curve;
	}

	// Bootstrap diagnostics for the curves
	const BootstrapResult<T> &discount_result() const { return discount_; }
	// nullptr if there is no curve for the tenor
	const BootstrapResult<T> *forward_result(Tenor tenor) const
	{
		auto iter = forwards_.find(tenor);
		return iter == forwards_.end() ? nullptr : &iter->second;
	}

	void set_discount(const BootstrapResult<T> &result) { discount_ = result; }
	void add_forward(Tenor tenor, const BootstrapResult<T> &result) { forwards_[tenor] = result; }

	bool has_forward_curve(Tenor tenor) const { return forwards_.find(tenor) != forwards_.end(); }
	// Tenors with their own curve, in ascending order
	std::vector<Tenor> tenors() const
	{
		std::vector<Tenor> result;
		for (auto &item : forwards_)
			result.push_back(item.first);
		return result;
	}
	size_t forward_curve_count() const { return forwards_.size(); }
	bool is_single_curve() const { return forwards_.empty(); }

	private:
	BootstrapResult<T> discount_;
	std::map<Tenor, BootstrapResult<T>> forwards_;
};

// Builds a CurveSet: the discount curve first, then one curve per
// tenor with instruments, each bootstrapped independently.
// Tenors with no instruments are skipped.
template <typename T> class MultiCurveBuilder
{
	public:
	// If no pool is given, build_parallel() creates one per call
	explicit MultiCurveBuilder(const BootstrapConfig &config = BootstrapConfig(),
				   std::shared_ptr<WorkStealingPool> pool = nullptr)
	    : config_(config), pool_(pool)
	{
	}

	Status build(const std::vector<Instrument<T>> &discount_instruments, const ForwardInstruments<T> &forwards,
		     CurveSet<T> &curve_set) const;
	// Same result as build(); after the discount curve is done
	// the forward curves are bootstrapped concurrently
	Status build_parallel(const std::vector<Instrument<T>> &discount_instruments,
			      const ForwardInstruments<T> &forwards, CurveSet<T> &curve_set) const;
	// One curve used for both discounting and forwarding
	Status build_single_curve(const std::vector<Instrument<T>> &instruments, CurveSet<T> &curve_set) const;
	Status build_discount_curve(const std::vector<Instrument<T>> &instruments, CurveSet<T> &curve_set) const;

	const BootstrapConfig &config() const { return config_; }

	private:
	BootstrapConfig config_;
	std::shared_ptr<WorkStealingPool> pool_;
};

// Builds many CurveSets concurrently, one pool task per set.
// Each task runs the sequential build so that the pool is
// not entered recursively.
template <typename T> class ParallelCurveSetBuilder
{
	public:
	explicit ParallelCurveSetBuilder(const BootstrapConfig &config = BootstrapConfig(),
					 std::shared_ptr<WorkStealingPool> pool = nullptr)
	    : config_(config), pool_(pool)
	{
	}

	// On success curve_sets holds one entry per input, in input
	// order. If any element fails the status of the first failing
	// element is returned as kMCB_BatchElementFailed with the
	// element position as index, and curve_sets is not modified.
	Status build_batch(const std::vector<CurveSetInstruments<T>> &batch, std::vector<CurveSet<T>> &curve_sets) const;
	Status build_single_curves_batch(const std::vector<std::vector<Instrument<T>>> &batch,
					 std::vector<CurveSet<T>> &curve_sets) const;
	Status build_discount_curves_batch(const std::vector<std::vector<Instrument<T>>> &batch,
					   std::vector<CurveSet<T>> &curve_sets) const;

	// Builds every element and reports each outcome; curve_sets[i]
	// is only meaningful where statuses[i] is ok
	void build_batch_elements(const std::vector<CurveSetInstruments<T>> &batch, std::vector<CurveSet<T>> &curve_sets,
				  std::vector<Status> &statuses) const;

	const BootstrapConfig &config() const { return config_; }

	private:
	Status collect(const std::vector<Status> &statuses, std::vector<CurveSet<T>> &built,
		       std::vector<CurveSet<T>> &curve_sets) const;
	void run(size_t n, const std::function<void(size_t)> &fn) const;

	BootstrapConfig config_;
	std::shared_ptr<WorkStealingPool> pool_;
};

extern int test_multi_curve();

} // namespace ratestrap

#endif
