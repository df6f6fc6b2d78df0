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

#include <dual.h>
#include <multi_curve.h>

#include <logger.h>

#include <string.h>

#include <algorithm>
#include <cmath>

namespace ratestrap
{

double tenor_period_years(Tenor tenor)
{
	switch (tenor) {
	case Tenor::TENOR_ON:
		return 1.0 / 365.0;
	case Tenor::TENOR_1M:
		return 1.0 / 12.0;
	case Tenor::TENOR_3M:
		return 0.25;
	case Tenor::TENOR_6M:
		return 0.5;
	case Tenor::TENOR_12M:
		return 1.0;
	default:
		return 0.0;
	}
}

const char *tenor_name(Tenor tenor)
{
	switch (tenor) {
	case Tenor::TENOR_ON:
		return "ON";
	case Tenor::TENOR_1M:
		return "1M";
	case Tenor::TENOR_3M:
		return "3M";
	case Tenor::TENOR_6M:
		return "6M";
	case Tenor::TENOR_12M:
		return "12M";
	default:
		return "?";
	}
}

template <typename T>
Status MultiCurveBuilder<T>::build(const std::vector<Instrument<T>> &discount_instruments,
				   const ForwardInstruments<T> &forwards, CurveSet<T> &curve_set) const
{
	SequentialBootstrapper<T> bootstrapper(config_);
	BootstrapResult<T> discount;
	Status status = bootstrapper.bootstrap(discount_instruments, discount);
	if (!status.ok()) {
		error("Failed to build discount curve: %s\n", status.message());
		return status;
	}
	CurveSet<T> result(discount);
	for (auto &item : forwards) {
		if (item.second.empty())
			continue;
		BootstrapResult<T> forward;
		status = bootstrapper.bootstrap(item.second, forward);
		if (!status.ok()) {
			error("Failed to build %s forward curve: %s\n", tenor_name(item.first), status.message());
			return status;
		}
		result.add_forward(item.first, forward);
	}
	curve_set = std::move(result);
	return Status();
}

template <typename T>
Status MultiCurveBuilder<T>::build_parallel(const std::vector<Instrument<T>> &discount_instruments,
					    const ForwardInstruments<T> &forwards, CurveSet<T> &curve_set) const
{
	SequentialBootstrapper<T> bootstrapper(config_);
	BootstrapResult<T> discount;
	Status status = bootstrapper.bootstrap(discount_instruments, discount);
	if (!status.ok()) {
		error("Failed to build discount curve: %s\n", status.message());
		return status;
	}

	std::vector<size_t> work;
	for (size_t i = 0; i < forwards.size(); i++) {
		if (!forwards[i].second.empty())
			work.push_back(i);
	}
	std::vector<BootstrapResult<T>> results(work.size());
	std::vector<Status> statuses(work.size());
	auto task = [&](size_t k) {
		statuses[k] = bootstrapper.bootstrap(forwards[work[k]].second, results[k]);
	};
	if (pool_) {
		pool_->parallel_for(work.size(), task);
	} else if (!work.empty()) {
		WorkStealingPool pool(std::min((size_t)config_.effective_threads(), work.size()));
		pool.parallel_for(work.size(), task);
	}

	CurveSet<T> result(discount);
	for (size_t k = 0; k < work.size(); k++) {
		Tenor tenor = forwards[work[k]].first;
		if (!statuses[k].ok()) {
			error("Failed to build %s forward curve: %s\n", tenor_name(tenor), statuses[k].message());
			return statuses[k];
		}
		result.add_forward(tenor, results[k]);
	}
	curve_set = std::move(result);
	return Status();
}

template <typename T>
Status MultiCurveBuilder<T>::build_single_curve(const std::vector<Instrument<T>> &instruments,
						CurveSet<T> &curve_set) const
{
	return build(instruments, ForwardInstruments<T>(), curve_set);
}

template <typename T>
Status MultiCurveBuilder<T>::build_discount_curve(const std::vector<Instrument<T>> &instruments,
						  CurveSet<T> &curve_set) const
{
	return build_single_curve(instruments, curve_set);
}

template <typename T> void ParallelCurveSetBuilder<T>::run(size_t n, const std::function<void(size_t)> &fn) const
{
	if (n == 0)
		return;
	if (pool_) {
		pool_->parallel_for(n, fn);
	} else {
		WorkStealingPool pool(std::min((size_t)config_.effective_threads(), n));
		pool.parallel_for(n, fn);
	}
}

template <typename T>
void ParallelCurveSetBuilder<T>::build_batch_elements(const std::vector<CurveSetInstruments<T>> &batch,
						      std::vector<CurveSet<T>> &curve_sets,
						      std::vector<Status> &statuses) const
{
	MultiCurveBuilder<T> builder(config_);
	std::vector<CurveSet<T>> built(batch.size());
	std::vector<Status> outcomes(batch.size());
	run(batch.size(), [&](size_t i) { outcomes[i] = builder.build(batch[i].discount, batch[i].forwards, built[i]); });
	curve_sets = std::move(built);
	statuses = std::move(outcomes);
}

template <typename T>
Status ParallelCurveSetBuilder<T>::collect(const std::vector<Status> &statuses, std::vector<CurveSet<T>> &built,
					   std::vector<CurveSet<T>> &curve_sets) const
{
	for (size_t i = 0; i < statuses.size(); i++) {
		if (!statuses[i].ok()) {
			const Status &cause = statuses[i];
			error("Batch element %d failed: %s\n", (int)i, cause.message());
			return Status::make(StatusCode::kMCB_BatchElementFailed, ": element %d: %s", (int)i,
					    cause.message())
			    .with_index((int)i)
			    .with_maturity(cause.maturity())
			    .with_value(cause.value())
			    .with_iterations(cause.iterations());
		}
	}
	curve_sets = std::move(built);
	return Status();
}

template <typename T>
Status ParallelCurveSetBuilder<T>::build_batch(const std::vector<CurveSetInstruments<T>> &batch,
					       std::vector<CurveSet<T>> &curve_sets) const
{
	std::vector<CurveSet<T>> built;
	std::vector<Status> statuses;
	build_batch_elements(batch, built, statuses);
	return collect(statuses, built, curve_sets);
}

template <typename T>
Status ParallelCurveSetBuilder<T>::build_single_curves_batch(const std::vector<std::vector<Instrument<T>>> &batch,
							     std::vector<CurveSet<T>> &curve_sets) const
{
	MultiCurveBuilder<T> builder(config_);
	std::vector<CurveSet<T>> built(batch.size());
	std::vector<Status> statuses(batch.size());
	run(batch.size(), [&](size_t i) { statuses[i] = builder.build_single_curve(batch[i], built[i]); });
	return collect(statuses, built, curve_sets);
}

template <typename T>
Status ParallelCurveSetBuilder<T>::build_discount_curves_batch(const std::vector<std::vector<Instrument<T>>> &batch,
							       std::vector<CurveSet<T>> &curve_sets) const
{
	MultiCurveBuilder<T> builder(config_);
	std::vector<CurveSet<T>> built(batch.size());
	std::vector<Status> statuses(batch.size());
	run(batch.size(), [&](size_t i) { statuses[i] = builder.build_discount_curve(batch[i], built[i]); });
	return collect(statuses, built, curve_sets);
}

template class CurveSet<double>;
template class MultiCurveBuilder<double>;
template class ParallelCurveSetBuilder<double>;
template class CurveSet<Dual>;
template class MultiCurveBuilder<Dual>;
template class ParallelCurveSetBuilder<Dual>;

static std::vector<Instrument<double>> discount_instruments()
{
	return {Instrument<double>::ois(0.5, 0.020), Instrument<double>::ois(1.0, 0.021),
		Instrument<double>::ois(2.0, 0.023), Instrument<double>::ois(5.0, 0.026),
		Instrument<double>::ois(10.0, 0.029)};
}

static ForwardInstruments<double> forward_instruments()
{
	ForwardInstruments<double> forwards;
	forwards.push_back(std::make_pair(Tenor::TENOR_3M, std::vector<Instrument<double>>{
							       Instrument<double>::fra(0.0, 0.25, 0.0225),
							       Instrument<double>::fra(0.25, 0.5, 0.0235),
							       Instrument<double>::irs(1.0, 0.024, Frequency::QUARTERLY),
							       Instrument<double>::irs(5.0, 0.0285, Frequency::QUARTERLY)}));
	forwards.push_back(std::make_pair(Tenor::TENOR_6M, std::vector<Instrument<double>>{
							       Instrument<double>::fra(0.0, 0.5, 0.024),
							       Instrument<double>::irs(2.0, 0.0265, Frequency::SEMI_ANNUAL),
							       Instrument<double>::irs(10.0, 0.032, Frequency::SEMI_ANNUAL)}));
	forwards.push_back(std::make_pair(Tenor::TENOR_1M, std::vector<Instrument<double>>()));
	forwards.push_back(std::make_pair(Tenor::TENOR_12M, std::vector<Instrument<double>>{
								Instrument<double>::irs(1.0, 0.026),
								Instrument<double>::irs(3.0, 0.029),
								Instrument<double>::irs(7.0, 0.033)}));
	return forwards;
}

static int compare_curves(const InterpolatedCurve<double> &a, const InterpolatedCurve<double> &b)
{
	if (a.pillar_count() != b.pillar_count())
		return 1;
	for (size_t i = 0; i < a.pillar_count(); i++) {
		if (a.pillars()[i] != b.pillars()[i] ||
		    std::fabs(a.discount_factors()[i] - b.discount_factors()[i]) > 1e-12)
			return 1;
	}
	return 0;
}

static int test_sequential_parallel_equivalence()
{
	int failure_count = 0;
	MultiCurveBuilder<double> builder;
	CurveSet<double> sequential, parallel;
	Status status = builder.build(discount_instruments(), forward_instruments(), sequential);
	if (!status.ok()) {
		fprintf(stderr, "Sequential build failed: %s\n", status.message());
		return 1;
	}
	MultiCurveBuilder<double> pooled(BootstrapConfig(), std::make_shared<WorkStealingPool>(4));
	status = pooled.build_parallel(discount_instruments(), forward_instruments(), parallel);
	if (!status.ok()) {
		fprintf(stderr, "Parallel build failed: %s\n", status.message());
		return 1;
	}
	// The 1M tenor has no instruments and is skipped
	if (sequential.forward_curve_count() != 3 || parallel.forward_curve_count() != 3)
		failure_count++;
	if (sequential.has_forward_curve(Tenor::TENOR_1M) || !sequential.has_forward_curve(Tenor::TENOR_6M))
		failure_count++;
	failure_count += compare_curves(*sequential.discount_curve(), *parallel.discount_curve());
	for (Tenor tenor : sequential.tenors())
		failure_count += compare_curves(*sequential.forward_curve(tenor), *parallel.forward_curve(tenor));
	std::vector<Tenor> expected = {Tenor::TENOR_3M, Tenor::TENOR_6M, Tenor::TENOR_12M};
	if (parallel.tenors() != expected)
		failure_count++;
	return failure_count;
}

static int test_lookup_fallback()
{
	int failure_count = 0;
	MultiCurveBuilder<double> builder;
	CurveSet<double> single;
	if (!builder.build_single_curve(discount_instruments(), single).ok())
		return 1;
	if (!single.is_single_curve() || single.forward_curve_count() != 0)
		failure_count++;
	if (single.forward_curve(Tenor::TENOR_3M) != single.discount_curve() ||
	    single.forward_curve(kDefaultTenor) != single.discount_curve())
		failure_count++;
	if (single.forward_result(Tenor::TENOR_3M) != nullptr)
		failure_count++;
	CurveSet<double> discount_only;
	if (!builder.build_discount_curve(discount_instruments(), discount_only).ok() ||
	    !discount_only.is_single_curve() ||
	    discount_only.discount_result().discount_factors != single.discount_result().discount_factors)
		failure_count++;

	// The same orchestration runs on a differentiable scalar
	std::vector<Instrument<Dual>> dual_instruments;
	for (auto &instrument : discount_instruments())
		dual_instruments.push_back(Instrument<Dual>::ois(instrument.maturity(), instrument.rate()));
	MultiCurveBuilder<Dual> dual_builder;
	CurveSet<Dual> dual_set;
	if (!dual_builder.build_discount_curve(dual_instruments, dual_set).ok() ||
	    dual_set.discount_result().pillars.size() != single.discount_result().pillars.size())
		failure_count++;

	CurveSet<double> multi;
	if (!builder.build(discount_instruments(), forward_instruments(), multi).ok())
		return failure_count + 1;
	if (multi.is_single_curve() || multi.forward_curve(Tenor::TENOR_3M) == multi.discount_curve())
		failure_count++;
	if (multi.forward_curve(Tenor::TENOR_1M) != multi.discount_curve())
		failure_count++;

	if (std::fabs(tenor_period_years(Tenor::TENOR_ON) - 1.0 / 365.0) > 1e-15 ||
	    tenor_period_years(Tenor::TENOR_6M) != 0.5 || strcmp(tenor_name(Tenor::TENOR_12M), "12M") != 0 ||
	    strcmp(tenor_name(kDefaultTenor), "3M") != 0)
		failure_count++;
	return failure_count;
}

// Every coupon date falls on a pillar solved earlier, so the final
// curve reprices each instrument exactly
static int test_par_round_trip()
{
	int failure_count = 0;
	std::vector<Instrument<double>> discount = {Instrument<double>::ois(1.0, 0.021), Instrument<double>::ois(2.0, 0.023),
						    Instrument<double>::ois(3.0, 0.025)};
	ForwardInstruments<double> forwards;
	forwards.push_back(std::make_pair(
	    Tenor::TENOR_3M, std::vector<Instrument<double>>{
				 Instrument<double>::fra(0.0, 0.25, 0.0225), Instrument<double>::fra(0.25, 0.5, 0.0235),
				 Instrument<double>::fra(0.5, 0.75, 0.024), Instrument<double>::irs(1.0, 0.0242, Frequency::QUARTERLY)}));
	forwards.push_back(std::make_pair(
	    Tenor::TENOR_6M, std::vector<Instrument<double>>{
				 Instrument<double>::fra(0.0, 0.5, 0.024), Instrument<double>::irs(1.0, 0.0248, Frequency::SEMI_ANNUAL),
				 Instrument<double>::irs(1.5, 0.0255, Frequency::SEMI_ANNUAL),
				 Instrument<double>::irs(2.0, 0.0262, Frequency::SEMI_ANNUAL)}));
	MultiCurveBuilder<double> builder;
	CurveSet<double> curve_set;
	if (!builder.build(discount, forwards, curve_set).ok())
		return 1;
	forwards.push_back(std::make_pair(Tenor::TENOR_UNSPECIFIED, discount));
	for (auto &item : forwards) {
		auto curve = item.first == Tenor::TENOR_UNSPECIFIED ? curve_set.discount_curve()
								    : curve_set.forward_curve(item.first);
		DiscountFunction<double> f = [&curve](double t) {
			double df = 1.0;
			curve->discount_factor(t, df);
			return df;
		};
		for (auto &instrument : item.second) {
			double par = instrument.implied_rate(f(instrument.maturity()), f);
			if (std::fabs(par - instrument.rate()) > 1e-10) {
				fprintf(stderr, "%s %s at %f: expected %.12f, got %.12f\n", tenor_name(item.first),
					instrument.type_name(), instrument.maturity(), instrument.rate(), par);
				failure_count++;
			}
		}
	}
	return failure_count;
}

static int test_batch()
{
	int failure_count = 0;
	ParallelCurveSetBuilder<double> batch_builder(BootstrapConfig(), std::make_shared<WorkStealingPool>(3));
	std::vector<CurveSetInstruments<double>> batch;
	for (int i = 0; i < 6; i++) {
		CurveSetInstruments<double> element;
		element.discount = {Instrument<double>::ois(1.0, 0.02 + 0.001 * i), Instrument<double>::ois(3.0, 0.025)};
		element.forwards = forward_instruments();
		batch.push_back(element);
	}
	std::vector<CurveSet<double>> curve_sets;
	Status status = batch_builder.build_batch(batch, curve_sets);
	if (!status.ok() || curve_sets.size() != 6) {
		fprintf(stderr, "Batch build failed: %s\n", status.message());
		return 1;
	}
	// Each element matches a standalone sequential build
	MultiCurveBuilder<double> builder;
	for (size_t i = 0; i < batch.size(); i++) {
		CurveSet<double> expected;
		builder.build(batch[i].discount, batch[i].forwards, expected);
		failure_count += compare_curves(*expected.discount_curve(), *curve_sets[i].discount_curve());
	}

	// Elements 2 and 4 fail; the first failure is reported
	batch[2].discount = {Instrument<double>::ois(1.0, 0.02), Instrument<double>::ois(1.0, 0.021)};
	batch[4].discount.clear();
	std::vector<CurveSet<double>> untouched;
	status = batch_builder.build_batch(batch, untouched);
	if (status.code() != StatusCode::kMCB_BatchElementFailed || status.index() != 2 || !untouched.empty())
		failure_count++;

	std::vector<Status> statuses;
	batch_builder.build_batch_elements(batch, curve_sets, statuses);
	if (statuses.size() != 6 || !statuses[0].ok() || statuses[2].code() != StatusCode::kBTS_DuplicateMaturity ||
	    statuses[4].code() != StatusCode::kBTS_InsufficientData || !statuses[5].ok())
		failure_count++;
	if (!curve_sets[5].discount_curve() || curve_sets[2].discount_curve())
		failure_count++;

	std::vector<std::vector<Instrument<double>>> singles = {discount_instruments(), discount_instruments()};
	if (!batch_builder.build_single_curves_batch(singles, curve_sets).ok() || curve_sets.size() != 2 ||
	    !curve_sets[1].is_single_curve())
		failure_count++;
	singles.push_back(std::vector<Instrument<double>>());
	status = batch_builder.build_discount_curves_batch(singles, curve_sets);
	if (status.code() != StatusCode::kMCB_BatchElementFailed || status.index() != 2)
		failure_count++;

	// Without a shared pool the builder makes its own
	ParallelCurveSetBuilder<double> standalone;
	std::vector<CurveSetInstruments<double>> empty;
	if (!standalone.build_batch(empty, curve_sets).ok() || !curve_sets.empty())
		failure_count++;
	return failure_count;
}

int test_multi_curve()
{
	int failure_count = 0;
	failure_count += test_sequential_parallel_equivalence();
	failure_count += test_lookup_fallback();
	failure_count += test_par_round_trip();
	failure_count += test_batch();
	if (failure_count == 0)
		printf("Multi Curve Tests OK\n");
	else
		printf("Multi Curve Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
