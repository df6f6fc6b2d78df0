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

#include <bootstrap.h>
#include <dual.h>

#include <logger.h>

#include <cminpack.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace ratestrap
{

static const double kDuplicateMaturityTolerance = 1e-10;
static const double kMinDerivative = 1e-30;

template <typename T> void PartialCurve<T>::append(T t, T df)
{
	pillars_.push_back(t);
	dfs_.push_back(df);
	log_dfs_.push_back(log(df));
	times_.push_back(scalar_value(t));
}

template <typename T> void PartialCurve<T>::set_discount_factor(size_t i, T df)
{
	dfs_[i] = df;
	log_dfs_[i] = log(df);
}

template <typename T> T PartialCurve<T>::discount(T t) const
{
	double time = scalar_value(t);
	if (!(time > 0.0) || times_.empty())
		return ScalarTraits<T>::from_value(1.0);
	if (time < times_.front())
		return exp(log_dfs_.front() / pillars_.front() * t);
	if (time > times_.back())
		return exp(log_dfs_.back() / pillars_.back() * t);
	// first pillar strictly above t
	size_t hi = std::upper_bound(times_.begin(), times_.end(), time) - times_.begin();
	if (hi == times_.size() || times_[hi - 1] == time)
		return dfs_[hi - 1];
	size_t lo = hi - 1;
	T w = (t - pillars_[lo]) / (pillars_[hi] - pillars_[lo]);
	return exp(log_dfs_[lo] + (log_dfs_[hi] - log_dfs_[lo]) * w);
}

template <typename T> std::vector<size_t> sort_by_maturity(const std::vector<Instrument<T>> &instruments)
{
	std::vector<size_t> order(instruments.size());
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&instruments](size_t a, size_t b) {
		return scalar_value(instruments[a].maturity()) < scalar_value(instruments[b].maturity());
	});
	return order;
}

struct HybridSolverContext {
	const Instrument<double> *instrument;
	const DiscountFunction<double> *partial_curve;
};

// Residual as a function of y = ln(df) so that the solver
// can only ever see positive discount factors
static int hybrd_residual_function(void *p, int n, const double *x, double *fvec, int iflag)
{
	(void)n;
	(void)iflag;
	HybridSolverContext *context = static_cast<HybridSolverContext *>(p);
	double df = std::exp(x[0]);
	fvec[0] = context->instrument->residual(df, *context->partial_curve);
	if (!std::isfinite(fvec[0]))
		return -1;
	return 0;
}

static bool fallback_solve(const Instrument<double> &instrument, const DiscountFunction<double> &partial_curve,
			   double tolerance, double df0, double &df, double &residual)
{
	HybridSolverContext context = {&instrument, &partial_curve};
	double x[1] = {std::log(df0)};
	double fvec[1] = {0.0};
	double wa[16];
	// Ask for full machine precision in ln(df); info 3 (no further
	// improvement possible) is then the usual outcome
	double xtol = 10.0 * dpmpar(1);
	int info = hybrd1(hybrd_residual_function, &context, 1, x, fvec, xtol, wa, 16);
	double candidate = std::exp(x[0]);
	double r = instrument.residual(candidate, partial_curve);
	debug("hybrd1 info = %d, df = %.12f, residual = %g\n", info, candidate, r);
	if (!std::isfinite(r) || !(std::fabs(r) < std::max(tolerance, 1e-10)))
		return false;
	df = candidate;
	residual = r;
	return true;
}

// The hybrid solver works on plain doubles only
template <typename T>
static bool fallback_solve(const Instrument<T> &, const DiscountFunction<T> &, double, T, T &, T &)
{
	return false;
}

template <typename T>
Status SequentialBootstrapper<T>::solve_pillar(const Instrument<T> &instrument, size_t input_index,
					       const PartialCurve<T> &partial, T &df_out, T &residual_out,
					       int &iterations_out, SolverType &solver_out) const
{
	DiscountFunction<T> curve = partial.as_function();
	double maturity = scalar_value(instrument.maturity());

	T growth = 1.0 + instrument.rate() * instrument.maturity();
	T df0 = scalar_value(growth) > 0.0 ? T(1.0 / growth) : ScalarTraits<T>::from_value(1.0);
	T df = df0;
	T residual = instrument.residual(df, curve);
	int iteration = 0;
	bool converged = false;
	for (; iteration < config_.max_iterations; iteration++) {
		residual = instrument.residual(df, curve);
		if (!std::isfinite(scalar_value(residual))) {
			error("Non finite residual for %s at maturity %g (input %d)\n", instrument.type_name(), maturity,
			      (int)input_index);
			return Status::make(StatusCode::kBTS_NonFiniteResidual, ": %s at maturity %g",
					    instrument.type_name(), maturity)
			    .with_index((int)input_index)
			    .with_maturity(maturity)
			    .with_value(scalar_value(residual))
			    .with_iterations(iteration);
		}
		if (std::fabs(scalar_value(residual)) < config_.tolerance) {
			converged = true;
			break;
		}
		T derivative = instrument.residual_derivative(df, curve);
		if (!(std::fabs(scalar_value(derivative)) >= kMinDerivative))
			break;
		T next = df - residual / derivative;
		if (!std::isfinite(scalar_value(next)))
			break;
		if (scalar_value(next) <= 0.0)
			next = df / 2.0;
		df = next;
	}
	if (converged) {
		df_out = df;
		residual_out = residual;
		iterations_out = iteration;
		solver_out = SolverType::SOLVER_TYPE_NEWTON_RAPHSON;
		return Status();
	}

	debug("Newton-Raphson failed for %s at maturity %g after %d iterations, trying hybrid solver\n",
	      instrument.type_name(), maturity, iteration);
	T fallback_df, fallback_residual;
	if (fallback_solve(instrument, curve, config_.tolerance, df0, fallback_df, fallback_residual)) {
		df_out = fallback_df;
		residual_out = fallback_residual;
		iterations_out = iteration;
		solver_out = SolverType::SOLVER_TYPE_HYBRID_POWELL;
		return Status();
	}
	error("Failed to solve %s at maturity %g (input %d): residual %g after %d iterations\n",
	      instrument.type_name(), maturity, (int)input_index, scalar_value(residual), iteration);
	return Status::make(StatusCode::kBTS_ConvergenceFailure, ": %s at maturity %g, residual %g after %d iterations",
			    instrument.type_name(), maturity, scalar_value(residual), iteration)
	    .with_index((int)input_index)
	    .with_maturity(maturity)
	    .with_value(scalar_value(residual))
	    .with_iterations(iteration);
}

template <typename T>
Status SequentialBootstrapper<T>::bootstrap(const std::vector<Instrument<T>> &instruments,
					    BootstrapResult<T> &result) const
{
	Status status = config_.validate();
	if (!status.ok()) {
		error("%s\n", status.message());
		return status;
	}
	if (instruments.empty()) {
		error("No instruments supplied\n");
		return Status::make(StatusCode::kBTS_InsufficientData, ": need at least 1, got 0").with_counts(1, 0);
	}
	for (size_t i = 0; i < instruments.size(); i++) {
		Status invalid = instruments[i].validate(config_.max_maturity);
		if (!invalid.ok()) {
			error("Instrument %d: %s\n", (int)i, invalid.message());
			return Status::make(StatusCode::kBTS_InvalidInput, ": instrument %d: %s", (int)i, invalid.message())
			    .with_index((int)i)
			    .with_maturity(invalid.maturity())
			    .with_value(invalid.value());
		}
	}

	std::vector<size_t> order = sort_by_maturity(instruments);
	size_t n = instruments.size();
	PartialCurve<T> partial(n);
	std::vector<T> residuals;
	std::vector<int> iterations;
	std::vector<SolverType> solvers;
	residuals.reserve(n);
	iterations.reserve(n);
	solvers.reserve(n);

	for (size_t k = 0; k < n; k++) {
		size_t index = order[k];
		const Instrument<T> &instrument = instruments[index];
		double maturity = scalar_value(instrument.maturity());
		if (!partial.empty()) {
			double last = scalar_value(partial.pillars().back());
			if (std::fabs(last - maturity) < kDuplicateMaturityTolerance) {
				error("Instrument %d has the same maturity %g as an earlier instrument\n", (int)index,
				      maturity);
				return Status::make(StatusCode::kBTS_DuplicateMaturity, ": %g", maturity)
				    .with_index((int)index)
				    .with_maturity(maturity);
			}
		}

		T df, residual;
		int iteration_count = 0;
		SolverType solver = SolverType::SOLVER_TYPE_NEWTON_RAPHSON;
		status = solve_pillar(instrument, index, partial, df, residual, iteration_count, solver);
		if (!status.ok())
			return status;

		if (!config_.allow_negative_rates) {
			double zero_rate = -std::log(scalar_value(df)) / maturity;
			if (zero_rate < 0.0) {
				error("Negative zero rate %g at maturity %g (input %d)\n", zero_rate, maturity, (int)index);
				return Status::make(StatusCode::kBTS_NegativeRate, ": %g at maturity %g", zero_rate, maturity)
				    .with_index((int)index)
				    .with_maturity(maturity)
				    .with_value(zero_rate);
			}
		}
		// Discount factors must fall strictly with maturity even when
		// negative zero rates are allowed
		if (!partial.empty() && scalar_value(df) >= scalar_value(partial.discount_factors().back())) {
			error("Discount factor %g at maturity %g is not below the previous pillar (input %d)\n",
			      scalar_value(df), maturity, (int)index);
			return Status::make(StatusCode::kBTS_ArbitrageDetected, ": %g at maturity %g", scalar_value(df),
					    maturity)
			    .with_index((int)index)
			    .with_maturity(maturity)
			    .with_value(scalar_value(df));
		}

		partial.append(instrument.maturity(), df);
		residuals.push_back(residual);
		iterations.push_back(iteration_count);
		solvers.push_back(solver);
	}

	std::unique_ptr<InterpolatedCurve<T>> curve;
	status = make_curve(partial.pillars(), partial.discount_factors(), config_.interpolation,
			    config_.allow_extrapolation, curve);
	if (!status.ok())
		return status;

	result.curve = std::shared_ptr<const InterpolatedCurve<T>>(std::move(curve));
	result.pillars = partial.pillars();
	result.discount_factors = partial.discount_factors();
	result.residuals = std::move(residuals);
	result.iterations = std::move(iterations);
	result.solvers = std::move(solvers);
	result.order = std::move(order);
	return Status();
}

template class PartialCurve<double>;
template class SequentialBootstrapper<double>;
template std::vector<size_t> sort_by_maturity<double>(const std::vector<Instrument<double>> &);
template class PartialCurve<Dual>;
template class SequentialBootstrapper<Dual>;
template std::vector<size_t> sort_by_maturity<Dual>(const std::vector<Instrument<Dual>> &);

// Par rate of the instrument read off the finished curve
static double curve_par_rate(const Instrument<double> &instrument, const InterpolatedCurve<double> &curve)
{
	DiscountFunction<double> f = [&curve](double t) {
		double df = 1.0;
		curve.discount_factor(t, df);
		return df;
	};
	return instrument.implied_rate(f(instrument.maturity()), f);
}

static int test_ois_scenario()
{
	int failure_count = 0;
	std::vector<Instrument<double>> instruments = {Instrument<double>::ois(1.0, 0.02),
						       Instrument<double>::ois(2.0, 0.025),
						       Instrument<double>::ois(3.0, 0.03)};
	SequentialBootstrapper<double> bootstrapper;
	BootstrapResult<double> result;
	Status status = bootstrapper.bootstrap(instruments, result);
	if (!status.ok() || !result.curve || result.pillars.size() != 3) {
		fprintf(stderr, "OIS bootstrap failed: %s\n", status.message());
		return 1;
	}
	if (std::fabs(result.discount_factors[0] - 1.0 / 1.02) > 1e-12)
		failure_count++;
	for (size_t i = 0; i < 3; i++) {
		if (!(result.discount_factors[i] > 0.0 && result.discount_factors[i] < 1.0))
			failure_count++;
		if (i > 0 && !(result.discount_factors[i] < result.discount_factors[i - 1]))
			failure_count++;
		if (std::fabs(result.residuals[i]) > 1e-12 || result.order[i] != i ||
		    result.solvers[i] != SolverType::SOLVER_TYPE_NEWTON_RAPHSON)
			failure_count++;
		double par = curve_par_rate(instruments[i], *result.curve);
		if (std::fabs(par - instruments[i].rate()) > 1e-10) {
			fprintf(stderr, "Par rate at %f: expected %.12f, got %.12f\n", instruments[i].maturity(),
				instruments[i].rate(), par);
			failure_count++;
		}
	}
	// Two year annual OIS: 0.025 = (1 - df2) / (df1 + df2)
	double df1 = result.discount_factors[0];
	double df2 = (1.0 - 0.025 * df1) / 1.025;
	if (std::fabs(result.discount_factors[1] - df2) > 1e-12)
		failure_count++;
	return failure_count;
}

static int test_literal_scenario()
{
	int failure_count = 0;
	SequentialBootstrapper<double> bootstrapper;
	BootstrapResult<double> result;
	Status status = bootstrapper.bootstrap({Instrument<double>::ois(1.0, 0.03), Instrument<double>::ois(2.0, 0.032),
						Instrument<double>::ois(3.0, 0.034)},
					       result);
	if (!status.ok())
		return 1;
	const InterpolatedCurve<double> &curve = *result.curve;
	if (curve.pillar_count() != 3 || curve.interpolator_type() != InterpolatorType::LOG_LINEAR ||
	    !curve.allow_extrapolation())
		failure_count++;
	std::pair<double, double> domain = curve.domain();
	if (domain.first != 1.0 || domain.second != 3.0)
		failure_count++;
	double df = 0.0;
	if (!curve.discount_factor(1.5, df).ok() ||
	    !(df < result.discount_factors[0] && df > result.discount_factors[1]))
		failure_count++;
	return failure_count;
}

static int test_fra_residual()
{
	int failure_count = 0;
	std::vector<Instrument<double>> instruments = {Instrument<double>::fra(0.25, 0.5, 0.025),
						       Instrument<double>::ois(0.25, 0.02)};
	SequentialBootstrapper<double> bootstrapper;
	BootstrapResult<double> result;
	Status status = bootstrapper.bootstrap(instruments, result);
	if (!status.ok())
		return 1;
	// Sorted by maturity so the OIS comes first
	if (result.order[0] != 1 || result.order[1] != 0)
		failure_count++;
	if (std::fabs(result.residuals[1]) > 1e-10)
		failure_count++;
	double df_start = 0, df_end = 0;
	result.curve->discount_factor(0.25, df_start);
	result.curve->discount_factor(0.5, df_end);
	if (std::fabs((df_start / df_end - 1.0) / 0.25 - 0.025) > 1e-10)
		failure_count++;
	return failure_count;
}

static int test_mixed_instruments()
{
	int failure_count = 0;
	std::vector<Instrument<double>> instruments = {
	    Instrument<double>::ois(0.25, 0.02), Instrument<double>::future(0.5, 97.8, 0.0001),
	    Instrument<double>::fra(0.5, 0.75, 0.023), Instrument<double>::irs(2.0, 0.026, Frequency::SEMI_ANNUAL),
	    Instrument<double>::irs(5.0, 0.029), Instrument<double>::ois(10.0, 0.031, Frequency::QUARTERLY)};
	BootstrapConfig config;
	config.interpolation = InterpolatorType::MONOTONIC_CUBIC;
	SequentialBootstrapper<double> bootstrapper(config);
	BootstrapResult<double> result;
	Status status = bootstrapper.bootstrap(instruments, result);
	if (!status.ok()) {
		fprintf(stderr, "Mixed bootstrap failed: %s\n", status.message());
		return 1;
	}
	for (size_t i = 0; i < result.residuals.size(); i++) {
		if (std::fabs(result.residuals[i]) > 1e-12)
			failure_count++;
	}
	if (result.curve->interpolator_type() != InterpolatorType::MONOTONIC_CUBIC || result.curve->pillar_count() != 6)
		failure_count++;
	return failure_count;
}

static int test_idempotent()
{
	std::vector<Instrument<double>> instruments = {Instrument<double>::irs(3.0, 0.03),
						       Instrument<double>::ois(0.5, 0.021),
						       Instrument<double>::irs(7.0, 0.033, Frequency::QUARTERLY)};
	SequentialBootstrapper<double> bootstrapper;
	BootstrapResult<double> first, second;
	if (!bootstrapper.bootstrap(instruments, first).ok() || !bootstrapper.bootstrap(instruments, second).ok())
		return 1;
	if (first.discount_factors != second.discount_factors || first.pillars != second.pillars ||
	    first.iterations != second.iterations || first.order != second.order)
		return 1;
	return 0;
}

static int test_hybrid_fallback()
{
	int failure_count = 0;
	BootstrapConfig config;
	// A single Newton step cannot reach the tolerance for a two period swap
	config.max_iterations = 1;
	std::vector<Instrument<double>> instruments = {Instrument<double>::ois(1.0, 0.02),
						       Instrument<double>::ois(2.0, 0.025)};
	SequentialBootstrapper<double> bootstrapper(config);
	BootstrapResult<double> result;
	Status status = bootstrapper.bootstrap(instruments, result);
	if (!status.ok()) {
		fprintf(stderr, "Fallback bootstrap failed: %s\n", status.message());
		return 1;
	}
	if (result.solvers[0] != SolverType::SOLVER_TYPE_NEWTON_RAPHSON ||
	    result.solvers[1] != SolverType::SOLVER_TYPE_HYBRID_POWELL)
		failure_count++;
	if (std::fabs(result.residuals[1]) > 1e-10)
		failure_count++;
	return failure_count;
}

static int test_errors()
{
	int failure_count = 0;
	SequentialBootstrapper<double> bootstrapper;
	BootstrapResult<double> result;

	Status status = bootstrapper.bootstrap(std::vector<Instrument<double>>(), result);
	if (status.code() != StatusCode::kBTS_InsufficientData || status.required() != 1 || status.provided() != 0)
		failure_count++;

	status = bootstrapper.bootstrap({Instrument<double>::ois(1.0, 0.02), Instrument<double>::irs(1.0, 0.021)},
					result);
	if (status.code() != StatusCode::kBTS_DuplicateMaturity || status.index() != 1 || status.maturity() != 1.0)
		failure_count++;

	status = bootstrapper.bootstrap({Instrument<double>::ois(1.0, -0.005)}, result);
	if (status.code() != StatusCode::kBTS_NegativeRate || !(status.value() < 0.0))
		failure_count++;

	// Second forward strongly negative
	status = bootstrapper.bootstrap({Instrument<double>::ois(1.0, 0.05), Instrument<double>::ois(2.0, 0.01)}, result);
	if (status.code() != StatusCode::kBTS_ArbitrageDetected || status.index() != 1)
		failure_count++;

	status = bootstrapper.bootstrap({Instrument<double>::ois(1.0, 0.02), Instrument<double>::ois(60.0, 0.03)},
					result);
	if (status.code() != StatusCode::kBTS_InvalidInput || status.index() != 1)
		failure_count++;

	// No discount factor gives a par rate of -200%
	status = bootstrapper.bootstrap({Instrument<double>::ois(1.0, 0.02), Instrument<double>::ois(2.0, -2.0)},
					result);
	if (status.code() != StatusCode::kBTS_ConvergenceFailure || status.index() != 1 || status.maturity() != 2.0)
		failure_count++;

	// Nothing was written by the failures
	if (result.curve || !result.pillars.empty())
		failure_count++;

	BootstrapConfig config;
	config.allow_negative_rates = true;
	SequentialBootstrapper<double> permissive(config);
	status = permissive.bootstrap({Instrument<double>::ois(1.0, -0.005), Instrument<double>::ois(2.0, 0.005)},
				      result);
	if (!status.ok() || !(result.discount_factors[0] > 1.0) || !(result.discount_factors[1] < 1.0))
		failure_count++;
	// Rising discount factors are rejected whatever the rate sign
	status = permissive.bootstrap({Instrument<double>::ois(1.0, -0.005), Instrument<double>::ois(2.0, -0.004)},
				      result);
	if (status.code() != StatusCode::kBTS_ArbitrageDetected || status.index() != 1 || status.maturity() != 2.0)
		failure_count++;

	config = BootstrapConfig();
	config.tolerance = -1.0;
	SequentialBootstrapper<double> misconfigured(config);
	status = misconfigured.bootstrap({Instrument<double>::ois(1.0, 0.02)}, result);
	if (status.code() != StatusCode::kCFG_BadTolerance)
		failure_count++;
	return failure_count;
}

static int test_partial_curve()
{
	int failure_count = 0;
	PartialCurve<double> partial(2);
	if (partial.discount(1.0) != 1.0)
		failure_count++;
	partial.append(1.0, 0.98);
	partial.append(2.0, 0.95);
	if (partial.discount(0.0) != 1.0 || partial.discount(-1.0) != 1.0)
		failure_count++;
	if (partial.discount(1.0) != 0.98 || partial.discount(2.0) != 0.95)
		failure_count++;
	if (std::fabs(partial.discount(1.5) - std::sqrt(0.98 * 0.95)) > 1e-15)
		failure_count++;
	if (std::fabs(partial.discount(0.5) - std::exp(std::log(0.98) * 0.5)) > 1e-15)
		failure_count++;
	if (std::fabs(partial.discount(4.0) - 0.95 * 0.95) > 1e-15)
		failure_count++;
	partial.set_discount_factor(0, 0.97);
	if (partial.discount(1.0) != 0.97)
		failure_count++;
	return failure_count;
}

static double bootstrapped_df(const std::vector<double> &rates, size_t pillar)
{
	std::vector<Instrument<double>> instruments;
	for (size_t i = 0; i < rates.size(); i++)
		instruments.push_back(Instrument<double>::ois(1.0 + i, rates[i]));
	SequentialBootstrapper<double> bootstrapper;
	BootstrapResult<double> result;
	if (!bootstrapper.bootstrap(instruments, result).ok())
		return 0.0;
	return result.discount_factors[pillar];
}

// Rate derivatives carried through the solve by a dual number
static int test_dual_bootstrap()
{
	int failure_count = 0;
	Dual x = log(exp(Dual(0.5, 1.0)));
	if (std::fabs(x.value() - 0.5) > 1e-15 || std::fabs(x.derivative() - 1.0) > 1e-15)
		failure_count++;

	SequentialBootstrapper<Dual> bootstrapper;
	BootstrapResult<Dual> single;
	Status status = bootstrapper.bootstrap({Instrument<Dual>::ois(1.0, Dual(0.03, 1.0))}, single);
	if (!status.ok() || std::fabs(single.discount_factors[0].value() - 1.0 / 1.03) > 1e-12 ||
	    std::fabs(single.discount_factors[0].derivative() + 1.0 / (1.03 * 1.03)) > 1e-12) {
		fprintf(stderr, "Dual single pillar bootstrap failed: %s\n", status.message());
		failure_count++;
	}

	std::vector<double> rates = {0.02, 0.025, 0.03};
	std::vector<Instrument<Dual>> instruments;
	for (size_t i = 0; i < rates.size(); i++)
		instruments.push_back(Instrument<Dual>::ois(1.0 + i, Dual(rates[i], i == 1 ? 1.0 : 0.0)));
	BootstrapResult<Dual> result;
	status = bootstrapper.bootstrap(instruments, result);
	if (!status.ok() || result.discount_factors.size() != 3) {
		fprintf(stderr, "Dual bootstrap failed: %s\n", status.message());
		return failure_count + 1;
	}
	if (result.discount_factors[0].derivative() != 0.0)
		failure_count++;
	const double h = 1e-6;
	std::vector<double> up = rates, down = rates;
	up[1] += h;
	down[1] -= h;
	for (size_t i = 1; i < 3; i++) {
		double expected = (bootstrapped_df(up, i) - bootstrapped_df(down, i)) / (2.0 * h);
		if (std::fabs(result.discount_factors[i].value() - bootstrapped_df(rates, i)) > 1e-12 ||
		    std::fabs(result.discount_factors[i].derivative() - expected) > 1e-4) {
			fprintf(stderr, "Dual derivative at pillar %d: expected %.10f, got %.10f\n", (int)i, expected,
				result.discount_factors[i].derivative());
			failure_count++;
		}
	}
	return failure_count;
}

int test_bootstrap()
{
	int failure_count = 0;
	failure_count += test_partial_curve();
	failure_count += test_ois_scenario();
	failure_count += test_literal_scenario();
	failure_count += test_fra_residual();
	failure_count += test_mixed_instruments();
	failure_count += test_idempotent();
	failure_count += test_hybrid_fallback();
	failure_count += test_errors();
	failure_count += test_dual_bootstrap();
	if (failure_count == 0)
		printf("Bootstrap Tests OK\n");
	else
		printf("Bootstrap Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
