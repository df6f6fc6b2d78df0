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
#include <instrument.h>

#include <string.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace ratestrap
{

int payments_per_year(Frequency frequency)
{
	switch (frequency) {
	case Frequency::ANNUAL:
		return 1;
	case Frequency::SEMI_ANNUAL:
		return 2;
	case Frequency::QUARTERLY:
		return 4;
	case Frequency::MONTHLY:
		return 12;
	case Frequency::DAILY:
		return 365;
	default:
		return 0;
	}
}

double period_years(Frequency frequency)
{
	int ppy = payments_per_year(frequency);
	return ppy > 0 ? 1.0 / ppy : 0.0;
}

template <typename T> Instrument<T> Instrument<T>::ois(T maturity, T rate, Frequency payment_frequency)
{
	Instrument<T> instrument;
	instrument.type_ = InstrumentType::OIS;
	instrument.maturity_ = maturity;
	instrument.rate_ = rate;
	instrument.payment_frequency_ = payment_frequency;
	return instrument;
}

template <typename T>
Instrument<T> Instrument<T>::irs(T maturity, T rate, Frequency fixed_frequency, Frequency float_frequency)
{
	Instrument<T> instrument;
	instrument.type_ = InstrumentType::IRS;
	instrument.maturity_ = maturity;
	instrument.rate_ = rate;
	instrument.fixed_frequency_ = fixed_frequency;
	instrument.float_frequency_ = float_frequency;
	return instrument;
}

template <typename T> Instrument<T> Instrument<T>::fra(T start, T end, T rate)
{
	Instrument<T> instrument;
	instrument.type_ = InstrumentType::FRA;
	instrument.start_ = start;
	instrument.maturity_ = end;
	instrument.rate_ = rate;
	return instrument;
}

template <typename T> Instrument<T> Instrument<T>::future(T maturity, T price, T convexity_adjustment)
{
	Instrument<T> instrument;
	instrument.type_ = InstrumentType::FUTURE;
	instrument.maturity_ = maturity;
	instrument.price_ = price;
	instrument.convexity_adjustment_ = convexity_adjustment;
	return instrument;
}

template <typename T> Instrument<T> Instrument<T>::future_from_rate(T maturity, T rate, T convexity_adjustment)
{
	return future(maturity, 100.0 - rate * 100.0, convexity_adjustment);
}

template <typename T> const char *Instrument<T>::type_name() const
{
	switch (type_) {
	case InstrumentType::OIS:
		return "OIS";
	case InstrumentType::IRS:
		return "IRS";
	case InstrumentType::FRA:
		return "FRA";
	case InstrumentType::FUTURE:
		return "Future";
	default:
		return "Unknown";
	}
}

template <typename T> T Instrument<T>::rate() const
{
	if (type_ == InstrumentType::FUTURE)
		return (100.0 - price_) / 100.0 - convexity_adjustment_;
	return rate_;
}

template <typename T> int Instrument<T>::num_periods(Frequency frequency) const
{
	int ppy = payments_per_year(frequency);
	if (ppy <= 0)
		return 1;
	// Guard against maturities like 0.3 * 10 landing just above an integer
	double periods = std::ceil(scalar_value(maturity_) * ppy - 1e-9);
	return std::max(1, (int)periods);
}

// Par rate (1 - df) / annuity where the annuity sums the discounted
// accrual of each whole period read from the partial curve, plus a
// final (possibly short) period discounted at df
template <typename T>
T Instrument<T>::par_swap_rate(T df, const DiscountFunction<T> &partial_curve, Frequency frequency) const
{
	int n = num_periods(frequency);
	double dt = period_years(frequency);
	if (n == 1) {
		return (1.0 / df - 1.0) / maturity_;
	}
	T annuity = T(0.0);
	for (int i = 1; i < n; i++) {
		T t_i = ScalarTraits<T>::from_value(dt * i);
		annuity = annuity + partial_curve(t_i) * dt;
	}
	T final_dt = maturity_ - dt * (n - 1);
	annuity = annuity + df * final_dt;
	if (!(scalar_value(annuity) > 0.0))
		return T(0.0);
	return (1.0 - df) / annuity;
}

template <typename T> T Instrument<T>::implied_rate(T df, const DiscountFunction<T> &partial_curve) const
{
	switch (type_) {
	case InstrumentType::OIS:
		return par_swap_rate(df, partial_curve, payment_frequency_);
	case InstrumentType::IRS:
		return par_swap_rate(df, partial_curve, fixed_frequency_);
	case InstrumentType::FRA: {
		T df_start = partial_curve(start_);
		T tau = maturity_ - start_;
		return (df_start / df - 1.0) / tau;
	}
	case InstrumentType::FUTURE:
		return (1.0 / df - 1.0) / maturity_ + convexity_adjustment_;
	default:
		return T(0.0);
	}
}

template <typename T>
T Instrument<T>::numerical_residual_derivative(T df, const DiscountFunction<T> &partial_curve) const
{
	const double epsilon = 1e-8;
	T r_plus = residual(df + epsilon, partial_curve);
	T r_minus = residual(df - epsilon, partial_curve);
	return (r_plus - r_minus) / (2.0 * epsilon);
}

template <typename T> T Instrument<T>::residual_derivative(T df, const DiscountFunction<T> &partial_curve) const
{
	switch (type_) {
	case InstrumentType::OIS:
		if (num_periods(payment_frequency_) == 1)
			return -1.0 / (df * df * maturity_);
		return numerical_residual_derivative(df, partial_curve);
	case InstrumentType::IRS:
		if (num_periods(fixed_frequency_) == 1)
			return -1.0 / (df * df * maturity_);
		return numerical_residual_derivative(df, partial_curve);
	case InstrumentType::FRA: {
		T df_start = partial_curve(start_);
		T tau = maturity_ - start_;
		return -df_start / (df * df * tau);
	}
	case InstrumentType::FUTURE:
		return -1.0 / (df * df * maturity_);
	default:
		return numerical_residual_derivative(df, partial_curve);
	}
}

template <typename T> Status Instrument<T>::validate(double max_maturity) const
{
	double maturity = scalar_value(maturity_);
	switch (type_) {
	case InstrumentType::OIS:
		if (payments_per_year(payment_frequency_) == 0)
			return Status::make(StatusCode::kINS_BadFrequency, ": OIS payment frequency")
			    .with_maturity(maturity);
		break;
	case InstrumentType::IRS:
		if (payments_per_year(fixed_frequency_) == 0 || payments_per_year(float_frequency_) == 0)
			return Status::make(StatusCode::kINS_BadFrequency, ": IRS leg frequency").with_maturity(maturity);
		break;
	case InstrumentType::FRA:
	case InstrumentType::FUTURE:
		break;
	default:
		return Status::make(StatusCode::kINS_UnknownInstrumentType, ": %d", (int)type_);
	}
	if (!(maturity > 0.0)) {
		return Status::make(StatusCode::kINS_NonPositiveMaturity, ", got %g", maturity)
		    .with_maturity(maturity)
		    .with_value(maturity);
	}
	if (maturity > max_maturity) {
		return Status::make(StatusCode::kINS_MaturityExceedsMaximum, ": %g > %g", maturity, max_maturity)
		    .with_maturity(maturity)
		    .with_value(max_maturity);
	}
	if (type_ == InstrumentType::FRA) {
		double start = scalar_value(start_);
		if (!std::isfinite(start) || start >= maturity) {
			return Status::make(StatusCode::kINS_BadFraWindow, ": start %g, end %g", start, maturity)
			    .with_maturity(maturity)
			    .with_value(start);
		}
		if (start < 0.0) {
			return Status::make(StatusCode::kINS_NegativeFraStart, ", got %g", start)
			    .with_maturity(maturity)
			    .with_value(start);
		}
	}
	if (type_ == InstrumentType::FUTURE) {
		double price = scalar_value(price_);
		if (!(price > 0.0 && price < 200.0)) {
			return Status::make(StatusCode::kINS_UnreasonableFuturePrice, ", got %g", price)
			    .with_maturity(maturity)
			    .with_value(price);
		}
	}
	return Status();
}

template <typename T> Instrument<T> Instrument<T>::bumped(double bump) const
{
	Instrument<T> copy = *this;
	if (type_ == InstrumentType::FUTURE)
		copy.price_ = price_ - bump * 100.0;
	else
		copy.rate_ = rate_ + bump;
	return copy;
}

template class Instrument<double>;
template class Instrument<Dual>;

static int test_par_rates()
{
	int failure_count = 0;
	// Flat 3% continuously compounded curve
	DiscountFunction<double> curve = [](double t) { return std::exp(-0.03 * t); };

	auto ois1 = Instrument<double>::ois(1.0, 0.0);
	double df1 = curve(1.0);
	if (std::fabs(ois1.implied_rate(df1, curve) - (1.0 / df1 - 1.0)) > 1e-14)
		failure_count++;

	// Two year annual OIS: (1 - df2) / (df1 + df2)
	auto ois2 = Instrument<double>::ois(2.0, 0.0);
	double df2 = curve(2.0);
	double expected = (1.0 - df2) / (df1 + df2);
	if (std::fabs(ois2.implied_rate(df2, curve) - expected) > 1e-14)
		failure_count++;

	// 18 month semi annual swap has three whole periods
	auto irs = Instrument<double>::irs(1.5, 0.0, Frequency::SEMI_ANNUAL);
	double df15 = curve(1.5);
	expected = (1.0 - df15) / (0.5 * (curve(0.5) + curve(1.0)) + 0.5 * df15);
	if (std::fabs(irs.implied_rate(df15, curve) - expected) > 1e-14)
		failure_count++;

	// Stub period: 1.25y annual swap pays 1y then 0.25y
	auto stub = Instrument<double>::irs(1.25, 0.0);
	double df125 = curve(1.25);
	expected = (1.0 - df125) / (curve(1.0) + 0.25 * df125);
	if (std::fabs(stub.implied_rate(df125, curve) - expected) > 1e-14)
		failure_count++;

	// FRA(0.25, 0.5) forward rate
	auto fra = Instrument<double>::fra(0.25, 0.5, 0.0);
	expected = (curve(0.25) / curve(0.5) - 1.0) / 0.25;
	if (std::fabs(fra.implied_rate(curve(0.5), curve) - expected) > 1e-14)
		failure_count++;

	auto future = Instrument<double>::future(0.5, 97.5, 0.001);
	if (std::fabs(future.rate() - 0.024) > 1e-14)
		failure_count++;
	auto from_rate = Instrument<double>::future_from_rate(0.5, 0.025);
	if (std::fabs(from_rate.price() - 97.5) > 1e-12 || std::fabs(from_rate.rate() - 0.025) > 1e-14)
		failure_count++;

	if (strcmp(ois1.type_name(), "OIS") != 0 || strcmp(irs.type_name(), "IRS") != 0 ||
	    strcmp(fra.type_name(), "FRA") != 0 || strcmp(future.type_name(), "Future") != 0)
		failure_count++;
	if (fra.start() != 0.25 || fra.maturity() != 0.5 || ois2.start() != 0.0)
		failure_count++;
	return failure_count;
}

static int test_derivatives()
{
	int failure_count = 0;
	DiscountFunction<double> curve = [](double t) { return std::exp(-0.02 * t); };
	const double h = 1e-6;
	auto check = [&](const Instrument<double> &instrument) {
		double df = curve(scalar_value(instrument.maturity()));
		double analytic = instrument.residual_derivative(df, curve);
		double numeric =
		    (instrument.residual(df + h, curve) - instrument.residual(df - h, curve)) / (2.0 * h);
		if (std::fabs(analytic - numeric) > 1e-5 * std::fabs(numeric)) {
			fprintf(stderr, "%s derivative mismatch: %.12f vs %.12f\n", instrument.type_name(), analytic,
				numeric);
			return 1;
		}
		return 0;
	};
	failure_count += check(Instrument<double>::ois(1.0, 0.02));
	failure_count += check(Instrument<double>::ois(5.0, 0.02));
	failure_count += check(Instrument<double>::irs(0.75, 0.02));
	failure_count += check(Instrument<double>::irs(3.0, 0.02, Frequency::QUARTERLY));
	failure_count += check(Instrument<double>::fra(0.5, 0.75, 0.02));
	failure_count += check(Instrument<double>::future(0.25, 98.0, 0.0005));
	return failure_count;
}

static int test_validation()
{
	int failure_count = 0;
	if (!Instrument<double>::ois(5.0, 0.02).validate(50.0).ok())
		failure_count++;
	Status status = Instrument<double>::ois(0.0, 0.02).validate(50.0);
	if (status.code() != StatusCode::kINS_NonPositiveMaturity)
		failure_count++;
	status = Instrument<double>::irs(60.0, 0.02).validate(50.0);
	if (status.code() != StatusCode::kINS_MaturityExceedsMaximum || status.maturity() != 60.0)
		failure_count++;
	status = Instrument<double>::fra(0.5, 0.25, 0.02).validate(50.0);
	if (status.code() != StatusCode::kINS_BadFraWindow)
		failure_count++;
	status = Instrument<double>::fra(-0.25, 0.25, 0.02).validate(50.0);
	if (status.code() != StatusCode::kINS_NegativeFraStart)
		failure_count++;
	status = Instrument<double>::fra(std::numeric_limits<double>::quiet_NaN(), 0.25, 0.02).validate(50.0);
	if (status.code() != StatusCode::kINS_BadFraWindow)
		failure_count++;
	status = Instrument<double>::future(0.25, 250.0).validate(50.0);
	if (status.code() != StatusCode::kINS_UnreasonableFuturePrice || status.value() != 250.0)
		failure_count++;
	status = Instrument<double>::future(0.25, 0.0).validate(50.0);
	if (status.code() != StatusCode::kINS_UnreasonableFuturePrice)
		failure_count++;
	status = Instrument<double>::ois(1.0, 0.02, Frequency::FREQUENCY_UNSPECIFIED).validate(50.0);
	if (status.code() != StatusCode::kINS_BadFrequency)
		failure_count++;
	return failure_count;
}

static int test_bumped()
{
	int failure_count = 0;
	auto ois = Instrument<double>::ois(2.0, 0.03).bumped(1e-4);
	if (std::fabs(ois.rate() - 0.0301) > 1e-15 || ois.maturity() != 2.0)
		failure_count++;
	auto future = Instrument<double>::future(0.5, 97.0);
	auto bumped = future.bumped(1e-4);
	if (std::fabs(bumped.price() - 96.99) > 1e-12 || std::fabs(bumped.rate() - future.rate() - 1e-4) > 1e-12)
		failure_count++;
	return failure_count;
}

int test_instruments()
{
	int failure_count = 0;
	failure_count += test_par_rates();
	failure_count += test_derivatives();
	failure_count += test_validation();
	failure_count += test_bumped();
	if (failure_count == 0)
		printf("Instrument Tests OK\n");
	else
		printf("Instrument Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
