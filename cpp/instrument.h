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

#ifndef _RATESTRAP_INSTRUMENT_H
#define _RATESTRAP_INSTRUMENT_H

#include <enums.pb.h>

#include <scalar.h>
#include <status.h>

namespace ratestrap
{

// Number of payments per year for the frequency, 0 if unspecified
extern int payments_per_year(Frequency frequency);
// Length of one accrual period in years
extern double period_years(Frequency frequency);

// A market quote used to fix one pillar of a curve. The quote is
// described by its type tag; fields that do not apply to the
// type are zero. Instruments are immutable values, created by the
// static factory methods.
template <typename T> class Instrument
{
	public:
	// Overnight index swap paying at the given frequency
	static Instrument ois(T maturity, T rate, Frequency payment_frequency = Frequency::ANNUAL);
	// Vanilla swap; only the fixed leg frequency enters the par rate
	static Instrument irs(T maturity, T rate, Frequency fixed_frequency = Frequency::ANNUAL,
			      Frequency float_frequency = Frequency::QUARTERLY);
	// Forward rate agreement accruing from start to end
	static Instrument fra(T start, T end, T rate);
	// Interest rate future quoted as 100 - rate
	static Instrument future(T maturity, T price, T convexity_adjustment = T(0.0));
	static Instrument future_from_rate(T maturity, T rate, T convexity_adjustment = T(0.0));

	InstrumentType type() const { return type_; }
	const char *type_name() const;

	// Pillar maturity; for an FRA this is the end of the accrual
	T maturity() const { return maturity_; }
	// Quoted rate; for a future the price implied rate less
	// the convexity adjustment
	T rate() const;
	// FRA start, 0 for everything else
	T start() const { return start_; }
	T price() const { return price_; }
	T convexity_adjustment() const { return convexity_adjustment_; }
	Frequency payment_frequency() const { return payment_frequency_; }
	Frequency fixed_frequency() const { return fixed_frequency_; }
	Frequency float_frequency() const { return float_frequency_; }

	// Rate implied by the discount factor df at maturity, with
	// earlier discount factors read from the partial curve
	T implied_rate(T df, const DiscountFunction<T> &partial_curve) const;

	// implied_rate(df) - rate(); the bootstrap solves for the df
	// that makes this zero
	T residual(T df, const DiscountFunction<T> &partial_curve) const
	{
		return implied_rate(df, partial_curve) - rate();
	}

	// d(residual)/d(df); analytic where the par rate depends on df
	// alone, otherwise a central difference
	T residual_derivative(T df, const DiscountFunction<T> &partial_curve) const;

	// Checks the instrument can be bootstrapped. The failing
	// maturity and offending value are recorded in the status.
	Status validate(double max_maturity) const;

	// Returns a copy with the rate increased by bump; a future's
	// price is lowered by bump * 100
	Instrument bumped(double bump) const;

	private:
	Instrument()
	    : type_(InstrumentType::INSTRUMENT_TYPE_UNSPECIFIED), maturity_(0.0), rate_(0.0), start_(0.0), price_(0.0),
	      convexity_adjustment_(0.0), payment_frequency_(Frequency::FREQUENCY_UNSPECIFIED),
	      fixed_frequency_(Frequency::FREQUENCY_UNSPECIFIED), float_frequency_(Frequency::FREQUENCY_UNSPECIFIED)
	{
	}

	T par_swap_rate(T df, const DiscountFunction<T> &partial_curve, Frequency frequency) const;
	T numerical_residual_derivative(T df, const DiscountFunction<T> &partial_curve) const;
	int num_periods(Frequency frequency) const;

	InstrumentType type_;
	T maturity_;
	T rate_;
	T start_;
	T price_;
	T convexity_adjustment_;
	Frequency payment_frequency_;
	Frequency fixed_frequency_;
	Frequency float_frequency_;
};

extern int test_instruments();

} // namespace ratestrap

#endif
