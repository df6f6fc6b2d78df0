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

#include <converters.h>
#include <multi_curve.h>

#include <logger.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>

#ifdef _MSC_VER
#define strcasecmp _stricmp
#endif

namespace ratestrap
{

static std::pair<const char *, InterpolatorType> interpolators[] = {
    {"CubicSpline", InterpolatorType::CUBIC_SPLINE},
    {"FlatForward", InterpolatorType::FLAT_FORWARD},
    {"LinearZeroRate", InterpolatorType::LINEAR_ZERO_RATE},
    {"LogLinear", InterpolatorType::LOG_LINEAR},
    {"MonotonicCubic", InterpolatorType::MONOTONIC_CUBIC}};

static std::pair<const char *, Tenor> tenors[] = {{"ON", Tenor::TENOR_ON},   {"O/N", Tenor::TENOR_ON},
						  {"1M", Tenor::TENOR_1M},   {"3M", Tenor::TENOR_3M},
						  {"6M", Tenor::TENOR_6M},   {"12M", Tenor::TENOR_12M},
						  {"1Y", Tenor::TENOR_12M}};

static std::pair<const char *, Frequency> frequencies[] = {
    {"Annual", Frequency::ANNUAL},	 {"SemiAnnual", Frequency::SEMI_ANNUAL}, {"Quarterly", Frequency::QUARTERLY},
    {"Monthly", Frequency::MONTHLY}, {"Daily", Frequency::DAILY}};

static std::pair<const char *, InstrumentType> instrument_types[] = {{"OIS", InstrumentType::OIS},
								     {"IRS", InstrumentType::IRS},
								     {"FRA", InstrumentType::FRA},
								     {"Future", InstrumentType::FUTURE}};

template <typename E, size_t N>
static const std::pair<const char *, E> *find_by_name(const std::pair<const char *, E> (&table)[N], const char *value)
{
	if (value == nullptr)
		return nullptr;
	auto iter = std::find_if(std::begin(table), std::end(table), [value](const std::pair<const char *, E> &v) {
		return strcasecmp(value, v.first) == 0;
	});
	return iter == std::end(table) ? nullptr : iter;
}

template <typename E, size_t N>
static const char *find_by_value(const std::pair<const char *, E> (&table)[N], E value)
{
	auto iter = std::find_if(std::begin(table), std::end(table),
				 [value](const std::pair<const char *, E> &v) { return value == v.second; });
	return iter == std::end(table) ? "" : iter->first;
}

class ValueConverter : public Converter
{
	public:
	InterpolatorType interpolator_type_from_string(const char *value) const override final
	{
		auto entry = find_by_name(interpolators, value);
		if (entry == nullptr) {
			warn("cannot find interpolation method [%s], defaulting to LogLinear\n", value ? value : "");
			return InterpolatorType::LOG_LINEAR;
		}
		return entry->second;
	}

	const char *interpolator_type_to_string(InterpolatorType value) const override final
	{
		return find_by_value(interpolators, value);
	}

	Tenor tenor_from_string(const char *value) const override final
	{
		auto entry = find_by_name(tenors, value);
		return entry == nullptr ? Tenor::TENOR_UNSPECIFIED : entry->second;
	}

	std::string tenor_to_string(Tenor tenor) const override final
	{
		if (tenor == Tenor::TENOR_UNSPECIFIED || !Tenor_IsValid(tenor))
			return std::string();
		return std::string(tenor_name(tenor));
	}

	Frequency frequency_from_string(const char *value) const override final
	{
		auto entry = find_by_name(frequencies, value);
		return entry == nullptr ? Frequency::FREQUENCY_UNSPECIFIED : entry->second;
	}

	const char *frequency_to_string(Frequency value) const override final
	{
		return find_by_value(frequencies, value);
	}

	InstrumentType instrument_type_from_string(const char *value) const override final
	{
		auto entry = find_by_name(instrument_types, value);
		return entry == nullptr ? InstrumentType::INSTRUMENT_TYPE_UNSPECIFIED : entry->second;
	}

	const char *instrument_type_to_string(InstrumentType value) const override final
	{
		return find_by_value(instrument_types, value);
	}

	const char *solver_type_to_string(SolverType value) const override final
	{
		switch (value) {
		case SolverType::SOLVER_TYPE_NEWTON_RAPHSON:
			return "NewtonRaphson";
		case SolverType::SOLVER_TYPE_HYBRID_POWELL:
			return "HybridPowell";
		default:
			return "";
		}
	}

	Status instrument_from_message(const ParInstrument &message, Instrument<double> &instrument) const override final
	{
		switch (message.instrument_type()) {
		case InstrumentType::OIS: {
			Frequency frequency = message.payment_frequency() == Frequency::FREQUENCY_UNSPECIFIED
						  ? Frequency::ANNUAL
						  : message.payment_frequency();
			instrument = Instrument<double>::ois(message.maturity(), message.rate(), frequency);
			break;
		}
		case InstrumentType::IRS: {
			Frequency fixed = message.fixed_frequency() == Frequency::FREQUENCY_UNSPECIFIED
					      ? Frequency::ANNUAL
					      : message.fixed_frequency();
			Frequency floating = message.float_frequency() == Frequency::FREQUENCY_UNSPECIFIED
						 ? Frequency::QUARTERLY
						 : message.float_frequency();
			instrument = Instrument<double>::irs(message.maturity(), message.rate(), fixed, floating);
			break;
		}
		case InstrumentType::FRA: {
			// The end of the accrual window is the maturity
			double end = message.end() != 0.0 ? message.end() : message.maturity();
			instrument = Instrument<double>::fra(message.start(), end, message.rate());
			break;
		}
		case InstrumentType::FUTURE:
			instrument =
			    Instrument<double>::future(message.maturity(), message.price(), message.convexity_adjustment());
			break;
		default:
			error("Unknown instrument type %d\n", (int)message.instrument_type());
			return Status::make(StatusCode::kINS_UnknownInstrumentType, ": %d", (int)message.instrument_type());
		}
		return Status();
	}

	void instrument_to_message(const Instrument<double> &instrument, ParInstrument *message) const override final
	{
		message->Clear();
		message->set_instrument_type(instrument.type());
		message->set_maturity(instrument.maturity());
		switch (instrument.type()) {
		case InstrumentType::OIS:
			message->set_rate(instrument.rate());
			message->set_payment_frequency(instrument.payment_frequency());
			break;
		case InstrumentType::IRS:
			message->set_rate(instrument.rate());
			message->set_fixed_frequency(instrument.fixed_frequency());
			message->set_float_frequency(instrument.float_frequency());
			break;
		case InstrumentType::FRA:
			message->set_rate(instrument.rate());
			message->set_start(instrument.start());
			message->set_end(instrument.maturity());
			break;
		case InstrumentType::FUTURE:
			message->set_price(instrument.price());
			message->set_convexity_adjustment(instrument.convexity_adjustment());
			break;
		default:
			break;
		}
	}
};

static ValueConverter default_converter;

const Converter *get_default_converter() { return &default_converter; }

/////////////////////////// Tests

static int test_enum_names()
{
	int failure_count = 0;
	const Converter *converter = get_default_converter();
	if (converter->interpolator_type_from_string("MonotonicCubic") != InterpolatorType::MONOTONIC_CUBIC)
		failure_count++;
	if (converter->interpolator_type_from_string("loglinear") != InterpolatorType::LOG_LINEAR)
		failure_count++;
	if (converter->interpolator_type_from_string("Quadratic") != InterpolatorType::LOG_LINEAR)
		failure_count++;
	if (strcmp(converter->interpolator_type_to_string(InterpolatorType::FLAT_FORWARD), "FlatForward") != 0)
		failure_count++;
	for (int i = Tenor::TENOR_ON; i <= Tenor::TENOR_12M; i++) {
		Tenor tenor = (Tenor)i;
		if (converter->tenor_from_string(converter->tenor_to_string(tenor).c_str()) != tenor)
			failure_count++;
	}
	if (converter->tenor_from_string("1Y") != Tenor::TENOR_12M ||
	    converter->tenor_from_string("2W") != Tenor::TENOR_UNSPECIFIED)
		failure_count++;
	if (!converter->tenor_to_string(Tenor::TENOR_UNSPECIFIED).empty())
		failure_count++;
	if (converter->frequency_from_string("SemiAnnual") != Frequency::SEMI_ANNUAL ||
	    strcmp(converter->frequency_to_string(Frequency::MONTHLY), "Monthly") != 0)
		failure_count++;
	if (converter->instrument_type_from_string("future") != InstrumentType::FUTURE ||
	    converter->instrument_type_from_string(nullptr) != InstrumentType::INSTRUMENT_TYPE_UNSPECIFIED)
		failure_count++;
	if (strcmp(converter->solver_type_to_string(SolverType::SOLVER_TYPE_HYBRID_POWELL), "HybridPowell") != 0)
		failure_count++;
	return failure_count;
}

static int test_instrument_messages()
{
	int failure_count = 0;
	const Converter *converter = get_default_converter();
	ParInstrument message;
	message.set_instrument_type(InstrumentType::IRS);
	message.set_maturity(5.0);
	message.set_rate(0.031);
	Instrument<double> instrument = Instrument<double>::ois(1.0, 0.0);
	if (!converter->instrument_from_message(message, instrument).ok())
		failure_count++;
	if (instrument.type() != InstrumentType::IRS || instrument.fixed_frequency() != Frequency::ANNUAL ||
	    instrument.float_frequency() != Frequency::QUARTERLY || instrument.rate() != 0.031)
		failure_count++;

	message.Clear();
	message.set_instrument_type(InstrumentType::FRA);
	message.set_start(0.5);
	message.set_end(0.75);
	message.set_rate(0.02);
	if (!converter->instrument_from_message(message, instrument).ok() || instrument.start() != 0.5 ||
	    instrument.maturity() != 0.75)
		failure_count++;

	message.Clear();
	message.set_instrument_type(InstrumentType::FUTURE);
	message.set_maturity(0.25);
	message.set_price(97.5);
	message.set_convexity_adjustment(0.0001);
	if (!converter->instrument_from_message(message, instrument).ok() ||
	    std::fabs(instrument.rate() - 0.0249) > 1e-15)
		failure_count++;
	ParInstrument copy;
	converter->instrument_to_message(instrument, &copy);
	if (copy.instrument_type() != InstrumentType::FUTURE || copy.price() != 97.5 || copy.maturity() != 0.25)
		failure_count++;

	message.Clear();
	message.set_maturity(1.0);
	Status status = converter->instrument_from_message(message, instrument);
	if (status.code() != StatusCode::kINS_UnknownInstrumentType)
		failure_count++;
	return failure_count;
}

int test_conversions()
{
	int failure_count = 0;
	failure_count += test_enum_names();
	failure_count += test_instrument_messages();
	if (failure_count == 0)
		printf("Conversion Tests OK\n");
	else
		printf("Conversion Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
