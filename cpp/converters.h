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

#ifndef _RATESTRAP_CONVERTERS_H
#define _RATESTRAP_CONVERTERS_H

#include <bootstrap.pb.h>
#include <enums.pb.h>

#include <instrument.h>
#include <status.h>

#include <string>

namespace ratestrap
{

// Conversions between the enums and their names as used in
// configuration files and log output, and between the message
// and library representations of an instrument.
class Converter
{
	public:
	virtual ~Converter() {}
	virtual InterpolatorType interpolator_type_from_string(const char *value) const = 0;
	virtual const char *interpolator_type_to_string(InterpolatorType value) const = 0;
	virtual Tenor tenor_from_string(const char *value) const = 0;
	virtual std::string tenor_to_string(Tenor tenor) const = 0;
	virtual Frequency frequency_from_string(const char *value) const = 0;
	virtual const char *frequency_to_string(Frequency value) const = 0;
	virtual InstrumentType instrument_type_from_string(const char *value) const = 0;
	virtual const char *instrument_type_to_string(InstrumentType value) const = 0;
	virtual const char *solver_type_to_string(SolverType value) const = 0;
	// Instruments with no frequency set get the standard
	// conventions of their type
	virtual Status instrument_from_message(const ParInstrument &message, Instrument<double> &instrument) const = 0;
	virtual void instrument_to_message(const Instrument<double> &instrument, ParInstrument *message) const = 0;
};

extern const Converter *get_default_converter();
extern int test_conversions();

} // namespace ratestrap

#endif
