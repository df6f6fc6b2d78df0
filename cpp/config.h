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

#ifndef _RATESTRAP_CONFIG_H
#define _RATESTRAP_CONFIG_H

#include <bootstrap.pb.h>
#include <enums.pb.h>

#include <status.h>

#include <string>

namespace ratestrap
{

// Settings shared by every bootstrap. The value is passed by const
// reference into the builders and is never modified by them.
struct BootstrapConfig {
	// Newton iterations stop once |residual| is below this
	double tolerance;
	int max_iterations;
	InterpolatorType interpolation;
	bool allow_extrapolation;
	// Disables the negative rate and arbitrage checks
	bool allow_negative_rates;
	// Instruments maturing later than this are rejected
	double max_maturity;
	// Rate shift used by bump and revalue
	double bump_size;
	// Worker threads for parallel builds; 0 means hardware concurrency
	int num_threads;

	BootstrapConfig()
	    : tolerance(1e-12), max_iterations(100), interpolation(InterpolatorType::LOG_LINEAR),
	      allow_extrapolation(true), allow_negative_rates(false), max_maturity(50.0), bump_size(1e-4),
	      num_threads(0)
	{
	}

	// Tighter tolerance, more iterations
	static BootstrapConfig high_precision();
	// Looser tolerance, fewer iterations
	static BootstrapConfig fast();

	Status validate() const;
	// Number of threads after resolving 0 to the hardware concurrency
	int effective_threads() const;
};

// Overlays the options onto config; numeric fields left at zero
// keep the value already in config
extern void config_from_proto(const BootstrapOptions &options, BootstrapConfig &config);
extern void config_to_proto(const BootstrapConfig &config, BootstrapOptions &options);

// Parses BootstrapOptions in protobuf text format on top of the
// defaults and validates the result
extern Status parse_bootstrap_config(const std::string &text, BootstrapConfig &config);
extern Status load_bootstrap_config(const char *filename, BootstrapConfig &config);

extern int test_config();

} // namespace ratestrap

#endif
