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

#include <config.h>

#include <google/protobuf/text_format.h>

#include <logger.h>

#include <stdio.h>
#include <string.h>

#include <cmath>
#include <thread>

namespace ratestrap
{

BootstrapConfig BootstrapConfig::high_precision()
{
	BootstrapConfig config;
	config.tolerance = 1e-14;
	config.max_iterations = 500;
	return config;
}

BootstrapConfig BootstrapConfig::fast()
{
	BootstrapConfig config;
	config.tolerance = 1e-8;
	config.max_iterations = 50;
	return config;
}

Status BootstrapConfig::validate() const
{
	if (!(tolerance > 0.0) || !std::isfinite(tolerance))
		return Status::make(StatusCode::kCFG_BadTolerance, ", got %g", tolerance).with_value(tolerance);
	if (max_iterations < 1)
		return Status::make(StatusCode::kCFG_BadMaxIterations, ", got %d", max_iterations)
		    .with_iterations(max_iterations);
	if (!(max_maturity > 0.0) || !std::isfinite(max_maturity))
		return Status::make(StatusCode::kCFG_BadMaxMaturity, ", got %g", max_maturity).with_value(max_maturity);
	if (bump_size == 0.0 || !std::isfinite(bump_size))
		return Status::make(StatusCode::kCFG_BadBumpSize, ", got %g", bump_size).with_value(bump_size);
	return Status();
}

int BootstrapConfig::effective_threads() const
{
	if (num_threads > 0)
		return num_threads;
	unsigned n = std::thread::hardware_concurrency();
	return n > 0 ? (int)n : 1;
}

void config_from_proto(const BootstrapOptions &options, BootstrapConfig &config)
{
	config.tolerance = options.tolerance() != 0.0 ? options.tolerance() : config.tolerance;
	config.max_iterations = options.max_iterations() != 0 ? options.max_iterations() : config.max_iterations;
	config.max_maturity = options.max_maturity() != 0.0 ? options.max_maturity() : config.max_maturity;
	config.bump_size = options.bump_size() != 0.0 ? options.bump_size() : config.bump_size;
	config.num_threads = options.num_threads() != 0 ? options.num_threads() : config.num_threads;
	// LOG_LINEAR is the proto default so it cannot override another method
	if (options.interpolation() != InterpolatorType::LOG_LINEAR)
		config.interpolation = options.interpolation();
	if (options.disallow_extrapolation())
		config.allow_extrapolation = false;
	if (options.allow_negative_rates())
		config.allow_negative_rates = true;
}

void config_to_proto(const BootstrapConfig &config, BootstrapOptions &options)
{
	options.set_tolerance(config.tolerance);
	options.set_max_iterations(config.max_iterations);
	options.set_interpolation(config.interpolation);
	options.set_disallow_extrapolation(!config.allow_extrapolation);
	options.set_allow_negative_rates(config.allow_negative_rates);
	options.set_max_maturity(config.max_maturity);
	options.set_bump_size(config.bump_size);
	options.set_num_threads(config.num_threads);
}

Status parse_bootstrap_config(const std::string &text, BootstrapConfig &config)
{
	BootstrapOptions options;
	if (!google::protobuf::TextFormat::ParseFromString(text, &options)) {
		error("Failed to parse bootstrap options\n");
		return Status(StatusCode::kCFG_ParseFailure);
	}
	BootstrapConfig result;
	config_from_proto(options, result);
	Status status = result.validate();
	if (!status.ok()) {
		error("%s\n", status.message());
		return status;
	}
	config = result;
	return Status();
}

Status load_bootstrap_config(const char *filename, BootstrapConfig &config)
{
	FILE *fp = fopen(filename, "rb");
	if (fp == nullptr) {
		error("Unable to open configuration file %s\n", filename);
		return Status::make(StatusCode::kCFG_FileNotFound, ": %s", filename);
	}
	std::string text;
	char buf[4096];
	size_t n;
	while ((n = fread(buf, 1, sizeof buf, fp)) > 0)
		text.append(buf, n);
	fclose(fp);
	Status status = parse_bootstrap_config(text, config);
	if (status.ok())
		inform("Loaded bootstrap configuration from %s\n", filename);
	return status;
}

static int test_presets()
{
	int failure_count = 0;
	BootstrapConfig config;
	if (config.tolerance != 1e-12 || config.max_iterations != 100 ||
	    config.interpolation != InterpolatorType::LOG_LINEAR || !config.allow_extrapolation ||
	    config.allow_negative_rates || config.max_maturity != 50.0 || config.bump_size != 1e-4 ||
	    config.num_threads != 0)
		failure_count++;
	if (!config.validate().ok() || config.effective_threads() < 1)
		failure_count++;
	BootstrapConfig precise = BootstrapConfig::high_precision();
	if (precise.tolerance != 1e-14 || precise.max_iterations != 500 || !precise.validate().ok())
		failure_count++;
	BootstrapConfig quick = BootstrapConfig::fast();
	if (quick.tolerance != 1e-8 || quick.max_iterations != 50 || !quick.validate().ok())
		failure_count++;

	BootstrapConfig bad;
	bad.tolerance = 0.0;
	if (bad.validate().code() != StatusCode::kCFG_BadTolerance)
		failure_count++;
	bad = BootstrapConfig();
	bad.max_iterations = 0;
	if (bad.validate().code() != StatusCode::kCFG_BadMaxIterations)
		failure_count++;
	bad = BootstrapConfig();
	bad.max_maturity = -1.0;
	if (bad.validate().code() != StatusCode::kCFG_BadMaxMaturity)
		failure_count++;
	bad = BootstrapConfig();
	bad.bump_size = 0.0;
	if (bad.validate().code() != StatusCode::kCFG_BadBumpSize)
		failure_count++;
	return failure_count;
}

static int test_proto_conversion()
{
	int failure_count = 0;
	BootstrapOptions options;
	options.set_max_iterations(30);
	options.set_interpolation(InterpolatorType::MONOTONIC_CUBIC);
	options.set_disallow_extrapolation(true);
	BootstrapConfig config;
	config_from_proto(options, config);
	if (config.max_iterations != 30 || config.tolerance != 1e-12 ||
	    config.interpolation != InterpolatorType::MONOTONIC_CUBIC || config.allow_extrapolation)
		failure_count++;

	BootstrapOptions out;
	config_to_proto(config, out);
	BootstrapConfig copy;
	config_from_proto(out, copy);
	if (copy.max_iterations != 30 || copy.allow_extrapolation || copy.bump_size != config.bump_size)
		failure_count++;
	return failure_count;
}

static int test_text_format()
{
	int failure_count = 0;
	BootstrapConfig config;
	Status status = parse_bootstrap_config("tolerance: 1e-10\n"
					       "max_iterations: 25\n"
					       "interpolation: FLAT_FORWARD\n"
					       "allow_negative_rates: true\n"
					       "num_threads: 2\n",
					       config);
	if (!status.ok() || config.tolerance != 1e-10 || config.max_iterations != 25 ||
	    config.interpolation != InterpolatorType::FLAT_FORWARD || !config.allow_negative_rates ||
	    config.num_threads != 2 || config.max_maturity != 50.0)
		failure_count++;

	BootstrapConfig unchanged;
	status = parse_bootstrap_config("tolerance: oops", unchanged);
	if (status.code() != StatusCode::kCFG_ParseFailure || unchanged.tolerance != 1e-12)
		failure_count++;
	status = parse_bootstrap_config("tolerance: -1", unchanged);
	if (status.code() != StatusCode::kCFG_BadTolerance)
		failure_count++;
	status = load_bootstrap_config("/nonexistent/ratestrap.txt", unchanged);
	if (status.code() != StatusCode::kCFG_FileNotFound)
		failure_count++;
	return failure_count;
}

int test_config()
{
	int failure_count = 0;
	failure_count += test_presets();
	failure_count += test_proto_conversion();
	failure_count += test_text_format();
	if (failure_count == 0)
		printf("Config Tests OK\n");
	else
		printf("Config Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
