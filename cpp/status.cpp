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

#include <status.h>

#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>
#include <string.h>

#include <cmath>
#include <limits>

namespace ratestrap
{

const char *error_message(StatusCode code)
{
	switch (code) {
	case StatusCode::kOk:
		return "";
	case StatusCode::kBadArgument:
		return "ERR0001: Bad argument";
	case StatusCode::kError:
		return "ERR0002: Error servicing the request";
	case StatusCode::kNotImplemented:
		return "ERR0003: Feature not yet implemented";
	case StatusCode::kInternalError:
		return "ERR0005: Internal error (contact support)";
	case StatusCode::kShuttingDown:
		return "ERR0006: Service is shutting down";

	case StatusCode::kINS_NonPositiveMaturity:
		return "INS1101: Maturity must be positive";
	case StatusCode::kINS_MaturityExceedsMaximum:
		return "INS1102: Maturity exceeds maximum";
	case StatusCode::kINS_BadFraWindow:
		return "INS1103: FRA start must be before end";
	case StatusCode::kINS_NegativeFraStart:
		return "INS1104: FRA start must be non-negative";
	case StatusCode::kINS_UnreasonableFuturePrice:
		return "INS1105: Future price is unreasonable (expected 0-200)";
	case StatusCode::kINS_UnknownInstrumentType:
		return "INS1106: Unknown instrument type";
	case StatusCode::kINS_BadFrequency:
		return "INS1107: Payment frequency must be specified";

	case StatusCode::kCRV_MismatchedPillars:
		return "CRV1121: Pillar count must match discount factor count";
	case StatusCode::kCRV_NoPillars:
		return "CRV1122: Cannot create curve with no pillars";
	case StatusCode::kCRV_NonIncreasingPillars:
		return "CRV1123: Pillars must be strictly increasing";
	case StatusCode::kCRV_NonPositiveDiscountFactor:
		return "CRV1124: Discount factor must be positive";
	case StatusCode::kCRV_NonPositiveMaturity:
		return "CRV1125: Pillar maturity must be positive";
	case StatusCode::kCRV_NegativeTime:
		return "CRV1126: Time must not be negative";
	case StatusCode::kCRV_OutOfBounds:
		return "CRV1127: Time is outside the curve and extrapolation is disabled";

	case StatusCode::kBTS_ConvergenceFailure:
		return "BTS1201: Solver failed to converge";
	case StatusCode::kBTS_NonFiniteResidual:
		return "BTS1202: Residual is not finite";
	case StatusCode::kBTS_DuplicateMaturity:
		return "BTS1203: Two instruments have the same maturity";
	case StatusCode::kBTS_InsufficientData:
		return "BTS1204: Insufficient instruments";
	case StatusCode::kBTS_NegativeRate:
		return "BTS1205: Negative zero rate and negative rates are not allowed";
	case StatusCode::kBTS_ArbitrageDetected:
		return "BTS1206: Discount factors are not decreasing";
	case StatusCode::kBTS_InvalidInput:
		return "BTS1207: Invalid instrument";

	case StatusCode::kMCB_BatchElementFailed:
		return "MCB1241: Curve set in batch failed to build";

	case StatusCode::kCFG_BadTolerance:
		return "CFG1261: Tolerance must be positive and finite";
	case StatusCode::kCFG_BadMaxIterations:
		return "CFG1262: Max iterations must be at least 1";
	case StatusCode::kCFG_BadMaxMaturity:
		return "CFG1263: Max maturity must be positive";
	case StatusCode::kCFG_ParseFailure:
		return "CFG1264: Failed to parse configuration";
	case StatusCode::kCFG_FileNotFound:
		return "CFG1265: Configuration file not found";
	case StatusCode::kCFG_BadBumpSize:
		return "CFG1266: Bump size must be non-zero and finite";

	default:
		return "ERR0000: unexpected error";
	}
}

const char *error_message(char *buf, size_t buflen, StatusCode status_code, const char *format, ...)
{
	const char *status_msg = error_message(status_code);
	int n = snprintf(buf, buflen, "%s", status_msg);
	if (n < 0 || (size_t)n >= buflen) {
		return buf;
	}
	char *buf2 = buf + n;
	buflen -= n;
	va_list args;
	va_start(args, format);
	vsnprintf(buf2, buflen, format, args);
	va_end(args);
	return buf;
}

Status::Status() noexcept
    : code_(StatusCode::kOk), index_(-1), maturity_(std::numeric_limits<double>::quiet_NaN()),
      value_(std::numeric_limits<double>::quiet_NaN()), iterations_(-1), required_(-1), provided_(-1)
{
	message_[0] = 0;
}

Status::Status(StatusCode code) noexcept : Status()
{
	code_ = code;
	snprintf(message_, sizeof message_, "%s", error_message(code));
}

Status Status::make(StatusCode code, const char *format, ...)
{
	Status status(code);
	size_t n = strlen(status.message_);
	if (n + 1 < sizeof status.message_) {
		va_list args;
		va_start(args, format);
		vsnprintf(status.message_ + n, sizeof status.message_ - n, format, args);
		va_end(args);
	}
	return status;
}

int test_status()
{
	int failure_count = 0;
	char buf[128];
	const char *msg = error_message(buf, sizeof buf, StatusCode::kCFG_BadMaxIterations, ": %d, %d", 5, 6);
	if (strcmp(msg, "CFG1262: Max iterations must be at least 1: 5, 6") != 0)
		failure_count++;

	Status ok;
	if (!ok.ok() || ok.message()[0] != 0 || ok.index() != -1 || !std::isnan(ok.maturity()))
		failure_count++;

	Status failed = Status::make(StatusCode::kBTS_ConvergenceFailure, " at maturity %.2f", 2.5);
	failed.with_index(3).with_maturity(2.5).with_value(1e-3).with_iterations(100);
	if (failed.ok() || failed.code() != StatusCode::kBTS_ConvergenceFailure)
		failure_count++;
	if (strcmp(failed.message(), "BTS1201: Solver failed to converge at maturity 2.50") != 0)
		failure_count++;
	if (failed.index() != 3 || failed.maturity() != 2.5 || failed.value() != 1e-3 || failed.iterations() != 100)
		failure_count++;

	Status insufficient(StatusCode::kBTS_InsufficientData);
	insufficient.with_counts(1, 0);
	if (insufficient.required() != 1 || insufficient.provided() != 0 ||
	    strcmp(insufficient.message(), "BTS1204: Insufficient instruments") != 0)
		failure_count++;

	if (failure_count == 0)
		printf("Test Status OK\n");
	else
		printf("Test Status FAILED\n");
	return failure_count;
}
} // namespace ratestrap
