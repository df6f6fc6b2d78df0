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

#ifndef _RATESTRAP_STATUS_H
#define _RATESTRAP_STATUS_H

#include <enums.pb.h>
#include <stddef.h>

namespace ratestrap
{

typedef ResponseSubCode StatusCode;

extern const char *error_message(StatusCode code);
extern const char *error_message(char *buf, size_t buflen, StatusCode status_code, const char *format, ...);

// Outcome of an operation. A failed status carries the code, a
// formatted message that starts with the code's standard text,
// and whatever numeric context the failing operation had at hand.
// Context values that do not apply are left at -1 (indices and
// counts) or NaN (maturity and value).
class Status
{
	public:
	Status() noexcept;
	explicit Status(StatusCode code) noexcept;

	// Creates a failed status; the formatted text is appended to
	// the standard message for the code
	static Status make(StatusCode code, const char *format, ...);
	static Status ok_status() noexcept { return Status(); }

	bool ok() const noexcept { return code_ == StatusCode::kOk; }
	StatusCode code() const noexcept { return code_; }
	const char *message() const noexcept { return message_; }

	// Position of the offending instrument or pillar
	int index() const noexcept { return index_; }
	double maturity() const noexcept { return maturity_; }
	// Residual, rate, discount factor or time depending on the code
	double value() const noexcept { return value_; }
	int iterations() const noexcept { return iterations_; }
	int required() const noexcept { return required_; }
	int provided() const noexcept { return provided_; }

	Status &with_index(int index) noexcept
	{
		index_ = index;
		return *this;
	}
	Status &with_maturity(double maturity) noexcept
	{
		maturity_ = maturity;
		return *this;
	}
	Status &with_value(double value) noexcept
	{
		value_ = value;
		return *this;
	}
	Status &with_iterations(int iterations) noexcept
	{
		iterations_ = iterations;
		return *this;
	}
	Status &with_counts(int required, int provided) noexcept
	{
		required_ = required;
		provided_ = provided;
		return *this;
	}

	private:
	StatusCode code_;
	int index_;
	double maturity_;
	double value_;
	int iterations_;
	int required_;
	int provided_;
	char message_[256];
};

extern int test_status();
} // namespace ratestrap

#endif
