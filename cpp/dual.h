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

#ifndef _RATESTRAP_DUAL_H
#define _RATESTRAP_DUAL_H

#include <scalar.h>

#include <cmath>

namespace ratestrap
{

// Forward mode dual number carrying one directional derivative.
// Seed the derivative of an input (usually a quoted rate) with 1.0
// and every value computed from it carries d(value)/d(input).
class Dual
{
	public:
	Dual(double value = 0.0, double derivative = 0.0) : value_(value), derivative_(derivative) {}

	double value() const { return value_; }
	double derivative() const { return derivative_; }

	Dual operator-() const { return Dual(-value_, -derivative_); }

	private:
	double value_;
	double derivative_;
};

inline Dual operator+(const Dual &a, const Dual &b)
{
	return Dual(a.value() + b.value(), a.derivative() + b.derivative());
}

inline Dual operator-(const Dual &a, const Dual &b)
{
	return Dual(a.value() - b.value(), a.derivative() - b.derivative());
}

inline Dual operator*(const Dual &a, const Dual &b)
{
	return Dual(a.value() * b.value(), a.derivative() * b.value() + a.value() * b.derivative());
}

inline Dual operator/(const Dual &a, const Dual &b)
{
	double v = a.value() / b.value();
	return Dual(v, (a.derivative() - v * b.derivative()) / b.value());
}

inline bool operator<(const Dual &a, const Dual &b) { return a.value() < b.value(); }
inline bool operator>(const Dual &a, const Dual &b) { return a.value() > b.value(); }
inline bool operator<=(const Dual &a, const Dual &b) { return a.value() <= b.value(); }
inline bool operator>=(const Dual &a, const Dual &b) { return a.value() >= b.value(); }

inline Dual exp(const Dual &x)
{
	double v = std::exp(x.value());
	return Dual(v, v * x.derivative());
}

inline Dual log(const Dual &x) { return Dual(std::log(x.value()), x.derivative() / x.value()); }

inline Dual fabs(const Dual &x) { return x.value() < 0.0 ? -x : x; }

inline bool isfinite(const Dual &x) { return std::isfinite(x.value()) && std::isfinite(x.derivative()); }

} // namespace ratestrap

#endif
