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

#ifndef _RATESTRAP_SCALAR_H
#define _RATESTRAP_SCALAR_H

#include <cmath>
#include <functional>

namespace ratestrap
{

// The numeric type used by curves and instruments is a template
// parameter so that an automatic differentiation type can flow
// through the bootstrap. A scalar type must support arithmetic
// with double and provide log and exp overloads in its own
// namespace; templates call them unqualified so the using
// declarations below pick the std versions for double.
// ScalarTraits converts to and from plain double where a value
// must leave the differentiable computation (logging, LAPACK,
// comparisons against tolerances). The templates are instantiated
// for double and for Dual (see dual.h).
using std::exp;
using std::fabs;
using std::isfinite;
using std::log;

template <typename T> struct ScalarTraits {
	static double value(const T &x) { return x.value(); }
	static T from_value(double v) { return T(v); }
};

template <> struct ScalarTraits<double> {
	static double value(double x) { return x; }
	static double from_value(double v) { return v; }
};

template <typename T> inline double scalar_value(const T &x) { return ScalarTraits<T>::value(x); }

// A function of time returning a discount factor; this is how an
// instrument sees the curve bootstrapped so far
template <typename T> using DiscountFunction = std::function<T(T)>;

} // namespace ratestrap

#endif
