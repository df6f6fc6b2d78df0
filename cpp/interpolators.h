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
/**
 * Portions derived from Quantlib.
 * License: http://quantlib.org/license.shtml
 */

#ifndef _RATESTRAP_INTERPOLATORS_H
#define _RATESTRAP_INTERPOLATORS_H

#include <enums.pb.h>

#include <memory>

namespace ratestrap
{

// Piecewise cubic interpolation over plain doubles. The curve uses
// these for the spline methods; the linear methods are computed
// directly by the curve so that they work with any scalar type.
class Interpolator
{
	public:
	virtual ~Interpolator() {}

	// Interpolate at x; outside the data the first or last
	// segment polynomial is used
	virtual double interpolate(double x) const = 0;
	double operator()(double x) const { return interpolate(x); }

	// First and second derivatives at x
	virtual double derivative(double x) const = 0;
	virtual double derivative2(double x) const = 0;

	// Return the interpolator type
	virtual InterpolatorType type() const = 0;
};

// Return an Interpolator of the desired type. The x and y values are
// copied. x must be strictly increasing.
// Returns nullptr if the type is not a spline type, if there
// are too few points (natural cubic spline needs 3, monotone cubic
// needs 2), or if the spline system could not be solved.
extern std::unique_ptr<Interpolator> make_interpolator(InterpolatorType type, const double *x, const double *y,
						       unsigned int size);

extern int test_interpolators();

} // namespace ratestrap

#endif
