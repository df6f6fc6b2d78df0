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

#ifndef _RATESTRAP_SENSITIVITIES_H
#define _RATESTRAP_SENSITIVITIES_H

#include <bootstrap.h>
#include <config.h>
#include <instrument.h>
#include <matrix.h>
#include <status.h>

#include <stdio.h>

#include <vector>

namespace ratestrap
{

// Dense matrix of d(discount factor) / d(input rate). Rows follow
// the curve pillars in maturity order, columns follow the input
// instruments in the order they were supplied. Storage is column
// major so that the matrix can be handed to BLAS.
class SensitivityMatrix
{
	public:
	SensitivityMatrix() : rows_(0), cols_(0) {}
	SensitivityMatrix(int rows, int cols) : rows_(rows), cols_(cols), data_((size_t)rows * cols, 0.0) {}

	int rows() const { return rows_; }
	int cols() const { return cols_; }
	double at(int row, int col) const { return data_[(size_t)col * rows_ + row]; }
	void set(int row, int col, double v) { data_[(size_t)col * rows_ + row] = v; }

	// BLAS view of the data; valid while this object is alive
	ratestrap_matrix_t matrix()
	{
		ratestrap_matrix_t m = {rows_, cols_, data_.data()};
		return m;
	}

	void dump(const char *desc, FILE *fp = stdout) const;

	private:
	int rows_;
	int cols_;
	std::vector<double> data_;
};

// Comparison of the implicit function sensitivities with bump and
// revalue. An entry fails when both its absolute difference and
// its difference relative to the bumped value exceed the tolerance.
struct SensitivityVerification {
	SensitivityMatrix aad;
	SensitivityMatrix bump;
	double max_abs_diff;
	double max_rel_diff;
	int failed_entries;
	bool within_tolerance;

	SensitivityVerification() : max_abs_diff(0.0), max_rel_diff(0.0), failed_entries(0), within_tolerance(true) {}
};

// Bootstraps a curve and computes the sensitivities of its
// discount factors to the input rates.
//
// bootstrap_with_sensitivities() uses the implicit function theorem
// on the solved residual equations: pillar i satisfies
// R_i(DF_0 .. DF_i, rate_i) = 0, so that
// (I - C) S = D with D_ii = 1 / (dR_i/dDF_i) and
// C_im = -(dR_i/dDF_m) / (dR_i/dDF_i) for m < i.
// I - C is unit lower triangular and the system is solved by
// forward substitution (dtrsm).
//
// bootstrap_with_bump_and_revalue() rebuilds the curve once per
// input with the rate shifted by the configured bump size.
class SensitivityBootstrapper
{
	public:
	explicit SensitivityBootstrapper(const BootstrapConfig &config = BootstrapConfig()) : bootstrapper_(config) {}

	Status bootstrap_with_sensitivities(const std::vector<Instrument<double>> &instruments,
					    BootstrapResult<double> &result, SensitivityMatrix &sensitivities) const;
	Status bootstrap_with_bump_and_revalue(const std::vector<Instrument<double>> &instruments,
					       BootstrapResult<double> &result,
					       SensitivityMatrix &sensitivities) const;
	Status verify_sensitivities(const std::vector<Instrument<double>> &instruments, double tolerance,
				    SensitivityVerification &verification) const;

	// Computes the sensitivities for an existing bootstrap of the
	// same instruments
	Status compute_sensitivities(const std::vector<Instrument<double>> &instruments,
				     const BootstrapResult<double> &result, SensitivityMatrix &sensitivities) const;

	const BootstrapConfig &config() const { return bootstrapper_.config(); }

	private:
	SequentialBootstrapper<double> bootstrapper_;
};

extern int test_sensitivities();

} // namespace ratestrap

#endif
