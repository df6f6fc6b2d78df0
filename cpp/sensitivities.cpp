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

#include <sensitivities.h>

#include <logger.h>

#include <algorithm>
#include <cmath>

namespace ratestrap
{

static const double kPillarBump = 1e-8;
static const double kMinDerivative = 1e-30;

void SensitivityMatrix::dump(const char *desc, FILE *fp) const
{
	ratestrap_matrix_t m = {rows_, cols_, const_cast<double *>(data_.data())};
	ratestrap_matrix_dump_to(&m, desc, fp);
}

Status SensitivityBootstrapper::compute_sensitivities(const std::vector<Instrument<double>> &instruments,
						      const BootstrapResult<double> &result,
						      SensitivityMatrix &sensitivities) const
{
	int n = (int)result.pillars.size();
	if (n == 0 || result.order.size() != (size_t)n || instruments.size() != (size_t)n) {
		error("Sensitivities requested for %d instruments but the bootstrap has %d pillars\n",
		      (int)instruments.size(), n);
		return Status::make(StatusCode::kBadArgument, ": %d instruments, %d pillars", (int)instruments.size(), n)
		    .with_counts(n, (int)instruments.size());
	}

	// L = I - C and B = D, both in sorted pillar order
	SensitivityMatrix L(n, n);
	SensitivityMatrix B(n, n);
	PartialCurve<double> partial(n);
	for (int i = 0; i < n; i++) {
		const Instrument<double> &instrument = instruments[result.order[i]];
		double df = result.discount_factors[i];
		L.set(i, i, 1.0);
		double a = instrument.residual_derivative(df, partial.as_function());
		if (std::fabs(a) < kMinDerivative || !std::isfinite(a)) {
			warn("Residual derivative %g at pillar %d is degenerate; sensitivities set to zero\n", a, i);
		} else {
			B.set(i, i, 1.0 / a);
			for (int m = 0; m < i; m++) {
				double base = partial.discount_factors()[m];
				partial.set_discount_factor(m, base + kPillarBump);
				double up = instrument.residual(df, partial.as_function());
				partial.set_discount_factor(m, base - kPillarBump);
				double down = instrument.residual(df, partial.as_function());
				partial.set_discount_factor(m, base);
				double g = (up - down) / (2.0 * kPillarBump);
				L.set(i, m, g / a);
			}
		}
		partial.append(result.pillars[i], df);
	}

	ratestrap_matrix_t Lm = L.matrix();
	ratestrap_matrix_t Bm = B.matrix();
	ratestrap_matrix_lower_solve(&Lm, &Bm, true);

	SensitivityMatrix S(n, n);
	for (int i = 0; i < n; i++) {
		for (int j = 0; j < n; j++) {
			S.set(i, (int)result.order[j], B.at(i, j));
		}
	}
	sensitivities = std::move(S);
	return Status();
}

Status SensitivityBootstrapper::bootstrap_with_sensitivities(const std::vector<Instrument<double>> &instruments,
							     BootstrapResult<double> &result,
							     SensitivityMatrix &sensitivities) const
{
	BootstrapResult<double> base;
	Status status = bootstrapper_.bootstrap(instruments, base);
	if (!status.ok())
		return status;
	SensitivityMatrix S;
	status = compute_sensitivities(instruments, base, S);
	if (!status.ok())
		return status;
	result = std::move(base);
	sensitivities = std::move(S);
	return Status();
}

Status SensitivityBootstrapper::bootstrap_with_bump_and_revalue(const std::vector<Instrument<double>> &instruments,
								BootstrapResult<double> &result,
								SensitivityMatrix &sensitivities) const
{
	BootstrapResult<double> base;
	Status status = bootstrapper_.bootstrap(instruments, base);
	if (!status.ok())
		return status;
	double bump = config().bump_size;
	int n = (int)base.pillars.size();
	SensitivityMatrix S(n, (int)instruments.size());
	std::vector<Instrument<double>> shifted(instruments);
	for (size_t j = 0; j < instruments.size(); j++) {
		shifted[j] = instruments[j].bumped(bump);
		BootstrapResult<double> bumped;
		status = bootstrapper_.bootstrap(shifted, bumped);
		shifted[j] = instruments[j];
		if (!status.ok()) {
			error("Bumped bootstrap for instrument %d failed: %s\n", (int)j, status.message());
			return status;
		}
		for (int i = 0; i < n; i++)
			S.set(i, (int)j, (bumped.discount_factors[i] - base.discount_factors[i]) / bump);
	}
	result = std::move(base);
	sensitivities = std::move(S);
	return Status();
}

Status SensitivityBootstrapper::verify_sensitivities(const std::vector<Instrument<double>> &instruments,
						     double tolerance, SensitivityVerification &verification) const
{
	BootstrapResult<double> result;
	SensitivityVerification v;
	Status status = bootstrap_with_sensitivities(instruments, result, v.aad);
	if (!status.ok())
		return status;
	status = bootstrap_with_bump_and_revalue(instruments, result, v.bump);
	if (!status.ok())
		return status;
	for (int i = 0; i < v.aad.rows(); i++) {
		for (int j = 0; j < v.aad.cols(); j++) {
			double bumped = v.bump.at(i, j);
			double abs_diff = std::fabs(v.aad.at(i, j) - bumped);
			double rel_diff = std::fabs(bumped) > 1e-10 ? abs_diff / std::fabs(bumped) : abs_diff;
			v.max_abs_diff = std::max(v.max_abs_diff, abs_diff);
			v.max_rel_diff = std::max(v.max_rel_diff, rel_diff);
			if (abs_diff > tolerance && rel_diff > tolerance)
				v.failed_entries++;
		}
	}
	v.within_tolerance = v.failed_entries == 0;
	if (!v.within_tolerance)
		warn("%d sensitivities differ from bump and revalue by more than %g\n", v.failed_entries, tolerance);
	verification = std::move(v);
	return Status();
}

static int test_single_pillar()
{
	SensitivityBootstrapper engine;
	BootstrapResult<double> result;
	SensitivityMatrix S;
	if (!engine.bootstrap_with_sensitivities({Instrument<double>::ois(1.0, 0.03)}, result, S).ok())
		return 1;
	// df = 1 / (1 + r) so d(df)/dr = -df^2
	double df = result.discount_factors[0];
	if (S.rows() != 1 || S.cols() != 1 || std::fabs(S.at(0, 0) + df * df) > 1e-12)
		return 1;
	return 0;
}

static int test_triangular()
{
	int failure_count = 0;
	std::vector<Instrument<double>> instruments = {
	    Instrument<double>::ois(0.5, 0.02),	 Instrument<double>::ois(1.0, 0.021),
	    Instrument<double>::fra(1.0, 1.5, 0.024), Instrument<double>::irs(2.0, 0.024),
	    Instrument<double>::irs(5.0, 0.027),	 Instrument<double>::ois(10.0, 0.03, Frequency::SEMI_ANNUAL)};
	SensitivityBootstrapper engine;
	BootstrapResult<double> result;
	SensitivityMatrix S;
	Status status = engine.bootstrap_with_sensitivities(instruments, result, S);
	if (!status.ok()) {
		fprintf(stderr, "Sensitivity bootstrap failed: %s\n", status.message());
		return 1;
	}
	int n = S.rows();
	for (int i = 0; i < n; i++) {
		for (int j = i + 1; j < n; j++) {
			if (S.at(i, j) != 0.0)
				failure_count++;
		}
		// Raising a rate lowers the discount factor it fixes
		if (!(S.at(i, i) < 0.0))
			failure_count++;
	}

	// Post multiplying by a diagonal scales each column by its diagonal entry
	SensitivityMatrix D(n, n);
	for (int i = 0; i < n; i++)
		D.set(i, i, S.at(i, i));
	ratestrap_matrix_t Sm = S.matrix();
	ratestrap_matrix_t Dm = D.matrix();
	SensitivityMatrix product(n, n);
	ratestrap_matrix_t Pm = product.matrix();
	ratestrap_matrix_multiply(&Sm, &Dm, &Pm, false, false, 1.0, 0.0);
	for (int i = 0; i < n; i++) {
		for (int j = 0; j < n; j++) {
			if (std::fabs(product.at(i, j) - S.at(i, j) * S.at(j, j)) > 1e-14)
				failure_count++;
		}
	}
	return failure_count;
}

static int test_bump_agreement()
{
	int failure_count = 0;
	// Deliberately out of maturity order
	std::vector<Instrument<double>> instruments = {
	    Instrument<double>::irs(3.0, 0.028), Instrument<double>::ois(1.0, 0.022),
	    Instrument<double>::future(0.5, 97.9, 0.0002), Instrument<double>::irs(2.0, 0.026)};
	SensitivityBootstrapper engine;
	SensitivityVerification verification;
	Status status = engine.verify_sensitivities(instruments, 0.01, verification);
	if (!status.ok()) {
		fprintf(stderr, "Verification failed: %s\n", status.message());
		return 1;
	}
	if (!verification.within_tolerance || verification.failed_entries != 0 || verification.max_rel_diff > 0.01) {
		verification.aad.dump("AAD sensitivities", stderr);
		verification.bump.dump("Bump sensitivities", stderr);
		failure_count++;
	}
	// Column 0 is the 3y swap which only moves the last pillar
	if (verification.aad.at(0, 0) != 0.0 || verification.aad.at(2, 0) != 0.0 || !(verification.aad.at(3, 0) < 0.0))
		failure_count++;
	// Column 2 is the future which fixes the first pillar
	if (!(verification.aad.at(0, 2) < 0.0) || verification.aad.rows() != 4 || verification.bump.cols() != 4)
		failure_count++;
	return failure_count;
}

static int test_errors()
{
	int failure_count = 0;
	SensitivityBootstrapper engine;
	BootstrapResult<double> result;
	SensitivityMatrix S;
	Status status = engine.bootstrap_with_sensitivities(std::vector<Instrument<double>>(), result, S);
	if (status.code() != StatusCode::kBTS_InsufficientData)
		failure_count++;
	SensitivityVerification verification;
	status = engine.verify_sensitivities({Instrument<double>::ois(1.0, 0.02), Instrument<double>::ois(1.0, 0.02)},
					     0.01, verification);
	if (status.code() != StatusCode::kBTS_DuplicateMaturity)
		failure_count++;
	// Shifting the 1y rate by 5% leaves the 2y discount factor above the 1y one
	BootstrapConfig config;
	config.bump_size = 0.05;
	SensitivityBootstrapper coarse(config);
	status = coarse.bootstrap_with_bump_and_revalue(
	    {Instrument<double>::ois(1.0, 0.03), Instrument<double>::ois(2.0, 0.025)}, result, S);
	if (status.code() != StatusCode::kBTS_ArbitrageDetected || status.index() != 1)
		failure_count++;
	return failure_count;
}

int test_sensitivities()
{
	int failure_count = 0;
	failure_count += test_single_pillar();
	failure_count += test_triangular();
	failure_count += test_bump_agreement();
	failure_count += test_errors();
	if (failure_count == 0)
		printf("Sensitivity Tests OK\n");
	else
		printf("Sensitivity Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
