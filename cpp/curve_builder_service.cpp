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

#include <curve_builder_service.h>

#include <converters.h>
#include <multi_curve.h>
#include <sensitivities.h>

#include <logger.h>

#include <cmath>

namespace ratestrap
{

// Used when the request asks for verification without a tolerance
static const double kDefaultVerificationTolerance = 0.05;

static void set_header(ReplyHeader *header, const Status &status)
{
	if (status.ok()) {
		header->set_response_code(StandardResponseCode::SRC_OK);
		header->set_response_sub_code(StatusCode::kOk);
		header->clear_response_message();
	} else {
		header->set_response_code(StandardResponseCode::SRC_ERROR);
		header->set_response_sub_code(status.code());
		header->set_response_message(status.message());
	}
}

static Status convert_instruments(const google::protobuf::RepeatedPtrField<ParInstrument> &messages,
				  std::vector<Instrument<double>> &instruments)
{
	const Converter *converter = get_default_converter();
	instruments.clear();
	instruments.reserve(messages.size());
	for (int i = 0; i < messages.size(); i++) {
		Instrument<double> instrument = Instrument<double>::ois(0.0, 0.0);
		Status status = converter->instrument_from_message(messages.Get(i), instrument);
		if (!status.ok())
			return status.with_index(i);
		instruments.push_back(instrument);
	}
	return Status();
}

static Status convert_curve_set(const CurveSetDefinition &definition, CurveSetInstruments<double> &curve_set)
{
	Status status = convert_instruments(definition.discount_instruments(), curve_set.discount);
	if (!status.ok())
		return status;
	curve_set.forwards.clear();
	for (int i = 0; i < definition.forward_instruments_size(); i++) {
		const TenorInstruments &item = definition.forward_instruments(i);
		if (item.tenor() == Tenor::TENOR_UNSPECIFIED || !Tenor_IsValid(item.tenor())) {
			error("Forward curve %d has no tenor\n", i);
			return Status::make(StatusCode::kBadArgument, ": forward curve %d has no tenor", i).with_index(i);
		}
		for (auto &existing : curve_set.forwards) {
			if (existing.first == item.tenor()) {
				error("Forward curve %d repeats tenor %s\n", i, tenor_name(item.tenor()));
				return Status::make(StatusCode::kBadArgument, ": forward curve %d repeats tenor %s", i,
						    tenor_name(item.tenor()))
				    .with_index(i);
			}
		}
		std::vector<Instrument<double>> instruments;
		status = convert_instruments(item.instruments(), instruments);
		if (!status.ok())
			return status;
		curve_set.forwards.push_back(std::make_pair(item.tenor(), std::move(instruments)));
	}
	return Status();
}

// Row major copy of the matrix
static void set_sensitivities(const SensitivityMatrix &matrix, CurveSensitivities *message)
{
	message->set_num_pillars(matrix.rows());
	message->set_num_instruments(matrix.cols());
	message->clear_values();
	for (int i = 0; i < matrix.rows(); i++)
		for (int j = 0; j < matrix.cols(); j++)
			message->add_values(matrix.at(i, j));
}

static void set_zero_curve(const BootstrapResult<double> &result, Tenor tenor, const BootstrapConfig &config,
			   ZeroCurve *curve)
{
	curve->set_tenor(tenor);
	curve->set_interpolation(config.interpolation);
	curve->set_allow_extrapolation(config.allow_extrapolation);
	for (size_t i = 0; i < result.pillars.size(); i++) {
		curve->add_maturities(result.pillars[i]);
		curve->add_discount_factors(result.discount_factors[i]);
		curve->add_residuals(result.residuals[i]);
		curve->add_iterations(result.iterations[i]);
		curve->add_solvers(result.solvers[i]);
	}
}

class CurveBuilderServiceImpl : public CurveBuilderService
{
	private:
	BootstrapConfig defaults_;
	std::shared_ptr<WorkStealingPool> pool_;

	public:
	CurveBuilderServiceImpl(const BootstrapConfig &defaults, std::shared_ptr<WorkStealingPool> pool)
	    : defaults_(defaults), pool_(pool)
	{
	}

	BootstrapCurvesReply *handle_bootstrap_request(const BootstrapCurvesRequest *request,
						       BootstrapCurvesReply *reply) override final;
	BatchBootstrapCurvesReply *handle_batch_bootstrap_request(const BatchBootstrapCurvesRequest *request,
								  BatchBootstrapCurvesReply *reply) override final;

	private:
	Status make_config(const BootstrapOptions &options, BootstrapConfig &config) const;
	Status add_sensitivities(const BootstrapCurvesRequest *request, const BootstrapConfig &config,
				 const std::vector<Instrument<double>> &instruments, const BootstrapResult<double> &result,
				 ZeroCurve *curve) const;
};

Status CurveBuilderServiceImpl::make_config(const BootstrapOptions &options, BootstrapConfig &config) const
{
	config = defaults_;
	config_from_proto(options, config);
	Status status = config.validate();
	if (!status.ok())
		error("Invalid bootstrap options: %s\n", status.message());
	return status;
}

Status CurveBuilderServiceImpl::add_sensitivities(const BootstrapCurvesRequest *request, const BootstrapConfig &config,
						  const std::vector<Instrument<double>> &instruments,
						  const BootstrapResult<double> &result, ZeroCurve *curve) const
{
	SensitivityBootstrapper engine(config);
	SensitivityMatrix sensitivities;
	Status status = engine.compute_sensitivities(instruments, result, sensitivities);
	if (!status.ok())
		return status;
	set_sensitivities(sensitivities, curve->mutable_sensitivities());
	if (!request->verify_sensitivities())
		return Status();

	double tolerance = request->verification_tolerance() > 0.0 ? request->verification_tolerance()
								    : kDefaultVerificationTolerance;
	SensitivityVerification verification;
	status = engine.verify_sensitivities(instruments, tolerance, verification);
	if (!status.ok())
		return status;
	SensitivityVerificationReport *report = curve->mutable_verification();
	report->set_max_abs_diff(verification.max_abs_diff);
	report->set_max_rel_diff(verification.max_rel_diff);
	report->set_failed_entries(verification.failed_entries);
	report->set_within_tolerance(verification.within_tolerance);
	set_sensitivities(verification.bump, report->mutable_bump_sensitivities());
	return Status();
}

BootstrapCurvesReply *CurveBuilderServiceImpl::handle_bootstrap_request(const BootstrapCurvesRequest *request,
									BootstrapCurvesReply *reply)
{
	auto header = reply->mutable_header();
	header->set_response_code(StandardResponseCode::SRC_ERROR);
	header->set_response_sub_code(StatusCode::kInternalError);
	header->set_response_message(error_message(StatusCode::kInternalError));

	BootstrapConfig config;
	Status status = make_config(request->options(), config);
	if (!status.ok()) {
		set_header(header, status);
		return reply;
	}
	CurveSetInstruments<double> instruments;
	status = convert_curve_set(request->curve_set(), instruments);
	if (!status.ok()) {
		error("Invalid curve set: %s\n", status.message());
		set_header(header, status);
		return reply;
	}

	MultiCurveBuilder<double> builder(config, pool_);
	CurveSet<double> curve_set;
	if (request->parallel())
		status = builder.build_parallel(instruments.discount, instruments.forwards, curve_set);
	else
		status = builder.build(instruments.discount, instruments.forwards, curve_set);
	if (!status.ok()) {
		set_header(header, status);
		return reply;
	}

	ZeroCurve *discount = reply->mutable_discount_curve();
	set_zero_curve(curve_set.discount_result(), Tenor::TENOR_UNSPECIFIED, config, discount);
	if (request->generate_sensitivities() || request->verify_sensitivities()) {
		status = add_sensitivities(request, config, instruments.discount, curve_set.discount_result(), discount);
		if (!status.ok()) {
			set_header(header, status);
			return reply;
		}
	}
	for (auto &item : instruments.forwards) {
		const BootstrapResult<double> *result = curve_set.forward_result(item.first);
		if (result == nullptr)
			continue;
		ZeroCurve *forward = reply->add_forward_curves();
		set_zero_curve(*result, item.first, config, forward);
		if (request->generate_sensitivities() || request->verify_sensitivities()) {
			status = add_sensitivities(request, config, item.second, *result, forward);
			if (!status.ok()) {
				set_header(header, status);
				return reply;
			}
		}
	}
	debug("Built curve set with %d forward curves\n", reply->forward_curves_size());
	set_header(header, Status());
	return reply;
}

BatchBootstrapCurvesReply *
CurveBuilderServiceImpl::handle_batch_bootstrap_request(const BatchBootstrapCurvesRequest *request,
							BatchBootstrapCurvesReply *reply)
{
	auto header = reply->mutable_header();
	header->set_response_code(StandardResponseCode::SRC_ERROR);
	header->set_response_sub_code(StatusCode::kInternalError);
	header->set_response_message(error_message(StatusCode::kInternalError));

	BootstrapConfig config;
	Status status = make_config(request->options(), config);
	if (!status.ok()) {
		set_header(header, status);
		return reply;
	}

	// Elements that fail conversion are reported without being built
	int n = request->curve_sets_size();
	std::vector<Status> statuses(n);
	std::vector<CurveSetInstruments<double>> batch;
	std::vector<int> positions;
	for (int i = 0; i < n; i++) {
		CurveSetInstruments<double> instruments;
		statuses[i] = convert_curve_set(request->curve_sets(i), instruments);
		if (statuses[i].ok()) {
			batch.push_back(std::move(instruments));
			positions.push_back(i);
		}
	}
	ParallelCurveSetBuilder<double> builder(config, pool_);
	std::vector<CurveSet<double>> curve_sets;
	std::vector<Status> built;
	builder.build_batch_elements(batch, curve_sets, built);

	std::vector<const CurveSet<double> *> results(n, nullptr);
	for (size_t k = 0; k < positions.size(); k++) {
		statuses[positions[k]] = built[k];
		if (built[k].ok())
			results[positions[k]] = &curve_sets[k];
	}

	int first_failure = -1;
	for (int i = 0; i < n; i++) {
		BootstrapCurvesReply *element = reply->add_results();
		set_header(element->mutable_header(), statuses[i]);
		if (!statuses[i].ok()) {
			if (first_failure < 0)
				first_failure = i;
			continue;
		}
		set_zero_curve(results[i]->discount_result(), Tenor::TENOR_UNSPECIFIED, config,
			       element->mutable_discount_curve());
		for (Tenor tenor : results[i]->tenors())
			set_zero_curve(*results[i]->forward_result(tenor), tenor, config, element->add_forward_curves());
	}
	if (first_failure >= 0) {
		error("Curve set %d of %d failed: %s\n", first_failure, n, statuses[first_failure].message());
		set_header(header, Status::make(StatusCode::kMCB_BatchElementFailed, ": element %d: %s", first_failure,
						statuses[first_failure].message())
				       .with_index(first_failure));
		return reply;
	}
	set_header(header, Status());
	return reply;
}

std::unique_ptr<CurveBuilderService> get_curve_builder_service(const BootstrapConfig &defaults,
							       std::shared_ptr<WorkStealingPool> pool)
{
	return std::make_unique<CurveBuilderServiceImpl>(defaults, pool);
}

/////////////////////////// Tests

static void add_instrument(ParInstrument *message, InstrumentType type, double maturity, double rate)
{
	message->set_instrument_type(type);
	message->set_maturity(maturity);
	message->set_rate(rate);
}

static void make_curve_set(CurveSetDefinition *curve_set, double shift)
{
	add_instrument(curve_set->add_discount_instruments(), InstrumentType::OIS, 1.0, 0.02 + shift);
	add_instrument(curve_set->add_discount_instruments(), InstrumentType::OIS, 2.0, 0.022 + shift);
	add_instrument(curve_set->add_discount_instruments(), InstrumentType::OIS, 3.0, 0.025 + shift);
	TenorInstruments *forward = curve_set->add_forward_instruments();
	forward->set_tenor(Tenor::TENOR_6M);
	add_instrument(forward->add_instruments(), InstrumentType::IRS, 2.0, 0.026 + shift);
	add_instrument(forward->add_instruments(), InstrumentType::IRS, 1.0, 0.024 + shift);
}

static int test_bootstrap_request()
{
	int failure_count = 0;
	auto service = get_curve_builder_service();
	BootstrapCurvesRequest request;
	make_curve_set(request.mutable_curve_set(), 0.0);
	request.set_generate_sensitivities(true);
	request.set_verify_sensitivities(true);
	BootstrapCurvesReply reply;
	service->handle_bootstrap_request(&request, &reply);
	if (reply.header().response_code() != StandardResponseCode::SRC_OK) {
		fprintf(stderr, "Bootstrap request failed: %s\n", reply.header().response_message().c_str());
		return 1;
	}
	const ZeroCurve &discount = reply.discount_curve();
	if (discount.maturities_size() != 3 || discount.discount_factors_size() != 3 || discount.residuals_size() != 3 ||
	    discount.solvers_size() != 3 || std::fabs(discount.discount_factors(0) - 1.0 / 1.02) > 1e-12)
		failure_count++;
	if (discount.sensitivities().num_pillars() != 3 || discount.sensitivities().values_size() != 9 ||
	    !discount.verification().within_tolerance())
		failure_count++;
	// Row major: the first row only depends on the first instrument
	if (discount.sensitivities().values(1) != 0.0 || discount.sensitivities().values(2) != 0.0)
		failure_count++;
	if (reply.forward_curves_size() != 1 || reply.forward_curves(0).tenor() != Tenor::TENOR_6M ||
	    reply.forward_curves(0).maturities(0) != 1.0 || reply.forward_curves(0).sensitivities().num_instruments() != 2)
		failure_count++;
	return failure_count;
}

static int test_request_errors()
{
	int failure_count = 0;
	auto service = get_curve_builder_service();
	BootstrapCurvesRequest request;
	BootstrapCurvesReply reply;
	service->handle_bootstrap_request(&request, &reply);
	if (reply.header().response_code() != StandardResponseCode::SRC_ERROR ||
	    reply.header().response_sub_code() != StatusCode::kBTS_InsufficientData)
		failure_count++;

	make_curve_set(request.mutable_curve_set(), 0.0);
	request.mutable_options()->set_max_iterations(-1);
	reply.Clear();
	service->handle_bootstrap_request(&request, &reply);
	if (reply.header().response_sub_code() != StatusCode::kCFG_BadMaxIterations)
		failure_count++;

	request.clear_options();
	request.mutable_curve_set()->mutable_discount_instruments(1)->set_instrument_type(
	    InstrumentType::INSTRUMENT_TYPE_UNSPECIFIED);
	reply.Clear();
	service->handle_bootstrap_request(&request, &reply);
	if (reply.header().response_sub_code() != StatusCode::kINS_UnknownInstrumentType ||
	    reply.has_discount_curve())
		failure_count++;

	// Two curves for the same tenor
	request.Clear();
	make_curve_set(request.mutable_curve_set(), 0.0);
	TenorInstruments *repeat = request.mutable_curve_set()->add_forward_instruments();
	repeat->set_tenor(Tenor::TENOR_6M);
	add_instrument(repeat->add_instruments(), InstrumentType::IRS, 1.0, 0.03);
	add_instrument(repeat->add_instruments(), InstrumentType::IRS, 2.0, 0.031);
	add_instrument(repeat->add_instruments(), InstrumentType::IRS, 3.0, 0.032);
	request.set_generate_sensitivities(true);
	reply.Clear();
	service->handle_bootstrap_request(&request, &reply);
	if (reply.header().response_code() != StandardResponseCode::SRC_ERROR ||
	    reply.header().response_sub_code() != StatusCode::kBadArgument || reply.forward_curves_size() != 0 ||
	    reply.has_discount_curve())
		failure_count++;
	return failure_count;
}

static int test_batch_request()
{
	int failure_count = 0;
	BootstrapConfig defaults;
	defaults.num_threads = 2;
	auto service = get_curve_builder_service(defaults, std::make_shared<WorkStealingPool>(2));
	BatchBootstrapCurvesRequest request;
	for (int i = 0; i < 4; i++)
		make_curve_set(request.add_curve_sets(), 0.001 * i);
	// Equal maturities in the third curve set
	request.mutable_curve_sets(2)->mutable_discount_instruments(1)->set_maturity(1.0);
	BatchBootstrapCurvesReply reply;
	service->handle_batch_bootstrap_request(&request, &reply);
	if (reply.header().response_sub_code() != StatusCode::kMCB_BatchElementFailed || reply.results_size() != 4)
		return 1;
	for (int i = 0; i < 4; i++) {
		const BootstrapCurvesReply &result = reply.results(i);
		if (i == 2) {
			if (result.header().response_sub_code() != StatusCode::kBTS_DuplicateMaturity)
				failure_count++;
		} else if (result.header().response_code() != StandardResponseCode::SRC_OK ||
			   result.discount_curve().maturities_size() != 3 || result.forward_curves_size() != 1) {
			failure_count++;
		}
	}
	request.mutable_curve_sets(2)->mutable_discount_instruments(1)->set_maturity(2.0);
	reply.Clear();
	service->handle_batch_bootstrap_request(&request, &reply);
	if (reply.header().response_code() != StandardResponseCode::SRC_OK)
		failure_count++;
	return failure_count;
}

int test_curve_builder_service()
{
	int failure_count = 0;
	failure_count += test_bootstrap_request();
	failure_count += test_request_errors();
	failure_count += test_batch_request();
	if (failure_count == 0)
		printf("Curve Builder Service Tests OK\n");
	else
		printf("Curve Builder Service Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
