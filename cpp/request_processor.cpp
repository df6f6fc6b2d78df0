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

#include <request_processor.h>

#include <logger.h>

#include <inttypes.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace ratestrap
{

// The request processor is just a gateway
// it passes on the requests to respective handlers
// The only requests that it directly handles are:
// a) Hello request
// b) Shutdown request
// c) Unknown request
class RequestProcessorImpl : public RequestProcessor
{
	private:
	std::unique_ptr<CurveBuilderService> bootstrapper_;
	void *shutdown_data_;
	void (*shutdown_func_)(void *);

	public:
	RequestProcessorImpl(std::unique_ptr<CurveBuilderService> bootstrapper)
	    : bootstrapper_(std::move(bootstrapper)), shutdown_data_(nullptr), shutdown_func_(nullptr)
	{
	}
	Response *process(const Request *request, Response *response) override;

	void set_shutdown_handler(void *p, void (*funcptr)(void *)) override
	{
		shutdown_data_ = p;
		shutdown_func_ = funcptr;
	}

	private:
	Response *make_response(const ReplyHeader &reply_header, Response *response);
	Response *handle_hello_request(const Request *request, Response *response);
	Response *handle_shutdown_request(const Request *request, Response *response);
	Response *handle_unknown_request(const Request *request, Response *response);
};

std::unique_ptr<RequestProcessor> get_request_processor(std::unique_ptr<CurveBuilderService> bootstrapper)
{
	return std::make_unique<RequestProcessorImpl>(std::move(bootstrapper));
}

std::unique_ptr<RequestProcessor> get_request_processor(const BootstrapConfig &defaults)
{
	return std::make_unique<RequestProcessorImpl>(get_curve_builder_service(defaults));
}

Response *RequestProcessorImpl::handle_hello_request(const Request *request, Response *response)
{
	HelloReply *helloReply = response->mutable_hello_reply();
	helloReply->set_message(request->hello_request().name());
	ResponseHeader *header = response->mutable_header();
	header->set_response_code(StandardResponseCode::SRC_OK);
	int32_t delayfor = request->hello_request().delay_for();
	if (delayfor > 0) {
		inform("Sleeping for %d milliseconds\n", delayfor);
		std::this_thread::sleep_for(std::chrono::milliseconds(delayfor));
	}
	return response;
}

// This handler simply returns a success response
// The actual shutdown is initiated by the registered hook
Response *RequestProcessorImpl::handle_shutdown_request(const Request *request, Response *response)
{
	inform("Received shutdown request\n");
	response->mutable_shutdown_reply();
	ResponseHeader *header = response->mutable_header();
	if (shutdown_func_) {
		// Use a different thread to invoke shutdown
		header->set_response_code(StandardResponseCode::SRC_OK);
		std::thread shutdown_thread(shutdown_func_, shutdown_data_);
		shutdown_thread.detach();
	} else {
		warn("No shutdown hook registered, do not know how to shutdown\n");
		header->set_response_code(StandardResponseCode::SRC_ERROR);
		header->set_response_sub_code(StatusCode::kNotImplemented);
		header->set_response_message("No shutdown hook registered, do not know how to shutdown");
	}
	return response;
}

Response *RequestProcessorImpl::handle_unknown_request(const Request *request, Response *response)
{
	ResponseHeader *header = response->mutable_header();
	header->set_response_code(StandardResponseCode::SRC_UNKNOWN_REQUEST);
	header->set_response_message("Unknown request type");
	return response;
}

Response *RequestProcessorImpl::make_response(const ReplyHeader &reply_header, Response *response)
{
	ResponseHeader *header = response->mutable_header();
	header->set_response_code(reply_header.response_code());
	header->set_response_sub_code(reply_header.response_sub_code());
	header->set_response_message(reply_header.response_message());
	return response;
}

Response *RequestProcessorImpl::process(const Request *request, Response *response)
{
	auto start = std::chrono::high_resolution_clock::now();
	switch (request->request_case()) {
	case Request::RequestCase::kHelloRequest: {
		response = handle_hello_request(request, response);
		break;
	}
	case Request::RequestCase::kShutdownRequest: {
		response = handle_shutdown_request(request, response);
		break;
	}
	case Request::RequestCase::kBootstrapCurvesRequest: {
		auto reply = bootstrapper_->handle_bootstrap_request(&request->bootstrap_curves_request(),
								     response->mutable_bootstrap_curves_reply());
		response = make_response(reply->header(), response);
		break;
	}
	case Request::RequestCase::kBatchBootstrapCurvesRequest: {
		auto reply = bootstrapper_->handle_batch_bootstrap_request(
		    &request->batch_bootstrap_curves_request(), response->mutable_batch_bootstrap_curves_reply());
		response = make_response(reply->header(), response);
		break;
	}
	default: {
		response = handle_unknown_request(request, response);
		break;
	}
	}
	auto end = std::chrono::high_resolution_clock::now();
	auto duration = std::chrono::duration<double, std::milli>(end - start);
	if (response && response->has_header()) {
		response->mutable_header()->set_elapsed_time(duration.count());
	}
	trace("Request completed in %.3f millisecs\n", duration.count());
	trace("Response %s\n", response->DebugString().c_str());
	return response;
}

/////////////////////////// Tests

static void shutdown_hook(void *p) { static_cast<std::atomic<bool> *>(p)->store(true); }

static int test_hello_and_shutdown()
{
	int failure_count = 0;
	auto processor = get_request_processor(BootstrapConfig());
	Request request;
	request.mutable_hello_request()->set_name("ratestrap");
	Response response;
	processor->process(&request, &response);
	if (response.header().response_code() != StandardResponseCode::SRC_OK ||
	    response.hello_reply().message() != "ratestrap" || response.header().elapsed_time() < 0.0)
		failure_count++;

	request.mutable_shutdown_request();
	response.Clear();
	processor->process(&request, &response);
	if (response.header().response_code() != StandardResponseCode::SRC_ERROR)
		failure_count++;

	std::atomic<bool> stopped(false);
	processor->set_shutdown_handler(&stopped, shutdown_hook);
	response.Clear();
	processor->process(&request, &response);
	if (response.header().response_code() != StandardResponseCode::SRC_OK)
		failure_count++;
	for (int i = 0; i < 100 && !stopped.load(); i++)
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	if (!stopped.load())
		failure_count++;

	request.Clear();
	response.Clear();
	processor->process(&request, &response);
	if (response.header().response_code() != StandardResponseCode::SRC_UNKNOWN_REQUEST)
		failure_count++;
	return failure_count;
}

static int test_bootstrap_round_trip()
{
	int failure_count = 0;
	auto processor = get_request_processor(BootstrapConfig());
	Request request;
	BootstrapCurvesRequest *bootstrap = request.mutable_bootstrap_curves_request();
	bootstrap->mutable_options()->set_interpolation(InterpolatorType::MONOTONIC_CUBIC);
	double rates[] = {0.021, 0.023, 0.026, 0.03};
	double maturities[] = {1.0, 2.0, 5.0, 10.0};
	for (int i = 0; i < 4; i++) {
		ParInstrument *instrument = bootstrap->mutable_curve_set()->add_discount_instruments();
		instrument->set_instrument_type(i == 0 ? InstrumentType::OIS : InstrumentType::IRS);
		instrument->set_maturity(maturities[i]);
		instrument->set_rate(rates[i]);
	}

	// Serialise both ways as a remote client would
	std::string wire;
	if (!request.SerializeToString(&wire))
		return 1;
	Request received;
	if (!received.ParseFromString(wire))
		return 1;
	Response response;
	processor->process(&received, &response);
	if (!response.SerializeToString(&wire))
		return 1;
	Response reply;
	if (!reply.ParseFromString(wire))
		return 1;

	if (reply.header().response_code() != StandardResponseCode::SRC_OK ||
	    reply.response_case() != Response::ResponseCase::kBootstrapCurvesReply)
		return 1;
	const ZeroCurve &curve = reply.bootstrap_curves_reply().discount_curve();
	if (curve.interpolation() != InterpolatorType::MONOTONIC_CUBIC || curve.maturities_size() != 4 ||
	    curve.maturities(3) != 10.0)
		failure_count++;
	for (int i = 1; i < curve.discount_factors_size(); i++) {
		if (!(curve.discount_factors(i) < curve.discount_factors(i - 1)))
			failure_count++;
	}

	Request batch;
	batch.mutable_batch_bootstrap_curves_request()->add_curve_sets();
	response.Clear();
	processor->process(&batch, &response);
	if (response.header().response_code() != StandardResponseCode::SRC_ERROR ||
	    response.header().response_sub_code() != StatusCode::kMCB_BatchElementFailed ||
	    response.batch_bootstrap_curves_reply().results(0).header().response_sub_code() !=
		StatusCode::kBTS_InsufficientData)
		failure_count++;
	return failure_count;
}

int test_request_processor()
{
	int failure_count = 0;
	failure_count += test_hello_and_shutdown();
	failure_count += test_bootstrap_round_trip();
	if (failure_count == 0)
		printf("Request Processor Tests OK\n");
	else
		printf("Request Processor Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
