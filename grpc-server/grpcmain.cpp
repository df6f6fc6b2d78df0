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

#include <grpcpp/grpcpp.h>

#include "services.grpc.pb.h"

#include <config.h>
#include <request_processor.h>

#include <logger.h>

#include <stdlib.h>
#include <string.h>

#include <memory>
#include <string>

namespace ratestrap
{

// Every gRPC call is handed to the request processor
class RateStrapServiceImpl final : public RateStrapServices::Service
{
	public:
	explicit RateStrapServiceImpl(std::unique_ptr<RequestProcessor> processor) : processor_(std::move(processor))
	{
	}

	grpc::Status serve(grpc::ServerContext *, const Request *request, Response *response) override
	{
		processor_->process(request, response);
		return grpc::Status::OK;
	}

	// A shutdown request stops the server
	void attach(grpc::Server *server)
	{
		processor_->set_shutdown_handler(server, [](void *p) {
			inform("Shutting down server\n");
			static_cast<grpc::Server *>(p)->Shutdown();
		});
	}

	private:
	std::unique_ptr<RequestProcessor> processor_;
};

struct ServerOptions {
	std::string address = "0.0.0.0";
	int port = 9001;
	std::string config_file;
};

static bool parse_options(int argc, char **argv, ServerOptions &options)
{
	if (argc % 2 == 0) {
		error("Option '%s' has no value\n", argv[argc - 1]);
		return false;
	}
	for (int i = 1; i < argc; i += 2) {
		std::string opt = argv[i];
		const char *arg = argv[i + 1];
		if (opt == "-a") {
			options.address = arg;
		} else if (opt == "-p") {
			options.port = atoi(arg);
		} else if (opt == "-c") {
			options.config_file = arg;
		} else if (opt == "-loglevel" && (arg[0] == 'd' || arg[0] == 'D')) {
			Ratestrap_log_mask |= LOG_DEBUG;
		} else if (opt == "-loglevel" && (arg[0] == 't' || arg[0] == 'T')) {
			Ratestrap_log_mask |= LOG_DEBUG | LOG_TRACE;
		} else {
			error("Unrecognized option '%s %s'\n", opt.c_str(), arg);
			return false;
		}
	}
	if (options.port <= 0 || options.port > 65535) {
		error("Invalid port %d\n", options.port);
		return false;
	}
	return true;
}

static int run_server(const ServerOptions &options)
{
	BootstrapConfig defaults;
	if (!options.config_file.empty()) {
		Status status = load_bootstrap_config(options.config_file.c_str(), defaults);
		if (!status.ok()) {
			error("Cannot load %s: %s\n", options.config_file.c_str(), status.message());
			return 1;
		}
		inform("Loaded bootstrap options from %s\n", options.config_file.c_str());
	}

	RateStrapServiceImpl service(get_request_processor(defaults));
	std::string address = options.address + ":" + std::to_string(options.port);
	grpc::ServerBuilder builder;
	builder.AddListeningPort(address, grpc::InsecureServerCredentials());
	builder.RegisterService(&service);
	std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
	if (!server) {
		error("Failed to start server on %s\n", address.c_str());
		return 1;
	}
	inform("Server listening on %s\n", address.c_str());
	service.attach(server.get());
	// Returns after a shutdown request
	server->Wait();
	return 0;
}

} // namespace ratestrap

int main(int argc, char **argv)
{
	ratestrap::ServerOptions options;
	if (!ratestrap::parse_options(argc, argv, options)) {
		fprintf(stderr, "%s: [-a address] [-p port] [-c bootstrap-options.txt] [-loglevel d|t]\n", argv[0]);
		return 1;
	}
	return ratestrap::run_server(options);
}
