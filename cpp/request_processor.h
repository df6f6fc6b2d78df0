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

#ifndef _RATESTRAP_REQUEST_PROCESSOR_H
#define _RATESTRAP_REQUEST_PROCESSOR_H

#include <services.pb.h>

#include <curve_builder_service.h>

#include <memory>

namespace ratestrap
{

/* This is the API that the request processor must implement.
The response is filled in place and returned; its header always
carries the response code and the elapsed time.
*/
class RequestProcessor
{
	public:
	virtual ~RequestProcessor() {}
	virtual Response *process(const Request *request, Response *response) = 0;
	// The function is invoked on a separate thread when a
	// shutdown request is received
	virtual void set_shutdown_handler(void *p, void (*funcptr)(void *)) = 0;
};

std::unique_ptr<RequestProcessor> get_request_processor(std::unique_ptr<CurveBuilderService> bootstrapper);
std::unique_ptr<RequestProcessor> get_request_processor(const BootstrapConfig &defaults);

extern int test_request_processor();

} // namespace ratestrap

#endif
