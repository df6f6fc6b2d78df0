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

#ifndef _RATESTRAP_CURVE_BUILDER_SERVICE_H
#define _RATESTRAP_CURVE_BUILDER_SERVICE_H

#include <bootstrap.pb.h>

#include <config.h>
#include <threadpool.h>

#include <memory>

namespace ratestrap
{

// Builds curve sets described by protobuf requests. Failures are
// reported in the reply header; the returned pointer is always
// the reply passed in.
class CurveBuilderService
{
	public:
	virtual ~CurveBuilderService() {}
	virtual BootstrapCurvesReply *handle_bootstrap_request(const BootstrapCurvesRequest *request,
							       BootstrapCurvesReply *reply) = 0;
	virtual BatchBootstrapCurvesReply *handle_batch_bootstrap_request(const BatchBootstrapCurvesRequest *request,
									  BatchBootstrapCurvesReply *reply) = 0;
};

// Options missing from a request are taken from defaults
std::unique_ptr<CurveBuilderService> get_curve_builder_service(const BootstrapConfig &defaults = BootstrapConfig(),
							       std::shared_ptr<WorkStealingPool> pool = nullptr);

extern int test_curve_builder_service();

} // namespace ratestrap

#endif
