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

#include <bootstrap.h>
#include <config.h>
#include <converters.h>
#include <curve.h>
#include <curve_builder_service.h>
#include <instrument.h>
#include <interpolators.h>
#include <multi_curve.h>
#include <request_processor.h>
#include <sensitivities.h>
#include <status.h>
#include <threadpool.h>

#include <stdio.h>

using namespace ratestrap;

int main() {
	int rc = 0;
	rc += test_status();
	rc += test_config();
	rc += test_conversions();
	rc += test_interpolators();
	rc += test_instruments();
	rc += test_curves();
	rc += test_bootstrap();
	rc += test_threadpool();
	rc += test_multi_curve();
	rc += test_sensitivities();
	rc += test_curve_builder_service();
	rc += test_request_processor();
	if (rc != 0)
		printf("FAILED\n");
	else
		printf("OK\n");
	return rc != 0 ? 1 : 0;
}
