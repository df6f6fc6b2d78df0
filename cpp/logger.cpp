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
#include <logger.h>

#include <inttypes.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>

unsigned volatile Ratestrap_log_mask = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_FATAL_ERROR;

static std::atomic<FILE *> log_file(nullptr);

// Serialises writers so that lines from worker threads do not interleave
static std::mutex log_lock;

void ratestrap_set_log_file(FILE *file) { log_file.store(file); }

int ratestrap_set_log_level(const char *level)
{
	if (!level || !level[0])
		return 0;
	unsigned mask = LOG_FATAL_ERROR;
	switch (level[0]) {
	case 't':
	case 'T':
		mask |= LOG_TRACE;
		/* fallthrough */
	case 'd':
	case 'D':
		mask |= LOG_DEBUG;
		/* fallthrough */
	case 'i':
	case 'I':
		mask |= LOG_INFO;
		/* fallthrough */
	case 'w':
	case 'W':
		mask |= LOG_WARN;
		/* fallthrough */
	case 'e':
	case 'E':
		mask |= LOG_ERROR;
		break;
	default:
		return 0;
	}
	Ratestrap_log_mask = mask;
	return 1;
}

void ratestrap_log_message(int log_level, const char *filename, int line_number, const char *function, FILE *file,
			   const char *format, ...)
{
	if (!(log_level & Ratestrap_log_mask))
		return;

	if (!file) {
		file = log_file.load();
		if (!file)
			file = stderr;
	}

	const char *prefix;
	switch (log_level) {
	case LOG_TRACE:
		prefix = "TRACE ";
		break;
	case LOG_DEBUG:
		prefix = "DEBUG ";
		break;
	case LOG_WARN:
		prefix = "WARN ";
		break;
	case LOG_INFO:
		prefix = "INFO ";
		break;
	case LOG_FATAL_ERROR:
		prefix = "FATAL ERROR ";
		break;
	default:
		prefix = "ERROR ";
		break;
	}

	std::stringbuf buf;
	std::ostream os(&buf);
	os << std::this_thread::get_id();

	{
		std::lock_guard<std::mutex> guard(log_lock);
		fputs(prefix, file);
		fprintf(file, "tid(%s) ", buf.str().c_str());
		if (filename && function) {
			fprintf(file, "%s:%d (%s) ", filename, line_number, function);
		}
		va_list args;
		va_start(args, format);
		vfprintf(file, format, args);
		va_end(args);
		fflush(file);
	}
	if (log_level == LOG_FATAL_ERROR)
		exit(1);
}
