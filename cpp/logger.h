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

#ifndef _RATESTRAP_LOGGER_H
#define _RATESTRAP_LOGGER_H

#include <stdarg.h>
#include <stdio.h>

#define RATESTRAP_DEBUG_ENABLED 1

#ifdef __cplusplus
extern "C"
#else
extern
#endif
    volatile unsigned Ratestrap_log_mask;

enum LogLevel { LOG_TRACE = 1, LOG_DEBUG = 2, LOG_WARN = 4, LOG_INFO = 8, LOG_ERROR = 16, LOG_FATAL_ERROR = 32 };

// Log writes are synchronous and serialised across threads.
// Keep info level messages out of the solver loops.

// Writes a log message to file, or to the configured log file
// when file is NULL. A LOG_FATAL_ERROR message terminates the
// process.
#ifdef __cplusplus
extern "C"
#else
extern
#endif
    void
    ratestrap_log_message(int LogLevel, const char *filename, int line_number, const char *function, FILE *file,
			  const char *format, ...);

// Sets the log mask from a level name: "trace", "debug", "info",
// "warn" or "error" (only the first letter is checked). Each level
// enables itself and everything more severe. Returns 0 if the
// name was not recognised, in which case the mask is unchanged.
#ifdef __cplusplus
extern "C"
#else
extern
#endif
    int
    ratestrap_set_log_level(const char *level);

// Redirects log output; NULL restores stderr
#ifdef __cplusplus
extern "C"
#else
extern
#endif
    void
    ratestrap_set_log_file(FILE *file);

#define is_debug_enabled() (Ratestrap_log_mask & LOG_DEBUG)
#define is_trace_enabled() (Ratestrap_log_mask & LOG_TRACE)

#if RATESTRAP_DEBUG_ENABLED
#define trace(format, ...)                                                                                             \
	((void)(is_trace_enabled() &&                                                                                  \
		(ratestrap_log_message(LOG_TRACE, __FILE__, __LINE__, __func__, NULL, format, ##__VA_ARGS__), 0)))
#define debug(format, ...)                                                                                             \
	((void)(is_debug_enabled() &&                                                                                  \
		(ratestrap_log_message(LOG_DEBUG, __FILE__, __LINE__, __func__, NULL, format, ##__VA_ARGS__), 0)))
#define warn(format, ...) ratestrap_log_message(LOG_WARN, __FILE__, __LINE__, __func__, NULL, format, ##__VA_ARGS__)
#define inform(format, ...) ratestrap_log_message(LOG_INFO, __FILE__, __LINE__, __func__, NULL, format, ##__VA_ARGS__)
#define error(format, ...) ratestrap_log_message(LOG_ERROR, __FILE__, __LINE__, __func__, NULL, format, ##__VA_ARGS__)
#define die(format, ...)                                                                                               \
	ratestrap_log_message(LOG_FATAL_ERROR, __FILE__, __LINE__, __func__, NULL, format, ##__VA_ARGS__)
#else
#define trace(format, ...) ((void)0)
#define debug(format, ...) ((void)0)
#define warn(format, ...) ratestrap_log_message(LOG_WARN, NULL, __LINE__, NULL, NULL, format, ##__VA_ARGS__)
#define inform(format, ...) ratestrap_log_message(LOG_INFO, NULL, __LINE__, NULL, NULL, format, ##__VA_ARGS__)
#define error(format, ...) ratestrap_log_message(LOG_ERROR, NULL, __LINE__, NULL, NULL, format, ##__VA_ARGS__)
#define die(format, ...) ratestrap_log_message(LOG_FATAL_ERROR, NULL, __LINE__, NULL, NULL, format, ##__VA_ARGS__)
#endif

#endif
