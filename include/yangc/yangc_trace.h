/*
 * 
 *   Copyright 2016 RIFT.IO Inc
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 *
 */



/*!
 * @file yangc_trace.h
 * @brief Tracing for the yangc schema compiler.
 *
 * @details Tracing is controlled per category by a severity level.  Eight
 * syslog compatible severities are supported; a category is silenced by
 * setting its severity to YANGC_TRACE_SEVERITY_DISABLE.  A NULL context
 * disables all tracing.
 *
 * @code
 * yangc_trace_ctx_t *ctx = yangc_trace_init();
 * yangc_trace_ctx_category_severity_set(ctx,
 *                                       YANGC_TRACE_CATEGORY_RESOLVE,
 *                                       YANGC_TRACE_SEVERITY_DEBUG);
 * YANGC_TRACE_DEBUG(ctx, YANGC_TRACE_CATEGORY_RESOLVE, "pass %d", 3);
 * yangc_trace_ctx_close(ctx);
 * @endcode
 */

#ifndef YANGC_TRACE_H_
#define YANGC_TRACE_H_

#include <stdio.h>
#include <string.h>
#include <time.h>
#include <sys/cdefs.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include "yangc_status.h"

__BEGIN_DECLS

typedef enum {
  YANGC_TRACE_SEVERITY_DISABLE = 0,
  YANGC_TRACE_SEVERITY_EMERG,
  YANGC_TRACE_SEVERITY_ALERT,
  YANGC_TRACE_SEVERITY_CRIT,
  YANGC_TRACE_SEVERITY_ERROR,
  YANGC_TRACE_SEVERITY_WARN,
  YANGC_TRACE_SEVERITY_NOTICE,
  YANGC_TRACE_SEVERITY_INFO,
  YANGC_TRACE_SEVERITY_DEBUG,
} yangc_trace_severity_t;

typedef enum {
  YANGC_TRACE_CATEGORY_PARSE = 0,
  YANGC_TRACE_CATEGORY_BUILD,
  YANGC_TRACE_CATEGORY_RESOLVE,
  YANGC_TRACE_CATEGORY_CACHE,
  YANGC_TRACE_CATEGORY_FETCH,
  YANGC_TRACE_CATEGORY_UTIL,
  YANGC_TRACE_CATEGORY_LAST,
} yangc_trace_category_t;

typedef enum {
  YANGC_TRACE_DESTINATION_NONE = 0,
  YANGC_TRACE_DESTINATION_CONSOLE = 1,
} yangc_trace_destination_t;

/*!
 * Check the category bounds
 */
#define YANGC_TRACE_IS_VALID_CATEGORY(_c)       \
  ((_c) < YANGC_TRACE_CATEGORY_LAST)

/*!
 * Check the severity bounds
 */
#define YANGC_TRACE_IS_VALID_SEVERITY(_s)       \
  ((_s) <= YANGC_TRACE_SEVERITY_DEBUG)

/*!
 * Coarse log level of the compiler and tools, mapped onto the trace
 * severities of every category.
 */
typedef enum {
  YANGC_LOG_LEVEL_NONE = 0,
  YANGC_LOG_LEVEL_ERROR,
  YANGC_LOG_LEVEL_WARN,
  YANGC_LOG_LEVEL_INFO,
  YANGC_LOG_LEVEL_DEBUG,
} yangc_log_level_t;

/*!
 * Category specific tracing information.
 */
typedef struct {
  yangc_trace_severity_t severity;
  yangc_trace_destination_t dest;
} yangc_trace_category_info_t;

#define YANGC_TRACE_MAX_HOSTNAME_SZ 64

/*!
 * The tracing context.
 */
typedef struct yangc_trace_ctx_s {
  yangc_trace_category_info_t category[YANGC_TRACE_CATEGORY_LAST];
  char hostname[YANGC_TRACE_MAX_HOSTNAME_SZ]; /*!< Hostname of the machine */
  int pid;
  FILE *fileh;                                /*!< Output; NULL means stdout */
} yangc_trace_ctx_t;

/* Strip the file path name for readability */
#define YANGC_SHORT_FORM_OF_FILE                                            \
  (strrchr(__FILE__,'/') ? strrchr(__FILE__,'/')+1 : __FILE__ )

/*!
 * Common prefix for the trace:
 * yyyy-mm-dd hh:mm:ss.sss <severity> (<category>-trace@<host>:<pid>:<file>:<line>) - 
 */
#define YANGC_TRACE_EMIT_PREFIX(_fh, _ctx, _severity_str, _category)        \
  do {                                                                      \
    struct timeval _tv;                                                     \
    struct tm _tm;                                                          \
    gettimeofday(&_tv, NULL);                                               \
    localtime_r(&_tv.tv_sec, &_tm);                                         \
    fprintf((_fh),                                                          \
            "%d-%02d-%02d %02d:%02d:%02d.%03d %-6s "                        \
            "(%s-trace@%s:%d:%s:%d) - ",                                    \
            _tm.tm_year+1900,                                               \
            _tm.tm_mon+1,                                                   \
            _tm.tm_mday,                                                    \
            _tm.tm_hour,                                                    \
            _tm.tm_min,                                                     \
            _tm.tm_sec,                                                     \
            (int)_tv.tv_usec/1000,                                          \
            _severity_str,                                                  \
            yangc_trace_get_category_name(_category),                       \
            (_ctx)->hostname,                                               \
            (_ctx)->pid,                                                    \
            YANGC_SHORT_FORM_OF_FILE,                                       \
            __LINE__);                                                      \
  } while (0)

/*!
 * Main macro for generating the traces
 */
#define YANGC_TRACE(_ctx, _category, _severity, _severity_str, _fmt, ...)   \
  do {                                                                      \
    const yangc_trace_ctx_t *_tctx = (_ctx);                                \
    if (_tctx                                                               \
        && _tctx->category[_category].severity >= (_severity)               \
        && (_tctx->category[_category].dest                                 \
            & YANGC_TRACE_DESTINATION_CONSOLE)) {                           \
      FILE *_fh = _tctx->fileh ? _tctx->fileh : stdout;                     \
      YANGC_TRACE_EMIT_PREFIX(_fh, _tctx, _severity_str, _category);        \
      fprintf(_fh, _fmt "\n", ##__VA_ARGS__);                               \
      fflush(_fh);                                                          \
    }                                                                       \
  } while (0)

/*
 * Wrappers for YANGC_TRACE macro
 */
#define YANGC_TRACE_DEBUG(_ctx, _category, _fmt, ...)                       \
  YANGC_TRACE((_ctx), _category, YANGC_TRACE_SEVERITY_DEBUG, "DEBUG",       \
              _fmt, ##__VA_ARGS__)

#define YANGC_TRACE_INFO(_ctx, _category, _fmt, ...)                        \
  YANGC_TRACE((_ctx), _category, YANGC_TRACE_SEVERITY_INFO, "INFO",         \
              _fmt, ##__VA_ARGS__)

#define YANGC_TRACE_NOTICE(_ctx, _category, _fmt, ...)                      \
  YANGC_TRACE((_ctx), _category, YANGC_TRACE_SEVERITY_NOTICE, "NOTICE",     \
              _fmt, ##__VA_ARGS__)

#define YANGC_TRACE_WARN(_ctx, _category, _fmt, ...)                        \
  YANGC_TRACE((_ctx), _category, YANGC_TRACE_SEVERITY_WARN, "WARN",         \
              _fmt, ##__VA_ARGS__)

#define YANGC_TRACE_ERROR(_ctx, _category, _fmt, ...)                       \
  YANGC_TRACE((_ctx), _category, YANGC_TRACE_SEVERITY_ERROR, "ERROR",       \
              _fmt, ##__VA_ARGS__)

/*!
 * Function to initialize tracing.  Every category starts at
 * YANGC_TRACE_SEVERITY_ERROR with console output.
 *
 * @return Pointer to a new yangc_trace_ctx_t, owned by the caller
 */
yangc_trace_ctx_t *yangc_trace_init(void);

/*!
 * Function to close the tracing
 *
 * @param[in] ctx Pointer to the yangc_trace_ctx_t
 */
void yangc_trace_ctx_close(yangc_trace_ctx_t *ctx);

/*!
 * Set the severity of a category.
 *
 * @return YANGC_STATUS_BADARG for out of range arguments
 */
yangc_status_t yangc_trace_ctx_category_severity_set(yangc_trace_ctx_t *ctx,
                                                     yangc_trace_category_t category,
                                                     yangc_trace_severity_t severity);

/*!
 * Set the severity of every category.
 */
yangc_status_t yangc_trace_ctx_severity_set_all(yangc_trace_ctx_t *ctx,
                                                yangc_trace_severity_t severity);

/*!
 * Set the destination of a category.
 */
yangc_status_t yangc_trace_ctx_category_destination_set(yangc_trace_ctx_t *ctx,
                                                        yangc_trace_category_t category,
                                                        yangc_trace_destination_t dest);

/*!
 * Redirect the trace output.  The file is not owned by the context.
 * Passing NULL restores stdout.
 */
void yangc_trace_ctx_set_output(yangc_trace_ctx_t *ctx, FILE *fileh);

/*!
 * The function returns tracing category name from category type
 */
const char *yangc_trace_get_category_name(yangc_trace_category_t category);

/*!
 * This function returns a string from the severity type
 */
const char *yangc_trace_get_severity_string(yangc_trace_severity_t severity);

/*!
 * Map a log level to the trace severity it enables.
 */
yangc_trace_severity_t yangc_trace_severity_for_log_level(yangc_log_level_t level);

__END_DECLS

#endif // YANGC_TRACE_H_
