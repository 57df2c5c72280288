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
 * @file yangc_trace.cpp
 *
 * Trace context management.
 */

#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "yangc_trace.h"

static const char* yangc_trace_category_names[YANGC_TRACE_CATEGORY_LAST] = {
  "parse",
  "build",
  "resolve",
  "cache",
  "fetch",
  "util",
};

yangc_trace_ctx_t *yangc_trace_init(void)
{
  yangc_trace_ctx_t* ctx = static_cast<yangc_trace_ctx_t*>(calloc(1, sizeof(yangc_trace_ctx_t)));
  YANGC_ASSERT(ctx);

  for (int i = 0; i < YANGC_TRACE_CATEGORY_LAST; ++i) {
    ctx->category[i].severity = YANGC_TRACE_SEVERITY_ERROR;
    ctx->category[i].dest = YANGC_TRACE_DESTINATION_CONSOLE;
  }

  if (gethostname(ctx->hostname, YANGC_TRACE_MAX_HOSTNAME_SZ - 1) != 0) {
    strncpy(ctx->hostname, "localhost", YANGC_TRACE_MAX_HOSTNAME_SZ - 1);
  }
  char *hn_short = strchr(ctx->hostname, '.');
  if (hn_short) {
    *hn_short = 0;
  }
  ctx->pid = getpid();
  ctx->fileh = NULL;

  return ctx;
}

void yangc_trace_ctx_close(yangc_trace_ctx_t *ctx)
{
  free(ctx);
}

yangc_status_t yangc_trace_ctx_category_severity_set(yangc_trace_ctx_t *ctx,
                                                     yangc_trace_category_t category,
                                                     yangc_trace_severity_t severity)
{
  if (!ctx
      || !YANGC_TRACE_IS_VALID_CATEGORY(category)
      || !YANGC_TRACE_IS_VALID_SEVERITY(severity)) {
    return YANGC_STATUS_BADARG;
  }
  ctx->category[category].severity = severity;
  return YANGC_STATUS_SUCCESS;
}

yangc_status_t yangc_trace_ctx_severity_set_all(yangc_trace_ctx_t *ctx,
                                                yangc_trace_severity_t severity)
{
  for (int i = 0; i < YANGC_TRACE_CATEGORY_LAST; ++i) {
    yangc_status_t status = yangc_trace_ctx_category_severity_set(
        ctx, static_cast<yangc_trace_category_t>(i), severity);
    if (status != YANGC_STATUS_SUCCESS) {
      return status;
    }
  }
  return YANGC_STATUS_SUCCESS;
}

yangc_status_t yangc_trace_ctx_category_destination_set(yangc_trace_ctx_t *ctx,
                                                        yangc_trace_category_t category,
                                                        yangc_trace_destination_t dest)
{
  if (!ctx || !YANGC_TRACE_IS_VALID_CATEGORY(category)) {
    return YANGC_STATUS_BADARG;
  }
  ctx->category[category].dest = dest;
  return YANGC_STATUS_SUCCESS;
}

void yangc_trace_ctx_set_output(yangc_trace_ctx_t *ctx, FILE *fileh)
{
  YANGC_ASSERT(ctx);
  ctx->fileh = fileh;
}

const char *yangc_trace_get_category_name(yangc_trace_category_t category)
{
  if (!YANGC_TRACE_IS_VALID_CATEGORY(category)) {
    return "unknown";
  }
  return yangc_trace_category_names[category];
}

const char *yangc_trace_get_severity_string(yangc_trace_severity_t severity)
{
  switch (severity) {
    case YANGC_TRACE_SEVERITY_DISABLE: return "DISABLE";
    case YANGC_TRACE_SEVERITY_EMERG:   return "EMERG";
    case YANGC_TRACE_SEVERITY_ALERT:   return "ALERT";
    case YANGC_TRACE_SEVERITY_CRIT:    return "CRIT";
    case YANGC_TRACE_SEVERITY_ERROR:   return "ERROR";
    case YANGC_TRACE_SEVERITY_WARN:    return "WARN";
    case YANGC_TRACE_SEVERITY_NOTICE:  return "NOTICE";
    case YANGC_TRACE_SEVERITY_INFO:    return "INFO";
    case YANGC_TRACE_SEVERITY_DEBUG:   return "DEBUG";
  }
  return "UNKNOWN";
}

yangc_trace_severity_t yangc_trace_severity_for_log_level(yangc_log_level_t level)
{
  switch (level) {
    case YANGC_LOG_LEVEL_NONE:  return YANGC_TRACE_SEVERITY_DISABLE;
    case YANGC_LOG_LEVEL_ERROR: return YANGC_TRACE_SEVERITY_ERROR;
    case YANGC_LOG_LEVEL_WARN:  return YANGC_TRACE_SEVERITY_WARN;
    case YANGC_LOG_LEVEL_INFO:  return YANGC_TRACE_SEVERITY_INFO;
    case YANGC_LOG_LEVEL_DEBUG: return YANGC_TRACE_SEVERITY_DEBUG;
  }
  return YANGC_TRACE_SEVERITY_ERROR;
}
