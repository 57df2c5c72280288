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
 * @file yangc_status.h
 *
 * Status codes and assertion macros shared by the yangc library.
 */

#ifndef YANGC_STATUS_H_
#define YANGC_STATUS_H_

#include <stdio.h>
#include <stdlib.h>
#include <sys/cdefs.h>

__BEGIN_DECLS

/*!
 * Return status of the utility, configuration and cache functions.
 * Schema compilation failures are reported by exception instead.
 */
typedef enum yangc_status_e {
  YANGC_STATUS_SUCCESS = 0,
  YANGC_STATUS_FAILURE,
  YANGC_STATUS_NOTFOUND,
  YANGC_STATUS_EXISTS,
  YANGC_STATUS_BADARG,
} yangc_status_t;

static inline const char* yangc_status_string(yangc_status_t status)
{
  switch (status) {
    case YANGC_STATUS_SUCCESS:  return "SUCCESS";
    case YANGC_STATUS_FAILURE:  return "FAILURE";
    case YANGC_STATUS_NOTFOUND: return "NOTFOUND";
    case YANGC_STATUS_EXISTS:   return "EXISTS";
    case YANGC_STATUS_BADARG:   return "BADARG";
  }
  return "UNKNOWN";
}

#define YANGC_ASSERT_MESSAGE(cond_, fmt_, ...)                          \
  do {                                                                  \
    if (!(cond_)) {                                                     \
      fprintf(stderr, "%s:%d: assertion '%s' failed: " fmt_ "\n",       \
              __FILE__, __LINE__, #cond_, ##__VA_ARGS__);               \
      abort();                                                          \
    }                                                                   \
  } while (0)

#define YANGC_ASSERT(cond_)                                             \
  do {                                                                  \
    if (!(cond_)) {                                                     \
      fprintf(stderr, "%s:%d: assertion '%s' failed\n",                 \
              __FILE__, __LINE__, #cond_);                              \
      abort();                                                          \
    }                                                                   \
  } while (0)

#define YANGC_ASSERT_NOT_REACHED()                                      \
  do {                                                                  \
    fprintf(stderr, "%s:%d: unreachable code reached\n",                \
            __FILE__, __LINE__);                                        \
    abort();                                                            \
  } while (0)

__END_DECLS

#endif // YANGC_STATUS_H_
