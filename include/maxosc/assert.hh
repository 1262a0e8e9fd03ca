/*
 * Copyright (c) 2023 MariaDB plc, Finnish Branch
 *
 * Use of this software is governed by the Business Source License included
 * in the LICENSE.TXT file and at www.mariadb.com/bsl11.
 *
 * Change Date: 2029-02-28
 *
 * On the date above, in accordance with the Business Source License, use
 * of this software will be governed by version 2 or later of the General
 * Public License.
 */
#pragma once

#include <maxosc/ccdefs.hh>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <maxosc/log.hh>

#if defined (SS_DEBUG)

#define mxo_assert(exp) \
        do {if (exp) {} else { \
                const char* mxo_impl_debug_expr = #exp; \
                fprintf(stderr, \
                        "debug assert at %s:%d failed: %s\n", \
                        (char*)__FILE__, \
                        __LINE__, \
                        mxo_impl_debug_expr); \
                MXO_ERROR("debug assert at %s:%d failed: %s\n", (char*)__FILE__, __LINE__, \
                          mxo_impl_debug_expr); \
                raise(SIGABRT);}} while (false)

#define mxo_assert_message(exp, fmt, ...) \
        do {if (exp) {} else {     \
                const char* mxo_impl_debug_expr = #exp; \
                char mxo_impl_debug_message[1024]; \
                snprintf(mxo_impl_debug_message, sizeof(mxo_impl_debug_message), fmt, ##__VA_ARGS__); \
                fprintf(stderr, \
                        "debug assert at %s:%d failed: %s (%s)\n", \
                        (char*)__FILE__, \
                        __LINE__, \
                        mxo_impl_debug_message, \
                        mxo_impl_debug_expr); \
                MXO_ERROR("debug assert at %s:%d failed: %s (%s)\n", \
                          (char*)__FILE__, \
                          __LINE__, \
                          mxo_impl_debug_message, \
                          mxo_impl_debug_expr); \
                raise(SIGABRT);}} while (false)

#define MXO_AT_DEBUG(exp) exp

#else /* SS_DEBUG */

#define mxo_assert(exp)
#define mxo_assert_message(exp, fmt, ...)

#define MXO_AT_DEBUG(exp)

#endif /* SS_DEBUG */
