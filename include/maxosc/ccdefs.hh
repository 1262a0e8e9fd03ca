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

/**
 * @file ccdefs.hh
 *
 * This file is to be included first by all maxosc C++ headers.
 *
 * It defines things that depend upon the compilation environment and
 * pulls in the few headers every translation unit needs anyway.
 */

#if !defined (__cplusplus)
#error This file is only to be included by C++ code.
#endif

#undef _GNU_SOURCE
#define _GNU_SOURCE 1

#ifndef __STDC_FORMAT_MACROS
# define __STDC_FORMAT_MACROS
#endif

#ifndef __STDC_LIMIT_MACROS
#define __STDC_LIMIT_MACROS
#endif

/**
 * Define function attributes
 *
 * The function attributes are compiler specific.
 */
#ifdef __GNUC__
#define mxo_attribute(a) __attribute__ (a)
#else
#define mxo_attribute(a)
#endif

/**
 * COMMON INCLUDE FILES
 */
#include <cstddef>
#include <cstdint>
#include <new>
#include <string>
#include <chrono>

using namespace std::string_literals;
using namespace std::chrono_literals;

/**
 * All classes of maxosc are defined in the namespace @c maxosc.
 */
namespace maxosc
{
}

/**
 * Shorthand for the @c maxosc namespace.
 */
namespace mxo = maxosc;
