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
#include <maxosc/exception.hh>

namespace maxosc
{

// Caller misuse of the executor contract, e.g. several targets given to the local backend.
DEFINE_EXCEPTION(InvalidTargetError);

// A command or a lag convergence wait exceeded its budget.
DEFINE_EXCEPTION(TimeoutError);

// The external tool reported a failure. The code of the exception is the exit code.
DEFINE_EXCEPTION(CommandFailure);
DEFINE_SUB_EXCEPTION(CommandFailure, TransientCommandFailure);
DEFINE_SUB_EXCEPTION(CommandFailure, NonRetryableCommandFailure);

// Malformed replication status output.
DEFINE_EXCEPTION(LagParseError);

// Reporting attempted on a job that has not reached a terminal state.
DEFINE_EXCEPTION(IncompleteJobError);

DEFINE_EXCEPTION(ConfigError);
DEFINE_EXCEPTION(TopologyError);

/**
 * The kind of failure a host or a job ended up with. Mirrors the exception types above
 * so that outcomes can be recorded without keeping exception objects around.
 */
enum class ErrorKind
{
    NONE,
    INVALID_TARGET,
    TIMEOUT,
    TRANSIENT,
    NON_RETRYABLE,
    LAG_PARSE,
    ABORTED,
};

const char* to_string(ErrorKind kind);

/**
 * Parse the string produced by to_string(ErrorKind).
 *
 * @param str  The string to parse
 * @param kind Where the kind is stored on success
 *
 * @return True if @c str named an error kind
 */
bool from_string(const std::string& str, ErrorKind* kind);

/**
 * Whether a failure of this kind may be retried by the orchestrator.
 */
bool is_retryable(ErrorKind kind);
}
