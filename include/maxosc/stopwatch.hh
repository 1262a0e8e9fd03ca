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
#include <chrono>
#include <iosfwd>
#include <string>

namespace maxosc
{

/**
 *  The maxosc "standard" steady clock. Do not use this directly,
 *  use Clock declared further down (specifically, use Clock::now()).
 */
using SteadyClock = std::chrono::steady_clock;
using Duration = SteadyClock::duration;
using TimePoint = SteadyClock::time_point;

inline Duration from_secs(double secs)
{
    return Duration {Duration::rep(secs * Duration::period::den / Duration::period::num)};
}

inline double to_secs(Duration dur)
{
    return std::chrono::duration<double>(dur).count();
}

/**
 *   @class Clock
 *
 *   Exactly the same as std::chrono::steady_clock except that now() is
 *   defined out of line, so that all time keeping goes through one place.
 */
struct Clock : public SteadyClock
{
    static TimePoint now() noexcept;
};

/**
 *  @class StopWatch
 *
 *  Simple stopwatch for measuring time.
 *
 *  Example usage:
 *    mxo::StopWatch sw;
 *    run_tool();
 *    MXO_SINFO("Tool ran for " << sw.split());
 */
class StopWatch
{
public:
    /** Create and start the stopwatch. */
    StopWatch();

    /** Split time. Overall duration since creation or last restart(). */
    Duration split() const;

    /** Return split time and restart stopwatch. */
    Duration restart();
private:
    TimePoint m_start;
};

/** Returns the duration as a double and string adjusted to a suffix like ms for milliseconds.
 *  The double and suffix (unit) combination is selected to be easy to read.
 */
std::pair<double, std::string> dur_to_human_readable(Duration dur);

/** Create a string using dur_to_human_readable, std::ostringstream << d.first << sep << d.second. */
std::string to_string(Duration dur, const std::string& sep = "");

/** Stream to os << d.first << d.second. */
std::ostream& operator<<(std::ostream& os, Duration dur);

namespace wall_time
{

using Clock = std::chrono::system_clock;
using Duration = Clock::duration;
using TimePoint = Clock::time_point;

/** system_clock::timepoint to string, formatted using strftime formats */
std::string to_string(TimePoint tp, const std::string& fmt = "%F %T");

/** Stream to std::ostream using to_string(tp) */
std::ostream& operator<<(std::ostream& os, TimePoint tp);
}
}
