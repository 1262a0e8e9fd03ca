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

#include <maxosc/stopwatch.hh>

#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace maxosc
{

TimePoint Clock::now() noexcept
{
    return std::chrono::steady_clock::now();
}

StopWatch::StopWatch()
{
    restart();
}

Duration StopWatch::split() const
{
    return {Clock::now() - m_start};
}

Duration StopWatch::restart()
{
    TimePoint now = Clock::now();
    Duration split = now - m_start;
    m_start = now;
    return split;
}
}

/********** OUTPUT ***********/
namespace
{
struct TimeConvert
{
    double      div;        // divide the value of the previous unit by this
    std::string suffix;     // milliseconds, hours etc.
    double      max_visual; // threshold to switch to the next unit
};

// Schema changes are measured in hours at most, days is the last unit that makes sense.
const TimeConvert convert[]
{
    {1, "ns", 1000}, {1000, "us", 1000}, {1000, "ms", 1000},
    {1000, "s", 60}, {60, "min", 60}, {60, "hours", 24},
    {24, "days", std::numeric_limits<double>::max()}
};

const int convert_size = sizeof(convert) / sizeof(convert[0]);
}

namespace maxosc
{

std::pair<double, std::string> dur_to_human_readable(Duration dur)
{
    using namespace std::chrono;
    double time = duration_cast<nanoseconds>(dur).count();
    bool negative = time < 0;

    if (negative)
    {
        time = -time;
    }

    int i = 0;
    for (; i < convert_size - 1; ++i)
    {
        time /= convert[i].div;

        if (time < convert[i].max_visual)
        {
            break;
        }
    }

    if (i == convert_size - 1)
    {
        time /= convert[i].div;
    }

    return std::make_pair(negative ? -time : time, convert[i].suffix);
}

std::string to_string(Duration dur, const std::string& sep)
{
    auto p = dur_to_human_readable(dur);
    std::ostringstream os;
    os << p.first << sep << p.second;

    return os.str();
}

std::ostream& operator<<(std::ostream& os, Duration dur)
{
    auto p = dur_to_human_readable(dur);
    os << p.first << p.second;

    return os;
}

namespace wall_time
{
std::string to_string(TimePoint tp, const std::string& fmt)
{
    std::time_t timet = std::chrono::system_clock::to_time_t(tp);

    struct tm tm;
    localtime_r(&timet, &tm);
    const int sz = 1024;
    char buf[sz];
    strftime(buf, sz, fmt.c_str(), &tm);
    return buf;
}

std::ostream& operator<<(std::ostream& os, TimePoint tp)
{
    os << to_string(tp);
    return os;
}
}
}
