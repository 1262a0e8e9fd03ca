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

#include <condition_variable>
#include <cstddef>
#include <mutex>

// Same interface as std::latch from C++20.
namespace maxosc
{
class latch
{
public:
    latch(const latch&) = delete;
    latch& operator=(const latch&) = delete;

    explicit latch(std::ptrdiff_t expected)
        : m_value(expected)
    {
    }

    void count_down(std::ptrdiff_t n = 1)
    {
        std::lock_guard<std::mutex> guard(m_lock);
        m_value -= n;

        if (m_value == 0)
        {
            m_cv.notify_all();
        }
    }

    bool try_wait() const
    {
        std::lock_guard<std::mutex> guard(m_lock);
        return m_value == 0;
    }

    void wait() const
    {
        std::unique_lock<std::mutex> guard(m_lock);
        m_cv.wait(guard, [this](){
            return m_value == 0;
        });
    }

private:
    std::ptrdiff_t                  m_value;
    mutable std::mutex              m_lock;
    mutable std::condition_variable m_cv;
};
}
