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

#include <maxosc/threadpool.hh>
#include <pthread.h>
#include <string.h>
#include <maxosc/assert.hh>
#include <maxosc/string.hh>

namespace maxosc
{

const size_t MAX_THREAD_NAME_LEN = 15;

void set_thread_name(std::thread& thread, const std::string& name)
{
    pthread_setname_np(thread.native_handle(), name.substr(0, MAX_THREAD_NAME_LEN).c_str());
}

std::string get_thread_name()
{
    char buffer[MAX_THREAD_NAME_LEN + 1];
    if (pthread_getname_np(pthread_self(), buffer, MAX_THREAD_NAME_LEN + 1) != 0)
    {
        strcpy(buffer, "unknown");
    }

    return buffer;
}

ThreadPool::ThreadPool(const std::string& name, int nMax_threads)
    : m_name(name)
    , m_nMax_threads(nMax_threads > 0 ? nMax_threads : 1)
{
}

ThreadPool::~ThreadPool()
{
    if (!m_stop)
    {
        stop(true);
    }
}

int ThreadPool::num_of_threads() const
{
    std::lock_guard<std::mutex> guard(m_lock);

    return m_threads.size();
}

void ThreadPool::execute(const Task& task)
{
    std::unique_lock<std::mutex> lock(m_lock);
    mxo_assert(!m_stop);

    m_tasks.push_back(task);

    // More queued tasks than idle threads to pick them up.
    if ((int)m_tasks.size() > m_nIdle && (int)m_threads.size() < m_nMax_threads)
    {
        m_threads.emplace_back(&ThreadPool::main, this);
        set_thread_name(m_threads.back(), MAKE_STR(m_name << "-" << m_threads.size()));
    }

    lock.unlock();
    m_cv.notify_one();
}

void ThreadPool::stop(bool abandon_tasks)
{
    std::unique_lock<std::mutex> lock(m_lock);
    mxo_assert(!m_stop);
    m_stop = true;
    m_abandon_tasks = abandon_tasks;
    lock.unlock();

    m_cv.notify_all();

    for (auto& thread : m_threads)
    {
        thread.join();
    }
}

void ThreadPool::main()
{
    std::unique_lock<std::mutex> lock(m_lock);

    while (true)
    {
        ++m_nIdle;
        m_cv.wait(lock, [this]() {
                      return m_stop || !m_tasks.empty();
                  });
        --m_nIdle;

        if (m_stop && (m_tasks.empty() || m_abandon_tasks))
        {
            break;
        }

        Task task = std::move(m_tasks.front());
        m_tasks.pop_front();
        lock.unlock();

        task();

        lock.lock();
    }
}
}
