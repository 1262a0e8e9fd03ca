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
#include <deque>
#include <functional>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace maxosc
{

/**
 * @brief set_thread_name - Set the name of a thread.
 *                          Useful e.g. with "top -H -p $(pidof maxosc)"
 * @param thread
 * @param name            - Note: only the first 15 chars can be used
 */
void set_thread_name(std::thread& thread, const std::string& name);

/**
 * @brief get_thread_name - Get the name of the calling thread.
 */
std::string get_thread_name();

/**
 * A pool of worker threads sharing one task queue.
 *
 * Threads are created on demand: a task submitted while no thread is idle causes
 * a new thread to be created, unless the maximum number of threads has already been
 * reached, in which case the task waits in the queue for the first thread that
 * becomes idle.
 */
class ThreadPool
{
public:
    using Task = std::function<void()>;

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    static constexpr int UNLIMITED = std::numeric_limits<int>::max();

    /**
     * Creates a thread pool with at most the specified number of threads.
     *
     * @param name          Base name of the threads, an index is appended.
     * @param nMax_threads  The maximum number of threads created by the pool.
     */
    ThreadPool(const std::string& name, int nMax_threads = UNLIMITED);

    /**
     * Terminates the pool. If the pool has not already been stopped, then
     * @c stop(true) will be called.
     */
    ~ThreadPool();

    int max_num_of_threads() const
    {
        return m_nMax_threads;
    }

    /**
     * The number of threads created so far.
     */
    int num_of_threads() const;

    /**
     * Execute a task on one thread in the pool.
     *
     * @attn Must not be called if @c stop() has been called.
     *
     * @param task  The task to execute.
     */
    void execute(const Task& task);

    /**
     * Stop the pool and join all threads.
     *
     * @param abandon_tasks  If false, then all pending tasks will be executed
     *                       before the threads in the pool exit. If true, then
     *                       the current task (if one is running) of each thread is
     *                       allowed to finish after which the threads exit without
     *                       executing any pending tasks.
     */
    void stop(bool abandon_tasks = false);

private:
    void main();

    const std::string        m_name;
    const int                m_nMax_threads;
    std::vector<std::thread> m_threads;
    std::deque<Task>         m_tasks;
    int                      m_nIdle {0};
    bool                     m_stop {false};
    bool                     m_abandon_tasks {false};
    mutable std::mutex       m_lock;
    std::condition_variable  m_cv;
};
}
