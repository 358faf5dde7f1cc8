#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "logging.h"

// Background thread running `fn` immediately and then every `interval`.
// stop() wakes the thread early and joins it.
class periodic_task
{
public:
    periodic_task() = default;
    ~periodic_task() { stop(); }

    periodic_task(const periodic_task&) = delete;
    periodic_task& operator=(const periodic_task&) = delete;

    bool start(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    {
        if (m_running.exchange(true, std::memory_order_acq_rel))
            return false;

        m_name = std::move(name);
        m_interval = interval;
        m_fn = std::move(fn);
        m_thread = std::thread(&periodic_task::loop, this);
        return true;
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running.exchange(false, std::memory_order_acq_rel))
                return;
        }
        m_wake.notify_all();
        if (m_thread.joinable())
            m_thread.join();
    }

    bool running() const { return m_running.load(std::memory_order_acquire); }
    const std::string& name() const { return m_name; }

private:
    void loop()
    {
        logger::t_thread = m_name.c_str();
        while (m_running.load(std::memory_order_acquire))
        {
            m_fn();

            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait_for(lock, m_interval, [this] {
                return !m_running.load(std::memory_order_acquire);
            });
        }
    }

    std::string m_name;
    std::chrono::milliseconds m_interval{1000};
    std::function<void()> m_fn;
    std::atomic<bool> m_running{false};
    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::thread m_thread;
};
