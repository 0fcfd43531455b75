#ifndef TICK_DRIVER_H
#define TICK_DRIVER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

/**
 * @class TickDriver
 * @brief Runs a callback at a fixed interval on a dedicated thread.
 *
 * Callbacks of one driver never overlap. The cadence is fixed: the time spent
 * inside the callback is subtracted from the wait before the next tick.
 */
class TickDriver {
public:
    explicit TickDriver(std::chrono::milliseconds interval);

    /**
     * @brief Destructor, ensures the worker thread is stopped and joined.
     */
    ~TickDriver();

    TickDriver(const TickDriver&) = delete;
    TickDriver& operator=(const TickDriver&) = delete;

    /**
     * @brief Starts ticking in a new thread.
     * @param on_tick Invoked once per interval, first after one full interval.
     * @return False if the driver was already running.
     */
    bool start(std::function<void()> on_tick);

    /**
     * @brief Stops ticking. Idempotent.
     *
     * Waits for an in-flight tick to finish, except when called from inside
     * the tick callback, where the worker exits after the callback returns.
     */
    void stop();

    bool isRunning() const { return running; }
    std::chrono::milliseconds interval() const { return tick_interval; }

private:
    void run(std::function<void()> on_tick);

    std::chrono::milliseconds tick_interval;
    std::thread worker_thread;
    std::atomic<bool> running;
    std::mutex wait_mutex;
    std::condition_variable wake;
};

#endif // TICK_DRIVER_H
