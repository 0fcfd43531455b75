#include "tick_driver.hpp"

TickDriver::TickDriver(std::chrono::milliseconds interval)
    : tick_interval(interval), running(false) {}

TickDriver::~TickDriver() {
    stop();
    if (worker_thread.joinable()) {
        if (worker_thread.get_id() == std::this_thread::get_id()) {
            worker_thread.detach();
        } else {
            worker_thread.join();
        }
    }
}

bool TickDriver::start(std::function<void()> on_tick) {
    if (running) return false;

    // A previous stop() issued from inside a tick leaves the old worker to be reaped here.
    if (worker_thread.joinable()) {
        worker_thread.join();
    }

    running = true;
    worker_thread = std::thread(&TickDriver::run, this, std::move(on_tick));
    return true;
}

void TickDriver::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex);
        if (!running) return;
        running = false;
    }
    wake.notify_all();

    if (worker_thread.joinable() && worker_thread.get_id() != std::this_thread::get_id()) {
        worker_thread.join();
    }
}

void TickDriver::run(std::function<void()> on_tick) {
    auto next_tick = std::chrono::steady_clock::now() + tick_interval;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex);
            wake.wait_until(lock, next_tick, [this] { return !running; });
            if (!running) break;
        }

        on_tick();

        next_tick += tick_interval;
        auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            // Fell behind (slow callback or suspended process): skip the missed ticks.
            next_tick = now + tick_interval;
        }
    }
}
