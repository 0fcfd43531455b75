#include "simulated_instance.hpp"
#include "log.hpp"
#include <exception>

SimulatedInstance::SimulatedInstance(std::chrono::milliseconds tick_interval)
    : tick_driver(tick_interval), next_listener_id(1) {}

SimulatedInstance::~SimulatedInstance() {
    tick_driver.stop();
}

bool SimulatedInstance::start() {
    if (tick_driver.isRunning()) return true;
    return tick_driver.start([this] { tick(); });
}

bool SimulatedInstance::stop() {
    tick_driver.stop();
    return true;
}

void SimulatedInstance::tick() {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        advance();
    }

    std::vector<TickListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex);
        for (const auto& pair : tick_listeners) {
            listeners.push_back(pair.second);
        }
    }
    for (const auto& listener : listeners) {
        try {
            listener();
        } catch (const std::exception& e) {
            logWarn("instance", std::string("Tick listener failed: ") + e.what());
        }
    }
}

ListenerId SimulatedInstance::addTickListener(TickListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex);
    ListenerId id = next_listener_id++;
    tick_listeners[id] = std::move(listener);
    return id;
}

void SimulatedInstance::removeTickListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listener_mutex);
    tick_listeners.erase(id);
}

ListenerId SimulatedInstance::addUpdateListener(UpdateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex);
    ListenerId id = next_listener_id++;
    update_listeners[id] = std::move(listener);
    return id;
}

void SimulatedInstance::removeUpdateListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listener_mutex);
    update_listeners.erase(id);
}

void SimulatedInstance::emitUpdate(const YAML::Node& data) {
    std::vector<UpdateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex);
        for (const auto& pair : update_listeners) {
            listeners.push_back(pair.second);
        }
    }
    for (const auto& listener : listeners) {
        try {
            listener(data);
        } catch (const std::exception& e) {
            logWarn("instance", std::string("Update listener failed: ") + e.what());
        }
    }
}
