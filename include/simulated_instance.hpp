#ifndef SIMULATED_INSTANCE_H
#define SIMULATED_INSTANCE_H

#include "process_sim.hpp"
#include "tick_driver.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using ListenerId = std::size_t;

/**
 * @class SimulatedInstance
 * @brief Base of every simulated device: owns its tick thread and listeners.
 *
 * Derived engines implement advance(), which runs with the state mutex held so
 * a tick is applied completely or not at all. Start and stop are meant to be
 * called from one controlling thread at a time.
 */
class SimulatedInstance {
public:
    using TickListener = std::function<void()>;
    using UpdateListener = std::function<void(const YAML::Node& data)>;

    explicit SimulatedInstance(std::chrono::milliseconds tick_interval);
    virtual ~SimulatedInstance();

    SimulatedInstance(const SimulatedInstance&) = delete;
    SimulatedInstance& operator=(const SimulatedInstance&) = delete;

    /**
     * @brief Begins ticking. Idempotent.
     * @return True once the instance is running.
     */
    bool start();

    /**
     * @brief Halts ticking without resetting any state. Idempotent.
     */
    bool stop();

    bool isRunning() const { return tick_driver.isRunning(); }

    /**
     * @brief Advances the simulation by exactly one tick, then notifies tick listeners.
     */
    void tick();

    ListenerId addTickListener(TickListener listener);
    void removeTickListener(ListenerId id);

    /**
     * @brief Whether this instance announces changes of its construction arguments.
     *
     * When true, every update listener receives the data the instance should
     * be recreated from.
     */
    virtual bool emitsUpdates() const { return false; }
    ListenerId addUpdateListener(UpdateListener listener);
    void removeUpdateListener(ListenerId id);

    virtual std::string className() const = 0;
    virtual uint16_t classCode() const = 0;

    /**
     * @brief Current values for the register gateway, offsets relative to the slot base.
     */
    virtual std::vector<TelemetryPoint> telemetry() const = 0;

    std::chrono::milliseconds tickInterval() const { return tick_driver.interval(); }

protected:
    /// One simulation step. Called with state_mutex held.
    virtual void advance() = 0;

    /// Delivers data to the update listeners. Must not be called with state_mutex held.
    void emitUpdate(const YAML::Node& data);

    mutable std::mutex state_mutex;

private:
    TickDriver tick_driver;

    std::mutex listener_mutex;
    ListenerId next_listener_id;
    std::map<ListenerId, TickListener> tick_listeners;
    std::map<ListenerId, UpdateListener> update_listeners;
};

#endif // SIMULATED_INSTANCE_H
