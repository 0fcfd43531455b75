#ifndef SILO_SIMULATOR_H
#define SILO_SIMULATOR_H

#include "simulated_instance.hpp"
#include "random_source.hpp"
#include <functional>
#include <memory>

/**
 * @struct SiloParams
 * @brief Construction arguments of a silo level sensor.
 */
struct SiloParams {
    double capacity = 100;     ///< Maximum fill level.
    double time_to_empty = 60; ///< Approximate seconds from full to empty.
};

/**
 * @class SiloSimulator
 * @brief Simulates a silo level sensor that empties slowly and refills ten times faster.
 *
 * Emptying starts at full capacity and switches to refilling once the level
 * drops to 10% of capacity. Refilling stops exactly at capacity. Every
 * emptying phase draws its duration from +/-10% around time_to_empty.
 */
class SiloSimulator : public SimulatedInstance {
public:
    enum class Mode { Emptying, Refilling };
    using LevelListener = std::function<void(double level)>;

    static constexpr uint16_t kClassCode = 2;

    explicit SiloSimulator(const SiloParams& params = SiloParams(),
                           std::chrono::milliseconds tick_interval = std::chrono::milliseconds(1000),
                           std::shared_ptr<RandomSource> random = makeDefaultRandomSource());
    ~SiloSimulator() override;

    /**
     * @brief Current filling level, rounded to two decimal places.
     */
    double getLevel() const;

    /**
     * @brief Registers a callback receiving the rounded level after every tick.
     * @return Id for removeLevelListener().
     */
    ListenerId onLevelUpdate(LevelListener callback);
    void removeLevelListener(ListenerId id);

    Mode mode() const;
    double exactLevel() const;
    double stepDown() const;
    double stepUp() const { return step_up; }
    double capacity() const { return silo_capacity; }

    std::string className() const override { return "SiloSimulator"; }
    uint16_t classCode() const override { return kClassCode; }
    std::vector<TelemetryPoint> telemetry() const override;

protected:
    void advance() override;

private:
    void randomizeEmptyingStep();

    const double silo_capacity;
    const double base_time_to_empty_ms;
    const double time_to_refill_ms;
    const double step_up;

    double level;
    Mode current_mode;
    double step_down;

    std::shared_ptr<RandomSource> random;
};

#endif // SILO_SIMULATOR_H
