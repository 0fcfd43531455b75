#include "silo_simulator.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace {

double roundToCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

// Register values saturate instead of wrapping.
uint32_t toFix2(double value) {
    double scaled = std::round(value * 100.0);
    if (!(scaled > 0.0)) return 0;
    if (scaled >= static_cast<double>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<uint32_t>(scaled);
}

} // namespace

SiloSimulator::SiloSimulator(const SiloParams& params,
                             std::chrono::milliseconds tick_interval,
                             std::shared_ptr<RandomSource> rnd)
    : SimulatedInstance(tick_interval),
      silo_capacity(params.capacity),
      base_time_to_empty_ms(params.time_to_empty * 1000.0),
      time_to_refill_ms(base_time_to_empty_ms / 10),
      step_up(silo_capacity / (time_to_refill_ms / tick_interval.count())),
      level(params.capacity),
      current_mode(Mode::Emptying),
      step_down(0.0),
      random(std::move(rnd)) {
    randomizeEmptyingStep();
}

SiloSimulator::~SiloSimulator() {
    stop();
}

void SiloSimulator::randomizeEmptyingStep() {
    const double variance = 0.1;
    double adjusted_time_to_empty = base_time_to_empty_ms * (1 + random->uniform(-variance, variance));
    step_down = silo_capacity / (adjusted_time_to_empty / tickInterval().count());
}

void SiloSimulator::advance() {
    if (current_mode == Mode::Emptying) {
        level -= step_down;
        if (level <= silo_capacity * 0.1) {
            current_mode = Mode::Refilling;
            level = std::max(0.0, level);
        }
    } else {
        level += step_up;
        if (level >= silo_capacity) {
            current_mode = Mode::Emptying;
            level = silo_capacity;
            randomizeEmptyingStep();
        }
    }
}

double SiloSimulator::getLevel() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return roundToCents(level);
}

ListenerId SiloSimulator::onLevelUpdate(LevelListener callback) {
    // Ticks of one instance are serialized, so the level read here is the one this tick produced.
    return addTickListener([this, callback] { callback(getLevel()); });
}

void SiloSimulator::removeLevelListener(ListenerId id) {
    removeTickListener(id);
}

SiloSimulator::Mode SiloSimulator::mode() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return current_mode;
}

double SiloSimulator::exactLevel() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return level;
}

double SiloSimulator::stepDown() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return step_down;
}

std::vector<TelemetryPoint> SiloSimulator::telemetry() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return {
        {2, RegisterType::U32, toFix2(level)},
        {4, RegisterType::U16, static_cast<uint16_t>(current_mode == Mode::Emptying ? 0 : 1)},
        {5, RegisterType::U32, toFix2(silo_capacity)},
    };
}
