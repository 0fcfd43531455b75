#include "consumption_simulator.hpp"
#include "sim_errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <ctime>

namespace {

size_t channelIndex(Channel channel) {
    return static_cast<size_t>(channel);
}

ChannelConfig makeChannel(double annual, double phase_shift, double amplitude) {
    return ChannelConfig{annual, annual / ConsumptionSimulator::kSecondsInYear, phase_shift, amplitude};
}

// Register values saturate instead of wrapping.
uint32_t toFix3(double value) {
    double scaled = std::round(value * 1000.0);
    if (!(scaled > 0.0)) return 0;
    if (scaled >= static_cast<double>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<uint32_t>(scaled);
}

uint64_t toFix3Total(double value) {
    double scaled = std::round(value * 1000.0);
    if (!(scaled > 0.0)) return 0;
    if (scaled >= static_cast<double>(UINT64_MAX)) return UINT64_MAX;
    return static_cast<uint64_t>(scaled);
}

} // namespace

Channel parseChannel(const std::string& name) {
    if (name == "power") return Channel::Power;
    if (name == "gas") return Channel::Gas;
    if (name == "water") return Channel::Water;
    throw UnknownChannelError(name);
}

const char* channelName(Channel channel) {
    switch (channel) {
        case Channel::Power: return "power";
        case Channel::Gas:   return "gas";
        case Channel::Water: return "water";
    }
    return "power";
}

ConsumptionSimulator::ConsumptionSimulator(const AnnualConsumption& annual,
                                           std::chrono::milliseconds tick_interval,
                                           std::shared_ptr<RandomSource> rnd,
                                           DayClock clock)
    : SimulatedInstance(tick_interval),
      live_values{0.0, 0.0, 0.0},
      aggregated_values{0.0, 0.0, 0.0},
      random(std::move(rnd)),
      seconds_into_day(std::move(clock)) {
    // Power peaks in the evening, gas a little earlier (cooking, heating), hot water in the morning.
    channels[channelIndex(Channel::Power)] = makeChannel(annual.power, -M_PI / 2, 0.6);
    channels[channelIndex(Channel::Gas)] = makeChannel(annual.gas, -M_PI / 3, 0.5);
    channels[channelIndex(Channel::Water)] = makeChannel(annual.water, M_PI / 2, 0.8);
}

ConsumptionSimulator::~ConsumptionSimulator() {
    stop();
}

double ConsumptionSimulator::localSecondsIntoDay() {
    time_t now = time(0);
    struct tm ltm;
    localtime_r(&now, &ltm);
    return ltm.tm_hour * 3600 + ltm.tm_min * 60 + ltm.tm_sec;
}

void ConsumptionSimulator::advance() {
    double day_position = 2 * M_PI * seconds_into_day() / kSecondsInDay;
    double seconds_per_tick = tickInterval().count() / 1000.0;

    for (size_t i = 0; i < channels.size(); ++i) {
        const ChannelConfig& channel = channels[i];

        double cycle_factor = sin(day_position + channel.phase_shift);
        double noise = random->uniform(-0.1, 0.1);

        double this_second = channel.avg_per_second * (1 + cycle_factor * channel.amplitude + noise);
        this_second = std::max(0.0, this_second);

        aggregated_values[i] += this_second * seconds_per_tick;
        live_values[i] = this_second * 3600;
    }
}

double ConsumptionSimulator::getLiveValue(Channel channel) const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return live_values[channelIndex(channel)];
}

double ConsumptionSimulator::getLiveValue(const std::string& channel) const {
    return getLiveValue(parseChannel(channel));
}

double ConsumptionSimulator::getAggregatedValue(Channel channel) const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return aggregated_values[channelIndex(channel)];
}

double ConsumptionSimulator::getAggregatedValue(const std::string& channel) const {
    return getAggregatedValue(parseChannel(channel));
}

const ChannelConfig& ConsumptionSimulator::channelConfig(Channel channel) const {
    return channels[channelIndex(channel)];
}

std::vector<TelemetryPoint> ConsumptionSimulator::telemetry() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    std::vector<TelemetryPoint> points;
    for (size_t i = 0; i < channels.size(); ++i) {
        uint16_t index = static_cast<uint16_t>(i);
        points.push_back({static_cast<uint16_t>(2 + index * 2), RegisterType::U32, toFix3(live_values[i])});
        points.push_back({static_cast<uint16_t>(8 + index * 4), RegisterType::U64,
                          toFix3Total(aggregated_values[i])});
    }
    return points;
}
