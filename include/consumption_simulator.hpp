#ifndef CONSUMPTION_SIMULATOR_H
#define CONSUMPTION_SIMULATOR_H

#include "simulated_instance.hpp"
#include "random_source.hpp"
#include <array>
#include <functional>
#include <memory>
#include <string>

/// @brief The utility flows a consumption meter reports.
enum class Channel {
    Power, ///< kWh totals, kW live rate
    Gas,   ///< m³ totals, m³/h live rate
    Water  ///< hot water, m³ totals, m³/h live rate
};

/**
 * @brief Maps "power", "gas" or "water" to its channel.
 * @throw UnknownChannelError for any other name.
 */
Channel parseChannel(const std::string& name);
const char* channelName(Channel channel);

/**
 * @struct ChannelConfig
 * @brief Daily cycle parameters of one channel.
 */
struct ChannelConfig {
    double annual;         ///< Target quantity per year.
    double avg_per_second; ///< annual / seconds in a year.
    double phase_shift;    ///< Radians; places the daily peak.
    double amplitude;      ///< Fractional deviation from the average.
};

/**
 * @struct AnnualConsumption
 * @brief Construction arguments of a consumption meter.
 */
struct AnnualConsumption {
    double power; ///< kWh per year
    double gas;   ///< m³ per year
    double water; ///< m³ per year
};

/**
 * @class ConsumptionSimulator
 * @brief Simulates power, gas and hot water consumption of a household meter.
 *
 * Each channel follows a daily sine cycle around its average rate, with +/-10%
 * jitter drawn per channel and tick. A tick adds the current per-second rate
 * times the tick length to the totals. Consumption is never negative, so the
 * accumulated totals never decrease.
 */
class ConsumptionSimulator : public SimulatedInstance {
public:
    /// Seconds elapsed since local midnight.
    using DayClock = std::function<double()>;

    static constexpr double kSecondsInYear = 365.0 * 24 * 3600;
    static constexpr double kSecondsInDay = 24.0 * 3600;
    static constexpr uint16_t kClassCode = 1;

    ConsumptionSimulator(const AnnualConsumption& annual,
                         std::chrono::milliseconds tick_interval = std::chrono::milliseconds(1000),
                         std::shared_ptr<RandomSource> random = makeDefaultRandomSource(),
                         DayClock clock = localSecondsIntoDay);
    ~ConsumptionSimulator() override;

    /**
     * @brief Live consumption rate: kW for power, m³/h for gas and water.
     */
    double getLiveValue(Channel channel) const;
    double getLiveValue(const std::string& channel) const;

    /**
     * @brief Total consumption since the simulator was created: kWh or m³.
     */
    double getAggregatedValue(Channel channel) const;
    double getAggregatedValue(const std::string& channel) const;

    const ChannelConfig& channelConfig(Channel channel) const;

    std::string className() const override { return "ConsumptionSimulator"; }
    uint16_t classCode() const override { return kClassCode; }
    std::vector<TelemetryPoint> telemetry() const override;

    static double localSecondsIntoDay();

protected:
    void advance() override;

private:
    std::array<ChannelConfig, 3> channels;
    std::array<double, 3> live_values;
    std::array<double, 3> aggregated_values;

    std::shared_ptr<RandomSource> random;
    DayClock seconds_into_day;
};

#endif // CONSUMPTION_SIMULATOR_H
