/*
Consumption simulator tests: daily cycle, jitter bounds, accumulation.
*/
#include "consumption_simulator.hpp"
#include "test_support.hpp"

#include <thread>

using namespace std::chrono_literals;

static const AnnualConsumption kHousehold{8760.0, 1752.0, 87.6};

static double fixedTime(double seconds) { return seconds; }

static int test_flat_rate_matches_annual_target()
{
    // 06:00 puts the power channel at the zero crossing of its cycle.
    auto random = std::make_shared<SequenceRandomSource>(std::vector<double>{0.0});
    ConsumptionSimulator meter(kHousehold, 1000ms, random, [] { return fixedTime(6 * 3600); });

    EXPECT(near(meter.channelConfig(Channel::Power).avg_per_second, 8760.0 / (365.0 * 24 * 3600)),
           "average per second derived from annual target");
    EXPECT(near(meter.getLiveValue(Channel::Power), 0.0), "live value starts at zero");

    meter.tick();
    EXPECT(near(meter.getLiveValue(Channel::Power), 1.0, 1e-9), "8760 kWh a year is 1 kW flat");
    EXPECT(near(meter.getLiveValue("power"), meter.getLiveValue(Channel::Power)), "string accessor");
    EXPECT(near(meter.getAggregatedValue(Channel::Power), 8760.0 / (365.0 * 24 * 3600)),
           "one second of consumption accumulated");
    EXPECT(random->draws() == 3, "one noise draw per channel and tick");
    return 0;
}

static int test_channel_constants()
{
    ConsumptionSimulator meter(kHousehold, 1000ms, std::make_shared<SequenceRandomSource>(std::vector<double>{0.0}),
                               [] { return 0.0; });
    EXPECT(near(meter.channelConfig(Channel::Power).amplitude, 0.6), "power amplitude");
    EXPECT(near(meter.channelConfig(Channel::Gas).amplitude, 0.5), "gas amplitude");
    EXPECT(near(meter.channelConfig(Channel::Water).amplitude, 0.8), "water amplitude");
    EXPECT(near(meter.channelConfig(Channel::Power).phase_shift, -M_PI / 2), "power phase");
    EXPECT(near(meter.channelConfig(Channel::Gas).phase_shift, -M_PI / 3), "gas phase");
    EXPECT(near(meter.channelConfig(Channel::Water).phase_shift, M_PI / 2), "water phase");
    return 0;
}

static int test_cycle_and_noise_shape_rate()
{
    // Noon: power at its cycle maximum, water at its minimum.
    auto random = std::make_shared<SequenceRandomSource>(std::vector<double>{0.1, 0.0, -0.1});
    ConsumptionSimulator meter(kHousehold, 1000ms, random, [] { return fixedTime(12 * 3600); });
    meter.tick();

    double power_avg = meter.channelConfig(Channel::Power).avg_per_second;
    double water_avg = meter.channelConfig(Channel::Water).avg_per_second;
    EXPECT(near(meter.getLiveValue(Channel::Power), power_avg * (1 + 0.6 + 0.1) * 3600, 1e-9), "power peak");
    EXPECT(near(meter.getLiveValue(Channel::Water), water_avg * (1 - 0.8 - 0.1) * 3600, 1e-9), "water trough");
    EXPECT(meter.getLiveValue(Channel::Water) > 0.0, "trough stays positive");
    return 0;
}

static int test_unknown_channel()
{
    ConsumptionSimulator meter(kHousehold, 1000ms, makeDefaultRandomSource(), [] { return 0.0; });

    bool thrown = false;
    try {
        meter.getLiveValue("electricity");
    } catch (const UnknownChannelError& e) {
        thrown = e.channel() == "electricity";
    }
    EXPECT(thrown, "live value of unknown channel throws");

    thrown = false;
    try {
        meter.getAggregatedValue("");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    EXPECT(thrown, "aggregated value of unknown channel throws");
    EXPECT(parseChannel("water") == Channel::Water, "known channel parses");
    return 0;
}

static int test_totals_monotonic_and_rates_non_negative()
{
    double clock = 0.0;
    auto random = std::make_shared<MersenneRandomSource>(1234u);
    ConsumptionSimulator meter(kHousehold, 1000ms, random, [&clock] { return clock; });

    double previous[3] = {0.0, 0.0, 0.0};
    for (int i = 0; i < 2000; ++i) {
        clock = (i * 97) % 86400; // sweep the whole day
        meter.tick();
        for (Channel channel : {Channel::Power, Channel::Gas, Channel::Water}) {
            size_t index = static_cast<size_t>(channel);
            double total = meter.getAggregatedValue(channel);
            EXPECT(total >= previous[index], "accumulated total never decreases");
            EXPECT(meter.getLiveValue(channel) >= 0.0, "live rate never negative");
            previous[index] = total;
        }
    }
    EXPECT(previous[0] > 0.0, "power accumulated");
    return 0;
}

static int test_stop_keeps_totals()
{
    ConsumptionSimulator meter(kHousehold, 10ms, makeDefaultRandomSource());
    EXPECT(meter.start(), "start");
    std::this_thread::sleep_for(100ms);
    meter.stop();

    double total = meter.getAggregatedValue(Channel::Gas);
    EXPECT(total > 0.0, "running meter accumulated gas");
    std::this_thread::sleep_for(50ms);
    EXPECT(meter.getAggregatedValue(Channel::Gas) == total, "stopped meter does not tick");
    meter.stop();
    EXPECT(meter.getAggregatedValue(Channel::Gas) == total, "stop keeps totals");
    return 0;
}

static int test_telemetry_points()
{
    auto random = std::make_shared<SequenceRandomSource>(std::vector<double>{0.0});
    ConsumptionSimulator meter(kHousehold, 1000ms, random, [] { return fixedTime(6 * 3600); });
    meter.tick();

    auto points = meter.telemetry();
    EXPECT(points.size() == 6, "live and total per channel");
    EXPECT(points[0].offset == 2 && points[0].type == RegisterType::U32, "power live register");
    EXPECT(std::get<uint32_t>(points[0].value) == 1000, "1 kW published in watts");
    EXPECT(points[1].offset == 8 && points[1].type == RegisterType::U64, "power total register");
    EXPECT(meter.classCode() == ConsumptionSimulator::kClassCode, "class code");
    return 0;
}

static int test_short_ticks_accumulate_elapsed_time()
{
    auto random = std::make_shared<SequenceRandomSource>(std::vector<double>{0.0});
    ConsumptionSimulator meter({8760.0, 0.0, 0.0}, 100ms, random, [] { return fixedTime(6 * 3600); });

    for (int i = 0; i < 10; ++i) {
        meter.tick();
    }
    EXPECT(near(meter.getAggregatedValue(Channel::Power), 8760.0 / (365.0 * 24 * 3600), 1e-12),
           "ten 100 ms ticks accumulate one second of consumption");
    EXPECT(near(meter.getLiveValue(Channel::Power), 1.0, 1e-9), "live rate independent of tick length");
    return 0;
}

static int test_telemetry_saturates()
{
    auto random = std::make_shared<SequenceRandomSource>(std::vector<double>{0.0});
    ConsumptionSimulator meter({4e10, 0.0, 0.0}, 1000ms, random, [] { return fixedTime(6 * 3600); });
    meter.tick();

    auto points = meter.telemetry();
    EXPECT(meter.getLiveValue(Channel::Power) * 1000.0 > 4294967295.0, "live rate exceeds the register");
    EXPECT(std::get<uint32_t>(points[0].value) == UINT32_MAX, "live rate clamped to the register maximum");
    EXPECT(std::get<uint64_t>(points[1].value) > 0, "total published");
    EXPECT(std::get<uint32_t>(points[2].value) == 0, "idle channel publishes zero");
    return 0;
}

int main(void)
{
    quietLogs();
    if (test_flat_rate_matches_annual_target() != 0) return 1;
    if (test_channel_constants() != 0) return 1;
    if (test_cycle_and_noise_shape_rate() != 0) return 1;
    if (test_unknown_channel() != 0) return 1;
    if (test_totals_monotonic_and_rates_non_negative() != 0) return 1;
    if (test_stop_keeps_totals() != 0) return 1;
    if (test_telemetry_points() != 0) return 1;
    if (test_short_ticks_accumulate_elapsed_time() != 0) return 1;
    if (test_telemetry_saturates() != 0) return 1;
    return 0;
}
