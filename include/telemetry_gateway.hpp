#ifndef TELEMETRY_GATEWAY_H
#define TELEMETRY_GATEWAY_H

#include "instance_registry.hpp"
#include "register_map.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @class TelemetryGateway
 * @brief Publishes every live instance into a block of Modbus registers.
 *
 * Slot n covers input registers [30000 + 32n, 30000 + 32n + 32) and the RW
 * control register 40000 + 32n. The block starts with the class code and the
 * running flag, followed by the instance's telemetry points. Writing 1 to the
 * control register starts the instance, 0 stops it.
 */
class TelemetryGateway {
public:
    static constexpr uint16_t kInputBase = 30000;
    static constexpr uint16_t kControlBase = 40000;
    static constexpr uint16_t kSlotSize = 32;
    static constexpr size_t kMaxSlots = 10000 / kSlotSize;

    TelemetryGateway(InstanceRegistry& registry, std::shared_ptr<RegisterMap> register_map, size_t max_slots);
    ~TelemetryGateway();

    TelemetryGateway(const TelemetryGateway&) = delete;
    TelemetryGateway& operator=(const TelemetryGateway&) = delete;

    /**
     * @brief Exposes the instances already live and follows the registry from now on.
     */
    void attach();
    void detach();

    std::optional<size_t> slotOf(const std::string& id) const;

    static uint16_t inputBase(size_t slot) { return static_cast<uint16_t>(kInputBase + slot * kSlotSize); }
    static uint16_t controlAddress(size_t slot) { return static_cast<uint16_t>(kControlBase + slot * kSlotSize); }

private:
    struct Exposure {
        size_t slot;
        std::weak_ptr<SimulatedInstance> instance;
        ListenerId tick_listener;
    };

    void expose(const std::string& id, const std::shared_ptr<SimulatedInstance>& instance);
    void withdraw(const std::string& id);
    void onControlWrite(uint16_t address, const RegisterValue& value);

    static void publish(RegisterMap& registers, const SimulatedInstance& instance, uint16_t base);

    InstanceRegistry& registry;
    std::shared_ptr<RegisterMap> registers;
    size_t max_slots;

    mutable std::mutex gateway_mutex;
    bool attached;
    ListenerId created_listener;
    ListenerId deleted_listener;
    std::map<std::string, Exposure> exposed;
    std::vector<bool> slot_used;
};

#endif // TELEMETRY_GATEWAY_H
