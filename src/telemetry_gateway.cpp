#include "telemetry_gateway.hpp"
#include "log.hpp"
#include <algorithm>

namespace {

const char* kModule = "gateway";

} // namespace

TelemetryGateway::TelemetryGateway(InstanceRegistry& reg, std::shared_ptr<RegisterMap> register_map, size_t slots)
    : registry(reg), registers(std::move(register_map)), max_slots(std::min(slots, kMaxSlots)),
      attached(false), created_listener(0), deleted_listener(0), slot_used(max_slots, false) {}

TelemetryGateway::~TelemetryGateway() {
    detach();
}

void TelemetryGateway::attach() {
    {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        if (attached) return;
        attached = true;
    }

    registers->setWriteHandler([this](uint16_t address, const RegisterValue& value) {
        onControlWrite(address, value);
    });
    created_listener = registry.addCreatedListener(
        [this](const std::string& id, const std::string&, const YAML::Node&) {
            if (auto instance = registry.get(id)) {
                expose(id, instance);
            }
        });
    deleted_listener = registry.addDeletedListener([this](const std::string& id, const std::string&) {
        withdraw(id);
    });

    for (const auto& id : registry.ids()) {
        if (auto instance = registry.get(id)) {
            expose(id, instance);
        }
    }
}

void TelemetryGateway::detach() {
    {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        if (!attached) return;
        attached = false;
    }

    registry.removeListener(created_listener);
    registry.removeListener(deleted_listener);
    registers->setWriteHandler(nullptr);

    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        for (const auto& pair : exposed) {
            ids.push_back(pair.first);
        }
    }
    for (const auto& id : ids) {
        withdraw(id);
    }
}

std::optional<size_t> TelemetryGateway::slotOf(const std::string& id) const {
    std::lock_guard<std::mutex> lock(gateway_mutex);
    auto it = exposed.find(id);
    if (it == exposed.end()) return std::nullopt;
    return it->second.slot;
}

void TelemetryGateway::publish(RegisterMap& regs, const SimulatedInstance& instance, uint16_t base) {
    regs.setLogicalValue(base, instance.classCode());
    regs.setLogicalValue(base + 1, static_cast<uint16_t>(instance.isRunning() ? 1 : 0));
    for (const auto& point : instance.telemetry()) {
        regs.setLogicalValue(base + point.offset, point.value);
    }
}

void TelemetryGateway::expose(const std::string& id, const std::shared_ptr<SimulatedInstance>& instance) {
    std::lock_guard<std::mutex> lock(gateway_mutex);
    if (exposed.count(id) > 0) return;

    auto free_slot = std::find(slot_used.begin(), slot_used.end(), false);
    if (free_slot == slot_used.end()) {
        logWarn(kModule, "No free register slot for " + id + ", instance is not exposed over Modbus");
        return;
    }
    size_t slot = static_cast<size_t>(free_slot - slot_used.begin());
    *free_slot = true;

    uint16_t base = inputBase(slot);
    registers->defineRegister(base, RegisterType::U16, RegisterAccess::RO);
    registers->defineRegister(base + 1, RegisterType::U16, RegisterAccess::RO);
    for (const auto& point : instance->telemetry()) {
        registers->defineRegister(base + point.offset, point.type, RegisterAccess::RO);
    }
    registers->defineRegister(controlAddress(slot), RegisterType::U16, RegisterAccess::RW);
    registers->setLogicalValue(controlAddress(slot), static_cast<uint16_t>(instance->isRunning() ? 1 : 0));
    publish(*registers, *instance, base);

    // The listener lives inside the instance, so the raw pointer cannot dangle.
    SimulatedInstance* raw = instance.get();
    std::shared_ptr<RegisterMap> regs = registers;
    ListenerId listener = instance->addTickListener([regs, raw, base] { publish(*regs, *raw, base); });

    exposed[id] = Exposure{slot, instance, listener};
    logInfo(kModule, "Exposing " + id + " at input register " + std::to_string(base) +
                         ", control register " + std::to_string(controlAddress(slot)));
}

void TelemetryGateway::withdraw(const std::string& id) {
    std::lock_guard<std::mutex> lock(gateway_mutex);
    auto it = exposed.find(id);
    if (it == exposed.end()) return;

    if (auto instance = it->second.instance.lock()) {
        instance->removeTickListener(it->second.tick_listener);
    }
    size_t slot = it->second.slot;
    registers->removeRange(inputBase(slot), kSlotSize);
    registers->removeRange(controlAddress(slot), 1);
    slot_used[slot] = false;
    exposed.erase(it);
}

void TelemetryGateway::onControlWrite(uint16_t address, const RegisterValue& value) {
    if (address < kControlBase || (address - kControlBase) % kSlotSize != 0) return;
    size_t slot = (address - kControlBase) / kSlotSize;

    std::shared_ptr<SimulatedInstance> instance;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        for (const auto& pair : exposed) {
            if (pair.second.slot == slot) {
                id = pair.first;
                instance = pair.second.instance.lock();
                break;
            }
        }
    }
    if (!instance) return;

    uint16_t command = std::get<uint16_t>(value);
    if (command == 1) {
        logInfo(kModule, "Start command received for " + id);
        instance->start();
    } else if (command == 0) {
        logInfo(kModule, "Stop command received for " + id);
        instance->stop();
    } else {
        logWarn(kModule, "Ignoring control value " + std::to_string(command) + " for " + id);
        return;
    }
    registers->setLogicalValue(inputBase(slot) + 1, static_cast<uint16_t>(instance->isRunning() ? 1 : 0));
}
