#include "register_map.hpp"
#include "log.hpp"
#include <type_traits>

namespace {

uint64_t widen(const RegisterValue& value) {
    return std::visit([](auto v) -> uint64_t {
        using T = decltype(v);
        if constexpr (std::is_same_v<T, int32_t>) {
            return static_cast<uint64_t>(static_cast<uint32_t>(v));
        } else {
            return static_cast<uint64_t>(v);
        }
    }, value);
}

RegisterValue narrow(RegisterType type, uint64_t raw) {
    switch (type) {
        case RegisterType::U16: return static_cast<uint16_t>(raw);
        case RegisterType::U32: return static_cast<uint32_t>(raw);
        case RegisterType::S32: return static_cast<int32_t>(static_cast<uint32_t>(raw));
        case RegisterType::U64: return raw;
    }
    return static_cast<uint16_t>(raw);
}

} // namespace

void RegisterMap::storeWords(const Register& reg) {
    uint64_t raw = widen(reg.value);
    for (size_t i = 0; i < reg.num_regs; ++i) {
        size_t shift = 16 * (reg.num_regs - 1 - i);
        modbus_register_map[static_cast<uint16_t>(reg.address + i)] = static_cast<uint16_t>((raw >> shift) & 0xFFFF);
    }
}

void RegisterMap::defineRegister(uint16_t address, RegisterType type, RegisterAccess access) {
    std::lock_guard<std::mutex> lock(data_mutex);
    Register reg{address, type, access, narrow(type, 0), registerWidth(type)};
    logical_register_map[address] = reg;
    storeWords(reg);
}

void RegisterMap::removeRange(uint16_t first, size_t count) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = logical_register_map.lower_bound(first);
    while (it != logical_register_map.end() && it->first < first + count) {
        for (size_t i = 0; i < it->second.num_regs; ++i) {
            modbus_register_map.erase(static_cast<uint16_t>(it->first + i));
        }
        it = logical_register_map.erase(it);
    }
}

bool RegisterMap::getRegisterValue(uint16_t address, uint16_t& value) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = modbus_register_map.find(address);
    if (it != modbus_register_map.end()) {
        value = it->second;
        return true;
    }
    return false;
}

bool RegisterMap::setRegisterValue(uint16_t address, uint16_t value) {
    WriteHandler handler;
    Register written;
    {
        std::lock_guard<std::mutex> lock(data_mutex);

        // Find which logical register this modbus register belongs to
        auto it = logical_register_map.upper_bound(address);
        if (it == logical_register_map.begin()) {
            logWarn("registers", "Write to unmapped modbus address " + std::to_string(address));
            return false;
        }
        --it;
        Register& logical_reg = it->second;
        if (address >= logical_reg.address + logical_reg.num_regs) {
            logWarn("registers", "Write to unmapped modbus address " + std::to_string(address));
            return false;
        }
        if (logical_reg.access == RegisterAccess::RO) {
            logWarn("registers", "Denied write to RO logical register " + std::to_string(logical_reg.address));
            return false;
        }

        modbus_register_map[address] = value;

        // Reconstruct the logical value from the updated 16-bit registers
        uint64_t raw = 0;
        for (size_t i = 0; i < logical_reg.num_regs; ++i) {
            raw = (raw << 16) | modbus_register_map[static_cast<uint16_t>(logical_reg.address + i)];
        }
        logical_reg.value = narrow(logical_reg.type, raw);

        // Multi-word writes are complete once the last word arrives.
        if (address != logical_reg.address + logical_reg.num_regs - 1) return true;
        handler = write_handler;
        written = logical_reg;
    }

    if (handler) {
        handler(written.address, written.value);
    }
    return true;
}

std::optional<RegisterValue> RegisterMap::getLogicalValue(uint16_t address) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = logical_register_map.find(address);
    if (it != logical_register_map.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

void RegisterMap::setLogicalValue(uint16_t address, const RegisterValue& value) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = logical_register_map.find(address);
    if (it != logical_register_map.end()) {
        it->second.value = narrow(it->second.type, widen(value));
        storeWords(it->second);
    }
}

void RegisterMap::setWriteHandler(WriteHandler handler) {
    std::lock_guard<std::mutex> lock(data_mutex);
    write_handler = std::move(handler);
}

size_t RegisterMap::size() {
    std::lock_guard<std::mutex> lock(data_mutex);
    return logical_register_map.size();
}
