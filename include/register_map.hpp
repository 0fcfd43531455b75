#ifndef REGISTER_MAP_H
#define REGISTER_MAP_H

#include "process_sim.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>

/**
 * @struct Register
 * @brief One logical register: a typed value spread over 1 to 4 Modbus words.
 */
struct Register {
    uint16_t address;
    RegisterType type;
    RegisterAccess access;
    RegisterValue value;
    size_t num_regs; // Number of 16-bit Modbus registers it occupies
};

/**
 * @class RegisterMap
 * @brief Manages the shared state of all exposed registers with thread-safe access.
 *
 * The telemetry gateway writes logical values from the instances' tick
 * threads while the Modbus server thread reads 16-bit words. Multi-word values
 * are stored high word first.
 */
class RegisterMap {
public:
    /// Called after a client completed a write to an RW logical register.
    using WriteHandler = std::function<void(uint16_t address, const RegisterValue& value)>;

    /**
     * @brief Adds (or replaces) a logical register, initialised to zero.
     */
    void defineRegister(uint16_t address, RegisterType type, RegisterAccess access);

    /**
     * @brief Drops every logical register starting in [first, first + count).
     */
    void removeRange(uint16_t first, size_t count);

    /**
     * @brief Gets the value of a single 16-bit Modbus register.
     * @return True if the address is mapped.
     */
    bool getRegisterValue(uint16_t address, uint16_t& value);

    /**
     * @brief Sets a single 16-bit Modbus register on behalf of a client.
     * @return True if the address is mapped and writable.
     */
    bool setRegisterValue(uint16_t address, uint16_t value);

    std::optional<RegisterValue> getLogicalValue(uint16_t address);

    /**
     * @brief Sets a logical register, converting the value to its type. Unknown addresses are ignored.
     */
    void setLogicalValue(uint16_t address, const RegisterValue& value);

    void setWriteHandler(WriteHandler handler);

    size_t size();

private:
    void storeWords(const Register& reg);

    std::mutex data_mutex;
    std::map<uint16_t, Register> logical_register_map;
    std::unordered_map<uint16_t, uint16_t> modbus_register_map;
    WriteHandler write_handler;
};

#endif // REGISTER_MAP_H
