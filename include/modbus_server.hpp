#ifndef MODBUS_SERVER_H
#define MODBUS_SERVER_H

#include "register_map.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <modbus/modbus.h>

/**
 * @class ModbusServer
 * @brief Handles Modbus TCP communication in a dedicated thread.
 *
 * This class uses libmodbus to create a Modbus TCP server. It listens for
 * client requests, reads and writes the RegisterMap, and sends responses
 * back to the client. One client is served at a time.
 */
class ModbusServer {
public:
    /**
     * @brief Constructor for the ModbusServer.
     * @param register_map A shared pointer to the thread-safe register map.
     * @param unit_id The Modbus unit ID for the server.
     */
    ModbusServer(std::shared_ptr<RegisterMap> register_map, int unit_id);

    /**
     * @brief Destructor, ensures the server is stopped.
     */
    ~ModbusServer();

    /**
     * @brief Starts the Modbus server listening loop in a new thread.
     * @param address The IPv4 address to bind.
     * @param port The TCP port to listen on.
     * @return True on success, false on failure.
     */
    bool start(const std::string& address, int port);

    /**
     * @brief Stops the Modbus server.
     */
    void stop();

    /// Client protocol address to register map address: 0..9999 -> 3xxxx, 10000..19999 -> 4xxxx.
    static uint16_t protocolToInternal(uint16_t protocol_addr);

private:
    /**
     * @brief The main loop of the Modbus server thread.
     */
    void run();

    bool fillReadRequest(uint16_t* table, int addr, int nb);
    bool applyWriteRequest(const uint8_t* query, int header_length, int function_code, int addr, int nb);

    std::shared_ptr<RegisterMap> register_map;
    int unit_id;
    int port;
    modbus_t *ctx;
    modbus_mapping_t *mb_mapping;
    std::thread server_thread;
    std::atomic<bool> running;
    int server_socket;
};

#endif // MODBUS_SERVER_H
