#include "modbus_server.hpp"
#include "log.hpp"
#include <cerrno>
#include <unistd.h>
#include <sys/socket.h>

namespace {

const char* kModule = "modbus";

} // namespace

ModbusServer::ModbusServer(std::shared_ptr<RegisterMap> model, int id)
    : register_map(model), unit_id(id), port(0), ctx(nullptr), mb_mapping(nullptr), running(false), server_socket(-1) {}

ModbusServer::~ModbusServer() {
    stop();
}

bool ModbusServer::start(const std::string& address, int p) {
    if (running) return true;
    port = p;

    ctx = modbus_new_tcp(address.c_str(), port);
    if (ctx == nullptr) {
        logError(kModule, std::string("Failed to create modbus context: ") + modbus_strerror(errno));
        return false;
    }

    // Holding and input tables both cover the whole 16-bit protocol address space
    mb_mapping = modbus_mapping_new(0, 0, 65536, 65536);
    if (mb_mapping == nullptr) {
        logError(kModule, std::string("Failed to allocate modbus mapping: ") + modbus_strerror(errno));
        modbus_free(ctx);
        ctx = nullptr;
        return false;
    }

    modbus_set_slave(ctx, unit_id);

    server_socket = modbus_tcp_listen(ctx, 1);
    if (server_socket == -1) {
        logError(kModule, "Unable to listen on TCP port " + std::to_string(port) + ": " + modbus_strerror(errno));
        modbus_free(ctx);
        ctx = nullptr;
        modbus_mapping_free(mb_mapping);
        mb_mapping = nullptr;
        return false;
    }

    running = true;
    server_thread = std::thread(&ModbusServer::run, this);
    logInfo(kModule, "Modbus TCP server listening on " + address + ":" + std::to_string(port));
    return true;
}

void ModbusServer::stop() {
    if (!running) return;
    running = false;

    if (server_socket != -1) {
        shutdown(server_socket, SHUT_RDWR);
        close(server_socket);
        server_socket = -1;
    }
    if (ctx) {
        // Unblocks a pending modbus_receive on the client connection
        modbus_close(ctx);
    }

    if (server_thread.joinable()) {
        server_thread.join();
    }

    if (ctx) {
        modbus_free(ctx);
        ctx = nullptr;
    }
    if (mb_mapping) {
        modbus_mapping_free(mb_mapping);
        mb_mapping = nullptr;
    }
}

uint16_t ModbusServer::protocolToInternal(uint16_t protocol_addr) {
    // Instances are published at 3xxxx (telemetry) and 4xxxx (control);
    // clients address them 0-based within 0..19999.
    if (protocol_addr < 20000) {
        return static_cast<uint16_t>(protocol_addr + 30000);
    }
    return protocol_addr;
}

bool ModbusServer::fillReadRequest(uint16_t* table, int addr, int nb) {
    for (int i = 0; i < nb; ++i) {
        uint16_t value;
        uint16_t internal_addr = protocolToInternal(static_cast<uint16_t>(addr + i));
        if (!register_map->getRegisterValue(internal_addr, value)) {
            logDebug(kModule, "Internal register " + std::to_string(internal_addr) + " not found");
            return false;
        }
        table[addr + i] = value;
    }
    return true;
}

bool ModbusServer::applyWriteRequest(const uint8_t* query, int header_length, int function_code, int addr, int nb) {
    if (function_code == MODBUS_FC_WRITE_SINGLE_REGISTER) {
        uint16_t value = (query[header_length + 3] << 8) | query[header_length + 4];
        return register_map->setRegisterValue(protocolToInternal(static_cast<uint16_t>(addr)), value);
    }

    // Write Multiple Registers: function, address, count, byte count, values
    bool all_written = true;
    for (int i = 0; i < nb; ++i) {
        int offset = header_length + 6 + i * 2;
        uint16_t value = (query[offset] << 8) | query[offset + 1];
        if (!register_map->setRegisterValue(protocolToInternal(static_cast<uint16_t>(addr + i)), value)) {
            all_written = false;
        }
    }
    return all_written;
}

void ModbusServer::run() {
    logInfo(kModule, "Modbus server thread started.");
    uint8_t query[MODBUS_TCP_MAX_ADU_LENGTH];
    int header_length = modbus_get_header_length(ctx);

    while (running) {
        int rc = modbus_tcp_accept(ctx, &server_socket);
        if (rc == -1) {
            if (running) {
                logWarn(kModule, std::string("Modbus accept failed: ") + modbus_strerror(errno));
            }
            continue;
        }

        logInfo(kModule, "Client connected");

        while (running) {
            rc = modbus_receive(ctx, query);
            if (rc > 0) {
                int function_code = query[header_length];
                int addr = (query[header_length + 1] << 8) | query[header_length + 2];
                int nb = (query[header_length + 3] << 8) | query[header_length + 4];
                logDebug(kModule, "Received function " + std::to_string(function_code) + " for protocol addr " +
                                      std::to_string(addr) + " nb " + std::to_string(nb));

                bool valid = true;
                if (function_code == MODBUS_FC_READ_HOLDING_REGISTERS) {
                    valid = fillReadRequest(mb_mapping->tab_registers, addr, nb);
                } else if (function_code == MODBUS_FC_READ_INPUT_REGISTERS) {
                    valid = fillReadRequest(mb_mapping->tab_input_registers, addr, nb);
                } else if (function_code == MODBUS_FC_WRITE_SINGLE_REGISTER ||
                           function_code == MODBUS_FC_WRITE_MULTIPLE_REGISTERS) {
                    valid = applyWriteRequest(query, header_length, function_code, addr, nb);
                }

                if (!valid) {
                    // Send exception response for illegal data address
                    modbus_reply_exception(ctx, query, MODBUS_EXCEPTION_ILLEGAL_DATA_ADDRESS);
                    continue;
                }
                modbus_reply(ctx, query, rc, mb_mapping);
            } else if (rc == -1) {
                logInfo(kModule, "Client disconnected");
                break;
            }
        }
        modbus_close(ctx);
    }
    logInfo(kModule, "Modbus server thread stopped.");
}
