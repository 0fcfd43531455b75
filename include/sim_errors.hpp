#ifndef SIM_ERRORS_H
#define SIM_ERRORS_H

#include <stdexcept>
#include <string>

/// @brief A consumption channel other than power, gas or water was requested.
class UnknownChannelError : public std::invalid_argument {
public:
    explicit UnknownChannelError(const std::string& channel)
        : std::invalid_argument("Invalid channel \"" + channel + "\". Please use one of: power, gas, water."),
          channel_name(channel) {}

    const std::string& channel() const { return channel_name; }

private:
    std::string channel_name;
};

/// @brief A record store read, write or delete failed.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

/// @brief The requested record id is not in the store.
class RecordNotFoundError : public StoreError {
public:
    explicit RecordNotFoundError(const std::string& id)
        : StoreError("No record stored for id: " + id), record_id(id) {}

    const std::string& id() const { return record_id; }

private:
    std::string record_id;
};

/// @brief The instance registry refused a lifecycle operation.
class InstanceError : public std::runtime_error {
public:
    explicit InstanceError(const std::string& what) : std::runtime_error(what) {}
};

#endif // SIM_ERRORS_H
