#ifndef RECORD_STORE_H
#define RECORD_STORE_H

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

/**
 * @struct InstanceRecord
 * @brief Everything needed to recreate a simulated instance.
 */
struct InstanceRecord {
    std::string class_name;
    YAML::Node args; ///< Opaque construction arguments, a sequence.
};

/**
 * @class RecordStore
 * @brief Durable key-value store of instance records, keyed by instance id.
 *
 * Records are grouped by class name. Every failure is reported as StoreError.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    /**
     * @brief Ids of all stored records, sorted.
     */
    virtual std::vector<std::string> keys() = 0;

    /**
     * @brief Reads one record.
     * @throw RecordNotFoundError if no record is stored under id.
     */
    virtual InstanceRecord getItem(const std::string& id) = 0;

    /**
     * @brief Inserts or replaces the record of id, in the folder of its class.
     */
    virtual void setItem(const std::string& id, const InstanceRecord& record) = 0;

    /**
     * @brief Removes the record of id. Removing an absent id is not an error.
     */
    virtual void removeItem(const std::string& id) = 0;
};

/**
 * @class InMemoryRecordStore
 * @brief Volatile store for running without persistence.
 */
class InMemoryRecordStore : public RecordStore {
public:
    std::vector<std::string> keys() override;
    InstanceRecord getItem(const std::string& id) override;
    void setItem(const std::string& id, const InstanceRecord& record) override;
    void removeItem(const std::string& id) override;

private:
    std::mutex store_mutex;
    std::map<std::string, InstanceRecord> records;
};

#endif // RECORD_STORE_H
