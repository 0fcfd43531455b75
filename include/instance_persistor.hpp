#ifndef INSTANCE_PERSISTOR_H
#define INSTANCE_PERSISTOR_H

#include "instance_registry.hpp"
#include "record_store.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @struct PersistorOptions
 * @brief Retry policy of the startup restore.
 */
struct PersistorOptions {
    int max_restore_attempts = 10;                  ///< Failed attempts allowed across the whole restore.
    std::chrono::milliseconds retry_backoff{500};   ///< Pause after each failed attempt.
};

/**
 * @struct RestoreReport
 * @brief Outcome of one restore run.
 */
struct RestoreReport {
    std::vector<std::string> restored;      ///< Recreated (or already live) ids.
    std::vector<std::string> purged;        ///< Broken records deleted from the store.
    std::vector<std::string> purge_failed;  ///< Broken records whose deletion failed.
    int failed_attempts = 0;
};

/**
 * @class InstancePersistor
 * @brief Mirrors the instance registry into a record store and restores it at startup.
 *
 * Creation writes a record, an update replaces its args with [data], deletion
 * removes it. All store failures during these events are logged and never
 * reach the registry. restore() recreates every stored instance, retrying
 * failures up to a global ceiling, and deletes the records that never came back.
 */
class InstancePersistor {
public:
    InstancePersistor(InstanceRegistry& registry, std::shared_ptr<RecordStore> store,
                      PersistorOptions options = PersistorOptions());

    /**
     * @brief Detaches from the registry and every instance.
     */
    ~InstancePersistor();

    InstancePersistor(const InstancePersistor&) = delete;
    InstancePersistor& operator=(const InstancePersistor&) = delete;

    /**
     * @brief Subscribes to the registry lifecycle events. Idempotent.
     * @return False if the subscriptions could not be set up; instances then run unpersisted.
     */
    bool attach();

    /**
     * @brief Removes every subscription made by attach().
     */
    void detach();

    bool isAttached() const;

    /**
     * @brief Recreates all stored instances, then purges the records that could not be.
     *
     * Attaches first, like the event side must be live before instances
     * come back. Never throws; every failure is logged and reported.
     */
    RestoreReport restore();

private:
    void onCreated(const std::string& id, const std::string& class_name, const YAML::Node& args);
    void onUpdated(const std::string& id, const std::string& class_name, const YAML::Node& data);
    void onDeleted(const std::string& id, const std::string& class_name);

    void persist(const std::string& id, const std::string& class_name, const YAML::Node& args);
    void purge(const std::vector<std::string>& ids, RestoreReport& report);

    InstanceRegistry& registry;
    std::shared_ptr<RecordStore> store;
    PersistorOptions options;

    mutable std::mutex subscription_mutex;
    bool attached;
    ListenerId created_listener;
    ListenerId deleted_listener;
    // id -> (instance, update listener id)
    std::map<std::string, std::pair<std::weak_ptr<SimulatedInstance>, ListenerId>> update_subscriptions;
};

#endif // INSTANCE_PERSISTOR_H
