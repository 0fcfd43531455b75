#ifndef INSTANCE_REGISTRY_H
#define INSTANCE_REGISTRY_H

#include "simulated_instance.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

/**
 * @class InstanceRegistry
 * @brief Owns every live simulated instance and announces their creation and deletion.
 *
 * Classes are registered by name with a factory building an instance from
 * its opaque construction arguments (a YAML sequence). Lifecycle listeners
 * run on the thread performing the operation, outside the registry lock.
 */
class InstanceRegistry {
public:
    using Factory = std::function<std::shared_ptr<SimulatedInstance>(const YAML::Node& args)>;
    using CreatedListener = std::function<void(const std::string& id, const std::string& class_name,
                                               const YAML::Node& args)>;
    using DeletedListener = std::function<void(const std::string& id, const std::string& class_name)>;

    InstanceRegistry();
    ~InstanceRegistry();

    InstanceRegistry(const InstanceRegistry&) = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    void registerClass(const std::string& class_name, Factory factory);
    bool hasClass(const std::string& class_name) const;

    /**
     * @brief Builds an instance and announces it to the created listeners.
     * @param id Explicit id, or empty to generate "<class_name>-<16 hex digits>".
     * @return The id of the new instance.
     * @throw InstanceError for an unknown class, an id in use, or rejected args.
     */
    std::string create(const std::string& class_name, const YAML::Node& args, const std::string& id = "");

    /**
     * @brief Same as create() with an explicit id, used to bring back persisted instances.
     */
    void recreate(const std::string& id, const std::string& class_name, const YAML::Node& args);

    /**
     * @brief Stops and forgets an instance, then announces it to the deleted listeners.
     * @throw InstanceError if the id is unknown.
     */
    void remove(const std::string& id);

    /**
     * @brief Stops every instance without announcing deletions, for shutdown.
     */
    void removeAll();

    std::shared_ptr<SimulatedInstance> get(const std::string& id) const;
    bool contains(const std::string& id) const;
    std::vector<std::string> ids() const;
    size_t size() const;

    ListenerId addCreatedListener(CreatedListener listener);
    ListenerId addDeletedListener(DeletedListener listener);
    void removeListener(ListenerId id);

private:
    struct Entry {
        std::string class_name;
        std::shared_ptr<SimulatedInstance> instance;
    };

    std::string generateId(const std::string& class_name);

    mutable std::mutex registry_mutex;
    std::map<std::string, Factory> factories;
    std::map<std::string, Entry> instances;

    ListenerId next_listener_id;
    std::map<ListenerId, CreatedListener> created_listeners;
    std::map<ListenerId, DeletedListener> deleted_listeners;

    std::mt19937_64 id_rng;
};

#endif // INSTANCE_REGISTRY_H
