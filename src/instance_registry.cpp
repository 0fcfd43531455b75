#include "instance_registry.hpp"
#include "sim_errors.hpp"
#include "log.hpp"
#include <cstdio>
#include <exception>

InstanceRegistry::InstanceRegistry() : next_listener_id(1) {
    std::random_device rd;
    id_rng.seed((static_cast<uint64_t>(rd()) << 32) | rd());
}

InstanceRegistry::~InstanceRegistry() {
    removeAll();
}

void InstanceRegistry::registerClass(const std::string& class_name, Factory factory) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    factories[class_name] = std::move(factory);
}

bool InstanceRegistry::hasClass(const std::string& class_name) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return factories.count(class_name) > 0;
}

std::string InstanceRegistry::generateId(const std::string& class_name) {
    char suffix[17];
    snprintf(suffix, sizeof(suffix), "%016llx", static_cast<unsigned long long>(id_rng()));
    return class_name + "-" + suffix;
}

std::string InstanceRegistry::create(const std::string& class_name, const YAML::Node& args, const std::string& requested_id) {
    Factory factory;
    std::string id = requested_id;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        auto it = factories.find(class_name);
        if (it == factories.end()) {
            throw InstanceError("Unknown class: " + class_name);
        }
        factory = it->second;
        if (id.empty()) {
            do {
                id = generateId(class_name);
            } while (instances.count(id) > 0);
        } else if (instances.count(id) > 0) {
            throw InstanceError("Instance already exists: " + id);
        }
    }

    std::shared_ptr<SimulatedInstance> instance;
    try {
        instance = factory(args);
    } catch (const std::exception& e) {
        throw InstanceError("Could not construct " + class_name + " " + id + ": " + e.what());
    }
    if (!instance) {
        throw InstanceError("Factory of " + class_name + " returned no instance");
    }

    std::vector<CreatedListener> listeners;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        // Another thread may have taken the id while the factory ran.
        if (!instances.emplace(id, Entry{class_name, instance}).second) {
            instance->stop();
            throw InstanceError("Instance already exists: " + id);
        }
        for (const auto& pair : created_listeners) {
            listeners.push_back(pair.second);
        }
    }

    logInfo("registry", "Created instance: " + id + " (" + class_name + ")");
    for (const auto& listener : listeners) {
        try {
            listener(id, class_name, args);
        } catch (const std::exception& e) {
            logWarn("registry", "Created listener failed for " + id + ": " + e.what());
        }
    }
    return id;
}

void InstanceRegistry::recreate(const std::string& id, const std::string& class_name, const YAML::Node& args) {
    if (id.empty()) {
        throw InstanceError("Cannot recreate an instance without id");
    }
    create(class_name, args, id);
}

void InstanceRegistry::remove(const std::string& id) {
    Entry entry;
    std::vector<DeletedListener> listeners;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        auto it = instances.find(id);
        if (it == instances.end()) {
            throw InstanceError("Unknown instance: " + id);
        }
        entry = it->second;
        instances.erase(it);
        for (const auto& pair : deleted_listeners) {
            listeners.push_back(pair.second);
        }
    }

    entry.instance->stop();
    logInfo("registry", "Deleted instance: " + id + " (" + entry.class_name + ")");
    for (const auto& listener : listeners) {
        try {
            listener(id, entry.class_name);
        } catch (const std::exception& e) {
            logWarn("registry", "Deleted listener failed for " + id + ": " + e.what());
        }
    }
}

void InstanceRegistry::removeAll() {
    std::map<std::string, Entry> stopping;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        stopping.swap(instances);
    }
    for (auto& pair : stopping) {
        pair.second.instance->stop();
    }
}

std::shared_ptr<SimulatedInstance> InstanceRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = instances.find(id);
    if (it == instances.end()) return nullptr;
    return it->second.instance;
}

bool InstanceRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return instances.count(id) > 0;
}

std::vector<std::string> InstanceRegistry::ids() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    std::vector<std::string> result;
    for (const auto& pair : instances) {
        result.push_back(pair.first);
    }
    return result;
}

size_t InstanceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return instances.size();
}

ListenerId InstanceRegistry::addCreatedListener(CreatedListener listener) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    ListenerId id = next_listener_id++;
    created_listeners[id] = std::move(listener);
    return id;
}

ListenerId InstanceRegistry::addDeletedListener(DeletedListener listener) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    ListenerId id = next_listener_id++;
    deleted_listeners[id] = std::move(listener);
    return id;
}

void InstanceRegistry::removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    created_listeners.erase(id);
    deleted_listeners.erase(id);
}
