#include "instance_persistor.hpp"
#include "sim_errors.hpp"
#include "log.hpp"
#include <exception>
#include <thread>

namespace {

const char* kModule = "persistor";

std::string describe(const std::string& id, const std::string& class_name) {
    return id + " (" + class_name + ")";
}

} // namespace

InstancePersistor::InstancePersistor(InstanceRegistry& reg, std::shared_ptr<RecordStore> record_store,
                                     PersistorOptions opts)
    : registry(reg), store(std::move(record_store)), options(opts),
      attached(false), created_listener(0), deleted_listener(0) {}

InstancePersistor::~InstancePersistor() {
    detach();
}

bool InstancePersistor::attach() {
    std::lock_guard<std::mutex> lock(subscription_mutex);
    if (attached) return true;

    try {
        created_listener = registry.addCreatedListener(
            [this](const std::string& id, const std::string& class_name, const YAML::Node& args) {
                onCreated(id, class_name, args);
            });
        deleted_listener = registry.addDeletedListener(
            [this](const std::string& id, const std::string& class_name) {
                onDeleted(id, class_name);
            });
    } catch (const std::exception& e) {
        if (created_listener != 0) {
            registry.removeListener(created_listener);
            created_listener = 0;
        }
        logError(kModule, std::string("Could not initialize persist-layer because: ") + e.what());
        return false;
    }

    attached = true;
    return true;
}

void InstancePersistor::detach() {
    std::lock_guard<std::mutex> lock(subscription_mutex);
    if (!attached) return;

    registry.removeListener(created_listener);
    registry.removeListener(deleted_listener);
    created_listener = 0;
    deleted_listener = 0;

    for (auto& pair : update_subscriptions) {
        if (auto instance = pair.second.first.lock()) {
            instance->removeUpdateListener(pair.second.second);
        }
    }
    update_subscriptions.clear();
    attached = false;
}

bool InstancePersistor::isAttached() const {
    std::lock_guard<std::mutex> lock(subscription_mutex);
    return attached;
}

void InstancePersistor::persist(const std::string& id, const std::string& class_name, const YAML::Node& args) {
    store->setItem(id, InstanceRecord{class_name, args});
}

void InstancePersistor::onCreated(const std::string& id, const std::string& class_name, const YAML::Node& args) {
    logInfo(kModule, "Persisting new instance: " + describe(id, class_name));
    try {
        persist(id, class_name, args);
    } catch (const std::exception& e) {
        logWarn(kModule, "Failed persisting new instance " + describe(id, class_name) + ", because " + e.what());
    }

    auto instance = registry.get(id);
    if (!instance || !instance->emitsUpdates()) return;

    std::lock_guard<std::mutex> lock(subscription_mutex);
    if (!attached) return;
    ListenerId listener = instance->addUpdateListener([this, id, class_name](const YAML::Node& data) {
        onUpdated(id, class_name, data);
    });
    update_subscriptions[id] = std::make_pair(std::weak_ptr<SimulatedInstance>(instance), listener);
}

void InstancePersistor::onUpdated(const std::string& id, const std::string& class_name, const YAML::Node& data) {
    logInfo(kModule, "Persisting update for: " + describe(id, class_name));
    YAML::Node args(YAML::NodeType::Sequence);
    args.push_back(YAML::Clone(data));
    try {
        persist(id, class_name, args);
    } catch (const std::exception& e) {
        logWarn(kModule, "Failed persisting update of " + describe(id, class_name) + ", because " + e.what());
    }
}

void InstancePersistor::onDeleted(const std::string& id, const std::string& class_name) {
    logInfo(kModule, "Deleting persisted instance: " + describe(id, class_name));
    {
        std::lock_guard<std::mutex> lock(subscription_mutex);
        auto it = update_subscriptions.find(id);
        if (it != update_subscriptions.end()) {
            if (auto instance = it->second.first.lock()) {
                instance->removeUpdateListener(it->second.second);
            }
            update_subscriptions.erase(it);
        }
    }

    try {
        store->removeItem(id);
    } catch (const std::exception& e) {
        logWarn(kModule, "Failed deleting persisted instance " + describe(id, class_name) + ", because " + e.what());
    }
}

RestoreReport InstancePersistor::restore() {
    RestoreReport report;
    attach();

    std::vector<std::string> queue;
    try {
        queue = store->keys();
    } catch (const std::exception& e) {
        logError(kModule, std::string("Could not list persisted instances: ") + e.what());
        return report;
    }
    logInfo(kModule, "Restoring " + std::to_string(queue.size()) + " persisted instance(s)");

    // Failed ids are appended again; [head, queue.size()) is the pending work.
    size_t head = 0;
    while (head < queue.size() && report.failed_attempts <= options.max_restore_attempts) {
        const std::string id = queue[head++];
        std::string class_name = "unknown class";
        try {
            if (registry.contains(id)) {
                report.restored.push_back(id);
                continue;
            }
            InstanceRecord record = store->getItem(id);
            class_name = record.class_name;
            logInfo(kModule, "Restoring persisted instance: " + describe(id, class_name));
            registry.recreate(id, record.class_name, record.args);
            report.restored.push_back(id);
        } catch (const RecordNotFoundError&) {
            logInfo(kModule, "Persisted instance " + id + " disappeared before it could be restored");
        } catch (const std::exception& e) {
            ++report.failed_attempts;
            logWarn(kModule, "Failed to restore persisted instance: " + describe(id, class_name) +
                                 " because: " + e.what());
            if (report.failed_attempts <= options.max_restore_attempts) {
                std::this_thread::sleep_for(options.retry_backoff);
            }
            queue.push_back(id);
        }
    }

    std::vector<std::string> broken(queue.begin() + static_cast<std::ptrdiff_t>(head), queue.end());
    purge(broken, report);

    logInfo(kModule, "Restore finished: " + std::to_string(report.restored.size()) + " restored, " +
                         std::to_string(report.purged.size()) + " purged");
    return report;
}

void InstancePersistor::purge(const std::vector<std::string>& ids, RestoreReport& report) {
    for (const auto& id : ids) {
        logWarn(kModule, "Giving up on persisted instance " + id + ", deleting its record");
        try {
            store->removeItem(id);
            report.purged.push_back(id);
        } catch (const std::exception& e) {
            logWarn(kModule, "Could not delete broken record " + id + ": " + e.what());
            report.purge_failed.push_back(id);
        }
    }
}
