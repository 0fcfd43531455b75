#include "record_store.hpp"
#include "sim_errors.hpp"

std::vector<std::string> InMemoryRecordStore::keys() {
    std::lock_guard<std::mutex> lock(store_mutex);
    std::vector<std::string> ids;
    for (const auto& pair : records) {
        ids.push_back(pair.first);
    }
    return ids;
}

InstanceRecord InMemoryRecordStore::getItem(const std::string& id) {
    std::lock_guard<std::mutex> lock(store_mutex);
    auto it = records.find(id);
    if (it == records.end()) {
        throw RecordNotFoundError(id);
    }
    return InstanceRecord{it->second.class_name, YAML::Clone(it->second.args)};
}

void InMemoryRecordStore::setItem(const std::string& id, const InstanceRecord& record) {
    std::lock_guard<std::mutex> lock(store_mutex);
    // Clone so later changes to the caller's node do not leak into the store.
    records[id] = InstanceRecord{record.class_name, YAML::Clone(record.args)};
}

void InMemoryRecordStore::removeItem(const std::string& id) {
    std::lock_guard<std::mutex> lock(store_mutex);
    records.erase(id);
}
