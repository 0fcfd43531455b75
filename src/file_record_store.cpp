#include "file_record_store.hpp"
#include "sim_errors.hpp"
#include "log.hpp"
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* kRecordExtension = ".yaml";

// Ids and class names become path components.
void checkName(const std::string& what, const std::string& name) {
    if (name.empty() || name[0] == '.' ||
        name.find_first_of("/\\") != std::string::npos || name.find('\0') != std::string::npos) {
        throw StoreError("Invalid " + what + " for a record file name: \"" + name + "\"");
    }
}

std::string emitRecord(const InstanceRecord& record) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "className" << YAML::Value << record.class_name;
    out << YAML::Key << "args" << YAML::Value;
    if (record.args && !record.args.IsNull()) {
        out << record.args;
    } else {
        out << YAML::BeginSeq << YAML::EndSeq;
    }
    out << YAML::EndMap;
    if (!out.good()) {
        throw StoreError("Could not serialize record: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

} // namespace

FileRecordStore::FileRecordStore(const fs::path& directory) : root(directory) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw StoreError("Could not create store directory " + root.string() + ": " + ec.message());
    }
    loadIndex();
}

fs::path FileRecordStore::recordPath(const std::string& class_name, const std::string& id) const {
    return root / class_name / (id + kRecordExtension);
}

void FileRecordStore::loadIndex() {
    std::error_code ec;
    for (fs::directory_iterator folder(root, ec), end; !ec && folder != end; folder.increment(ec)) {
        if (!folder->is_directory()) continue;
        std::string class_name = folder->path().filename().string();

        std::error_code inner_ec;
        for (fs::directory_iterator file(folder->path(), inner_ec), file_end; !inner_ec && file != file_end;
             file.increment(inner_ec)) {
            const fs::path& path = file->path();
            std::string name = path.filename().string();
            if (!file->is_regular_file() || name[0] == '.' || path.extension() != kRecordExtension) continue;

            std::string id = path.stem().string();
            auto inserted = folder_of.emplace(id, class_name);
            if (!inserted.second) {
                logWarn("store", "Record " + id + " found under both " + inserted.first->second + " and " +
                                     class_name + ", keeping " + inserted.first->second);
            }
        }
        if (inner_ec) {
            throw StoreError("Could not read store folder " + folder->path().string() + ": " + inner_ec.message());
        }
    }
    if (ec) {
        throw StoreError("Could not read store directory " + root.string() + ": " + ec.message());
    }
}

std::vector<std::string> FileRecordStore::keys() {
    std::lock_guard<std::mutex> lock(store_mutex);
    std::vector<std::string> ids;
    for (const auto& pair : folder_of) {
        ids.push_back(pair.first);
    }
    return ids;
}

InstanceRecord FileRecordStore::getItem(const std::string& id) {
    std::lock_guard<std::mutex> lock(store_mutex);
    auto it = folder_of.find(id);
    if (it == folder_of.end()) {
        throw RecordNotFoundError(id);
    }

    fs::path path = recordPath(it->second, id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        folder_of.erase(it);
        throw RecordNotFoundError(id);
    }

    YAML::Node document;
    try {
        document = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw StoreError("Could not read record " + path.string() + ": " + e.what());
    }
    if (!document.IsMap() || !document["className"]) {
        throw StoreError("Malformed record " + path.string());
    }

    InstanceRecord record;
    try {
        record.class_name = document["className"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw StoreError("Malformed class name in record " + path.string() + ": " + e.what());
    }
    record.args = document["args"] ? document["args"] : YAML::Node(YAML::NodeType::Sequence);
    return record;
}

void FileRecordStore::setItem(const std::string& id, const InstanceRecord& record) {
    checkName("id", id);
    checkName("class name", record.class_name);
    std::string text = emitRecord(record);

    std::lock_guard<std::mutex> lock(store_mutex);
    fs::path folder = root / record.class_name;
    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        throw StoreError("Could not create folder " + folder.string() + ": " + ec.message());
    }

    fs::path target = recordPath(record.class_name, id);
    fs::path temp = folder / ("." + id + kRecordExtension + ".tmp");
    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc);
        file << text;
        file.flush();
        if (!file) {
            fs::remove(temp, ec);
            throw StoreError("Could not write record " + temp.string());
        }
    }
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw StoreError("Could not replace record " + target.string() + ": " + ec.message());
    }

    auto it = folder_of.find(id);
    if (it != folder_of.end() && it->second != record.class_name) {
        fs::path old_path = recordPath(it->second, id);
        fs::remove(old_path, ec);
        if (ec) {
            logWarn("store", "Could not remove stale record " + old_path.string() + ": " + ec.message());
        }
    }
    folder_of[id] = record.class_name;
}

void FileRecordStore::removeItem(const std::string& id) {
    std::lock_guard<std::mutex> lock(store_mutex);
    auto it = folder_of.find(id);
    if (it == folder_of.end()) return;

    fs::path path = recordPath(it->second, id);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw StoreError("Could not remove record " + path.string() + ": " + ec.message());
    }
    folder_of.erase(it);
}
