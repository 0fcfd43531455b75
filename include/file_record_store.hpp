#ifndef FILE_RECORD_STORE_H
#define FILE_RECORD_STORE_H

#include "record_store.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

/**
 * @class FileRecordStore
 * @brief Keeps one YAML document per record at <dir>/<class name>/<id>.yaml.
 *
 * Files are replaced through a temporary file and a rename, so a crash never
 * leaves a half-written record behind. The id index is loaded once at
 * construction; the directory is owned by a single process.
 */
class FileRecordStore : public RecordStore {
public:
    /**
     * @brief Opens (and creates if needed) the store directory and indexes its records.
     * @throw StoreError if the directory cannot be created or read.
     */
    explicit FileRecordStore(const std::filesystem::path& directory);

    std::vector<std::string> keys() override;
    InstanceRecord getItem(const std::string& id) override;
    void setItem(const std::string& id, const InstanceRecord& record) override;
    void removeItem(const std::string& id) override;

    const std::filesystem::path& directory() const { return root; }

private:
    std::filesystem::path recordPath(const std::string& class_name, const std::string& id) const;
    void loadIndex();

    std::filesystem::path root;
    std::mutex store_mutex;
    std::map<std::string, std::string> folder_of; // id -> class name
};

#endif // FILE_RECORD_STORE_H
