/*
Record store tests: file layout, upsert, idempotent removal, reopen.
*/
#include "file_record_store.hpp"
#include "record_store.hpp"
#include "test_support.hpp"

#include <fstream>

namespace fs = std::filesystem;

static InstanceRecord siloRecord(int capacity)
{
    InstanceRecord record;
    record.class_name = "Silo";
    record.args = YAML::Load("[{capacity: " + std::to_string(capacity) + "}]");
    return record;
}

static int test_round_trip()
{
    TempDirectory dir;
    FileRecordStore store(dir.path());

    store.setItem("silo-1", siloRecord(50));
    InstanceRecord read = store.getItem("silo-1");
    EXPECT(read.class_name == "Silo", "class name round trips");
    EXPECT(read.args.IsSequence() && read.args.size() == 1, "args stay a sequence");
    EXPECT(read.args[0]["capacity"].as<int>() == 50, "args round trip");
    EXPECT(store.directory() == dir.path(), "store rooted at its directory");
    EXPECT(fs::exists(dir.path() / "Silo" / "silo-1.yaml"), "record grouped in class folder");
    return 0;
}

static int test_upsert_and_keys()
{
    TempDirectory dir;
    FileRecordStore store(dir.path());

    store.setItem("b", siloRecord(10));
    store.setItem("a", siloRecord(20));
    store.setItem("b", siloRecord(30));

    std::vector<std::string> keys = store.keys();
    EXPECT(keys.size() == 2, "upsert does not duplicate ids");
    EXPECT(keys[0] == "a" && keys[1] == "b", "keys sorted");
    EXPECT(store.getItem("b").args[0]["capacity"].as<int>() == 30, "latest write wins");

    InstanceRecord moved;
    moved.class_name = "Meter";
    moved.args = YAML::Load("[{power: 1, gas: 2, water: 3}]");
    store.setItem("b", moved);
    EXPECT(store.keys().size() == 2, "class change keeps one record per id");
    EXPECT(!fs::exists(dir.path() / "Silo" / "b.yaml"), "old class folder cleaned");
    EXPECT(store.getItem("b").class_name == "Meter", "record moved");
    return 0;
}

static int test_remove_is_idempotent()
{
    TempDirectory dir;
    FileRecordStore store(dir.path());
    store.setItem("gone", siloRecord(1));

    store.removeItem("gone");
    store.removeItem("gone");
    store.removeItem("never-there");
    EXPECT(store.keys().empty(), "record removed");

    bool not_found = false;
    try {
        store.getItem("gone");
    } catch (const RecordNotFoundError& e) {
        not_found = e.id() == "gone";
    }
    EXPECT(not_found, "reading a removed record fails with not found");
    return 0;
}

static int test_reopen_finds_records()
{
    TempDirectory dir;
    {
        FileRecordStore store(dir.path());
        store.setItem("silo-1", siloRecord(50));
        InstanceRecord empty_args;
        empty_args.class_name = "Silo";
        store.setItem("silo-2", empty_args);
    }
    // Leftover of an interrupted write.
    std::ofstream(dir.path() / "Silo" / ".silo-3.yaml.tmp") << "className: Silo\n";

    FileRecordStore reopened(dir.path());
    std::vector<std::string> keys = reopened.keys();
    EXPECT(keys.size() == 2, "records survive reopening, temp files ignored");
    InstanceRecord second = reopened.getItem("silo-2");
    EXPECT(second.args.IsSequence() && second.args.size() == 0, "missing args read back as empty sequence");
    return 0;
}

static int test_rejects_unsafe_names_and_bad_files()
{
    TempDirectory dir;
    FileRecordStore store(dir.path());

    bool thrown = false;
    try {
        store.setItem("../escape", siloRecord(1));
    } catch (const StoreError&) {
        thrown = true;
    }
    EXPECT(thrown, "path separators refused in ids");

    thrown = false;
    try {
        store.setItem("", siloRecord(1));
    } catch (const StoreError&) {
        thrown = true;
    }
    EXPECT(thrown, "empty id refused");

    fs::create_directories(dir.path() / "Silo");
    std::ofstream(dir.path() / "Silo" / "corrupt.yaml") << "className: [unterminated\n";
    FileRecordStore reopened(dir.path());
    thrown = false;
    try {
        reopened.getItem("corrupt");
    } catch (const RecordNotFoundError&) {
        thrown = false;
    } catch (const StoreError&) {
        thrown = true;
    }
    EXPECT(thrown, "corrupt record reported as store error");
    return 0;
}

static int test_in_memory_store()
{
    InMemoryRecordStore store;
    InstanceRecord record = siloRecord(5);
    store.setItem("x", record);
    record.args[0]["capacity"] = 99;
    EXPECT(store.getItem("x").args[0]["capacity"].as<int>() == 5, "stored copy independent of caller");
    store.removeItem("x");
    store.removeItem("x");
    EXPECT(store.keys().empty(), "removed");

    bool thrown = false;
    try {
        store.getItem("x");
    } catch (const RecordNotFoundError&) {
        thrown = true;
    }
    EXPECT(thrown, "not found");
    return 0;
}

int main(void)
{
    quietLogs();
    if (test_round_trip() != 0) return 1;
    if (test_upsert_and_keys() != 0) return 1;
    if (test_remove_is_idempotent() != 0) return 1;
    if (test_reopen_finds_records() != 0) return 1;
    if (test_rejects_unsafe_names_and_bad_files() != 0) return 1;
    if (test_in_memory_store() != 0) return 1;
    return 0;
}
