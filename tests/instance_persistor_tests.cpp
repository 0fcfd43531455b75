/*
Instance persistor tests: lifecycle mirroring, bounded restore, purge of broken records.
*/
#include "file_record_store.hpp"
#include "instance_persistor.hpp"
#include "silo_simulator.hpp"
#include "simulation_classes.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static PersistorOptions fastRetries(int attempts)
{
    PersistorOptions options;
    options.max_restore_attempts = attempts;
    options.retry_backoff = 0ms;
    return options;
}

static void registerTestClasses(InstanceRegistry& registry, int* broken_calls = nullptr)
{
    registry.registerClass("Counter", [](const YAML::Node&) {
        auto instance = std::make_shared<CountingInstance>(true);
        instance->start();
        return instance;
    });
    registry.registerClass("Broken", [broken_calls](const YAML::Node&) -> std::shared_ptr<SimulatedInstance> {
        if (broken_calls) ++*broken_calls;
        throw std::runtime_error("cannot build");
    });
}

static InstanceRecord record(const std::string& class_name)
{
    return InstanceRecord{class_name, YAML::Load("[]")};
}

static bool contains(const std::vector<std::string>& ids, const std::string& id)
{
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

static int test_lifecycle_is_mirrored()
{
    InstanceRegistry registry;
    registerTestClasses(registry);
    auto store = std::make_shared<InMemoryRecordStore>();
    InstancePersistor persistor(registry, store, fastRetries(10));
    EXPECT(persistor.attach(), "attach");
    EXPECT(persistor.attach(), "attach is idempotent");

    std::string id = registry.create("Counter", YAML::Load("[{label: first}]"));
    InstanceRecord stored = store->getItem(id);
    EXPECT(stored.class_name == "Counter", "created instance recorded with its class");
    EXPECT(stored.args[0]["label"].as<std::string>() == "first", "created instance recorded with its args");

    auto counter = std::dynamic_pointer_cast<CountingInstance>(registry.get(id));
    EXPECT(counter != nullptr, "instance available");
    YAML::Node data;
    data["label"] = "second";
    counter->announce(data);
    stored = store->getItem(id);
    EXPECT(stored.args.IsSequence() && stored.args.size() == 1, "update stored as one element sequence");
    EXPECT(stored.args[0]["label"].as<std::string>() == "second", "update replaced args");

    registry.remove(id);
    EXPECT(store->keys().empty(), "deleted instance forgotten by the store");

    // A late update from the removed instance must not resurrect the record.
    counter->announce(data);
    EXPECT(store->keys().empty(), "no update subscription after delete");
    return 0;
}

static int test_detach_stops_mirroring()
{
    InstanceRegistry registry;
    registerTestClasses(registry);
    auto store = std::make_shared<InMemoryRecordStore>();
    InstancePersistor persistor(registry, store, fastRetries(10));
    EXPECT(persistor.attach(), "attach");

    std::string id = registry.create("Counter", YAML::Load("[]"));
    persistor.detach();
    EXPECT(!persistor.isAttached(), "detached");

    registry.create("Counter", YAML::Load("[]"));
    EXPECT(store->keys().size() == 1, "creation after detach not recorded");
    registry.remove(id);
    EXPECT(store->keys().size() == 1, "deletion after detach not recorded");
    return 0;
}

static int test_store_failures_do_not_reach_registry()
{
    InstanceRegistry registry;
    registerTestClasses(registry);
    auto store = std::make_shared<FlakyRecordStore>();
    store->fail_writes = true;
    InstancePersistor persistor(registry, store, fastRetries(10));
    EXPECT(persistor.attach(), "attach");

    std::string id = registry.create("Counter", YAML::Load("[]"));
    EXPECT(registry.contains(id), "instance created although the store failed");
    EXPECT(registry.get(id)->isRunning(), "instance runs unpersisted");
    EXPECT(store->writes == 1, "one write attempted");

    store->fail_remove.insert(id);
    registry.remove(id);
    EXPECT(!registry.contains(id), "instance removed although the store failed");
    return 0;
}

static int test_restore_recreates_valid_and_purges_broken()
{
    InstanceRegistry registry;
    int broken_calls = 0;
    registerTestClasses(registry, &broken_calls);
    auto store = std::make_shared<InMemoryRecordStore>();
    store->setItem("counter-1", record("Counter"));
    store->setItem("broken-1", record("Broken"));
    store->setItem("counter-2", record("Counter"));
    store->setItem("broken-2", record("Broken"));
    store->setItem("counter-3", record("Counter"));
    store->setItem("ghost-1", record("Unregistered"));

    InstancePersistor persistor(registry, store, fastRetries(10));
    RestoreReport report = persistor.restore();

    EXPECT(persistor.isAttached(), "restore attaches the event side");
    EXPECT(report.restored.size() == 3, "every valid record recreated");
    EXPECT(registry.size() == 3, "registry holds the valid instances");
    for (const auto& id : {"counter-1", "counter-2", "counter-3"}) {
        EXPECT(registry.contains(id), "valid id restored");
        EXPECT(registry.get(id)->isRunning(), "restored instance running");
    }

    EXPECT(report.purged.size() == 3, "broken records purged");
    EXPECT(contains(report.purged, "broken-1") && contains(report.purged, "broken-2") &&
           contains(report.purged, "ghost-1"), "purged ids reported");
    EXPECT(report.purge_failed.empty(), "no purge failures");
    EXPECT(report.failed_attempts == 11, "restore stops once the attempt budget is exceeded");
    EXPECT(broken_calls < 11, "broken factory retried a bounded number of times");

    std::vector<std::string> left = store->keys();
    EXPECT(left.size() == 3, "only valid records remain stored");
    EXPECT(!contains(left, "broken-1") && !contains(left, "ghost-1"), "broken records gone");
    return 0;
}

static int test_restore_with_as_many_broken_records_as_attempts()
{
    InstanceRegistry registry;
    registerTestClasses(registry);
    auto store = std::make_shared<InMemoryRecordStore>();
    for (int i = 0; i < 10; ++i) {
        store->setItem("broken-" + std::to_string(i), record("Broken"));
    }
    store->setItem("counter-1", record("Counter"));
    store->setItem("counter-2", record("Counter"));

    InstancePersistor persistor(registry, store, fastRetries(10));
    RestoreReport report = persistor.restore();

    EXPECT(report.restored.size() == 2, "valid records restored after a full round of failures");
    EXPECT(registry.contains("counter-1") && registry.contains("counter-2"), "valid instances live");
    EXPECT(report.purged.size() == 10, "every broken record purged");
    for (int i = 0; i < 10; ++i) {
        EXPECT(contains(report.purged, "broken-" + std::to_string(i)), "broken id purged");
    }
    EXPECT(report.failed_attempts == 11, "attempt budget exhausted");

    std::vector<std::string> left = store->keys();
    EXPECT(left.size() == 2 && left[0] == "counter-1" && left[1] == "counter-2", "only valid records stored");
    return 0;
}

static int test_restore_with_zero_budget()
{
    InstanceRegistry registry;
    registerTestClasses(registry);
    auto store = std::make_shared<InMemoryRecordStore>();
    store->setItem("a-counter", record("Counter"));
    store->setItem("b-broken", record("Broken"));

    InstancePersistor persistor(registry, store, fastRetries(0));
    RestoreReport report = persistor.restore();
    EXPECT(report.restored.size() == 1 && report.restored[0] == "a-counter", "valid record restored");
    EXPECT(report.purged.size() == 1 && report.purged[0] == "b-broken", "first failure is final");
    EXPECT(report.failed_attempts == 1, "one failed attempt");
    return 0;
}

static int test_purge_failure_is_collected()
{
    InstanceRegistry registry;
    registerTestClasses(registry);
    auto store = std::make_shared<FlakyRecordStore>();
    store->inner.setItem("broken-1", record("Broken"));
    store->inner.setItem("broken-2", record("Broken"));
    store->inner.setItem("broken-3", record("Broken"));
    store->fail_remove.insert("broken-2");

    InstancePersistor persistor(registry, store, fastRetries(4));
    RestoreReport report = persistor.restore();

    EXPECT(report.restored.empty(), "nothing restorable");
    EXPECT(report.purge_failed.size() == 1 && report.purge_failed[0] == "broken-2", "failed purge reported");
    EXPECT(report.purged.size() == 2, "remaining broken records still purged");
    std::vector<std::string> left = store->inner.keys();
    EXPECT(left.size() == 1 && left[0] == "broken-2", "only the undeletable record remains");
    return 0;
}

static int test_restore_tolerates_store_and_registry_state()
{
    InstanceRegistry registry;
    registerTestClasses(registry);
    auto store = std::make_shared<FlakyRecordStore>();
    store->inner.setItem("counter-1", record("Counter"));
    store->fail_keys = true;

    InstancePersistor persistor(registry, store, fastRetries(10));
    RestoreReport report = persistor.restore();
    EXPECT(report.restored.empty() && report.purged.empty(), "unlistable store restores nothing");
    EXPECT(registry.size() == 0, "no instances");

    // Live before restore: counted as restored, not recreated twice.
    store->fail_keys = false;
    registry.recreate("counter-1", "Counter", YAML::Load("[]"));
    report = persistor.restore();
    EXPECT(report.restored.size() == 1 && report.restored[0] == "counter-1", "live id counts as restored");
    EXPECT(report.failed_attempts == 0, "no failures");
    EXPECT(registry.size() == 1, "no duplicate instance");
    return 0;
}

static int test_restore_from_disk()
{
    TempDirectory dir;
    std::string id;
    {
        InstanceRegistry registry;
        registerSimulationClasses(registry, 1000ms);
        InstancePersistor persistor(registry, std::make_shared<FileRecordStore>(dir.path()), fastRetries(10));
        EXPECT(persistor.attach(), "attach");
        id = registry.create("SiloSimulator", YAML::Load("[{capacity: 40, timeToEmpty: 20}]"));
        persistor.detach();
    }

    InstanceRegistry registry;
    registerSimulationClasses(registry, 1000ms);
    InstancePersistor persistor(registry, std::make_shared<FileRecordStore>(dir.path()), fastRetries(10));
    RestoreReport report = persistor.restore();
    EXPECT(report.restored.size() == 1 && report.restored[0] == id, "silo restored under its id");

    auto silo = std::dynamic_pointer_cast<SiloSimulator>(registry.get(id));
    EXPECT(silo != nullptr, "restored as a silo");
    EXPECT(silo->capacity() == 40, "construction args restored");
    EXPECT(silo->isRunning(), "restored silo running");
    return 0;
}

int main(void)
{
    quietLogs();
    if (test_lifecycle_is_mirrored() != 0) return 1;
    if (test_detach_stops_mirroring() != 0) return 1;
    if (test_store_failures_do_not_reach_registry() != 0) return 1;
    if (test_restore_recreates_valid_and_purges_broken() != 0) return 1;
    if (test_restore_with_as_many_broken_records_as_attempts() != 0) return 1;
    if (test_restore_with_zero_budget() != 0) return 1;
    if (test_purge_failure_is_collected() != 0) return 1;
    if (test_restore_tolerates_store_and_registry_state() != 0) return 1;
    if (test_restore_from_disk() != 0) return 1;
    return 0;
}
