#include "domain/ServiceMachineManager.h"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <future>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common/TestUtils.h"

namespace LSE {

class ServiceMachineManagerThreadSafetyTest : public ::testing::Test {
protected:
    static constexpr int NUM_THREADS = 10;
    static constexpr int OPERATIONS_PER_THREAD = 500;

    LSE::Test::Utils::ManualClock clock_;
};

TEST_F(ServiceMachineManagerThreadSafetyTest, ConcurrentFirstAccessYieldsSingleMachine) {
    ServiceMachineManager manager(clock_.clock());
    std::atomic<bool> startFlag{false};
    std::vector<std::future<ServiceMachine *>> futures;

    for (int i = 0; i < NUM_THREADS; ++i) {
        futures.push_back(std::async(std::launch::async, [&manager, &startFlag]() {
            while (!startFlag.load()) {
                std::this_thread::yield();
            }
            return manager.getOrCreate("shared").get();
        }));
    }

    startFlag.store(true);

    std::set<ServiceMachine *> instances;
    for (auto &future : futures) {
        instances.insert(future.get());
    }

    EXPECT_EQ(instances.size(), 1u);
    EXPECT_EQ(manager.size(), 1u);
    EXPECT_EQ(manager.get("shared").get(), *instances.begin());
}

TEST_F(ServiceMachineManagerThreadSafetyTest, ConcurrentRegistrationOfDistinctIds) {
    ServiceMachineManager manager(clock_.clock());
    std::atomic<bool> startFlag{false};
    std::vector<std::future<int>> futures;

    for (int i = 0; i < NUM_THREADS; ++i) {
        futures.push_back(std::async(std::launch::async, [&manager, &startFlag, i]() {
            while (!startFlag.load()) {
                std::this_thread::yield();
            }

            int created = 0;
            for (int j = 0; j < OPERATIONS_PER_THREAD; ++j) {
                std::string id = "svc_" + std::to_string(i) + "_" + std::to_string(j);
                if (manager.getOrCreate(id)) {
                    created++;
                }
                // Read paths interleaved with writes
                manager.contains(id);
                manager.size();
            }
            return created;
        }));
    }

    startFlag.store(true);

    int total = 0;
    for (auto &future : futures) {
        total += future.get();
    }

    EXPECT_EQ(total, NUM_THREADS * OPERATIONS_PER_THREAD);
    EXPECT_EQ(manager.size(), static_cast<std::size_t>(NUM_THREADS * OPERATIONS_PER_THREAD));
    EXPECT_EQ(manager.getAllStates().size(), static_cast<std::size_t>(NUM_THREADS * OPERATIONS_PER_THREAD));
}

TEST_F(ServiceMachineManagerThreadSafetyTest, RegistryMutationsDuringSnapshotReads) {
    ServiceMachineManager manager(clock_.clock());
    for (int i = 0; i < 100; ++i) {
        manager.getOrCreate("stable_" + std::to_string(i));
    }

    std::atomic<bool> startFlag{false};
    std::atomic<bool> stopFlag{false};

    auto writer = std::async(std::launch::async, [&manager, &startFlag]() {
        while (!startFlag.load()) {
            std::this_thread::yield();
        }
        for (int j = 0; j < OPERATIONS_PER_THREAD; ++j) {
            const std::string id = "transient_" + std::to_string(j);
            manager.getOrCreate(id);
            manager.remove(id);
        }
    });

    auto reader = std::async(std::launch::async, [&manager, &startFlag, &stopFlag]() {
        while (!startFlag.load()) {
            std::this_thread::yield();
        }
        std::size_t minimum = SIZE_MAX;
        while (!stopFlag.load()) {
            const std::size_t seen = manager.getAllStates().size();
            minimum = std::min(minimum, seen);
        }
        return minimum;
    });

    startFlag.store(true);
    writer.get();
    stopFlag.store(true);

    EXPECT_GE(reader.get(), 100u);
    EXPECT_EQ(manager.size(), 100u);
}

}  // namespace LSE
