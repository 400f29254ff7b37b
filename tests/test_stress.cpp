#include <gtest/gtest.h>
#include "test_fixtures.hpp"
#include "key_lookup.hpp"
#include "entry_mutator.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

using namespace strongbox;
using namespace strongbox::testing;

class StressTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        AuditLogger::set_enabled(false);
        config.key_iterations = 1000;
        config.safe_iterations = 1000;
        config.mac_iterations = 1000;
        config.audit_logging = false;
    }

    void TearDown() override {
        AuditLogger::set_enabled(true);
        TempDirTest::TearDown();
    }

    StoreConfig config;
};

TEST_F(StressTest, ConcurrentLookupsDuringWrites) {
    auto container = KeyStoreContainer::create(path_for("store.p12"), "storepass", config);
    Certificate cert = make_self_signed(rsa_key_a(), "alice");
    add_entry(*container, "alice", cert, rsa_key_a());

    const int num_readers = 4;
    const int lookups_per_reader = 25;
    std::atomic<int> hits{0};
    std::atomic<bool> writer_done{false};

    auto reader = [&]() {
        for (int i = 0; i < lookups_per_reader; ++i) {
            auto key = find_private_key(*container, cert.public_key(), "storepass");
            if (key && *key == rsa_key_a()) hits++;
        }
    };

    // The writer never touches "alice", so every lookup must hit.
    auto writer = [&]() {
        Certificate other = make_self_signed(dsa_key(), "bob");
        for (int i = 0; i < 10; ++i) {
            add_entry(*container, "bob-" + std::to_string(i), other, dsa_key());
        }
        writer_done = true;
    };

    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    threads.emplace_back(writer);
    for (int i = 0; i < num_readers; ++i) {
        threads.emplace_back(reader);
    }

    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] " << hits << " lookups alongside 10 writes in " << diff.count() << "s" << std::endl;

    EXPECT_TRUE(writer_done);
    EXPECT_EQ(hits, num_readers * lookups_per_reader);
    EXPECT_EQ(container->size(), 11u);
}
