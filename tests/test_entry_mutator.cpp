#include <gtest/gtest.h>
#include "test_fixtures.hpp"
#include "entry_mutator.hpp"
#include "key_lookup.hpp"
#include "errors.hpp"
#include "metrics.hpp"

using namespace strongbox;
using namespace strongbox::testing;

class EntryMutatorTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        MetricsRegistry::instance().reset();
        config.key_iterations = 1000;
        config.safe_iterations = 1000;
        config.mac_iterations = 1000;
        path = path_for("store.p12");
        container = KeyStoreContainer::create(path, "storepass", config);
    }

    std::unique_ptr<KeyStoreContainer> reopen() {
        return KeyStoreContainer::open(path, "storepass", config);
    }

    StoreConfig config;
    std::string path;
    std::unique_ptr<KeyStoreContainer> container;
};

TEST_F(EntryMutatorTest, AddPersistsImmediately) {
    Certificate cert = make_self_signed(rsa_key_a(), "alice");
    add_entry(*container, "alice", cert, rsa_key_a());

    auto fresh = reopen();
    EXPECT_EQ(fresh->aliases(), (std::vector<std::string>{"alice"}));
    auto store = fresh->handle();
    EXPECT_EQ(*store->certificate("alice"), cert);
    EXPECT_EQ(*store->recover_key("alice", "storepass"), rsa_key_a());
}

TEST_F(EntryMutatorTest, AddOverwritesAlias) {
    add_entry(*container, "alice", make_self_signed(rsa_key_a(), "alice"), rsa_key_a());
    Certificate replacement = make_self_signed(rsa_key_b(), "alice", 2);
    add_entry(*container, "alice", replacement, rsa_key_b());

    auto fresh = reopen();
    EXPECT_EQ(fresh->size(), 1u);
    EXPECT_FALSE(find_private_key(*fresh, rsa_key_a().public_key(), "storepass").has_value());
    auto key = find_private_key(*fresh, replacement, "storepass");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, rsa_key_b());
}

TEST_F(EntryMutatorTest, AliasesAreCaseSensitive) {
    add_entry(*container, "alice", make_self_signed(rsa_key_a(), "alice"), rsa_key_a());
    add_entry(*container, "ALICE", make_self_signed(rsa_key_b(), "ALICE"), rsa_key_b());

    auto fresh = reopen();
    EXPECT_EQ(fresh->aliases(), (std::vector<std::string>{"alice", "ALICE"}));
}

TEST_F(EntryMutatorTest, KeyNeedNotMatchCertificate) {
    // No pairing check: the certificate's key drives lookup, the sealed key is returned.
    Certificate cert = make_self_signed(rsa_key_a(), "mismatch");
    add_entry(*container, "mismatch", cert, dsa_key());

    auto key = find_private_key(*reopen(), cert, "storepass");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, dsa_key());
}

TEST_F(EntryMutatorTest, DeleteRemovesEntry) {
    add_entry(*container, "alice", make_self_signed(rsa_key_a(), "alice"), rsa_key_a());
    add_entry(*container, "bob", make_self_signed(dsa_key(), "bob"), dsa_key());

    delete_entry(*container, "alice");

    auto fresh = reopen();
    EXPECT_EQ(fresh->aliases(), (std::vector<std::string>{"bob"}));
    EXPECT_FALSE(find_private_key(*fresh, rsa_key_a().public_key(), "storepass").has_value());
}

TEST_F(EntryMutatorTest, DeleteMissingAliasStillPersists) {
    add_entry(*container, "alice", make_self_signed(rsa_key_a(), "alice"), rsa_key_a());
    double persists = MetricsRegistry::instance().get_counter(metric::PERSISTS);

    EXPECT_NO_THROW(delete_entry(*container, "nobody"));
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::PERSISTS), persists + 1);
    EXPECT_EQ(reopen()->size(), 1u);
}

TEST_F(EntryMutatorTest, EmptyAliasRejected) {
    EXPECT_THROW(add_entry(*container, "", make_self_signed(rsa_key_a(), "x"), rsa_key_a()), EncodingError);
    EXPECT_EQ(container->size(), 0u);
    EXPECT_EQ(reopen()->size(), 0u);
}

TEST_F(EntryMutatorTest, UnencodableAliasLeavesStoreUsable) {
    EXPECT_THROW(add_entry(*container, "key-\xF0\x9F\x94\x91", make_self_signed(rsa_key_a(), "x"), rsa_key_a()),
                 EncodingError);
    EXPECT_THROW(add_entry(*container, "bad\xFF", make_self_signed(rsa_key_a(), "x"), rsa_key_a()),
                 EncodingError);
    EXPECT_EQ(container->size(), 0u);

    add_entry(*container, "bob", make_self_signed(dsa_key(), "bob"), dsa_key());
    EXPECT_NO_THROW(delete_entry(*container, "nobody"));
    EXPECT_EQ(reopen()->aliases(), (std::vector<std::string>{"bob"}));
}

TEST_F(EntryMutatorTest, DeleteThenReAdd) {
    Certificate cert = make_self_signed(rsa_key_a(), "alice");
    add_entry(*container, "alice", cert, rsa_key_a());
    delete_entry(*container, "alice");
    add_entry(*container, "alice", cert, rsa_key_a());

    auto key = find_private_key(*reopen(), cert, "storepass");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, rsa_key_a());
}
