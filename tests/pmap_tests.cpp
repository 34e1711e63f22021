#include <gtest/gtest.h>

#include <boost/uuid/uuid_generators.hpp>

#include <libetcdgw/database.hpp>
#include <libetcdgw/pmap.hpp>

#include <memory>
#include <optional>
#include <string>

#include "fake_store.hpp"
#include "user.pb.h"

using namespace libetcdgw;


namespace {

std::string user_oid(uint64_t n)
{
    return OidCodec{}.encode(n);
}

libetcdgw::test::User make_user(uint64_t oid, const std::string &name)
{
    libetcdgw::test::User user;
    user.set_oid(user_oid(oid));
    user.set_name(name);
    user.set_email(name + "@example.com");
    return user;
}

} // namespace


class MapFixture : public ::testing::Test {
protected:
    std::shared_ptr<libetcdgw::test::FakeStore> store = std::make_shared<libetcdgw::test::FakeStore>();
    std::shared_ptr<Client> client = std::make_shared<Client>(store);
    Database db{client};

    std::shared_ptr<MapOidProto<libetcdgw::test::User>> users = map_oid_proto<libetcdgw::test::User>(10);
    std::shared_ptr<MapStringOid> users_by_name = map_string_oid(11);

    void attach_name_index()
    {
        users->attach_index<std::string>("users_by_name", users_by_name,
            [](const libetcdgw::test::User &user) -> std::optional<std::string> {
                if (user.name().empty())
                    return std::nullopt;
                return user.name();
            });
    }
};

TEST_F(MapFixture, physical_layout)
{
    ASSERT_EQ(users->physical_key(1), std::string("\x00\x0a", 2) + user_oid(1));

    auto range = users->key_range();
    ASSERT_EQ(range.start(), std::string("\x00\x0a", 2));
    ASSERT_EQ(range.resolve_end(), std::string("\x00\x0b", 2));

    auto last = map_string_string(0xFFFF);
    ASSERT_EQ(last->key_range().resolve_end(), std::string(1, '\0'));

    ASSERT_THROW(map_string_string(0), InvalidArgument);
}

TEST_F(MapFixture, get_put_erase)
{
    db.run([&](DbTransaction &txn) {
        users->put(txn, 1, make_user(1, "alice"));
    }, true);

    ASSERT_TRUE(store->value(users->physical_key(1)));

    auto txn = db.begin(true);
    auto alice = users->get(txn, 1);
    ASSERT_TRUE(alice);
    ASSERT_EQ(alice->name(), "alice");
    ASSERT_FALSE(users->get(txn, 2));

    users->erase(txn, 1);
    ASSERT_FALSE(users->get(txn, 1));
    txn.commit();

    ASSERT_FALSE(store->value(users->physical_key(1)));
}

TEST_F(MapFixture, index_follows_writes)
{
    attach_name_index();
    ASSERT_EQ(users->indexes(), std::vector<std::string>{"users_by_name"});

    db.run([&](DbTransaction &txn) {
        users->put(txn, 1, make_user(1, "alice"));
        users->put(txn, 2, make_user(2, "bob"));
    }, true);

    db.run([&](DbTransaction &txn) {
        ASSERT_EQ(users_by_name->get(txn, "alice"), 1u);
        ASSERT_EQ(users_by_name->get(txn, "bob"), 2u);
    });

    // the primary entry and its index entry go in the same commit
    auto before = store->calls(wire::TXN);
    db.run([&](DbTransaction &txn) { users->erase(txn, 1); }, true);
    ASSERT_EQ(store->calls(wire::TXN), before + 1);

    db.run([&](DbTransaction &txn) {
        ASSERT_FALSE(users->get(txn, 1));
        ASSERT_FALSE(users_by_name->get(txn, "alice"));
        ASSERT_EQ(users_by_name->get(txn, "bob"), 2u);
    });
}

TEST_F(MapFixture, rename_drops_stale_index_entry)
{
    attach_name_index();

    db.run([&](DbTransaction &txn) { users->put(txn, 1, make_user(1, "alice")); }, true);
    db.run([&](DbTransaction &txn) { users->put(txn, 1, make_user(1, "alicia")); }, true);

    db.run([&](DbTransaction &txn) {
        ASSERT_FALSE(users_by_name->get(txn, "alice"));
        ASSERT_EQ(users_by_name->get(txn, "alicia"), 1u);
        ASSERT_EQ(users_by_name->count(txn), 1);
    });

    // a value without an index key leaves no entry behind
    db.run([&](DbTransaction &txn) { users->put(txn, 1, make_user(1, "")); }, true);
    db.run([&](DbTransaction &txn) { ASSERT_EQ(users_by_name->count(txn), 0); });
}

TEST_F(MapFixture, taken_over_index_key_survives)
{
    attach_name_index();

    db.run([&](DbTransaction &txn) { users->put(txn, 1, make_user(1, "alice")); }, true);
    // record 2 takes the index key over from record 1
    db.run([&](DbTransaction &txn) { users->put(txn, 2, make_user(2, "alice")); }, true);
    db.run([&](DbTransaction &txn) { users->put(txn, 1, make_user(1, "bob")); }, true);

    db.run([&](DbTransaction &txn) {
        ASSERT_EQ(users_by_name->get(txn, "alice"), 2u);
        ASSERT_EQ(users_by_name->get(txn, "bob"), 1u);
    });

    // a third record renames away from "bob" after 1 took it; 1 keeps its entry
    db.run([&](DbTransaction &txn) { users->put(txn, 3, make_user(3, "bob")); }, true);
    db.run([&](DbTransaction &txn) { users->put(txn, 1, make_user(1, "bob")); }, true);
    db.run([&](DbTransaction &txn) { users->erase(txn, 3); }, true);

    db.run([&](DbTransaction &txn) {
        ASSERT_EQ(users_by_name->get(txn, "bob"), 1u);
        ASSERT_EQ(users_by_name->get(txn, "alice"), 2u);
        ASSERT_TRUE(users->get(txn, 2));
    });
}

TEST_F(MapFixture, index_management)
{
    attach_name_index();
    ASSERT_THROW(attach_name_index(), InvalidArgument);
    ASSERT_THROW(users->attach_index<std::string>("nameless", nullptr,
                                                  [](const libetcdgw::test::User &) { return std::optional<std::string>(); }),
                 InvalidArgument);

    users->detach_index("users_by_name");
    ASSERT_TRUE(users->indexes().empty());
    ASSERT_THROW(users->detach_index("users_by_name"), InvalidArgument);

    auto txn = db.begin(true);
    ASSERT_THROW(users->rebuild_index(txn, "users_by_name"), InvalidArgument);
}

TEST_F(MapFixture, rebuild_index)
{
    db.run([&](DbTransaction &txn) {
        users->put(txn, 1, make_user(1, "alice"));
        users->put(txn, 2, make_user(2, "bob"));
        users->put(txn, 3, make_user(3, "carol"));
        users_by_name->put(txn, "stale", 99);
    }, true);

    attach_name_index();
    auto rebuilt = db.run([&](DbTransaction &txn) { return users->rebuild_index(txn, "users_by_name"); }, true);
    ASSERT_EQ(rebuilt, 3);

    db.run([&](DbTransaction &txn) {
        ASSERT_EQ(users_by_name->count(txn), 3);
        ASSERT_FALSE(users_by_name->get(txn, "stale"));
        ASSERT_EQ(users_by_name->get(txn, "carol"), 3u);
    });
}

TEST_F(MapFixture, select_and_count)
{
    db.run([&](DbTransaction &txn) {
        for (uint64_t oid = 1; oid <= 5; ++oid)
            users->put(txn, oid, make_user(oid, "user" + std::to_string(oid)));
    }, true);

    // a neighbouring slot does not leak into the scan
    client->set(users_by_name->physical_key("x"), OidCodec{}.encode(1));

    auto txn = db.begin();

    auto all = users->select(txn);
    ASSERT_EQ(all.keys, (std::vector<uint64_t>{1, 2, 3, 4, 5}));
    ASSERT_EQ(all.values.size(), 5u);
    ASSERT_EQ(all.values[4].name(), "user5");

    auto window = users->select(txn, 2, 4);
    ASSERT_EQ(window.keys, (std::vector<uint64_t>{2, 3}));

    auto limited = users->select(txn, std::nullopt, std::nullopt, true, false, 2);
    ASSERT_EQ(limited.keys, (std::vector<uint64_t>{1, 2}));
    ASSERT_TRUE(limited.values.empty());

    auto values_only = users->select(txn, 4, std::nullopt, false, true);
    ASSERT_TRUE(values_only.keys.empty());
    ASSERT_EQ(values_only.values.size(), 2u);

    ASSERT_EQ(users->count(txn), 5);
    ASSERT_EQ(users->count(txn, 3), 1);
}

TEST_F(MapFixture, count_by_string_prefix)
{
    auto names = map_string_string(20);
    db.run([&](DbTransaction &txn) {
        names->put(txn, "app/a", "1");
        names->put(txn, "app/b", "2");
        names->put(txn, "apple", "3");
        names->put(txn, "bin/x", "4");
    }, true);

    auto txn = db.begin(true);
    ASSERT_EQ(names->count(txn, std::string("app/")), 2);
    ASSERT_EQ(names->count(txn, std::string("app")), 3);

    // buffered writes count before they are committed
    names->put(txn, "app/c", "5");
    ASSERT_EQ(names->count(txn, std::string("app/")), 3);
}

TEST_F(MapFixture, truncate_test)
{
    attach_name_index();
    db.run([&](DbTransaction &txn) {
        users->put(txn, 1, make_user(1, "alice"));
        users->put(txn, 2, make_user(2, "bob"));
    }, true);

    auto removed = db.run([&](DbTransaction &txn) { return users->truncate(txn); }, true);
    ASSERT_EQ(removed, 2);

    db.run([&](DbTransaction &txn) {
        ASSERT_EQ(users->count(txn), 0);
        ASSERT_EQ(users_by_name->count(txn), 0);
    });
}

TEST_F(MapFixture, truncate_keeping_indexes)
{
    attach_name_index();
    db.run([&](DbTransaction &txn) { users->put(txn, 1, make_user(1, "alice")); }, true);

    db.run([&](DbTransaction &txn) { users->truncate(txn, false); }, true);

    db.run([&](DbTransaction &txn) {
        ASSERT_EQ(users->count(txn), 0);
        ASSERT_EQ(users_by_name->get(txn, "alice"), 1u);
    });
}

TEST_F(MapFixture, compressed_values)
{
    auto blobs = map_oid_string(30, Compression::ZLIB);
    std::string blob(10000, 'z');

    db.run([&](DbTransaction &txn) { blobs->put(txn, 1, blob); }, true);

    auto stored = store->value(blobs->physical_key(1));
    ASSERT_TRUE(stored);
    ASSERT_LT(stored->size(), blob.size());
    ASSERT_EQ(decompress(*stored, Compression::ZLIB), blob);

    db.run([&](DbTransaction &txn) { ASSERT_EQ(blobs->get(txn, 1), blob); });
}

TEST_F(MapFixture, uuid_keyed_maps)
{
    boost::uuids::string_generator parse;
    auto group = parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    auto member = parse("6ba7b811-9dad-11d1-80b4-00c04fd430c8");

    auto groups = map_uuid_uuid_set(40);
    auto labels = map_uuid_string_uuid(41);

    db.run([&](DbTransaction &txn) {
        groups->put(txn, group, {member});
        labels->put(txn, {group, "owner"}, member);
    }, true);

    db.run([&](DbTransaction &txn) {
        auto members = groups->get(txn, group);
        ASSERT_TRUE(members);
        ASSERT_EQ(members->count(member), 1u);
        ASSERT_EQ(labels->get(txn, std::make_pair(group, std::string("owner"))), member);
    });
}
