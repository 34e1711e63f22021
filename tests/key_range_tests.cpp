#include <gtest/gtest.h>

#include <libetcdgw/key_range.hpp>
#include <libetcdgw/util.hpp>

#include <string>

using libetcdgw::KeyRange;


TEST(KeyRangeTest, single_test)
{
    auto range = KeyRange::single("foo");

    ASSERT_EQ(range.mode(), KeyRange::Mode::SINGLE);
    ASSERT_EQ(range.start(), "foo");
    ASSERT_FALSE(range.resolve_end());

    ASSERT_TRUE(range.contains("foo"));
    ASSERT_FALSE(range.contains("foo0"));

    KeyRange implicit = std::string("foo");
    ASSERT_EQ(implicit, range);
}

TEST(KeyRangeTest, prefix_test)
{
    auto range = KeyRange::prefix("k/");

    ASSERT_EQ(range.mode(), KeyRange::Mode::PREFIX);
    ASSERT_EQ(*range.resolve_end(), "k0");

    ASSERT_TRUE(range.contains("k/"));
    ASSERT_TRUE(range.contains("k/a"));
    ASSERT_TRUE(range.contains(std::string("k/\xFF\xFF", 4)));
    ASSERT_FALSE(range.contains("k0"));
    ASSERT_FALSE(range.contains("k"));
}

TEST(KeyRangeTest, prefix_end_covers_every_extension)
{
    const std::string prefixes[] = {
        "a", "abc", std::string("\0", 1), std::string("x\0", 2), "\x7F", std::string("\x01\xFE", 2),
    };

    for (const auto &prefix : prefixes) {
        auto end = *KeyRange::prefix(prefix).resolve_end();
        ASSERT_EQ(end, libetcdgw::increment_last_byte(prefix));
        ASSERT_LT(prefix, end);

        for (unsigned c = 0; c < 256; ++c) {
            auto key = prefix + static_cast<char>(c);
            ASSERT_LE(prefix, key);
            ASSERT_LT(key, end);
        }
    }
}

TEST(KeyRangeTest, range_test)
{
    auto range = KeyRange::range("a", "c");

    ASSERT_EQ(range.mode(), KeyRange::Mode::RANGE);
    ASSERT_EQ(*range.resolve_end(), "c");
    ASSERT_TRUE(range.contains("a"));
    ASSERT_TRUE(range.contains("b/long/key"));
    ASSERT_FALSE(range.contains("c"));
}

TEST(KeyRangeTest, empty_end_is_single_key)
{
    auto range = KeyRange::range("k", "");

    ASSERT_EQ(range.mode(), KeyRange::Mode::RANGE);
    ASSERT_EQ(*range.resolve_end(), "");
    ASSERT_TRUE(range.contains("k"));
    ASSERT_FALSE(range.contains("k0"));
    ASSERT_FALSE(range.contains("a"));
}

TEST(KeyRangeTest, all_test)
{
    auto range = KeyRange::all();

    ASSERT_EQ(range.start(), std::string(1, '\0'));
    ASSERT_EQ(*range.resolve_end(), std::string(1, '\0'));
    ASSERT_TRUE(range.contains("anything"));
    ASSERT_TRUE(range.contains("\xFF\xFF"));
}

TEST(KeyRangeTest, validation_test)
{
    ASSERT_THROW(KeyRange("k", std::string("z"), true), libetcdgw::InvalidArgument);
    ASSERT_THROW(KeyRange::prefix(""), libetcdgw::InvalidArgument);
    ASSERT_THROW(KeyRange::prefix("k\xFF"), libetcdgw::InvalidArgument);

    ASSERT_NO_THROW(KeyRange("k", std::string("z"), false));
    ASSERT_EQ(KeyRange("k", std::nullopt, true), KeyRange::prefix("k"));
}

TEST(KeyRangeTest, increment_last_byte_test)
{
    ASSERT_EQ(libetcdgw::increment_last_byte("abc"), "abd");
    ASSERT_EQ(libetcdgw::increment_last_byte(std::string("a\0", 2)), "a\x01");
    ASSERT_EQ(libetcdgw::increment_last_byte("a\xFE"), "a\xFF");

    ASSERT_THROW(libetcdgw::increment_last_byte(""), libetcdgw::InvalidArgument);
    ASSERT_THROW(libetcdgw::increment_last_byte("a\xFF"), libetcdgw::InvalidArgument);
}

TEST(UtilTest, successor_of_prefix_test)
{
    using libetcdgw::util::successor_of_prefix;

    ASSERT_EQ(successor_of_prefix("ab"), "ac");
    ASSERT_EQ(successor_of_prefix("a\xFF"), "b");
    ASSERT_EQ(successor_of_prefix("\xFF\xFF"), "");
    ASSERT_EQ(successor_of_prefix(""), "");
}

TEST(UtilTest, pack_test)
{
    using namespace libetcdgw::util;

    ASSERT_EQ(pack_u16(1), std::string("\x00\x01", 2));
    ASSERT_EQ(pack_u16(0x1234), "\x12\x34");
    ASSERT_EQ(unpack_u16(pack_u16(65535)), 65535);

    ASSERT_EQ(pack_u64(0x0102030405060708ULL), "\x01\x02\x03\x04\x05\x06\x07\x08");
    ASSERT_EQ(unpack_u64(pack_u64(42)), 42u);

    ASSERT_THROW(unpack_u16("x"), libetcdgw::CodecError);
    ASSERT_THROW(unpack_u64("short"), libetcdgw::CodecError);
}

TEST(UtilTest, split_url_test)
{
    using libetcdgw::util::split_url;

    auto [protocol, address] = split_url("http://localhost:2379");
    ASSERT_EQ(protocol, "http");
    ASSERT_EQ(address, "localhost:2379");

    ASSERT_THROW(split_url("localhost:2379"), libetcdgw::InvalidAddress);
}
