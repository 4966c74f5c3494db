/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "vdf/vdf_entry.h"
#include "vdf_test_builder.h"

#include <gtest/gtest.h>

using appinfo::test::VdfBytes;
using namespace appinfo::vdf;

TEST(EntryTest, ReadsHeaderFieldsInOrder) {
    VdfBytes b;
    b.entry_header(440, 99).map("appinfo").i32("appid", 440).end().end();
    ByteReader r(b.bytes());
    const auto entry = read_entry(r, {});
    ASSERT_TRUE(entry.has_value());
    const auto& hdr = entry->header;
    EXPECT_EQ(hdr.app_id, 440u);
    EXPECT_EQ(hdr.data_size, 0u);
    EXPECT_EQ(hdr.info_state, 2u);
    EXPECT_EQ(hdr.last_updated, 1700000000u);
    EXPECT_EQ(hdr.access_token, 0x1122334455667788ull);
    EXPECT_EQ(hdr.sha, "000102030405060708090a0b0c0d0e0f10111213");
    EXPECT_EQ(hdr.change_number, 99u);
    EXPECT_FALSE(r.remaining());
}

TEST(EntryTest, RootChildrenUntilTerminator) {
    VdfBytes b;
    b.simple_entry(730, "Counter-Strike").u32(0);
    ByteReader r(b.bytes());
    const auto entry = read_entry(r, {});
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->root.children.size(), 1u);
    EXPECT_EQ(entry->root.children[0].name, "appinfo");
    const auto* name = entry->root.find_path({"appinfo", "common", "name"});
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(*name->as_string(), "Counter-Strike");
    EXPECT_EQ(r.bytes_left(), 4u);
}

TEST(EntryTest, ZeroAppIdIsEndMarker) {
    VdfBytes b;
    b.u32(0);
    ByteReader r(b.bytes());
    EXPECT_FALSE(read_entry(r, {}).has_value());
    EXPECT_FALSE(r.remaining());
}

TEST(EntryTest, ZeroAppIdWithBodyIsAnEntry) {
    VdfBytes b;
    b.simple_entry(0, "zero").u32(0);
    ByteReader r(b.bytes());
    const auto entry = read_entry(r, {});
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->header.app_id, 0u);
    EXPECT_EQ(r.bytes_left(), 4u);
    EXPECT_FALSE(read_entry(r, {}).has_value());
}

TEST(EntryTest, TruncatedHeaderIsEndOfInput) {
    VdfBytes b;
    b.u32(10).u32(0).u32(2);
    ByteReader r(b.bytes());
    try {
        read_entry(r, {});
        FAIL() << "expected EndOfInput";
    } catch (const VdfError& e) {
        EXPECT_EQ(e.code(), VdfErrorCode::EndOfInput);
        EXPECT_EQ(e.offset(), 12u);
    }
}

TEST(EntryTest, MissingRootTerminatorIsEndOfInput) {
    VdfBytes b;
    b.entry_header(10).map("appinfo").end();
    ByteReader r(b.bytes());
    EXPECT_THROW(read_entry(r, {}), VdfError);
}
