/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "vdf/vdf_document.h"
#include "vdf_test_builder.h"

#include <gtest/gtest.h>

#include <string>

using appinfo::test::VdfBytes;
using namespace appinfo::vdf;

static VdfErrorCode decode_error(const std::vector<std::uint8_t>& bytes, const VdfReadOptions& opt = {}) {
    try {
        parse_vdf(bytes, opt);
    } catch (const VdfError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected a VdfError";
    return VdfErrorCode::EndOfInput;
}

TEST(DocumentTest, RejectsBadSignature) {
    VdfBytes b;
    b.header(0x07564428u).simple_entry(10, "x");
    EXPECT_EQ(decode_error(b.bytes()), VdfErrorCode::InvalidSignature);
}

TEST(DocumentTest, RejectsBadVersion) {
    VdfBytes b;
    b.header(kAppInfoSignature, 2).simple_entry(10, "x");
    EXPECT_EQ(decode_error(b.bytes()), VdfErrorCode::InvalidVersion);
}

TEST(DocumentTest, ShortHeaderIsEndOfInput) {
    VdfBytes b;
    b.u32(kAppInfoSignature).raw({0x01, 0x00});
    EXPECT_EQ(decode_error(b.bytes()), VdfErrorCode::EndOfInput);
}

TEST(DocumentTest, HeaderOnlyHasNoEntries) {
    VdfBytes b;
    b.header();
    const auto doc = parse_vdf(b.bytes());
    EXPECT_EQ(doc.header.sign, kAppInfoSignature);
    EXPECT_EQ(doc.header.version, 1u);
    EXPECT_TRUE(doc.entries.empty());
}

TEST(DocumentTest, SingleEntryWithoutTrailer) {
    VdfBytes b;
    b.header().simple_entry(10, "Counter-Strike");
    const auto doc = parse_vdf(b.bytes());
    ASSERT_EQ(doc.entries.size(), 1u);
    EXPECT_EQ(doc.entries[0].header.app_id, 10u);
}

TEST(DocumentTest, StopsAtEndMarker) {
    VdfBytes b;
    b.header().simple_entry(10, "a").simple_entry(20, "b").simple_entry(30, "c").u32(0);
    const auto doc = parse_vdf(b.bytes());
    ASSERT_EQ(doc.entries.size(), 3u);
    EXPECT_EQ(doc.entries[0].header.app_id, 10u);
    EXPECT_EQ(doc.entries[1].header.app_id, 20u);
    EXPECT_EQ(doc.entries[2].header.app_id, 30u);
}

TEST(DocumentTest, ZeroAppIdEntryBetweenOthersIsKept) {
    VdfBytes b;
    b.header()
        .simple_entry(10, "a")
        .simple_entry(0, "zero")
        .simple_entry(20, "b")
        .simple_entry(30, "c");
    const auto doc = parse_vdf(b.bytes());
    ASSERT_EQ(doc.entries.size(), 4u);
    EXPECT_EQ(doc.entries[0].header.app_id, 10u);
    EXPECT_EQ(doc.entries[1].header.app_id, 0u);
    EXPECT_EQ(doc.entries[2].header.app_id, 20u);
    EXPECT_EQ(doc.entries[3].header.app_id, 30u);
    const auto* name = doc.entries[1].root.find_path({"appinfo", "common", "name"});
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(*name->as_string(), "zero");
}

TEST(DocumentTest, BytesAfterZeroAppIdAreAnEntry) {
    VdfBytes b;
    b.header().simple_entry(10, "a").u32(0).raw({0xDE, 0xAD});
    EXPECT_EQ(decode_error(b.bytes()), VdfErrorCode::EndOfInput);

    VdfReadOptions opt{};
    opt.tolerate_truncated_tail = true;
    const auto doc = parse_vdf(b.bytes(), opt);
    EXPECT_EQ(doc.entries.size(), 1u);
}

TEST(DocumentTest, TruncatedEntryIsFatalByDefault) {
    VdfBytes b;
    b.header().simple_entry(10, "a").entry_header(20).map("appinfo");
    try {
        parse_vdf(b.bytes());
        FAIL() << "expected EndOfInput";
    } catch (const VdfError& e) {
        EXPECT_EQ(e.code(), VdfErrorCode::EndOfInput);
        EXPECT_NE(std::string(e.what()).find("Entry #1"), std::string::npos);
    }
}

TEST(DocumentTest, TruncatedEntryDroppedWhenTolerated) {
    VdfBytes b;
    b.header().simple_entry(10, "a").entry_header(20).map("appinfo");
    VdfReadOptions opt{};
    opt.tolerate_truncated_tail = true;
    const auto doc = parse_vdf(b.bytes(), opt);
    ASSERT_EQ(doc.entries.size(), 1u);
    EXPECT_EQ(doc.entries[0].header.app_id, 10u);
}

TEST(DocumentTest, UnsupportedTagStaysFatalWhenTolerating) {
    VdfBytes b;
    b.header().entry_header(10).map("appinfo").tag(VdfType::Color).cstr("tint").end().end();
    VdfReadOptions opt{};
    opt.tolerate_truncated_tail = true;
    opt.unhandled_tags = UnhandledTagPolicy::Reject;
    EXPECT_EQ(decode_error(b.bytes(), opt), VdfErrorCode::UnsupportedTag);
}

TEST(DocumentTest, DecodingTwiceYieldsEqualDocuments) {
    VdfBytes b;
    b.header().simple_entry(10, "a").simple_entry(20, "b").u32(0);
    const auto first = parse_vdf(b.bytes());
    const auto second = parse_vdf(b.bytes());
    ASSERT_EQ(first.entries.size(), second.entries.size());
    for (std::size_t i = 0; i < first.entries.size(); i++) {
        EXPECT_EQ(first.entries[i].header.app_id, second.entries[i].header.app_id);
        EXPECT_EQ(first.entries[i].header.sha, second.entries[i].header.sha);
        const auto* a = first.entries[i].root.find_path({"appinfo", "common", "name"});
        const auto* c = second.entries[i].root.find_path({"appinfo", "common", "name"});
        ASSERT_NE(a, nullptr);
        ASSERT_NE(c, nullptr);
        EXPECT_NE(a, c);
        EXPECT_EQ(*a->as_string(), *c->as_string());
    }
}

TEST(DocumentTest, VersionSet) {
    EXPECT_TRUE(is_supported_version(1));
    EXPECT_FALSE(is_supported_version(0));
    EXPECT_FALSE(is_supported_version(0x28));
}
