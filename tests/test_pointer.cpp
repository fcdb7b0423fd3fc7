#include <gtest/gtest.h>
#include <lfs/pointer.hpp>
#include <core/utils.hpp>

static const std::string OID =
    "4d7a214614ab2935c943f9e0ff69d22eadbb8f32b1258daaa5e2ca24d17e2393";

static std::string pointer_text(const std::string& oid, const std::string& size) {
    return "version https://git-lfs.github.com/spec/v1\n"
           "oid sha256:" + oid + "\n"
           "size " + size + "\n";
}

TEST(LfsPointer, ParseValid) {
    auto p = parse_pointer(pointer_text(OID, "12345"));
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->oid, OID);
    EXPECT_EQ(p->size, 12345u);
}

TEST(LfsPointer, ParseToleratesCrlfAndExtensions) {
    std::string text = "version https://git-lfs.github.com/spec/v1\r\n"
                       "ext-0-foo sha256:" + OID + "\r\n"
                       "oid sha256:" + OID + "\r\n"
                       "size 7\r\n";
    auto p = parse_pointer(text);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->size, 7u);
}

TEST(LfsPointer, FormatParses) {
    LfsPointer p{OID, 42};
    std::string text = format_pointer(p);
    EXPECT_EQ(text, pointer_text(OID, "42"));
    auto back = parse_pointer(text);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, p);
}

TEST(LfsPointer, RejectsMissingVersion) {
    EXPECT_FALSE(parse_pointer("oid sha256:" + OID + "\nsize 1\n").has_value());
}

TEST(LfsPointer, RejectsBadOid) {
    EXPECT_FALSE(parse_pointer(pointer_text("abc123", "1")).has_value());
    std::string upper = OID;
    upper[0] = 'D';
    EXPECT_FALSE(parse_pointer(pointer_text(upper, "1")).has_value());
}

TEST(LfsPointer, RejectsBadSize) {
    EXPECT_FALSE(parse_pointer(pointer_text(OID, "-1")).has_value());
    EXPECT_FALSE(parse_pointer(pointer_text(OID, "12k")).has_value());
}

TEST(LfsPointer, RejectsMissingFields) {
    EXPECT_FALSE(parse_pointer("version https://git-lfs.github.com/spec/v1\nsize 3\n").has_value());
    EXPECT_FALSE(parse_pointer("version https://git-lfs.github.com/spec/v1\noid sha256:" + OID + "\n")
                     .has_value());
}

TEST(LfsPointer, EmptyTextIsNotPointer) {
    EXPECT_FALSE(looks_like_pointer(""));
    EXPECT_FALSE(parse_pointer("").has_value());
}

TEST(LfsPointer, LargeBlobIsNotPointer) {
    std::string big = pointer_text(OID, "1") + std::string(2048, 'x');
    EXPECT_FALSE(looks_like_pointer(big));
}

TEST(LfsPointer, PointerForContent) {
    auto p = pointer_for_content("hello world");
    EXPECT_EQ(p.size, 11u);
    EXPECT_EQ(p.oid, "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
    EXPECT_EQ(p.oid, sha256_hex("hello world"));
}

TEST(LfsPointer, ValidOid) {
    EXPECT_TRUE(is_valid_oid(OID));
    EXPECT_FALSE(is_valid_oid(OID.substr(1)));
    EXPECT_FALSE(is_valid_oid(std::string(64, 'g')));
}
