// =============================================================================
// Identifier and Timestamp Tests
// =============================================================================

#include <gtest/gtest.h>
#include <set>
#include "engram/error.hpp"
#include "engram/time_util.hpp"
#include "engram/uuid.hpp"

using namespace engram;

TEST(UuidTest, GeneratedIdsAreUnique) {
    std::set<Uuid> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(generate_uuid());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(UuidTest, CanonicalFormRoundTrips) {
    const std::string text = "0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44";
    EXPECT_EQ(to_string(parse_uuid(text)), text);
}

TEST(UuidTest, NonCanonicalFormsRejected) {
    EXPECT_FALSE(try_parse_uuid("{0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44}").has_value());
    EXPECT_FALSE(try_parse_uuid("0b7c2f7e4d7e4c559d619a0c1f2b3e44").has_value());
    EXPECT_FALSE(try_parse_uuid("0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3exx").has_value());
    EXPECT_THROW(parse_uuid("nope"), InvalidArgumentError);
}

TEST(TimestampTest, FormatsMicroseconds) {
    auto ts = parse_iso8601("2024-02-29T23:59:58.5Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_iso8601(*ts), "2024-02-29T23:59:58.500000Z");
}

TEST(TimestampTest, EpochFormatsAsUtc) {
    EXPECT_EQ(format_iso8601(Timestamp{}), "1970-01-01T00:00:00.000000Z");
}

TEST(TimestampTest, OffsetsNormalizeToUtc) {
    auto with_offset = parse_iso8601("2024-05-01T14:00:00+02:00");
    auto utc = parse_iso8601("2024-05-01T12:00:00Z");
    ASSERT_TRUE(with_offset && utc);
    EXPECT_EQ(*with_offset, *utc);
}

TEST(TimestampTest, MissingZoneReadAsUtc) {
    EXPECT_EQ(parse_iso8601("2024-05-01T12:00:00"), parse_iso8601("2024-05-01T12:00:00Z"));
}

TEST(TimestampTest, NowRoundTrips) {
    Timestamp now = std::chrono::system_clock::now();
    auto parsed = parse_iso8601(format_iso8601(now));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, now);
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parse_iso8601("").has_value());
    EXPECT_FALSE(parse_iso8601("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2024-05-01 noon").has_value());
    EXPECT_FALSE(parse_iso8601("2024-05-01T12:00:00.Z").has_value());
    EXPECT_FALSE(parse_iso8601("2024-05-01T12:00:00Zjunk").has_value());
}
