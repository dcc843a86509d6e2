#include <array>
#include <cmath>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "frame_builder.hpp"
#include "parsing/field_decoders.hpp"

using namespace dex_stream::parsing;
using namespace dex_stream::core;
using namespace dex_stream::test_support;

class FieldDecodersTest : public ::testing::Test {
  protected:
    StringLimits legacy_{PrefixWidth::SINGLE_BYTE, 100};
    StringLimits enhanced_{PrefixWidth::FLAGGED, 1024};
};

// sanitize_double

TEST_F(FieldDecodersTest, SanitizeKeepsFiniteValues) {
    EXPECT_EQ(sanitize_double(0.0), 0.0);
    EXPECT_EQ(sanitize_double(-12.5), -12.5);
    EXPECT_EQ(sanitize_double(std::numeric_limits<double>::max()), std::numeric_limits<double>::max());
}

TEST_F(FieldDecodersTest, SanitizeDropsNonFinite) {
    EXPECT_FALSE(sanitize_double(std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_FALSE(sanitize_double(std::numeric_limits<double>::infinity()).has_value());
    EXPECT_FALSE(sanitize_double(-std::numeric_limits<double>::infinity()).has_value());
}

TEST_F(FieldDecodersTest, SanitizeIsIdempotent) {
    for (double value : {1.5, 0.0, std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()}) {
        const Metric once = sanitize_double(value);
        EXPECT_EQ(sanitize_double(once), once);
    }
}

// decode_length_prefixed_string

TEST_F(FieldDecodersTest, LegacyStringAdvancesOffset) {
    ByteWriter writer;
    writer.short_string("solana").short_string("raydium");
    const auto bytes = writer.take();

    std::size_t offset = 0;
    std::string out;
    ASSERT_TRUE(decode_length_prefixed_string(view(bytes), offset, legacy_, out));
    EXPECT_EQ(out, "solana");
    EXPECT_EQ(offset, 7);

    ASSERT_TRUE(decode_length_prefixed_string(view(bytes), offset, legacy_, out));
    EXPECT_EQ(out, "raydium");
    EXPECT_EQ(offset, bytes.size());
}

TEST_F(FieldDecodersTest, EmptyStringIsValid) {
    ByteWriter writer;
    writer.short_string("");
    const auto bytes = writer.take();

    std::size_t offset = 0;
    std::string out = "stale";
    ASSERT_TRUE(decode_length_prefixed_string(view(bytes), offset, legacy_, out));
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(offset, 1);
}

TEST_F(FieldDecodersTest, EnhancedWidePrefix) {
    const std::string description(300, 'x');
    ByteWriter writer;
    writer.string(description);
    const auto bytes = writer.take();
    ASSERT_EQ(bytes[0], 0x81);  // flag | (300 >> 8)
    ASSERT_EQ(bytes[1], 0x2C);  // 300 & 0xFF

    std::size_t offset = 0;
    std::string out;
    ASSERT_TRUE(decode_length_prefixed_string(view(bytes), offset, enhanced_, out));
    EXPECT_EQ(out, description);
    EXPECT_EQ(offset, 302);
}

TEST_F(FieldDecodersTest, LegacyIgnoresFlagBit) {
    // 0x81 is a plain length of 129 under the legacy layout
    ByteWriter writer;
    writer.u8(0x81).raw(std::string(129, 'a'));
    const auto bytes = writer.take();

    StringLimits wide_legacy{PrefixWidth::SINGLE_BYTE, 255};
    std::size_t offset = 0;
    std::string out;
    ASSERT_TRUE(decode_length_prefixed_string(view(bytes), offset, wide_legacy, out));
    EXPECT_EQ(out.size(), 129);
}

TEST_F(FieldDecodersTest, LengthAboveCeilingIsInvalid) {
    ByteWriter writer;
    writer.u8(150).raw(std::string(150, 'a'));
    const auto bytes = writer.take();

    std::size_t offset = 0;
    std::string out = "stale";
    DecodeError error = DecodeError::TRUNCATED_FIELD;
    EXPECT_FALSE(decode_length_prefixed_string(view(bytes), offset, legacy_, out, &error));
    EXPECT_EQ(error, DecodeError::INVALID_LENGTH);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(offset, 1);  // Past the prefix only
}

TEST_F(FieldDecodersTest, LengthPastChunkIsTruncated) {
    ByteWriter writer;
    writer.u8(10).raw("abc");
    const auto bytes = writer.take();

    std::size_t offset = 0;
    std::string out;
    DecodeError error = DecodeError::INVALID_LENGTH;
    EXPECT_FALSE(decode_length_prefixed_string(view(bytes), offset, legacy_, out, &error));
    EXPECT_EQ(error, DecodeError::TRUNCATED_FIELD);
    EXPECT_EQ(offset, 0);
}

TEST_F(FieldDecodersTest, MissingPrefixIsTruncated) {
    const Bytes bytes{0x81};  // Wide prefix cut after its first byte

    std::size_t offset = 0;
    std::string out;
    DecodeError error = DecodeError::INVALID_LENGTH;
    EXPECT_FALSE(decode_length_prefixed_string(view(bytes), offset, enhanced_, out, &error));
    EXPECT_EQ(error, DecodeError::TRUNCATED_FIELD);

    offset = 1;
    EXPECT_FALSE(decode_length_prefixed_string(view(bytes), offset, legacy_, out, &error));
    EXPECT_EQ(error, DecodeError::TRUNCATED_FIELD);
}

TEST_F(FieldDecodersTest, InvalidUtf8BytesAreDropped) {
    ByteWriter writer;
    writer.u8(7).raw(std::string("ab\xFF\xC3\xA9" "c\x80", 7));
    const auto bytes = writer.take();

    std::size_t offset = 0;
    std::string out;
    ASSERT_TRUE(decode_length_prefixed_string(view(bytes), offset, legacy_, out));
    EXPECT_EQ(out, "ab\xC3\xA9" "c");
    EXPECT_EQ(offset, 8);
}

// decode_aligned_f64_block

TEST_F(FieldDecodersTest, AlignedBlockSkipsPadding) {
    ByteWriter writer;
    writer.short_string("abc").align().f64(1.25).f64(-2.5);
    const auto bytes = writer.take();

    std::size_t offset = 4;  // Just past the string
    std::array<double, 2> values{};
    ASSERT_TRUE(decode_aligned_f64_block(view(bytes), offset, values));
    EXPECT_EQ(values[0], 1.25);
    EXPECT_EQ(values[1], -2.5);
    EXPECT_EQ(offset, 24);
}

TEST_F(FieldDecodersTest, AlignedBlockAtBoundaryReadsInPlace) {
    ByteWriter writer;
    writer.f64(7.0);
    const auto bytes = writer.take();

    std::size_t offset = 0;
    std::array<double, 1> values{};
    ASSERT_TRUE(decode_aligned_f64_block(view(bytes), offset, values));
    EXPECT_EQ(values[0], 7.0);
    EXPECT_EQ(offset, 8);
}

TEST_F(FieldDecodersTest, AlignedBlockPreservesNaN) {
    ByteWriter writer;
    writer.f64(std::numeric_limits<double>::quiet_NaN());
    const auto bytes = writer.take();

    std::size_t offset = 0;
    std::array<double, 1> values{};
    ASSERT_TRUE(decode_aligned_f64_block(view(bytes), offset, values));
    EXPECT_TRUE(std::isnan(values[0]));
    EXPECT_FALSE(sanitize_double(values[0]).has_value());
}

TEST_F(FieldDecodersTest, AlignedBlockTruncated) {
    ByteWriter writer;
    writer.short_string("abc").align().f64(1.0);
    const auto bytes = writer.take();

    std::size_t offset = 4;
    std::array<double, 2> values{9.0, 9.0};
    DecodeError error = DecodeError::INVALID_LENGTH;
    EXPECT_FALSE(decode_aligned_f64_block(view(bytes), offset, values, &error));
    EXPECT_EQ(error, DecodeError::TRUNCATED_FIELD);
    EXPECT_EQ(offset, 4);
    EXPECT_EQ(values[0], 9.0);
}

TEST_F(FieldDecodersTest, AlignmentPastEndIsTruncated) {
    const Bytes bytes(5, 0);

    std::size_t offset = 3;
    std::array<double, 1> values{};
    DecodeError error = DecodeError::INVALID_LENGTH;
    EXPECT_FALSE(decode_aligned_f64_block(view(bytes), offset, values, &error));
    EXPECT_EQ(error, DecodeError::TRUNCATED_FIELD);
}

TEST_F(FieldDecodersTest, AlignedBlockReadsOnBoundaryFromAnyStart) {
    ByteWriter writer;
    for (int i = 0; i < 5; ++i) {
        writer.f64(i + 0.5);
    }
    const auto bytes = writer.take();

    for (std::size_t start = 0; start < 16; ++start) {
        std::size_t offset = start;
        std::array<double, 2> values{};
        ASSERT_TRUE(decode_aligned_f64_block(view(bytes), offset, values)) << "start " << start;

        const std::size_t block_start = offset - values.size() * sizeof(double);
        EXPECT_EQ(block_start % 8, 0u) << "start " << start;
        EXPECT_GE(block_start, start);
        EXPECT_LT(block_start - start, 8u);
        EXPECT_EQ(values[0], static_cast<double>(block_start / 8) + 0.5);
    }
}

// Text sanitation

TEST_F(FieldDecodersTest, StripControlCharacters) {
    std::string text = "Bo\x01nk\t\n\x7F Inu\xC2\x85!";
    strip_control_characters(text);
    EXPECT_EQ(text, "Bonk Inu!");

    std::string accented = "caf\xC3\xA9";
    strip_control_characters(accented);
    EXPECT_EQ(accented, "caf\xC3\xA9");
}

TEST_F(FieldDecodersTest, TruncateKeepsSequencesWhole) {
    std::string text = "ab\xC3\xA9";  // 4 bytes, last two are one code point
    truncate_utf8(text, 3);
    EXPECT_EQ(text, "ab");

    std::string short_text = "abc";
    truncate_utf8(short_text, 10);
    EXPECT_EQ(short_text, "abc");
}

TEST_F(FieldDecodersTest, AppendValidUtf8RejectsOverlongAndSurrogates) {
    std::string out;
    append_valid_utf8(std::string_view("\xC0\xAF" "a" "\xED\xA0\x80" "b" "\xF0\x9F\x9A\x80", 11), out);
    EXPECT_EQ(out, "ab\xF0\x9F\x9A\x80");
}
