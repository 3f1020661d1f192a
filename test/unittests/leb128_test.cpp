#include <gtest/gtest.h>
#include <limits>
#include <random>
#include "rime/binary.hpp"
#include "test/utils/bytes.hpp"


static uint64_t decode_u(const bytes& input, unsigned width, const DecodeOptions& options = {}) {
    auto rdr = make_reader(input, options);
    const auto value = rdr.read_uleb128(width);
    EXPECT_TRUE(rdr.atend()) << "trailing bytes after LEB128";
    return value;
}

static int64_t decode_s(const bytes& input, unsigned width, const DecodeOptions& options = {}) {
    auto rdr = make_reader(input, options);
    const auto value = rdr.read_sleb128(width);
    EXPECT_TRUE(rdr.atend()) << "trailing bytes after LEB128";
    return value;
}

TEST(leb128, encode_known_values)
{
    EXPECT_EQ(leb(uint32_t(0)), "00"_bytes);
    EXPECT_EQ(leb(uint32_t(127)), "7f"_bytes);
    EXPECT_EQ(leb(uint32_t(128)), "8001"_bytes);
    EXPECT_EQ(leb(uint32_t(624485)), "e58e26"_bytes);
    EXPECT_EQ(leb(int32_t(-1)), "7f"_bytes);
    EXPECT_EQ(leb(int32_t(63)), "3f"_bytes);
    EXPECT_EQ(leb(int32_t(64)), "c000"_bytes);
    EXPECT_EQ(leb(int32_t(-64)), "40"_bytes);
    EXPECT_EQ(leb(int32_t(-65)), "bf7f"_bytes);
    EXPECT_EQ(leb(int32_t(-123456)), "c0bb78"_bytes);
}

TEST(leb128, decode_known_values)
{
    EXPECT_EQ(decode_u("e58e26"_bytes, 32), 624485);
    EXPECT_EQ(decode_u("ffffffff0f"_bytes, 32), 0xffffffff);
    EXPECT_EQ(decode_s("c0bb78"_bytes, 32), -123456);
    EXPECT_EQ(decode_s("ffffffff07"_bytes, 32), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(decode_s("8080808078"_bytes, 32), std::numeric_limits<int32_t>::min());
    EXPECT_EQ(decode_s("40"_bytes, 7), -64);
    EXPECT_EQ(decode_s("3f"_bytes, 7), 63);
    EXPECT_EQ(decode_s("7f"_bytes, 7), -1);
}

TEST(leb128, non_minimal_encoding_within_width)
{
    EXPECT_EQ(decode_u("8080808000"_bytes, 32), 0);
    EXPECT_EQ(decode_u("8100"_bytes, 32), 1);
    EXPECT_EQ(decode_s("ff7f"_bytes, 32), -1);
}

TEST(leb128, unsigned_round_trip)
{
    for (const uint32_t v : {0u, 1u, 63u, 64u, 127u, 128u, 16383u, 16384u, 0x7fffffffu, 0xffffffffu})
        EXPECT_EQ(decode_u(leb(v), 32), v);

    for (const uint64_t v : {uint64_t(0), uint64_t(0xffffffff), uint64_t(1) << 32, uint64_t(1) << 63, std::numeric_limits<uint64_t>::max()})
        EXPECT_EQ(decode_u(leb(v), 64), v);

    for (unsigned v = 0; v < 128; ++v)
        EXPECT_EQ(decode_u(leb(uint8_t(v)), 7), v);
}

TEST(leb128, signed_round_trip)
{
    for (int v = -64; v < 64; ++v)
        EXPECT_EQ(decode_s(leb(int8_t(v)), 7), v);

    for (const int32_t v : {0, 1, -1, 63, 64, -64, -65, 8191, -8192, std::numeric_limits<int32_t>::max(), std::numeric_limits<int32_t>::min()})
        EXPECT_EQ(decode_s(leb(v), 32), v);

    // the full 33 bit range used by block type indices
    for (const int64_t v : {int64_t(0), int64_t(-1), int64_t(0xffffffff), -(int64_t(1) << 32), int64_t(1) << 31})
        EXPECT_EQ(decode_s(leb(v), 33), v);

    for (const int64_t v : {int64_t(0), int64_t(-1), std::numeric_limits<int64_t>::max(), std::numeric_limits<int64_t>::min()})
        EXPECT_EQ(decode_s(leb(v), 64), v);
}

TEST(leb128, random_round_trip)
{
    std::mt19937_64 rng(20261019);

    for (int i = 0; i < 100000; ++i) {
        const uint64_t bits = rng();
        // vary the magnitude so short encodings are as common as long ones
        const unsigned shift = rng() % 64;

        const auto u64 = bits >> shift;
        const auto s64 = int64_t(bits) >> shift;
        const auto u32 = uint32_t(u64);
        const auto s32 = int32_t(int64_t(bits) >> (shift / 2 + 32));
        const auto s33 = int64_t(bits) >> (shift / 2 + 31);

        ASSERT_EQ(decode_u(leb(u64), 64), u64) << bits << " >> " << shift;
        ASSERT_EQ(decode_s(leb(s64), 64), s64) << bits << " >> " << shift;
        ASSERT_EQ(decode_u(leb(u32), 32), u32) << bits << " >> " << shift;
        ASSERT_EQ(decode_s(leb(s32), 32), s32) << bits << " >> " << shift;
        ASSERT_EQ(decode_s(leb(s33), 33), s33) << bits << " >> " << shift;
    }
}

TEST(leb128, too_many_bytes)
{
    EXPECT_DECODE_ERROR(decode_u("808080808000"_bytes, 32), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_u("8000"_bytes, 7), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_s("80808080808080808080"_bytes, 64), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_s("ffffffffff7f"_bytes, 33), error_kind_t::MALFORMED_INTEGER);
}

TEST(leb128, unused_bits_set)
{
    EXPECT_DECODE_ERROR(decode_u("ffffffff1f"_bytes, 32), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_u("ffffffff70"_bytes, 32), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_u("02"_bytes, 1), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_u("ffffffffffffffffff7f"_bytes, 64), error_kind_t::MALFORMED_INTEGER);

    // bits above the sign must repeat it
    EXPECT_DECODE_ERROR(decode_s("ffffffff4f"_bytes, 32), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_s("8080808008"_bytes, 32), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_s("8080808020"_bytes, 33), error_kind_t::MALFORMED_INTEGER);
}

TEST(leb128, varuint1)
{
    EXPECT_EQ(decode_u("00"_bytes, 1), 0);
    EXPECT_EQ(decode_u("01"_bytes, 1), 1);
}

TEST(leb128, truncated)
{
    EXPECT_DECODE_ERROR(decode_u(""_bytes, 32), error_kind_t::END_OF_INPUT);
    EXPECT_DECODE_ERROR(decode_u("80"_bytes, 32), error_kind_t::END_OF_INPUT);
    EXPECT_DECODE_ERROR(decode_s("ffff"_bytes, 64), error_kind_t::END_OF_INPUT);
}

TEST(leb128, error_offset_is_start_of_integer)
{
    const auto input = "00 ffffffff1f"_bytes;
    auto rdr = make_reader(input);
    rdr.read<byte_t>();
    EXPECT_DECODE_ERROR_AT(rdr.read_uleb128(32), error_kind_t::MALFORMED_INTEGER, 1);
}

TEST(leb128, permissive_truncates_unused_bits)
{
    const DecodeOptions permissive{.permissive = true};

    EXPECT_EQ(decode_u("ffffffff1f"_bytes, 32, permissive), 0xffffffff);
    EXPECT_EQ(decode_u("ffffffff7f"_bytes, 32, permissive), 0xffffffff);
    EXPECT_EQ(decode_s("ffffffff4f"_bytes, 32, permissive), -1);

    // still strict about length and truncation
    EXPECT_DECODE_ERROR(decode_u("808080808000"_bytes, 32, permissive), error_kind_t::MALFORMED_INTEGER);
    EXPECT_DECODE_ERROR(decode_u("80"_bytes, 32, permissive), error_kind_t::END_OF_INPUT);
}

TEST(leb128, typed_readers)
{
    const auto input = "01 7f ffffffff0f 7f 40 ffffffff0f"_bytes;
    auto rdr = make_reader(input);

    EXPECT_EQ(read<varuint1_t>(rdr), 1);
    EXPECT_EQ(read<varuint7_t>(rdr), 0x7f);
    EXPECT_EQ(read<varuint32_t>(rdr), 0xffffffff);
    EXPECT_EQ(read<varsint7_t>(rdr), -1);
    EXPECT_EQ(read<varsint32_t>(rdr), -64);
    EXPECT_EQ(read<varsint33_t>(rdr), 0xffffffff);
    EXPECT_TRUE(rdr.atend());
}

TEST(leb128, writer_overflow)
{
    byte_t buf[2];
    Writer w(buf, buf + sizeof(buf));
    EXPECT_DECODE_ERROR(w.write_leb128<uint32_t>(0xffffffff), error_kind_t::END_OF_INPUT);
}

TEST(reader, slice_is_bounded)
{
    const auto input = "01 02 03 04"_bytes;
    auto rdr = make_reader(input);
    rdr.read<byte_t>();

    auto sub = rdr.slice(2, error_kind_t::SECTION_SIZE_MISMATCH);
    EXPECT_EQ(rdr.offset(), 3);
    EXPECT_EQ(rdr.remaining(), 1);
    EXPECT_EQ(sub.offset(), 1);
    EXPECT_EQ(sub.remaining(), 2);

    EXPECT_EQ(sub.read<byte_t>(), 0x02);
    EXPECT_EQ(sub.read<byte_t>(), 0x03);
    EXPECT_TRUE(sub.atend());
    EXPECT_EQ(sub.remaining(), 0);

    // never reads into the parent's bytes
    EXPECT_DECODE_ERROR_AT(sub.read<byte_t>(), error_kind_t::SECTION_SIZE_MISMATCH, 3);
    EXPECT_DECODE_ERROR(sub.read_bytes(1), error_kind_t::SECTION_SIZE_MISMATCH);
    EXPECT_DECODE_ERROR(rdr.slice(2, error_kind_t::SECTION_SIZE_MISMATCH), error_kind_t::END_OF_INPUT);
    EXPECT_EQ(rdr.read<byte_t>(), 0x04);
}
