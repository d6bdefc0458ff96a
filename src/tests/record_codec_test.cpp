#include <gtest/gtest.h>
#include <limits>
#include "chunk/record_codec.hpp"
#include "engine/asset_metadata.hpp"

using namespace mvault::chunk;

TEST(RecordCodecTest, FieldsReadBackInOrder) {
  RecordWriter writer("TEST", 3);
  writer.write_u8(0xAB);
  writer.write_u32(0xDEADBEEF);
  writer.write_u64(std::numeric_limits<uint64_t>::max());
  writer.write_i64(-42);
  writer.write_string("hello");
  writer.write_blob({1, 2, 3});
  writer.write_string("");

  const auto bytes = writer.release();
  RecordReader reader(bytes, "TEST");
  EXPECT_EQ(reader.version(), 3);
  EXPECT_EQ(reader.read_u8(), 0xAB);
  EXPECT_EQ(reader.read_u32(), 0xDEADBEEFu);
  EXPECT_EQ(reader.read_u64(), std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(reader.read_i64(), -42);
  EXPECT_EQ(reader.read_string(), "hello");
  EXPECT_EQ(reader.read_blob(), (std::vector<uint8_t>{1, 2, 3}));
  EXPECT_EQ(reader.read_string(), "");
  EXPECT_TRUE(reader.at_end());
  EXPECT_NO_THROW(reader.expect_end());
}

TEST(RecordCodecTest, IntegersAreBigEndian) {
  RecordWriter writer("TEST", 1);
  writer.write_u32(0x01020304);
  const auto& bytes = writer.bytes();

  // Tag (4) + version (1) + value
  ASSERT_EQ(bytes.size(), 9u);
  EXPECT_EQ(bytes[5], 0x01);
  EXPECT_EQ(bytes[6], 0x02);
  EXPECT_EQ(bytes[7], 0x03);
  EXPECT_EQ(bytes[8], 0x04);
}

TEST(RecordCodecTest, WrongTagIsRejected) {
  RecordWriter writer("AAAA", 1);
  const auto bytes = writer.release();
  EXPECT_THROW(RecordReader(bytes, "BBBB"), RecordFormatError);
}

TEST(RecordCodecTest, TruncationIsDetected) {
  RecordWriter writer("TEST", 1);
  writer.write_string("a longer string value");
  writer.write_u64(7);
  const auto full = writer.release();

  for (std::size_t cut = 0; cut < full.size(); ++cut) {
    std::vector<uint8_t> truncated(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(cut));
    EXPECT_THROW({
      RecordReader reader(truncated, "TEST");
      reader.read_string();
      reader.read_u64();
    }, RecordFormatError) << "cut at " << cut;
  }
}

TEST(RecordCodecTest, TrailingBytesFailExpectEnd) {
  RecordWriter writer("TEST", 1);
  writer.write_u8(1);
  writer.write_u8(2);
  const auto bytes = writer.release();

  RecordReader reader(bytes, "TEST");
  reader.read_u8();
  EXPECT_FALSE(reader.at_end());
  EXPECT_THROW(reader.expect_end(), RecordFormatError);
}

TEST(RecordCodecTest, OversizedLengthPrefixIsRejected) {
  RecordWriter writer("TEST", 1);
  writer.write_u32(0xFFFFFFFF);  // claims a 4 GiB string
  const auto bytes = writer.release();

  RecordReader reader(bytes, "TEST");
  EXPECT_THROW(reader.read_string(), RecordFormatError);
}

TEST(AssetMetadataCodecTest, MetadataSurvivesEncoding) {
  mvault::engine::AssetMetadata metadata{"model", {"model::chunk::0", "model::chunk::1"}, 123456789};
  EXPECT_EQ(mvault::engine::decode_metadata(mvault::engine::encode_metadata(metadata)), metadata);

  mvault::engine::AssetMetadata empty{"empty", {}, 0};
  EXPECT_EQ(mvault::engine::decode_metadata(mvault::engine::encode_metadata(empty)), empty);
}

TEST(AssetMetadataCodecTest, GarbageIsRejected) {
  std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'm', 'e', 't', 'a'};
  EXPECT_THROW(mvault::engine::decode_metadata(garbage), RecordFormatError);
}
