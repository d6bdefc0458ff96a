#include "engine/asset_metadata.hpp"
#include "chunk/record_codec.hpp"

namespace mvault {
namespace engine {

namespace {
constexpr char METADATA_TAG[5] = "AMET";
constexpr uint8_t METADATA_VERSION = 1;
}

std::vector<uint8_t> encode_metadata(const AssetMetadata& metadata) {
  chunk::RecordWriter writer(METADATA_TAG, METADATA_VERSION);
  writer.write_string(metadata.asset_id);
  writer.write_u64(metadata.total_bytes);
  writer.write_u32(static_cast<uint32_t>(metadata.chunk_keys.size()));
  for (const auto& key : metadata.chunk_keys) {
    writer.write_string(key);
  }
  return writer.release();
}

AssetMetadata decode_metadata(const std::vector<uint8_t>& bytes) {
  chunk::RecordReader reader(bytes, METADATA_TAG);
  if (reader.version() != METADATA_VERSION) {
    throw chunk::RecordFormatError("Metadata: unsupported version " + std::to_string(reader.version()));
  }

  AssetMetadata metadata;
  metadata.asset_id = reader.read_string();
  metadata.total_bytes = reader.read_u64();
  uint32_t count = reader.read_u32();
  for (uint32_t i = 0; i < count; ++i) {
    metadata.chunk_keys.push_back(reader.read_string());
  }
  reader.expect_end();
  return metadata;
}

} // namespace engine
} // namespace mvault
