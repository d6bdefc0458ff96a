#include "cache/cache_entry.hpp"
#include "chunk/record_codec.hpp"

namespace mvault {
namespace cache {

namespace {
constexpr char ENTRY_TAG[5] = "CENT";
constexpr char INDEX_TAG[5] = "CIDX";
constexpr uint8_t FORMAT_VERSION = 1;

void check_version(const chunk::RecordReader& reader, const char* what) {
  if (reader.version() != FORMAT_VERSION) {
    throw chunk::RecordFormatError(std::string(what) + ": unsupported version " +
                                   std::to_string(reader.version()));
  }
}
}

std::vector<uint8_t> encode_entry(const CacheEntry& entry) {
  chunk::RecordWriter writer(ENTRY_TAG, FORMAT_VERSION);
  writer.write_string(entry.id);
  writer.write_string(entry.name);
  writer.write_string(entry.version);
  writer.write_string(entry.provider);
  writer.write_u64(entry.size);
  writer.write_i64(entry.timestamp);
  writer.write_string(entry.checksum);
  writer.write_blob(entry.data);
  return writer.release();
}

CacheEntry decode_entry(const std::vector<uint8_t>& bytes) {
  chunk::RecordReader reader(bytes, ENTRY_TAG);
  check_version(reader, "Cache entry");

  CacheEntry entry;
  entry.id = reader.read_string();
  entry.name = reader.read_string();
  entry.version = reader.read_string();
  entry.provider = reader.read_string();
  entry.size = reader.read_u64();
  entry.timestamp = reader.read_i64();
  entry.checksum = reader.read_string();
  entry.data = reader.read_blob();
  reader.expect_end();
  return entry;
}

std::vector<uint8_t> encode_index(const CacheIndex& index) {
  chunk::RecordWriter writer(INDEX_TAG, FORMAT_VERSION);
  writer.write_u32(static_cast<uint32_t>(index.size()));
  for (const auto& [id, row] : index) {
    writer.write_string(id);
    writer.write_string(row.name);
    writer.write_string(row.version);
    writer.write_u64(row.size);
    writer.write_string(row.provider);
    writer.write_i64(row.timestamp);
  }
  return writer.release();
}

CacheIndex decode_index(const std::vector<uint8_t>& bytes) {
  chunk::RecordReader reader(bytes, INDEX_TAG);
  check_version(reader, "Cache index");

  CacheIndex index;
  uint32_t count = reader.read_u32();
  for (uint32_t i = 0; i < count; ++i) {
    std::string id = reader.read_string();
    CacheIndexRow row;
    row.name = reader.read_string();
    row.version = reader.read_string();
    row.size = reader.read_u64();
    row.provider = reader.read_string();
    row.timestamp = reader.read_i64();
    index.emplace(std::move(id), std::move(row));
  }
  reader.expect_end();
  return index;
}

} // namespace cache
} // namespace mvault
