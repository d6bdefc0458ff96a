#ifndef MVAULT_CACHE_CACHE_ENTRY_HPP
#define MVAULT_CACHE_CACHE_ENTRY_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mvault {
namespace cache {

struct CacheEntry {
  std::string id;
  std::string name;
  std::string version;
  std::vector<uint8_t> data;
  std::uint64_t size{0};
  std::string provider;
  // Milliseconds since the Unix epoch
  std::int64_t timestamp{0};
  // Hex SHA-256 of data at storage time
  std::string checksum;
};

// Row of the metadata index, enough to enumerate entries without reading blobs
struct CacheIndexRow {
  std::string name;
  std::string version;
  std::uint64_t size{0};
  std::string provider;
  std::int64_t timestamp{0};
};

using CacheIndex = std::map<std::string, CacheIndexRow>;

// Binary records; decoding throws chunk::RecordFormatError
std::vector<uint8_t> encode_entry(const CacheEntry& entry);
CacheEntry decode_entry(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> encode_index(const CacheIndex& index);
CacheIndex decode_index(const std::vector<uint8_t>& bytes);

} // namespace cache
} // namespace mvault

#endif // MVAULT_CACHE_CACHE_ENTRY_HPP
