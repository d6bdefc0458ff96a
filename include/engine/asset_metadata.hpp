#ifndef MVAULT_ENGINE_ASSET_METADATA_HPP
#define MVAULT_ENGINE_ASSET_METADATA_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace mvault {
namespace engine {

// Durable pointer to an asset's chunks. Its existence defines asset presence.
struct AssetMetadata {
  std::string asset_id;
  std::vector<std::string> chunk_keys;
  // Exact byte count across all chunks
  std::uint64_t total_bytes{0};

  bool operator==(const AssetMetadata& other) const {
    return asset_id == other.asset_id && chunk_keys == other.chunk_keys && total_bytes == other.total_bytes;
  }
};

std::vector<uint8_t> encode_metadata(const AssetMetadata& metadata);
// Throws chunk::RecordFormatError on malformed input
AssetMetadata decode_metadata(const std::vector<uint8_t>& bytes);

} // namespace engine
} // namespace mvault

#endif // MVAULT_ENGINE_ASSET_METADATA_HPP
