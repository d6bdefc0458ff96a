#ifndef MVAULT_CHUNK_CHUNKER_HPP
#define MVAULT_CHUNK_CHUNKER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mvault {
namespace chunk {

using Bytes = std::vector<uint8_t>;

// Default chunk size for model assets
constexpr std::size_t DEFAULT_CHUNK_SIZE = 50 * 1024 * 1024;  // 50 MB

// Splits buffer left to right into pieces of chunk_size bytes. The last piece
// holds the remainder. An empty buffer yields no pieces.
// Throws std::invalid_argument when chunk_size is 0.
std::vector<Bytes> split(const Bytes& buffer, std::size_t chunk_size);

// Concatenates pieces in the given order
Bytes assemble(const std::vector<Bytes>& pieces);

// Number of pieces split() produces for a buffer of total_size bytes
std::size_t chunk_count(std::uint64_t total_size, std::size_t chunk_size);

// Key of the index-th chunk of an asset: "{asset_id}::chunk::{index}"
std::string chunk_key(const std::string& asset_id, std::size_t index);

// Inverse of chunk_key. Returns nullopt for keys not in chunk form.
std::optional<std::pair<std::string, std::size_t>> parse_chunk_key(const std::string& key);

} // namespace chunk
} // namespace mvault

#endif // MVAULT_CHUNK_CHUNKER_HPP
