#include "chunk/chunker.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mvault {
namespace chunk {

namespace {
const std::string CHUNK_SEPARATOR = "::chunk::";
}

std::vector<Bytes> split(const Bytes& buffer, std::size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Chunker: chunk size must be at least 1");
  }

  std::vector<Bytes> pieces;
  pieces.reserve(chunk_count(buffer.size(), chunk_size));

  for (std::size_t offset = 0; offset < buffer.size(); offset += chunk_size) {
    std::size_t length = std::min(chunk_size, buffer.size() - offset);
    pieces.emplace_back(buffer.begin() + offset, buffer.begin() + offset + length);
  }
  return pieces;
}

Bytes assemble(const std::vector<Bytes>& pieces) {
  std::size_t total = 0;
  for (const auto& piece : pieces) {
    total += piece.size();
  }

  Bytes out;
  out.reserve(total);
  for (const auto& piece : pieces) {
    out.insert(out.end(), piece.begin(), piece.end());
  }
  return out;
}

std::size_t chunk_count(std::uint64_t total_size, std::size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Chunker: chunk size must be at least 1");
  }
  return static_cast<std::size_t>((total_size + chunk_size - 1) / chunk_size);
}

std::string chunk_key(const std::string& asset_id, std::size_t index) {
  return asset_id + CHUNK_SEPARATOR + std::to_string(index);
}

std::optional<std::pair<std::string, std::size_t>> parse_chunk_key(const std::string& key) {
  std::size_t pos = key.rfind(CHUNK_SEPARATOR);
  if (pos == std::string::npos) {
    return std::nullopt;
  }

  std::string index_str = key.substr(pos + CHUNK_SEPARATOR.size());
  if (index_str.empty() || !std::all_of(index_str.begin(), index_str.end(),
                                             [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }

  try {
    return std::make_pair(key.substr(0, pos), static_cast<std::size_t>(std::stoull(index_str)));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace chunk
} // namespace mvault
