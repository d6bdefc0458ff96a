#ifndef MVAULT_ENGINE_ASSET_CACHE_HPP
#define MVAULT_ENGINE_ASSET_CACHE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mvault {
namespace engine {

struct CacheStats {
  std::uint64_t total_size{0};
  std::size_t model_count{0};
  std::uint64_t available_space{0};
};

// Capability shared by the chunked table store and the whole-blob cache.
// Deployments pick a backend by its storage limits.
class AssetCache {
public:
  virtual ~AssetCache() = default;

  virtual bool contains(const std::string& id) = 0;
  // Stores data under id. Returns false if it could not be stored.
  virtual bool put(const std::string& id, const std::vector<uint8_t>& data) = 0;
  virtual std::optional<std::vector<uint8_t>> fetch(const std::string& id) = 0;
  virtual bool remove(const std::string& id) = 0;
  virtual CacheStats stats() = 0;
  virtual const char* backend_name() const = 0;
};

} // namespace engine
} // namespace mvault

#endif // MVAULT_ENGINE_ASSET_CACHE_HPP
