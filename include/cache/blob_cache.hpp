#ifndef MVAULT_CACHE_BLOB_CACHE_HPP
#define MVAULT_CACHE_BLOB_CACHE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cache/cache_entry.hpp"
#include "engine/asset_cache.hpp"
#include "store/table_store.hpp"

namespace mvault {
namespace cache {

// Whole-blob model cache for a small, quota-limited store. Every entry
// carries a SHA-256 checksum that is verified on each read; a mismatch
// evicts the entry and reports it as absent.
//
// Operations report failure through their return value and log the cause.
class BlobCache : public engine::AssetCache {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr const char* TABLE = "blob_cache";
  static constexpr const char* ENTRY_PREFIX = "llm_model_cache_";
  static constexpr const char* INDEX_KEY = "llm_model_metadata";
  static constexpr std::uint64_t DEFAULT_QUOTA = 5 * 1024 * 1024;  // 5 MB
  static constexpr std::chrono::hours DEFAULT_MAX_AGE{24 * 30};    // 30 days

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BlobCache(store::TableStore& store, std::uint64_t quota = DEFAULT_QUOTA,
                     Clock clock = [] { return std::chrono::system_clock::now(); });


  // ---- ENTRY OPERATIONS ----
  // Stores data with its checksum and updates the metadata index. Fails
  // when the entry would not fit in the quota.
  bool cache_model(const std::string& id, const std::string& name, const std::vector<uint8_t>& data,
                   const std::string& provider, const std::string& version = "1.0.0");
  // Verified read. Corrupted entries are evicted and reported as absent.
  std::optional<CacheEntry> get_cached_model(const std::string& id);
  bool is_model_cached(const std::string& id);
  bool remove_cached_model(const std::string& id);
  bool clear_all_cached_models();


  // ---- ENUMERATION AND STATISTICS ----
  engine::CacheStats get_cache_stats();
  // All entries, newest first. Checksums are not verified here.
  std::vector<CacheEntry> get_cached_models();
  // Index rows by id, read without touching any blob
  CacheIndex get_index() const;
  double get_cache_usage_percentage();
  bool has_enough_space(std::uint64_t size);


  // ---- EVICTION ----
  // Removes entries older than max_age. Returns how many were removed.
  std::size_t cleanup_old_models(std::chrono::milliseconds max_age = DEFAULT_MAX_AGE);


  // ---- ASSET CACHE ----
  bool contains(const std::string& id) override { return is_model_cached(id); }
  bool put(const std::string& id, const std::vector<uint8_t>& data) override;
  std::optional<std::vector<uint8_t>> fetch(const std::string& id) override;
  bool remove(const std::string& id) override { return remove_cached_model(id); }
  engine::CacheStats stats() override { return get_cache_stats(); }
  const char* backend_name() const override { return "blob"; }

  std::uint64_t quota() const { return quota_; }

  // "0 Bytes", "512 Bytes", "1.5 KB", "2 MB"
  static std::string format_bytes(std::uint64_t bytes);

private:
  // ---- PARAMETERS ----
  store::TableStore& store_;
  std::uint64_t quota_;
  Clock clock_;
  // Guards read-modify-write cycles on the metadata index
  mutable std::mutex index_mutex_;


  // ---- HELPERS ----
  static std::string entry_key(const std::string& id);
  std::vector<std::string> entry_keys() const;
  std::int64_t now_ms() const;
  // Sum of data sizes of all readable entries except skip_id, the quantity get_cache_stats reports
  std::uint64_t used_bytes(const std::string& skip_id = "");

  CacheIndex read_index() const;
  void update_index(const std::string& id, const CacheEntry& entry);
  void remove_from_index(const std::string& id);
};

} // namespace cache
} // namespace mvault

#endif // MVAULT_CACHE_BLOB_CACHE_HPP
