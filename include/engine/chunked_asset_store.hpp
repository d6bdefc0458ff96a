#ifndef MVAULT_ENGINE_CHUNKED_ASSET_STORE_HPP
#define MVAULT_ENGINE_CHUNKED_ASSET_STORE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "chunk/chunker.hpp"
#include "engine/asset_cache.hpp"
#include "engine/asset_metadata.hpp"
#include "engine/progress.hpp"
#include "fetch/http_client.hpp"
#include "store/table_store.hpp"

namespace mvault {
namespace engine {

using Bytes = std::vector<uint8_t>;

// Downloads large assets and keeps them as fixed-size chunk records plus one
// metadata record. The metadata write is the commit point: an asset is
// present iff its metadata exists, and chunks written before a crash are
// harmless orphans until collect_orphaned_chunks() reclaims them.
//
// Calls for the same asset id are serialized; calls for different ids run
// concurrently.
class ChunkedAssetStore : public AssetCache {
public:
  static constexpr const char* CHUNK_TABLE = "chunks";
  static constexpr const char* METADATA_TABLE = "models";

  struct Options {
    std::size_t chunk_size{chunk::DEFAULT_CHUNK_SIZE};
  };

  struct GcStats {
    std::size_t total_chunks{0};
    std::size_t orphaned_chunks{0};
    std::uint64_t orphaned_bytes{0};
    std::size_t freed_chunks{0};
    std::uint64_t freed_bytes{0};
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkedAssetStore(store::TableStore& store, fetch::HttpClient& http_client);
  ChunkedAssetStore(store::TableStore& store, fetch::HttpClient& http_client, Options options);


  // ---- FETCH AND STORE ----
  // Streams url into chunk records without holding the whole asset in
  // memory. No-op (Info event only) when the asset is already present.
  // Throws fetch::FetchFailedError or store::WriteFailedError.
  void stream_and_store(const std::string& url, const std::string& asset_id,
                        const ProgressCallback& on_progress = {});
  // Returns the stored asset, or downloads it whole, stores it and returns
  // the downloaded buffer.
  Bytes load_or_fetch_model(const std::string& url, const std::string& asset_id,
                            const ProgressCallback& on_progress = {});
  // Splits an in-memory buffer into chunks and commits it. Skips with an
  // Info event when the asset is already present.
  void store_buffer(const std::string& asset_id, const Bytes& data,
                    const ProgressCallback& on_progress = {});


  // ---- READ BACK ----
  // Reconstructs a stored asset. nullopt when no metadata exists.
  // Throws store::StoreError when a listed chunk is missing.
  std::optional<Bytes> load(const std::string& asset_id, const ProgressCallback& on_progress = {});
  bool has_data(const std::string& asset_id) const;
  std::optional<AssetMetadata> get_metadata(const std::string& asset_id) const;
  // Total byte count recorded at commit time
  std::optional<std::uint64_t> asset_size(const std::string& asset_id) const;
  std::vector<std::string> list_assets() const;


  // ---- REMOVAL AND CLEANUP ----
  // Best-effort removal of chunks, then metadata. False when not present.
  bool delete_asset(const std::string& asset_id);
  // Removes chunk records no metadata refers to. Chunks of assets with an
  // operation in flight are never touched.
  GcStats collect_orphaned_chunks(bool dry_run = false);


  // ---- AUXILIARY RECORDS ----
  void store_data(const std::string& key, const Bytes& data);
  std::optional<Bytes> load_data(const std::string& key) const;


  // ---- ASSET CACHE ----
  bool contains(const std::string& id) override { return has_data(id); }
  bool put(const std::string& id, const Bytes& data) override;
  std::optional<Bytes> fetch(const std::string& id) override { return load(id); }
  bool remove(const std::string& id) override { return delete_asset(id); }
  CacheStats stats() override;
  const char* backend_name() const override { return "chunked"; }

  std::size_t chunk_size() const { return options_.chunk_size; }

private:
  // ---- PARAMETERS ----
  store::TableStore& store_;
  fetch::HttpClient& http_client_;
  Options options_;

  // Per-asset locks of operations currently running
  mutable std::mutex inflight_mutex_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> inflight_;


  // ---- SINGLE FLIGHT ----
  std::shared_ptr<std::mutex> acquire_asset_lock(const std::string& asset_id);


  // ---- PIPELINE STEPS ----
  // Opens url and fails with FetchFailedError on a non-success status
  std::unique_ptr<fetch::HttpResponse> open(const std::string& url);
  // Accumulates the body into chunk_size buffers, flushing each as it fills
  void stream_body(fetch::HttpResponse& response, const std::string& url,
                   const std::string& asset_id, const ProgressCallback& on_progress);
  // Reads the body into memory reporting download progress
  Bytes read_body(fetch::HttpResponse& response, const std::string& url,
                  const ProgressCallback& on_progress);
  // Splits data, stores every chunk and commits the metadata
  void store_chunks(const std::string& asset_id, const Bytes& data, const ProgressCallback& on_progress);
  void write_chunk(const std::string& asset_id, std::size_t index, const Bytes& data,
                   std::vector<std::string>& chunk_keys, const ProgressCallback& on_progress);
  // Terminal write that makes the asset present
  void commit_metadata(const std::string& asset_id, std::vector<std::string> chunk_keys,
                       std::uint64_t total_bytes);
  Bytes read_chunks(const AssetMetadata& metadata) const;
  void report_failure(const std::string& asset_id, const std::exception& e,
                      const ProgressCallback& on_progress) const;
};

} // namespace engine
} // namespace mvault

#endif // MVAULT_ENGINE_CHUNKED_ASSET_STORE_HPP
