#include "engine/chunked_asset_store.hpp"
#include <algorithm>
#include <cstring>
#include <map>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "chunk/record_codec.hpp"

namespace mvault {
namespace engine {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkedAssetStore::ChunkedAssetStore(store::TableStore& store, fetch::HttpClient& http_client)
  : ChunkedAssetStore(store, http_client, Options{}) {}

ChunkedAssetStore::ChunkedAssetStore(store::TableStore& store, fetch::HttpClient& http_client, Options options)
  : store_(store)
  , http_client_(http_client)
  , options_(options) {
  if (options_.chunk_size == 0) {
    throw std::invalid_argument("Asset store: chunk size must be at least 1");
  }
  BOOST_LOG_TRIVIAL(info) << "Asset store: Initialized with chunk size " << options_.chunk_size << " bytes";
}


//==============================================
// FETCH AND STORE
//==============================================

void ChunkedAssetStore::stream_and_store(const std::string& url, const std::string& asset_id,
                                         const ProgressCallback& on_progress) {
  auto asset_lock = acquire_asset_lock(asset_id);
  std::lock_guard<std::mutex> guard(*asset_lock);

  if (has_data(asset_id)) {
    BOOST_LOG_TRIVIAL(info) << "Asset store: " << asset_id << " already cached, skipping download";
    emit(on_progress, InfoEvent{asset_id, "Already cached"});
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Asset store: Streaming " << url << " into " << asset_id;
  try {
    auto response = open(url);

    if (response->reader() == nullptr) {
      // Transport cannot stream, fall back to the whole-body path
      BOOST_LOG_TRIVIAL(debug) << "Asset store: No stream reader for " << url << ", using buffered path";
      Bytes body = read_body(*response, url, on_progress);
      store_chunks(asset_id, body, on_progress);
      emit(on_progress, CompleteEvent{asset_id, body.size()});
      return;
    }

    stream_body(*response, url, asset_id, on_progress);
  } catch (const std::exception& e) {
    report_failure(asset_id, e, on_progress);
    throw;
  }
}

Bytes ChunkedAssetStore::load_or_fetch_model(const std::string& url, const std::string& asset_id,
                                             const ProgressCallback& on_progress) {
  auto asset_lock = acquire_asset_lock(asset_id);
  std::lock_guard<std::mutex> guard(*asset_lock);

  try {
    if (auto metadata = get_metadata(asset_id)) {
      Bytes out = read_chunks(*metadata);
      BOOST_LOG_TRIVIAL(info) << "Asset store: Loaded " << asset_id << " from store (" << out.size() << " bytes)";
      emit(on_progress, CompleteEvent{asset_id, out.size()});
      return out;
    }

    BOOST_LOG_TRIVIAL(info) << "Asset store: Fetching " << url << " into " << asset_id;
    auto response = open(url);
    Bytes body = read_body(*response, url, on_progress);
    store_chunks(asset_id, body, on_progress);
    emit(on_progress, CompleteEvent{asset_id, body.size()});
    return body;
  } catch (const std::exception& e) {
    report_failure(asset_id, e, on_progress);
    throw;
  }
}

void ChunkedAssetStore::store_buffer(const std::string& asset_id, const Bytes& data,
                                     const ProgressCallback& on_progress) {
  auto asset_lock = acquire_asset_lock(asset_id);
  std::lock_guard<std::mutex> guard(*asset_lock);

  if (has_data(asset_id)) {
    BOOST_LOG_TRIVIAL(info) << "Asset store: " << asset_id << " already cached, not storing buffer";
    emit(on_progress, InfoEvent{asset_id, "Already cached"});
    return;
  }

  try {
    store_chunks(asset_id, data, on_progress);
    emit(on_progress, CompleteEvent{asset_id, data.size()});
  } catch (const std::exception& e) {
    report_failure(asset_id, e, on_progress);
    throw;
  }
}


//==============================================
// READ BACK
//==============================================

std::optional<Bytes> ChunkedAssetStore::load(const std::string& asset_id, const ProgressCallback& on_progress) {
  auto asset_lock = acquire_asset_lock(asset_id);
  std::lock_guard<std::mutex> guard(*asset_lock);

  auto metadata = get_metadata(asset_id);
  if (!metadata) {
    BOOST_LOG_TRIVIAL(debug) << "Asset store: " << asset_id << " is not stored";
    return std::nullopt;
  }

  Bytes out = read_chunks(*metadata);
  emit(on_progress, CompleteEvent{asset_id, out.size()});
  return out;
}

bool ChunkedAssetStore::has_data(const std::string& asset_id) const {
  return store_.has(METADATA_TABLE, asset_id);
}

std::optional<AssetMetadata> ChunkedAssetStore::get_metadata(const std::string& asset_id) const {
  auto record = store_.get(METADATA_TABLE, asset_id);
  if (!record) {
    return std::nullopt;
  }

  try {
    return decode_metadata(*record);
  } catch (const chunk::RecordFormatError& e) {
    BOOST_LOG_TRIVIAL(error) << "Asset store: Metadata of " << asset_id << " is unreadable: " << e.what();
    throw store::StoreError("Asset store: Corrupt metadata for " + asset_id + ": " + e.what());
  }
}

std::optional<std::uint64_t> ChunkedAssetStore::asset_size(const std::string& asset_id) const {
  auto metadata = get_metadata(asset_id);
  if (!metadata) {
    return std::nullopt;
  }
  return metadata->total_bytes;
}

std::vector<std::string> ChunkedAssetStore::list_assets() const {
  return store_.list_keys(METADATA_TABLE);
}


//==============================================
// REMOVAL AND CLEANUP
//==============================================

bool ChunkedAssetStore::delete_asset(const std::string& asset_id) {
  auto asset_lock = acquire_asset_lock(asset_id);
  std::lock_guard<std::mutex> guard(*asset_lock);

  std::vector<std::string> chunk_keys;
  try {
    auto metadata = get_metadata(asset_id);
    if (!metadata) {
      BOOST_LOG_TRIVIAL(debug) << "Asset store: Nothing to delete for " << asset_id;
      return false;
    }
    chunk_keys = std::move(metadata->chunk_keys);
  } catch (const store::StoreError& e) {
    // Unreadable metadata still gets removed; its chunks become orphans
    BOOST_LOG_TRIVIAL(warning) << "Asset store: Deleting " << asset_id << " without chunk list: " << e.what();
  }

  BOOST_LOG_TRIVIAL(info) << "Asset store: Deleting " << asset_id << " (" << chunk_keys.size() << " chunks)";

  std::size_t failed = 0;
  for (const auto& key : chunk_keys) {
    try {
      store_.remove(CHUNK_TABLE, key);
    } catch (const std::exception& e) {
      ++failed;
      BOOST_LOG_TRIVIAL(warning) << "Asset store: Failed to delete chunk " << key << ": " << e.what();
    }
  }

  try {
    store_.remove(METADATA_TABLE, asset_id);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Asset store: Failed to delete metadata of " << asset_id << ": " << e.what();
  }

  if (failed > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Asset store: " << failed << " chunks of " << asset_id << " were left behind";
  }
  return true;
}

ChunkedAssetStore::GcStats ChunkedAssetStore::collect_orphaned_chunks(bool dry_run) {
  BOOST_LOG_TRIVIAL(info) << "Asset store: Collecting orphaned chunks" << (dry_run ? " (dry run)" : "");

  GcStats stats;
  std::unordered_set<std::string> referenced;
  std::unordered_set<std::string> unreadable_assets;

  for (const auto& asset_id : list_assets()) {
    try {
      if (auto metadata = get_metadata(asset_id)) {
        referenced.insert(metadata->chunk_keys.begin(), metadata->chunk_keys.end());
      }
    } catch (const store::StoreError& e) {
      // Without a chunk list nothing of this asset can be proven unreferenced
      BOOST_LOG_TRIVIAL(warning) << "Asset store: Keeping all chunks of " << asset_id << ": " << e.what();
      unreadable_assets.insert(asset_id);
    }
  }

  // Candidates grouped by owning asset
  std::map<std::string, std::vector<std::string>> candidates;
  for (const auto& key : store_.list_keys(CHUNK_TABLE)) {
    auto parsed = chunk::parse_chunk_key(key);
    if (!parsed) {
      continue;  // auxiliary record
    }
    ++stats.total_chunks;
    if (referenced.count(key) == 0 && unreadable_assets.count(parsed->first) == 0) {
      candidates[parsed->first].push_back(key);
    }
  }

  for (const auto& [asset_id, keys] : candidates) {
    // Skip assets with an operation in flight, their chunks are not orphans yet
    auto asset_lock = acquire_asset_lock(asset_id);
    std::unique_lock<std::mutex> guard(*asset_lock, std::try_to_lock);
    if (!guard.owns_lock()) {
      BOOST_LOG_TRIVIAL(debug) << "Asset store: " << asset_id << " is busy, leaving its chunks alone";
      continue;
    }

    // Metadata may have been committed since the scan started
    std::unordered_set<std::string> now_referenced;
    try {
      if (auto metadata = get_metadata(asset_id)) {
        now_referenced.insert(metadata->chunk_keys.begin(), metadata->chunk_keys.end());
      }
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Asset store: Keeping all chunks of " << asset_id << ": " << e.what();
      continue;
    }

    for (const auto& key : keys) {
      if (now_referenced.count(key) > 0) {
        continue;
      }
      std::uint64_t size = store_.size_of(CHUNK_TABLE, key).value_or(0);
      ++stats.orphaned_chunks;
      stats.orphaned_bytes += size;

      if (dry_run) {
        continue;
      }
      try {
        if (store_.remove(CHUNK_TABLE, key)) {
          ++stats.freed_chunks;
          stats.freed_bytes += size;
        }
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "Asset store: Failed to delete orphaned chunk " << key << ": " << e.what();
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Asset store: " << stats.orphaned_chunks << " of " << stats.total_chunks
                          << " chunks orphaned, freed " << stats.freed_chunks << " (" << stats.freed_bytes << " bytes)";
  return stats;
}


//==============================================
// AUXILIARY RECORDS
//==============================================

void ChunkedAssetStore::store_data(const std::string& key, const Bytes& data) {
  if (chunk::parse_chunk_key(key)) {
    throw std::invalid_argument("Asset store: Auxiliary key collides with chunk key format: " + key);
  }
  store_.put(CHUNK_TABLE, key, data);
}

std::optional<Bytes> ChunkedAssetStore::load_data(const std::string& key) const {
  return store_.get(CHUNK_TABLE, key);
}


//==============================================
// ASSET CACHE
//==============================================

bool ChunkedAssetStore::put(const std::string& id, const Bytes& data) {
  try {
    store_buffer(id, data);
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Asset store: Failed to store " << id << ": " << e.what();
    return false;
  }
}

CacheStats ChunkedAssetStore::stats() {
  CacheStats stats;
  for (const auto& asset_id : list_assets()) {
    try {
      if (auto metadata = get_metadata(asset_id)) {
        stats.total_size += metadata->total_bytes;
        ++stats.model_count;
      }
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Asset store: Skipping " << asset_id << " in stats: " << e.what();
    }
  }
  stats.available_space = store_.available_space().value_or(0);
  return stats;
}


//==============================================
// SINGLE FLIGHT
//==============================================

std::shared_ptr<std::mutex> ChunkedAssetStore::acquire_asset_lock(const std::string& asset_id) {
  std::lock_guard<std::mutex> lock(inflight_mutex_);

  // Drop entries whose operations have finished
  for (auto it = inflight_.begin(); it != inflight_.end();) {
    if (it->second.expired()) {
      it = inflight_.erase(it);
    } else {
      ++it;
    }
  }

  auto& slot = inflight_[asset_id];
  auto asset_lock = slot.lock();
  if (!asset_lock) {
    asset_lock = std::make_shared<std::mutex>();
    slot = asset_lock;
  }
  return asset_lock;
}

//==============================================
// PIPELINE STEPS
//==============================================

std::unique_ptr<fetch::HttpResponse> ChunkedAssetStore::open(const std::string& url) {
  auto response = http_client_.get(url);
  if (!response) {
    throw fetch::FetchFailedError(url, "no response");
  }
  if (!response->ok()) {
    BOOST_LOG_TRIVIAL(error) << "Asset store: Fetch of " << url << " failed with status " << response->status();
    throw fetch::FetchFailedError(response->status(), url);
  }
  return response;
}

void ChunkedAssetStore::stream_body(fetch::HttpResponse& response, const std::string& url,
                                    const std::string& asset_id, const ProgressCallback& on_progress) {
  const std::size_t capacity = options_.chunk_size;
  const std::optional<std::uint64_t> total = response.content_length();
  fetch::ByteStreamReader& reader = *response.reader();

  Bytes buffer(capacity);
  std::size_t offset = 0;
  std::size_t chunk_counter = 0;
  std::uint64_t received = 0;
  std::vector<std::string> chunk_keys;

  Bytes batch;
  while (reader.read_some(batch)) {
    std::size_t consumed = 0;
    while (consumed < batch.size()) {
      std::size_t to_copy = std::min(capacity - offset, batch.size() - consumed);
      std::memcpy(buffer.data() + offset, batch.data() + consumed, to_copy);
      offset += to_copy;
      consumed += to_copy;
      received += to_copy;
      emit(on_progress, DownloadEvent{url, received, total});

      if (offset == capacity) {
        write_chunk(asset_id, chunk_counter++, buffer, chunk_keys, on_progress);
        offset = 0;
      }
    }
  }

  // Final, shorter chunk
  if (offset > 0) {
    buffer.resize(offset);
    write_chunk(asset_id, chunk_counter++, buffer, chunk_keys, on_progress);
  }

  commit_metadata(asset_id, std::move(chunk_keys), received);
  BOOST_LOG_TRIVIAL(info) << "Asset store: Streamed " << received << " bytes of " << asset_id
                          << " into " << chunk_counter << " chunks";
  emit(on_progress, CompleteEvent{asset_id, received});
}

Bytes ChunkedAssetStore::read_body(fetch::HttpResponse& response, const std::string& url,
                                   const ProgressCallback& on_progress) {
  const std::optional<std::uint64_t> total = response.content_length();
  fetch::ByteStreamReader* reader = response.reader();

  if (reader == nullptr) {
    Bytes body = response.read_all();
    emit(on_progress, DownloadEvent{url, body.size(), total});
    return body;
  }

  Bytes body;
  if (total) {
    body.reserve(static_cast<std::size_t>(*total));
  }
  Bytes batch;
  while (reader->read_some(batch)) {
    body.insert(body.end(), batch.begin(), batch.end());
    emit(on_progress, DownloadEvent{url, body.size(), total});
  }
  return body;
}

void ChunkedAssetStore::store_chunks(const std::string& asset_id, const Bytes& data,
                                     const ProgressCallback& on_progress) {
  std::vector<Bytes> parts = chunk::split(data, options_.chunk_size);
  std::vector<std::string> chunk_keys;
  chunk_keys.reserve(parts.size());

  for (std::size_t index = 0; index < parts.size(); ++index) {
    write_chunk(asset_id, index, parts[index], chunk_keys, on_progress);
  }

  commit_metadata(asset_id, std::move(chunk_keys), data.size());
  BOOST_LOG_TRIVIAL(info) << "Asset store: Stored " << data.size() << " bytes of " << asset_id
                          << " in " << parts.size() << " chunks";
}

void ChunkedAssetStore::write_chunk(const std::string& asset_id, std::size_t index, const Bytes& data,
                                    std::vector<std::string>& chunk_keys, const ProgressCallback& on_progress) {
  std::string key = chunk::chunk_key(asset_id, index);
  store_.put(CHUNK_TABLE, key, data);
  chunk_keys.push_back(key);
  BOOST_LOG_TRIVIAL(debug) << "Asset store: Stored chunk " << key << " (" << data.size() << " bytes)";
  emit(on_progress, ChunkStoredEvent{asset_id, index, data.size()});
}

void ChunkedAssetStore::commit_metadata(const std::string& asset_id, std::vector<std::string> chunk_keys,
                                        std::uint64_t total_bytes) {
  AssetMetadata metadata{asset_id, std::move(chunk_keys), total_bytes};
  store_.put(METADATA_TABLE, asset_id, encode_metadata(metadata));
  BOOST_LOG_TRIVIAL(debug) << "Asset store: Committed metadata for " << asset_id;
}

Bytes ChunkedAssetStore::read_chunks(const AssetMetadata& metadata) const {
  std::vector<Bytes> parts;
  parts.reserve(metadata.chunk_keys.size());

  for (const auto& key : metadata.chunk_keys) {
    auto part = store_.get(CHUNK_TABLE, key);
    if (!part) {
      BOOST_LOG_TRIVIAL(error) << "Asset store: Chunk " << key << " of " << metadata.asset_id << " is missing";
      throw store::StoreError("Asset store: Missing chunk " + key);
    }
    parts.push_back(std::move(*part));
  }
  return chunk::assemble(parts);
}

void ChunkedAssetStore::report_failure(const std::string& asset_id, const std::exception& e,
                                       const ProgressCallback& on_progress) const {
  BOOST_LOG_TRIVIAL(error) << "Asset store: Operation on " << asset_id << " failed: " << e.what();
  emit(on_progress, ErrorEvent{asset_id, e.what()});
}

} // namespace engine
} // namespace mvault
