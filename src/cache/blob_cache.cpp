#include "cache/blob_cache.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "chunk/record_codec.hpp"
#include "crypto/digest.hpp"

namespace mvault {
namespace cache {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlobCache::BlobCache(store::TableStore& store, std::uint64_t quota, Clock clock)
  : store_(store)
  , quota_(quota)
  , clock_(std::move(clock)) {
  BOOST_LOG_TRIVIAL(info) << "Blob cache: Initialized with quota " << format_bytes(quota_);
}


//==============================================
// ENTRY OPERATIONS
//==============================================

bool BlobCache::cache_model(const std::string& id, const std::string& name, const std::vector<uint8_t>& data,
                            const std::string& provider, const std::string& version) {
  try {
    std::uint64_t used = used_bytes(id);
    if (used + data.size() > quota_) {
      BOOST_LOG_TRIVIAL(warning) << "Blob cache: Model " << id << " (" << format_bytes(data.size())
                                 << ") does not fit, " << format_bytes(quota_ > used ? quota_ - used : 0) << " available";
      return false;
    }

    CacheEntry entry;
    entry.id = id;
    entry.name = name;
    entry.version = version;
    entry.data = data;
    entry.size = data.size();
    entry.provider = provider;
    entry.timestamp = now_ms();
    entry.checksum = crypto::sha256_hex(data);

    store_.put(TABLE, entry_key(id), encode_entry(entry));
    update_index(id, entry);

    BOOST_LOG_TRIVIAL(info) << "Blob cache: Model " << id << " cached successfully (" << format_bytes(entry.size) << ")";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to cache model " << id << ": " << e.what();
    return false;
  }
}

std::optional<CacheEntry> BlobCache::get_cached_model(const std::string& id) {
  try {
    auto record = store_.get(TABLE, entry_key(id));
    if (!record) {
      return std::nullopt;
    }

    CacheEntry entry;
    try {
      entry = decode_entry(*record);
    } catch (const chunk::RecordFormatError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Blob cache: Model " << id << " record is unreadable, removing corrupted cache: " << e.what();
      remove_cached_model(id);
      return std::nullopt;
    }

    std::string checksum = crypto::sha256_hex(entry.data);
    if (checksum != entry.checksum) {
      BOOST_LOG_TRIVIAL(warning) << "Blob cache: Model " << id << " checksum mismatch, removing corrupted cache";
      remove_cached_model(id);
      return std::nullopt;
    }

    BOOST_LOG_TRIVIAL(info) << "Blob cache: Retrieved cached model " << id << " (" << format_bytes(entry.size) << ")";
    return entry;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to retrieve cached model " << id << ": " << e.what();
    return std::nullopt;
  }
}

bool BlobCache::is_model_cached(const std::string& id) {
  return get_cached_model(id).has_value();
}

bool BlobCache::remove_cached_model(const std::string& id) {
  try {
    store_.remove(TABLE, entry_key(id));
    remove_from_index(id);
    BOOST_LOG_TRIVIAL(info) << "Blob cache: Removed cached model " << id;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to remove cached model " << id << ": " << e.what();
    return false;
  }
}

bool BlobCache::clear_all_cached_models() {
  try {
    std::vector<std::string> keys = entry_keys();
    for (const auto& key : keys) {
      store_.remove(TABLE, key);
    }

    std::lock_guard<std::mutex> lock(index_mutex_);
    store_.remove(TABLE, INDEX_KEY);

    BOOST_LOG_TRIVIAL(info) << "Blob cache: Cleared " << keys.size() << " cached models";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to clear cached models: " << e.what();
    return false;
  }
}


//==============================================
// ENUMERATION AND STATISTICS
//==============================================

engine::CacheStats BlobCache::get_cache_stats() {
  engine::CacheStats stats;
  try {
    for (const auto& entry : get_cached_models()) {
      if (entry.size > 0) {
        stats.total_size += entry.size;
        ++stats.model_count;
      }
    }
    stats.available_space = quota_ > stats.total_size ? quota_ - stats.total_size : 0;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to get cache stats: " << e.what();
    return engine::CacheStats{};
  }
  return stats;
}

std::vector<CacheEntry> BlobCache::get_cached_models() {
  std::vector<CacheEntry> entries;
  try {
    for (const auto& key : entry_keys()) {
      auto record = store_.get(TABLE, key);
      if (!record) {
        continue;
      }
      try {
        entries.push_back(decode_entry(*record));
      } catch (const chunk::RecordFormatError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Blob cache: Skipping unreadable entry " << key << ": " << e.what();
      }
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to get cached models: " << e.what();
    return {};
  }

  std::sort(entries.begin(), entries.end(), [](const CacheEntry& a, const CacheEntry& b) {
    return a.timestamp > b.timestamp;
  });
  return entries;
}

CacheIndex BlobCache::get_index() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  try {
    return read_index();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to read metadata index: " << e.what();
    return {};
  }
}

double BlobCache::get_cache_usage_percentage() {
  if (quota_ == 0) {
    return 0.0;
  }
  engine::CacheStats stats = get_cache_stats();
  return static_cast<double>(stats.total_size) / static_cast<double>(quota_) * 100.0;
}

bool BlobCache::has_enough_space(std::uint64_t size) {
  return get_cache_stats().available_space >= size;
}


//==============================================
// EVICTION
//==============================================

std::size_t BlobCache::cleanup_old_models(std::chrono::milliseconds max_age) {
  try {
    const std::int64_t now = now_ms();
    std::size_t removed_count = 0;

    for (const auto& entry : get_cached_models()) {
      if (now - entry.timestamp > max_age.count()) {
        if (remove_cached_model(entry.id)) {
          ++removed_count;
        }
      }
    }

    BOOST_LOG_TRIVIAL(info) << "Blob cache: Cleaned up " << removed_count << " old cached models";
    return removed_count;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to clean up old models: " << e.what();
    return 0;
  }
}


//==============================================
// ASSET CACHE
//==============================================

bool BlobCache::put(const std::string& id, const std::vector<uint8_t>& data) {
  return cache_model(id, id, data, "unknown");
}

std::optional<std::vector<uint8_t>> BlobCache::fetch(const std::string& id) {
  auto entry = get_cached_model(id);
  if (!entry) {
    return std::nullopt;
  }
  return std::move(entry->data);
}

std::string BlobCache::format_bytes(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 Bytes";
  }

  static const char* sizes[] = {"Bytes", "KB", "MB", "GB"};
  int i = 0;
  double value_in_unit = static_cast<double>(bytes);
  while (value_in_unit >= 1024.0 && i < 3) {
    value_in_unit /= 1024.0;
    ++i;
  }

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << value_in_unit;
  std::string value = ss.str();

  // Drop trailing zeros: "1.50" -> "1.5", "2.00" -> "2"
  value.erase(value.find_last_not_of('0') + 1);
  if (!value.empty() && value.back() == '.') {
    value.pop_back();
  }
  return value + " " + sizes[i];
}


//==============================================
// HELPERS
//==============================================

std::string BlobCache::entry_key(const std::string& id) {
  return ENTRY_PREFIX + id;
}

std::vector<std::string> BlobCache::entry_keys() const {
  std::vector<std::string> keys = store_.list_keys(TABLE);
  const std::string prefix = ENTRY_PREFIX;
  keys.erase(std::remove_if(keys.begin(), keys.end(), [&prefix](const std::string& key) {
    return key.compare(0, prefix.size(), prefix) != 0;
  }), keys.end());
  return keys;
}

std::int64_t BlobCache::now_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch()).count();
}

std::uint64_t BlobCache::used_bytes(const std::string& skip_id) {
  std::uint64_t used = 0;
  for (const auto& entry : get_cached_models()) {
    if (entry.id == skip_id) {
      continue;
    }
    used += entry.size;
  }
  return used;
}

CacheIndex BlobCache::read_index() const {
  auto record = store_.get(TABLE, INDEX_KEY);
  if (!record) {
    return {};
  }
  return decode_index(*record);
}

void BlobCache::update_index(const std::string& id, const CacheEntry& entry) {
  std::lock_guard<std::mutex> lock(index_mutex_);
  try {
    CacheIndex index;
    try {
      index = read_index();
    } catch (const chunk::RecordFormatError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Blob cache: Rebuilding unreadable metadata index: " << e.what();
    }
    index[id] = CacheIndexRow{entry.name, entry.version, entry.size, entry.provider, entry.timestamp};
    store_.put(TABLE, INDEX_KEY, encode_index(index));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to update metadata: " << e.what();
  }
}

void BlobCache::remove_from_index(const std::string& id) {
  std::lock_guard<std::mutex> lock(index_mutex_);
  try {
    CacheIndex index = read_index();
    if (index.erase(id) > 0) {
      store_.put(TABLE, INDEX_KEY, encode_index(index));
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob cache: Failed to remove from metadata: " << e.what();
  }
}

} // namespace cache
} // namespace mvault
