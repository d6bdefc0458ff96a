#include "store/file_table_store.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <thread>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace mvault {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
FileTableStore::FileTableStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing FileTableStore with base path: " << base_path;

  if (base_path.empty()) {
    throw StoreUnavailableError("empty base path");
  }

  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot create store directory " << base_path << ": " << e.what();
    throw StoreUnavailableError(base_path + ": " + e.what());
  }

  if (!std::filesystem::is_directory(base_path_)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Base path is not a directory: " << base_path;
    throw StoreUnavailableError(base_path + " is not a directory");
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::optional<Bytes> FileTableStore::get(const std::string& table, const std::string& key) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving " << table << "/" << key;

  std::filesystem::path file_path = resolve_key_path(table, key);

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Key not found: " << table << "/" << key;
    return std::nullopt;
  }

  auto stored_key = read_header(file);
  if (!stored_key || *stored_key != key) {
    BOOST_LOG_TRIVIAL(error) << "Store: Corrupt record header at " << file_path.string();
    throw StoreError("Store: Corrupt record for key: " + key);
  }

  std::error_code ec;
  std::uintmax_t file_size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw StoreError("Store: Failed to stat record for key: " + key + ": " + ec.message());
  }

  if (file_size < header_size(key)) {
    throw StoreError("Store: Corrupt record for key: " + key);
  }

  Bytes value(file_size - header_size(key));
  if (!value.empty() && !file.read(reinterpret_cast<char*>(value.data()), value.size())) {
    BOOST_LOG_TRIVIAL(error) << "Store: Short read for key: " << key;
    throw StoreError("Store: Failed to read record for key: " + key);
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieved " << value.size() << " bytes for " << table << "/" << key;
  return value;
}

void FileTableStore::put(const std::string& table, const std::string& key, const Bytes& value) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing " << value.size() << " bytes under " << table << "/" << key;
  validate_table(table);

  std::filesystem::path file_path = resolve_key_path(table, key);
  std::filesystem::path temp_path = file_path;
  temp_path += TEMP_MARKER + std::to_string(temp_counter_.fetch_add(1)) + "." +
               std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

  std::lock_guard<std::mutex> lock(write_mutex_);
  try {
    check_directory_exists(file_path.parent_path());

    {
      std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
      if (!file) {
        throw WriteFailedError("cannot create " + temp_path.string());
      }
      write_header(file, key);
      if (!value.empty()) {
        file.write(reinterpret_cast<const char*>(value.data()), value.size());
      }
      file.flush();
      if (!file) {
        throw WriteFailedError("short write to " + temp_path.string());
      }
    }

    // Rename is atomic, readers see either the old record or the new one
    std::filesystem::rename(temp_path, file_path);
  } catch (const WriteFailedError& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: " << e.what();
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw;
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to store " << table << "/" << key << ": " << e.what();
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw WriteFailedError(table + "/" + key + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully stored " << value.size() << " bytes with key: " << key;
}

bool FileTableStore::remove(const std::string& table, const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Removing " << table << "/" << key;

  std::filesystem::path file_path = resolve_key_path(table, key);

  std::lock_guard<std::mutex> lock(write_mutex_);
  std::error_code ec;
  bool removed = std::filesystem::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove " << table << "/" << key << ": " << ec.message();
    throw StoreError("Store: Failed to remove key: " + key + ": " + ec.message());
  }

  if (removed) {
    prune_empty_dirs(file_path.parent_path(), table_dir(table));
    BOOST_LOG_TRIVIAL(debug) << "Store: Successfully removed " << table << "/" << key;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Store: Nothing to remove for " << table << "/" << key;
  }
  return removed;
}

void FileTableStore::clear(const std::string& table) {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing table: " << table;
  validate_table(table);

  std::lock_guard<std::mutex> lock(write_mutex_);
  std::error_code ec;
  std::filesystem::remove_all(table_dir(table), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to clear table " << table << ": " << ec.message();
    throw StoreError("Store: Failed to clear table: " + table);
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Table cleared successfully: " << table;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileTableStore::has(const std::string& table, const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(table, key);
  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(file_path, ec);

  BOOST_LOG_TRIVIAL(trace) << "Store: Key " << table << "/" << key << (exists ? " exists" : " not found");
  return exists;
}

std::vector<std::string> FileTableStore::list_keys(const std::string& table) const {
  validate_table(table);
  std::vector<std::string> keys;
  std::filesystem::path dir = table_dir(table);

  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return keys;
  }

  std::filesystem::recursive_directory_iterator it(dir, ec), end;
  if (ec) {
    throw StoreError("Store: Failed to enumerate table " + table + ": " + ec.message());
  }

  for (; it != end; it.increment(ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Enumeration of " << table << " failed: " << ec.message();
      throw StoreError("Store: Failed to enumerate table " + table + ": " + ec.message());
    }
    if (!it->is_regular_file(ec) || is_temp_file(it->path())) {
      continue;
    }

    std::ifstream file(it->path(), std::ios::binary);
    auto key = read_header(file);
    if (!key) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Skipping unreadable record: " << it->path().string();
      continue;
    }
    keys.push_back(std::move(*key));
  }

  std::sort(keys.begin(), keys.end());
  BOOST_LOG_TRIVIAL(debug) << "Store: Table " << table << " holds " << keys.size() << " keys";
  return keys;
}

std::optional<std::uint64_t> FileTableStore::size_of(const std::string& table, const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(table, key);
  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    return std::nullopt;
  }
  if (size < header_size(key)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Truncated record at " << file_path.string();
    throw StoreError("Store: Corrupt record for key: " + key);
  }
  return static_cast<std::uint64_t>(size - header_size(key));
}

std::optional<std::uint64_t> FileTableStore::available_space() const {
  std::error_code ec;
  std::filesystem::space_info info = std::filesystem::space(base_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Cannot query free space: " << ec.message();
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(info.available);
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path FileTableStore::get_path_for_hash(const std::filesystem::path& table_dir,
                                                        const std::string& hash) const {
  std::filesystem::path path = table_dir;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path FileTableStore::resolve_key_path(const std::string& table, const std::string& key) const {
  validate_table(table);
  return get_path_for_hash(table_dir(table), crypto::sha256_hex(key));
}

std::filesystem::path FileTableStore::table_dir(const std::string& table) const {
  return base_path_ / table;
}


//==============================================
// RECORD FORMAT
//==============================================

std::optional<std::string> FileTableStore::read_header(std::istream& input) {
  char magic[sizeof(RECORD_MAGIC)];
  if (!input.read(magic, sizeof(magic)) || std::memcmp(magic, RECORD_MAGIC, sizeof(magic)) != 0) {
    return std::nullopt;
  }

  uint32_t network_key_length = 0;
  if (!input.read(reinterpret_cast<char*>(&network_key_length), sizeof(network_key_length))) {
    return std::nullopt;
  }
  uint32_t key_length = boost::endian::big_to_native(network_key_length);

  std::string key(key_length, '\0');
  if (key_length > 0 && !input.read(&key[0], key_length)) {
    return std::nullopt;
  }
  return key;
}

void FileTableStore::write_header(std::ostream& output, const std::string& key) {
  uint32_t network_key_length = boost::endian::native_to_big(static_cast<uint32_t>(key.size()));
  output.write(RECORD_MAGIC, sizeof(RECORD_MAGIC));
  output.write(reinterpret_cast<const char*>(&network_key_length), sizeof(network_key_length));
  output.write(key.data(), key.size());
}

std::uintmax_t FileTableStore::header_size(const std::string& key) {
  return sizeof(RECORD_MAGIC) + sizeof(uint32_t) + key.size();
}


//==============================================
// UTILITY METHODS
//==============================================

void FileTableStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void FileTableStore::prune_empty_dirs(std::filesystem::path path, const std::filesystem::path& stop) const {
  std::error_code ec;
  while (path != stop && path.has_parent_path()) {
    if (!std::filesystem::is_empty(path, ec) || ec) {
      break;
    }
    std::filesystem::remove(path, ec);
    if (ec) {
      break;
    }
    path = path.parent_path();
  }
}

void FileTableStore::validate_table(const std::string& table) {
  bool valid = !table.empty() && std::all_of(table.begin(), table.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-';
  });
  if (!valid) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid table name: '" << table << "'";
    throw StoreError("Store: Invalid table name: " + table);
  }
}

bool FileTableStore::is_temp_file(const std::filesystem::path& path) {
  return path.filename().string().find(TEMP_MARKER) != std::string::npos;
}

} // namespace store
} // namespace mvault
