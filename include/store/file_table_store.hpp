#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include "store/table_store.hpp"

namespace mvault {
namespace store {

// Filesystem-backed TableStore. Each table is a directory; each key is a
// content-addressed file whose path is derived from the SHA-256 of the key:
//   {base_path}/{table}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{hash[6:]}
// A record file starts with a header holding the key so tables can be
// enumerated. Writes land in a temporary sibling and are renamed into place.
class FileTableStore : public TableStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws StoreUnavailableError if base_path cannot be used as a directory
  explicit FileTableStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  std::optional<Bytes> get(const std::string& table, const std::string& key) const override;
  void put(const std::string& table, const std::string& key, const Bytes& value) override;
  bool remove(const std::string& table, const std::string& key) override;
  void clear(const std::string& table) override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& table, const std::string& key) const override;
  std::vector<std::string> list_keys(const std::string& table) const override;
  std::optional<std::uint64_t> size_of(const std::string& table, const std::string& key) const override;
  // Free space on the filesystem holding base_path
  std::optional<std::uint64_t> available_space() const override;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all tables
  std::filesystem::path base_path_;
  // Serializes structural changes (writes, removals, directory pruning)
  mutable std::mutex write_mutex_;
  std::atomic<uint64_t> temp_counter_{0};

  static constexpr char RECORD_MAGIC[4] = {'M', 'V', 'R', '1'};
  static constexpr const char* TEMP_MARKER = ".tmp.";


  // ---- CAS STORAGE SUPPORT ----
  // Creates a directory structure using parts of the hash
  std::filesystem::path get_path_for_hash(const std::filesystem::path& table_dir,
                                          const std::string& hash) const;
  // Resolves a key to its record path inside a table
  std::filesystem::path resolve_key_path(const std::string& table, const std::string& key) const;
  std::filesystem::path table_dir(const std::string& table) const;


  // ---- RECORD FORMAT ----
  // Reads the header of a record file and returns the stored key,
  // leaving the stream positioned at the start of the value
  static std::optional<std::string> read_header(std::istream& input);
  static void write_header(std::ostream& output, const std::string& key);
  static std::uintmax_t header_size(const std::string& key);


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Removes empty directories from path up to (not including) stop
  void prune_empty_dirs(std::filesystem::path path, const std::filesystem::path& stop) const;
  static void validate_table(const std::string& table);
  static bool is_temp_file(const std::filesystem::path& path);
};

} // namespace store
} // namespace mvault
