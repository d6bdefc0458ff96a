#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "store/store_error.hpp"

namespace mvault {
namespace store {

using Bytes = std::vector<uint8_t>;

// Table-like key-value store. Every call is its own atomic unit; there are
// no multi-key transactions.
class TableStore {
public:
  virtual ~TableStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Returns the value stored under key, or nullopt when absent
  virtual std::optional<Bytes> get(const std::string& table, const std::string& key) const = 0;
  // Stores value under key, replacing any previous value. Throws WriteFailedError.
  virtual void put(const std::string& table, const std::string& key, const Bytes& value) = 0;
  // Removes key. Returns false when nothing was stored under it.
  virtual bool remove(const std::string& table, const std::string& key) = 0;
  // Removes every key of a table
  virtual void clear(const std::string& table) = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool has(const std::string& table, const std::string& key) const = 0;
  // Sorted list of all keys in a table
  virtual std::vector<std::string> list_keys(const std::string& table) const = 0;
  // Size in bytes of the value stored under key, or nullopt when absent
  virtual std::optional<std::uint64_t> size_of(const std::string& table, const std::string& key) const = 0;
  // Bytes the backing medium can still accept, when known
  virtual std::optional<std::uint64_t> available_space() const { return std::nullopt; }
};

} // namespace store
} // namespace mvault
