#ifndef MVAULT_STORE_ERROR_HPP
#define MVAULT_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace mvault {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// The backing store cannot be opened. Surfaced to the caller, never retried.
class StoreUnavailableError : public StoreError {
public:
  explicit StoreUnavailableError(const std::string& message)
    : StoreError("Store unavailable: " + message) {}
};

// A single put was rejected. Records written before it are left in place.
class WriteFailedError : public StoreError {
public:
  explicit WriteFailedError(const std::string& message)
    : StoreError("Write failed: " + message) {}
};

} // namespace store
} // namespace mvault

#endif // MVAULT_STORE_ERROR_HPP
