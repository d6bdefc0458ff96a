#ifndef MVAULT_FETCH_ERROR_HPP
#define MVAULT_FETCH_ERROR_HPP

#include <stdexcept>
#include <string>

namespace mvault {
namespace fetch {

class FetchError : public std::runtime_error {
public:
  explicit FetchError(const std::string& message) : std::runtime_error(message) {}
};

// Non-success HTTP status, or a transport failure (status 0). Nothing has
// been written to the store when this is raised before the body is read.
class FetchFailedError : public FetchError {
public:
  FetchFailedError(int status, const std::string& url)
    : FetchError("Fetch failed: " + std::to_string(status) + " for " + url)
    , status_(status) {}

  FetchFailedError(const std::string& url, const std::string& reason)
    : FetchError("Fetch failed: " + reason + " for " + url)
    , status_(0) {}

  int status() const { return status_; }

private:
  int status_;
};

} // namespace fetch
} // namespace mvault

#endif // MVAULT_FETCH_ERROR_HPP
