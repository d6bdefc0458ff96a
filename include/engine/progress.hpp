#ifndef MVAULT_ENGINE_PROGRESS_HPP
#define MVAULT_ENGINE_PROGRESS_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace mvault {
namespace engine {

struct DownloadEvent {
  std::string url;
  std::uint64_t loaded{0};
  std::optional<std::uint64_t> total;
};

struct ChunkStoredEvent {
  std::string asset_id;
  std::size_t chunk_index{0};
  std::uint64_t bytes_stored{0};
};

struct CompleteEvent {
  std::string asset_id;
  std::uint64_t total_bytes{0};
};

struct ErrorEvent {
  std::string asset_id;
  std::string error;
};

struct InfoEvent {
  std::string asset_id;
  std::string msg;
};

using ProgressEvent = std::variant<DownloadEvent, ChunkStoredEvent, CompleteEvent, ErrorEvent, InfoEvent>;

// Invoked synchronously from the pipeline thread. May be empty.
using ProgressCallback = std::function<void(const ProgressEvent&)>;

// Short type name: "download", "chunkStored", "complete", "error", "info"
const char* event_type(const ProgressEvent& event);

// One-line human readable description
std::string describe(const ProgressEvent& event);

std::ostream& operator<<(std::ostream& os, const ProgressEvent& event);

// Calls callback if set
inline void emit(const ProgressCallback& callback, ProgressEvent event) {
  if (callback) {
    callback(event);
  }
}

} // namespace engine
} // namespace mvault

#endif // MVAULT_ENGINE_PROGRESS_HPP
