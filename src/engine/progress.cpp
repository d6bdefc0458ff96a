#include "engine/progress.hpp"
#include <iomanip>
#include <sstream>

namespace mvault {
namespace engine {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

const char* event_type(const ProgressEvent& event) {
  return std::visit(overloaded{
    [](const DownloadEvent&) { return "download"; },
    [](const ChunkStoredEvent&) { return "chunkStored"; },
    [](const CompleteEvent&) { return "complete"; },
    [](const ErrorEvent&) { return "error"; },
    [](const InfoEvent&) { return "info"; },
  }, event);
}

std::string describe(const ProgressEvent& event) {
  std::ostringstream ss;
  std::visit(overloaded{
    [&ss](const DownloadEvent& e) {
      ss << "download " << e.url << ": " << e.loaded;
      if (e.total && *e.total > 0) {
        ss << "/" << *e.total << " bytes ("
           << std::fixed << std::setprecision(1)
           << (100.0 * static_cast<double>(e.loaded) / static_cast<double>(*e.total)) << "%)";
      } else {
        ss << " bytes";
      }
    },
    [&ss](const ChunkStoredEvent& e) {
      ss << "chunk " << e.chunk_index << " of " << e.asset_id << " stored (" << e.bytes_stored << " bytes)";
    },
    [&ss](const CompleteEvent& e) {
      ss << e.asset_id << " complete (" << e.total_bytes << " bytes)";
    },
    [&ss](const ErrorEvent& e) {
      ss << e.asset_id << " failed: " << e.error;
    },
    [&ss](const InfoEvent& e) {
      ss << e.asset_id << ": " << e.msg;
    },
  }, event);
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const ProgressEvent& event) {
  return os << "[" << event_type(event) << "] " << describe(event);
}

} // namespace engine
} // namespace mvault
