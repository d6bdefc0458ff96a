#include "cli/cli.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace mvault {
namespace cli {

namespace {

struct CommandSpec {
  const char* name;
  std::size_t min_args;
  std::size_t max_args;
  const char* usage;
};

const CommandSpec COMMANDS[] = {
  {"fetch", 2, 2, "fetch <url> <id>"},
  {"stream", 2, 2, "stream <url> <id>"},
  {"get", 2, 2, "get <id> <out_file>"},
  {"has", 1, 1, "has <id>"},
  {"rm", 1, 1, "rm <id>"},
  {"ls", 0, 0, "ls"},
  {"gc", 0, 1, "gc [--dry-run]"},
  {"cache", 3, 3, "cache <id> <file> <provider>"},
  {"cache-get", 2, 2, "cache-get <id> <out_file>"},
  {"cache-ls", 0, 0, "cache-ls"},
  {"cache-rm", 1, 1, "cache-rm <id>"},
  {"cache-stats", 0, 0, "cache-stats"},
  {"cache-cleanup", 0, 1, "cache-cleanup [days]"},
  {"help", 0, 0, "help"},
};

const CommandSpec* find_command(const std::string& name) {
  for (const auto& spec : COMMANDS) {
    if (name == spec.name) {
      return &spec;
    }
  }
  return nullptr;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(engine::ChunkedAssetStore& assets, cache::BlobCache& blob_cache,
         unsigned int default_max_age_days, std::istream& in, std::ostream& out)
  : running_(false)
  , default_max_age_days_(default_max_age_days)
  , assets_(assets)
  , blob_cache_(blob_cache)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "mvault> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "mvault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> tokens{std::istream_iterator<std::string>(iss), std::istream_iterator<std::string>()};
  if (tokens.empty()) {
    return true;
  }

  std::string command = tokens.front();
  if (command == "quit" || command == "exit") {
    return false;
  }

  std::vector<std::string> args(tokens.begin() + 1, tokens.end());
  const CommandSpec* spec = find_command(command);
  if (!spec) {
    out_ << "Unknown command: " << command << ". Type 'help' for a list of commands." << std::endl;
    return true;
  }
  if (args.size() < spec->min_args || args.size() > spec->max_args) {
    out_ << "Invalid input. Usage: " << spec->usage << std::endl;
    return true;
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "fetch") {
    handle_fetch_command(args[0], args[1]);
  }
  else if (command == "stream") {
    handle_stream_command(args[0], args[1]);
  }
  else if (command == "get") {
    handle_get_command(args[0], args[1]);
  }
  else if (command == "has") {
    handle_has_command(args[0]);
  }
  else if (command == "rm") {
    handle_remove_command(args[0]);
  }
  else if (command == "ls") {
    handle_list_command();
  }
  else if (command == "gc") {
    if (!args.empty() && args[0] != "--dry-run") {
      out_ << "Invalid input. Usage: gc [--dry-run]" << std::endl;
      return;
    }
    bool dry_run = !args.empty();
    try {
      auto stats = assets_.collect_orphaned_chunks(dry_run);
      out_ << "Chunks: " << stats.total_chunks
           << ", orphaned: " << stats.orphaned_chunks
           << " (" << cache::BlobCache::format_bytes(stats.orphaned_bytes) << ")"
           << ", freed: " << stats.freed_chunks
           << " (" << cache::BlobCache::format_bytes(stats.freed_bytes) << ")" << std::endl;
    } catch (const std::exception& e) {
      log_and_display_error("Error collecting orphaned chunks", e.what());
    }
  }
  else if (command == "cache") {
    handle_cache_command(args[0], args[1], args[2]);
  }
  else if (command == "cache-get") {
    handle_cache_get_command(args[0], args[1]);
  }
  else if (command == "cache-ls") {
    handle_cache_list_command();
  }
  else if (command == "cache-rm") {
    handle_cache_remove_command(args[0]);
  }
  else if (command == "cache-stats") {
    handle_cache_stats_command();
  }
  else if (command == "cache-cleanup") {
    handle_cache_cleanup_command(args);
  }
  else if (command == "help") {
    handle_help_command();
  }
}

void CLI::handle_fetch_command(const std::string& url, const std::string& asset_id) {
  try {
    auto data = assets_.load_or_fetch_model(url, asset_id, progress_printer());
    out_ << "Asset " << asset_id << " ready (" << cache::BlobCache::format_bytes(data.size()) << ")" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error fetching asset", e.what());
  }
}

void CLI::handle_stream_command(const std::string& url, const std::string& asset_id) {
  try {
    assets_.stream_and_store(url, asset_id, progress_printer());
  } catch (const std::exception& e) {
    log_and_display_error("Error streaming asset", e.what());
  }
}

void CLI::handle_get_command(const std::string& asset_id, const std::string& out_file) {
  try {
    auto data = assets_.load(asset_id);
    if (!data) {
      out_ << "Asset not found: " << asset_id << std::endl;
      return;
    }
    if (write_file(out_file, *data)) {
      out_ << "Wrote " << cache::BlobCache::format_bytes(data->size()) << " to " << out_file << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error reading asset", e.what());
  }
}

void CLI::handle_has_command(const std::string& asset_id) {
  try {
    out_ << (assets_.has_data(asset_id) ? "yes" : "no") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error checking asset", e.what());
  }
}

void CLI::handle_remove_command(const std::string& asset_id) {
  try {
    if (assets_.delete_asset(asset_id)) {
      out_ << "Asset deleted successfully" << std::endl;
    } else {
      out_ << "Asset not found: " << asset_id << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting asset", e.what());
  }
}

void CLI::handle_list_command() {
  try {
    for (const auto& id : assets_.list_assets()) {
      auto metadata = assets_.get_metadata(id);
      out_ << id;
      if (metadata) {
        out_ << "  " << cache::BlobCache::format_bytes(metadata->total_bytes)
             << "  " << metadata->chunk_keys.size() << " chunks";
      }
      out_ << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing assets", e.what());
  }
}

void CLI::handle_cache_command(const std::string& id, const std::string& file, const std::string& provider) {
  std::ifstream input(file, std::ios::binary);
  if (!input) {
    out_ << "Error opening file: " << file << std::endl;
    return;
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

  if (blob_cache_.cache_model(id, file, data, provider)) {
    out_ << "Cached " << id << " (" << cache::BlobCache::format_bytes(data.size()) << ")" << std::endl;
  } else {
    out_ << "Failed to cache " << id << std::endl;
  }
}

void CLI::handle_cache_get_command(const std::string& id, const std::string& out_file) {
  auto entry = blob_cache_.get_cached_model(id);
  if (!entry) {
    out_ << "Not cached: " << id << std::endl;
    return;
  }
  if (write_file(out_file, entry->data)) {
    out_ << "Wrote " << cache::BlobCache::format_bytes(entry->size) << " to " << out_file << std::endl;
  }
}

void CLI::handle_cache_list_command() {
  for (const auto& entry : blob_cache_.get_cached_models()) {
    out_ << entry.id << "  " << entry.name << "  " << entry.version
         << "  " << entry.provider << "  " << cache::BlobCache::format_bytes(entry.size) << std::endl;
  }
}

void CLI::handle_cache_remove_command(const std::string& id) {
  if (blob_cache_.remove_cached_model(id)) {
    out_ << "Removed " << id << std::endl;
  } else {
    out_ << "Failed to remove " << id << std::endl;
  }
}

void CLI::handle_cache_stats_command() {
  auto stats = blob_cache_.get_cache_stats();
  out_ << "Models: " << stats.model_count << std::endl;
  out_ << "Used: " << cache::BlobCache::format_bytes(stats.total_size)
       << " of " << cache::BlobCache::format_bytes(blob_cache_.quota()) << std::endl;
  out_ << "Available: " << cache::BlobCache::format_bytes(stats.available_space) << std::endl;
}

void CLI::handle_cache_cleanup_command(const std::vector<std::string>& args) {
  unsigned int days = default_max_age_days_;
  if (!args.empty()) {
    try {
      days = static_cast<unsigned int>(std::stoul(args[0]));
    } catch (const std::exception&) {
      out_ << "Invalid number of days: " << args[0] << std::endl;
      return;
    }
  }
  std::size_t removed = blob_cache_.cleanup_old_models(std::chrono::hours(24) * days);
  out_ << "Removed " << removed << " cached models older than " << days << " days" << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                          Display this help message" << std::endl;
  out_ << "  fetch <url> <id>              Download <url> whole and store it as <id>" << std::endl;
  out_ << "  stream <url> <id>             Stream <url> into chunks stored as <id>" << std::endl;
  out_ << "  get <id> <out_file>           Write stored asset <id> to <out_file>" << std::endl;
  out_ << "  has <id>                      Check whether asset <id> is stored" << std::endl;
  out_ << "  rm <id>                       Delete asset <id> and its chunks" << std::endl;
  out_ << "  ls                            List stored assets" << std::endl;
  out_ << "  gc [--dry-run]                Remove chunks no asset refers to" << std::endl;
  out_ << "  cache <id> <file> <provider>  Put local <file> into the blob cache" << std::endl;
  out_ << "  cache-get <id> <out_file>     Write cached model <id> to <out_file>" << std::endl;
  out_ << "  cache-ls                      List cached models, newest first" << std::endl;
  out_ << "  cache-rm <id>                 Remove cached model <id>" << std::endl;
  out_ << "  cache-stats                   Show blob cache usage" << std::endl;
  out_ << "  cache-cleanup [days]          Remove cached models older than [days]" << std::endl;
  out_ << "  quit                          Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

engine::ProgressCallback CLI::progress_printer() {
  return [this](const engine::ProgressEvent& event) {
    // Download events are too frequent for the terminal
    if (std::holds_alternative<engine::DownloadEvent>(event)) {
      return;
    }
    out_ << event << std::endl;
  };
}

bool CLI::write_file(const std::string& path, const std::vector<uint8_t>& data) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  if (!output) {
    out_ << "Error opening file: " << path << std::endl;
    return false;
  }
  output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!output) {
    out_ << "Error writing file: " << path << std::endl;
    return false;
  }
  return true;
}

} // namespace cli
} // namespace mvault
