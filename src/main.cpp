#include "cli/cli.hpp"
#include "config/config.hpp"
#include "fetch/beast_http_client.hpp"
#include "logger/logger.hpp"
#include "store/file_table_store.hpp"
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string config_path;
  std::optional<std::string> store_path;
  std::optional<std::string> log_level;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config>] [-s <store>] [-l <level>]\n"
        << "Optional arguments:\n"
        << "  -c, --config     INI configuration file\n"
        << "  -s, --store      Store directory (overrides store.path)\n"
        << "  -l, --log-level  trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -c mvault.ini -l debug\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-c", "--config", "-s", "--store", "-l", "--log-level"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[i + 1]);
    if (flag == "-c" || flag == "--config") {
      options.config_path = value;
    } else if (flag == "-s" || flag == "--store") {
      options.store_path = value;
    } else {
      options.log_level = value;
    }
  }

  options.valid = true;
  return options;
}

mvault::config::Config resolve_config(const ProgramOptions& options) {
  mvault::config::Config config;
  if (!options.config_path.empty()) {
    config = mvault::config::load_config(options.config_path);
  }
  if (options.store_path) {
    config.store_path = *options.store_path;
  }
  if (options.log_level) {
    config.log_level = *options.log_level;
  }
  config.validate();
  return config;
}

bool run_shell(const mvault::config::Config& config) {
  try {
    mvault::logger::init_logging(config.log_file, mvault::logger::parse_severity(config.log_level));

    mvault::store::FileTableStore store(config.store_path);

    mvault::fetch::BeastHttpClient::Options http_options;
    http_options.timeout = std::chrono::seconds(config.http_timeout_seconds);
    http_options.max_redirects = static_cast<int>(config.max_redirects);
    mvault::fetch::BeastHttpClient http_client(http_options);

    mvault::engine::ChunkedAssetStore::Options engine_options;
    engine_options.chunk_size = static_cast<std::size_t>(config.chunk_size);
    mvault::engine::ChunkedAssetStore assets(store, http_client, engine_options);
    mvault::cache::BlobCache blob_cache(store, config.cache_quota);

    mvault::cli::CLI cli(assets, blob_cache, config.cache_max_age_days);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start mvault: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  mvault::config::Config config;
  try {
    config = resolve_config(options);
  } catch (const mvault::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  return run_shell(config) ? 0 : 1;
}
