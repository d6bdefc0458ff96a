#ifndef MVAULT_CONFIG_CONFIG_HPP
#define MVAULT_CONFIG_CONFIG_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mvault {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

struct Config {
  // [store]
  std::string store_path{"mvault_store"};
  std::uint64_t chunk_size{50 * 1024 * 1024};

  // [cache]
  std::uint64_t cache_quota{5 * 1024 * 1024};
  unsigned int cache_max_age_days{30};

  // [http]
  unsigned int http_timeout_seconds{60};
  unsigned int max_redirects{5};

  // [log]
  std::string log_file;
  std::string log_level{"info"};

  // Throws ConfigError on the first invalid field
  void validate() const;
};

// Reads an INI file. Keys missing from the file keep their defaults.
// Throws ConfigError if the file cannot be parsed or a value is invalid.
Config load_config(const std::string& path);

// Same as load_config but reads from an already opened stream
Config parse_config(std::istream& input);

} // namespace config
} // namespace mvault

#endif // MVAULT_CONFIG_CONFIG_HPP
