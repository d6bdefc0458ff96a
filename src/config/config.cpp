#include "config/config.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include "logger/logger.hpp"

namespace mvault {
namespace config {

namespace pt = boost::property_tree;

namespace {

template <typename T>
void read_value(const pt::ptree& tree, const std::string& key, T& target) {
  auto node = tree.get_child_optional(key);
  if (!node) {
    return;
  }
  auto value = node->get_value_optional<T>();
  if (!value) {
    throw ConfigError("Invalid value for " + key + ": " + node->data());
  }
  target = *value;
}

} // namespace

void Config::validate() const {
  if (store_path.empty()) {
    throw ConfigError("store.path must not be empty");
  }
  if (chunk_size == 0) {
    throw ConfigError("store.chunk_size must be positive");
  }
  if (http_timeout_seconds == 0) {
    throw ConfigError("http.timeout_seconds must be positive");
  }
  try {
    logger::parse_severity(log_level);
  } catch (const std::invalid_argument&) {
    throw ConfigError("Unknown log.level: " + log_level);
  }
}

Config parse_config(std::istream& input) {
  pt::ptree tree;
  try {
    pt::read_ini(input, tree);
  } catch (const pt::ini_parser_error& e) {
    throw ConfigError(e.what());
  }

  Config config;
  read_value(tree, "store.path", config.store_path);
  read_value(tree, "store.chunk_size", config.chunk_size);
  read_value(tree, "cache.quota", config.cache_quota);
  read_value(tree, "cache.max_age_days", config.cache_max_age_days);
  read_value(tree, "http.timeout_seconds", config.http_timeout_seconds);
  read_value(tree, "http.max_redirects", config.max_redirects);
  read_value(tree, "log.file", config.log_file);
  read_value(tree, "log.level", config.log_level);

  config.validate();
  return config;
}

Config load_config(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("Cannot open config file: " + path);
  }
  Config config = parse_config(file);
  BOOST_LOG_TRIVIAL(debug) << "Config: Loaded " << path;
  return config;
}

} // namespace config
} // namespace mvault
