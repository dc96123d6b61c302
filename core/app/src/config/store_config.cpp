#include "rxpos/config/store_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

namespace rxpos {

namespace {

template <typename T>
void overlay(const nlohmann::json& j, const char* key, T& field) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  try {
    it->get_to(field);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("config key '") + key +
                      "' has the wrong type: " + e.what());
  }
}

}  // namespace

StoreConfig parseStoreConfig(const std::string& json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("config is not valid JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw ConfigError("config must be a JSON object");
  }

  StoreConfig config;
  overlay(j, "database_path", config.database_path);
  overlay(j, "ipc_cmd_endpoint", config.ipc_cmd_endpoint);
  overlay(j, "ipc_pub_endpoint", config.ipc_pub_endpoint);
  overlay(j, "default_tax_rate", config.default_tax_rate);
  overlay(j, "low_stock_threshold", config.low_stock_threshold);
  overlay(j, "currency_symbol", config.currency_symbol);
  overlay(j, "store_name", config.store_name);

  static const char* const kKnown[] = {
      "database_path",    "ipc_cmd_endpoint",    "ipc_pub_endpoint",
      "default_tax_rate", "low_stock_threshold", "currency_symbol",
      "store_name"};
  for (const auto& item : j.items()) {
    bool known = false;
    for (const char* k : kKnown) {
      if (item.key() == k) {
        known = true;
        break;
      }
    }
    if (!known) {
      std::cerr << "[StoreConfig] ignoring unknown key '" << item.key()
                << "'\n";
    }
  }

  if (!(config.default_tax_rate >= 0.0 && config.default_tax_rate <= 100.0)) {
    throw ConfigError("default_tax_rate must be between 0 and 100");
  }
  if (config.low_stock_threshold < 0) {
    throw ConfigError("low_stock_threshold cannot be negative");
  }
  if (config.database_path.empty()) {
    throw ConfigError("database_path cannot be empty");
  }

  return config;
}

StoreConfig loadStoreConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }
  std::ostringstream text;
  text << in.rdbuf();

  StoreConfig config = parseStoreConfig(text.str());
  std::cout << "[StoreConfig] loaded " << path << " (store='"
            << config.store_name << "', db=" << config.database_path << ")\n";
  return config;
}

}  // namespace rxpos
