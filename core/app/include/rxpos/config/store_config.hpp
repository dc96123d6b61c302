#pragma once

#include <stdexcept>
#include <string>

namespace rxpos {

// -----------------------------------------------------------------------------
// StoreConfig
// -----------------------------------------------------------------------------
// Responsibility: Engine-wide settings, fixed for the lifetime of a PosEngine.
// Every field has a working default, so a missing config file key (or no
// config file at all) still yields a runnable store.
//
// Empty IPC endpoints disable the IPC server (tests run without sockets).
// -----------------------------------------------------------------------------
struct StoreConfig {
  std::string database_path{"rxpos.db"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  // Applied to a fresh cart and after every clear. Percent, [0, 100].
  double default_tax_rate{0.0};

  // A sold medicine with quantity <= this raises a LowStockEvent. >= 0.
  int low_stock_threshold{10};

  std::string currency_symbol{"$"};
  std::string store_name{"Medical Store"};
};

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown by loadStoreConfig / parseStoreConfig when the file cannot be read,
// is not valid JSON, has a key of the wrong type, or has an out-of-range
// value. The message names the offending file or key.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// loadStoreConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads a JSON object from `path` and overlays it on the defaults.
//
// @details
// Recognized keys are the StoreConfig field names. Unknown keys are ignored
// with a warning on std::cerr. Throws ConfigError.
// -----------------------------------------------------------------------------
StoreConfig loadStoreConfig(const std::string& path);

// Same as loadStoreConfig, from JSON text already in memory.
StoreConfig parseStoreConfig(const std::string& json_text);

}  // namespace rxpos
