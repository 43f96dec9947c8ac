#pragma once

#include "park/domain/booking_policy.hpp"
#include "park/registry/space_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace park {

struct PaymentConfig {
  std::chrono::milliseconds timeout{5000};
  std::string gateway{"demo"};
  std::vector<std::string> declined_methods;
  std::chrono::milliseconds simulated_latency{0};  // Demo gateway only
};

struct DetectionConfig {
  double confidence_threshold{0.7};
  std::string endpoint{"tcp://127.0.0.1:5555"};  // Empty: no SUB thread
};

struct HistoryConfig {
  std::chrono::minutes window{5};
};

struct ForecastConfig {
  std::string model{"seasonal"};  // "seasonal" | "linear"
  double lookback_hours{168.0};
  std::size_t min_history_buckets{12};
  std::string model_path;  // Required for "linear"
};

struct MaintenanceConfig {
  std::chrono::milliseconds interval{60000};
};

struct IpcConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};    // REP
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};  // PUB
};

// -----------------------------------------------------------------------------
// EngineConfig: everything ParkingEngine needs to assemble itself
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct. Default-constructed it describes the stock
//         5 x 10 lot at $5/hr with the demo payment gateway and the
//         seasonal forecaster.
//
// @details
// fromJson() overlays only the keys that are present; unknown keys are
// ignored. A present key of the wrong type, or a value that fails
// validate(), raises ConfigError naming the key, e.g.
// "booking.max_booking_hours must be >= min_booking_hours".
//
// Example:
//   {
//     "lot": {"rows": 2, "columns": 5, "default_hourly_rate": 4.0,
//             "spaces": [{"id": "P007", "hourly_rate": 5.0}]},
//     "payment": {"timeout_ms": 3000, "declined_methods": ["expired_card"]},
//     "ipc": {"command_endpoint": "tcp://0.0.0.0:5556"}
//   }
// -----------------------------------------------------------------------------
struct EngineConfig {
  LotLayout lot;
  domain::BookingPolicy booking;
  PaymentConfig payment;
  DetectionConfig detection;
  HistoryConfig history;
  ForecastConfig forecast;
  MaintenanceConfig maintenance;
  IpcConfig ipc;

  // @throws ConfigError
  void validate() const;

  // @throws ConfigError
  static EngineConfig fromJson(const nlohmann::json& j);

  // @throws ConfigError if the file is missing, unreadable or invalid.
  static EngineConfig loadFile(const std::string& path);
};

}  // namespace park
